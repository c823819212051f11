// File: include/sr/apps/node_app.hpp
#pragma once

#include <memory>
#include <string>

#include "sr/core/config.hpp"
#include "sr/core/io/signal_source.hpp"
#include "sr/core/recording/recorder_client.hpp"

namespace sr {

// Process exit codes of sr_node.
constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;   // bad arguments, bad config, unknown source/recorder type
constexpr int kExitStartupError = 2;  // recorder unreachable or a sink/port failed to start

struct NodeOptions {
  std::string config_path;  // recorded in the run header

  // Block SIGINT/SIGTERM and turn them into a graceful shutdown. Off in tests.
  bool handle_signals{true};
};

// nullptr for an unknown type.
std::unique_ptr<ISignalSource> make_source_from_config(const SensorConfig& s);
std::unique_ptr<RecorderClient> make_recorder_from_config(const RecorderConfig& r);

// Wires the node from a validated config and runs it until a signal or
// run.max_run_s. Logging must already be initialised.
int run_node(const Config& cfg, const NodeOptions& opts);

}  // namespace sr
