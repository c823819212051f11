// File: src/apps/sr_node/node_app.cpp
#include "sr/apps/node_app.hpp"

#include <pthread.h>
#include <signal.h>

#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "sr/adapters/frame_dir/frame_diff_source.hpp"
#include "sr/adapters/obs_ws/obs_ws_recorder_client.hpp"
#include "sr/adapters/pcm_file/pcm_level_source.hpp"
#include "sr/adapters/sample_file/sample_file_source.hpp"
#include "sr/adapters/sim_recorder/sim_recorder_client.hpp"
#include "sr/adapters/synth/synth_signal_source.hpp"
#include "sr/core/events/jsonl_event_sink.hpp"
#include "sr/core/model/detection_handler.hpp"
#include "sr/core/model/orchestrator.hpp"
#include "sr/core/util/clock.hpp"

namespace sr {

std::unique_ptr<ISignalSource> make_source_from_config(const SensorConfig& s) {
  if (s.source == "synth") {
    SynthSourceConfig sc;
    sc.sample_interval_ms = s.sample_interval_ms;
    sc.seed = s.synth.seed;
    sc.baseline = s.synth.baseline;
    sc.noise = s.synth.noise;
    sc.burst_level = s.synth.burst_level;
    sc.first_burst_s = s.synth.first_burst_s;
    sc.burst_period_s = s.synth.burst_period_s;
    sc.burst_length_s = s.synth.burst_length_s;
    sc.fail_every_n = s.synth.fail_every_n;
    return std::make_unique<SynthSignalSource>(sc);
  }

  if (s.source == "sample_file") {
    SampleFileSourceConfig fc;
    fc.path = s.sample_file.path;
    fc.loop = s.sample_file.loop;
    return std::make_unique<SampleFileSource>(fc);
  }

  if (s.source == "frame_dir") {
    FrameDiffSourceConfig dc;
    dc.path = s.frame_dir.path;
    dc.width = s.frame_dir.width;
    dc.height = s.frame_dir.height;
    dc.pixel_delta = s.frame_dir.pixel_delta;
    dc.loop = s.frame_dir.loop;
    return std::make_unique<FrameDiffSource>(dc);
  }

  if (s.source == "pcm_file") {
    PcmLevelSourceConfig pc;
    pc.path = s.pcm_file.path;
    pc.chunk_samples = s.pcm_file.chunk_samples;
    if (s.pcm_file.metric == "rms") pc.metric = LevelMetric::kRms;
    else if (s.pcm_file.metric == "either") pc.metric = LevelMetric::kEither;
    pc.rms_gain = s.pcm_file.rms_gain;
    pc.loop = s.pcm_file.loop;
    return std::make_unique<PcmLevelSource>(pc);
  }

  return nullptr;
}

std::unique_ptr<RecorderClient> make_recorder_from_config(const RecorderConfig& r) {
  if (r.type == "sim") {
    SimRecorderConfig sc;
    sc.endpoint = r.host + ":" + std::to_string(r.port);
    sc.reachable = r.sim.reachable;
    sc.externally_recording = r.sim.externally_recording;
    sc.stop_ack_polls = r.sim.stop_ack_polls;
    return std::make_unique<SimRecorderClient>(sc);
  }

  if (r.type == "obs") {
    ObsWsConfig oc;
    oc.host = r.host;
    oc.port = r.port;
    oc.password = r.password;
    oc.timeout = seconds_to_ns(r.timeout_s);
    return std::make_unique<ObsWsRecorderClient>(oc);
  }

  return nullptr;
}

int run_node(const Config& cfg, const NodeOptions& opts) {
  // Block termination signals before any thread exists; a dedicated thread
  // picks them up with sigwait(). SIGUSR1 only wakes that thread at exit.
  sigset_t mask;
  sigemptyset(&mask);
  if (opts.handle_signals) {
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);
  }

  auto recorder = make_recorder_from_config(cfg.recorder);
  if (!recorder) {
    spdlog::error("Unknown recorder.type: {}", cfg.recorder.type);
    return kExitConfigError;
  }

  SteadyClock clock;
  JsonlEventSink sink;
  Orchestrator orch(cfg, opts.config_path, clock, sink, std::move(recorder));

  const std::pair<SourceKind, const SensorConfig*> sensors[] = {
      {SourceKind::kVision, &cfg.sensors.vision},
      {SourceKind::kAudio, &cfg.sensors.audio},
  };
  for (const auto& [kind, sensor] : sensors) {
    if (!sensor->enabled) continue;
    auto source = make_source_from_config(*sensor);
    if (!source) {
      spdlog::error("Unknown sensors.{}.source: {}", to_string(kind), sensor->source);
      return kExitConfigError;
    }
    orch.add_sensor(kind, std::move(source));
  }
  orch.add_handler(std::make_unique<LogDetectionHandler>());

  const Status st_start = orch.start();
  if (!st_start.ok()) {
    spdlog::error("Startup failed: {}", st_start.message());
    orch.shutdown();
    return kExitStartupError;
  }

  std::thread signal_thread;
  if (opts.handle_signals) {
    signal_thread = std::thread([&orch, mask]() {
      int sig = 0;
      if (sigwait(&mask, &sig) != 0) return;
      if (sig == SIGINT || sig == SIGTERM) {
        spdlog::info("Received signal {}, shutting down", sig);
        orch.request_shutdown();
      }
    });
  }

  spdlog::info("Events: {} (latest: {})", sink.path(), sink.latest_path());
  orch.run();

  if (signal_thread.joinable()) {
    // Unblocks sigwait() when run() ended on its own (max_run_s).
    pthread_kill(signal_thread.native_handle(), SIGUSR1);
    signal_thread.join();
  }

  orch.shutdown();
  spdlog::info("OK");
  return kExitOk;
}

}  // namespace sr
