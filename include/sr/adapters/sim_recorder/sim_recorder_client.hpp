// File: include/sr/adapters/sim_recorder/sim_recorder_client.hpp
#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "sr/core/recording/recorder_client.hpp"

namespace sr {

struct SimRecorderConfig {
  std::string endpoint{"localhost:4444"};  // only used in log lines

  bool reachable{true};
  bool externally_recording{false};  // someone else already started a recording

  // is_recording() keeps answering true for this many polls after a stop.
  int stop_ack_polls{0};
};

// In-process recorder that behaves like a remote one: it can be unreachable,
// busy with a foreign recording, or slow to acknowledge a stop. Knobs can be
// flipped at runtime from another thread.
class SimRecorderClient final : public RecorderClient {
 public:
  explicit SimRecorderClient(SimRecorderConfig cfg = {});

  Status connect() override;
  Status start_recording() override;
  Status stop_recording() override;
  Result<bool> is_recording() override;
  void close() override;

  std::string name() const override { return "sim(" + cfg_.endpoint + ")"; }

  void set_reachable(bool reachable);
  void set_externally_recording(bool recording);
  void set_stop_ack_polls(int polls);

  struct Counters {
    std::uint64_t connects{0};
    std::uint64_t starts{0};  // successful starts only
    std::uint64_t start_attempts{0};
    std::uint64_t stops{0};   // successful stops only
    std::uint64_t status_queries{0};
  };
  [[nodiscard]] Counters counters() const;
  [[nodiscard]] bool connected() const;
  [[nodiscard]] bool recording() const;

 private:
  Status check_link_locked() const;

  mutable std::mutex mu_;
  SimRecorderConfig cfg_;
  bool connected_{false};
  bool recording_{false};   // recording started through this client
  int pending_ack_polls_{0};
  Counters counters_;
};

}  // namespace sr
