// File: include/sr/core/sensing/sensor_port.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "sr/core/io/signal_source.hpp"
#include "sr/core/sensing/detection_bus.hpp"
#include "sr/core/status.hpp"
#include "sr/core/types.hpp"
#include "sr/core/util/clock.hpp"

namespace sr {

// Fixed for the lifetime of a SensorPort; recreate the port to change it.
struct ThresholdConfig {
  float threshold = 0.5f;
  int sample_interval_ms = 100;
};

// Rising-edge comparator. Starts "below", so a first sample at/above the
// threshold counts as an onset.
class EdgeDetector {
 public:
  explicit EdgeDetector(float threshold) : threshold_(threshold) {}

  // True iff the previous sample was below the threshold and this one is at/above it.
  bool update(float value) {
    const bool above = value >= threshold_;
    const bool rising = above && !above_;
    above_ = above;
    return rising;
  }

  void reset() { above_ = false; }
  [[nodiscard]] bool above() const { return above_; }
  [[nodiscard]] float threshold() const { return threshold_; }

 private:
  float threshold_;
  bool above_{false};
};

// Samples one ISignalSource on its own thread and pushes a DetectionEvent onto
// the bus on every rising edge.
//
// - start() on a running port is a no-op.
// - stop() is idempotent, may be called mid-sample, and joins the thread; no
//   event is pushed after it returns.
// - Source failures (open or sample) are logged and retried on the next tick.
class SensorPort {
 public:
  SensorPort(SourceKind kind, ThresholdConfig cfg, std::unique_ptr<ISignalSource> source,
             DetectionBus& bus, const Clock& clock);
  ~SensorPort();

  SensorPort(const SensorPort&) = delete;
  SensorPort& operator=(const SensorPort&) = delete;

  Status start();
  void stop();

  [[nodiscard]] bool running() const { return running_.load(); }
  [[nodiscard]] SourceKind kind() const { return kind_; }
  [[nodiscard]] const ThresholdConfig& config() const { return cfg_; }

  [[nodiscard]] std::uint64_t samples_taken() const { return samples_.load(); }
  [[nodiscard]] std::uint64_t sample_failures() const { return failures_.load(); }
  [[nodiscard]] std::uint64_t events_emitted() const { return emitted_.load(); }
  [[nodiscard]] std::uint64_t events_dropped() const { return dropped_.load(); }

 private:
  void run();
  bool ensure_open();
  void note_failure(const Status& st);
  void note_recovered();
  void publish(const DetectionEvent& e);
  // Sleeps until `until` or stop(); returns false once stop was requested.
  bool wait_until(std::chrono::steady_clock::time_point until);

  const SourceKind kind_;
  const ThresholdConfig cfg_;
  std::unique_ptr<ISignalSource> source_;
  DetectionBus& bus_;
  const Clock& clock_;

  EdgeDetector edge_;
  bool source_open_{false};
  bool failing_{false};  // inside a streak of failed ticks

  std::thread worker_;
  std::atomic<bool> running_{false};

  std::mutex stop_mu_;
  std::condition_variable stop_cv_;
  bool stop_requested_{false};

  std::atomic<std::uint64_t> samples_{0};
  std::atomic<std::uint64_t> failures_{0};
  std::atomic<std::uint64_t> emitted_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace sr
