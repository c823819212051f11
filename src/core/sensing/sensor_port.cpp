// File: src/core/sensing/sensor_port.cpp
#include "sr/core/sensing/sensor_port.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace sr {
namespace {

// Slice length for a blocked push; bounds how long stop() can wait on a full bus.
constexpr std::chrono::milliseconds kPushSlice{50};

}  // namespace

SensorPort::SensorPort(SourceKind kind, ThresholdConfig cfg, std::unique_ptr<ISignalSource> source,
                       DetectionBus& bus, const Clock& clock)
    : kind_(kind),
      cfg_(cfg),
      source_(std::move(source)),
      bus_(bus),
      clock_(clock),
      edge_(cfg.threshold) {}

SensorPort::~SensorPort() { stop(); }

Status SensorPort::start() {
  if (running_) return Status::ok_status();
  if (!source_) return Status::invalid_argument("SensorPort: no signal source");
  if (cfg_.sample_interval_ms <= 0) {
    return Status::invalid_argument("SensorPort: sample_interval_ms must be > 0");
  }

  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    stop_requested_ = false;
  }
  edge_.reset();
  failing_ = false;

  running_ = true;
  worker_ = std::thread(&SensorPort::run, this);

  spdlog::info("SensorPort[{}]: started (source={} threshold={} interval={}ms)", to_string(kind_),
               source_->name(), cfg_.threshold, cfg_.sample_interval_ms);
  return Status::ok_status();
}

void SensorPort::stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();

  if (!worker_.joinable()) return;
  worker_.join();

  if (source_open_) {
    source_->close();
    source_open_ = false;
  }
  running_ = false;

  spdlog::info("SensorPort[{}]: stopped (samples={} failures={} events={} dropped={})",
               to_string(kind_), samples_.load(), failures_.load(), emitted_.load(),
               dropped_.load());
}

bool SensorPort::wait_until(std::chrono::steady_clock::time_point until) {
  std::unique_lock<std::mutex> lock(stop_mu_);
  stop_cv_.wait_until(lock, until, [&] { return stop_requested_; });
  return !stop_requested_;
}

bool SensorPort::ensure_open() {
  if (source_open_) return true;

  const Status st = source_->open();
  if (!st.ok()) {
    failures_++;
    note_failure(st);
    return false;
  }
  source_open_ = true;
  return true;
}

void SensorPort::note_failure(const Status& st) {
  if (!failing_) {
    spdlog::warn("SensorPort[{}]: {} ({}); retrying every {}ms", to_string(kind_), st.message(),
                 to_string(st.code()), cfg_.sample_interval_ms);
    failing_ = true;
    return;
  }
  spdlog::debug("SensorPort[{}]: {}", to_string(kind_), st.message());
}

void SensorPort::note_recovered() {
  if (!failing_) return;
  spdlog::info("SensorPort[{}]: source recovered", to_string(kind_));
  failing_ = false;
}

void SensorPort::publish(const DetectionEvent& e) {
  spdlog::debug("SensorPort[{}]: onset metric={:.4f} t={}ns", to_string(kind_), e.metric,
                e.observed_at.ns);

  // Backpressure: keep trying while the bus is full, but give stop() a chance
  // between slices.
  while (true) {
    if (bus_.push_for(e, kPushSlice)) {
      emitted_++;
      return;
    }
    if (bus_.closed()) {
      dropped_++;
      spdlog::warn("SensorPort[{}]: bus closed, dropping onset", to_string(kind_));
      return;
    }
    std::lock_guard<std::mutex> lock(stop_mu_);
    if (stop_requested_) {
      dropped_++;
      return;
    }
  }
}

void SensorPort::run() {
  using clock = std::chrono::steady_clock;
  const auto period = std::chrono::milliseconds(cfg_.sample_interval_ms);

  auto next_tick = clock::now();
  while (true) {
    if (ensure_open()) {
      auto r = source_->sample();
      if (r.ok()) {
        samples_++;
        note_recovered();
        const float value = r.value();
        if (edge_.update(value)) {
          publish(DetectionEvent{kind_, clock_.now(), value});
        }
      } else {
        // A failed sample leaves the comparator where it was.
        failures_++;
        note_failure(r.status());
      }
    }

    next_tick += period;
    const auto now = clock::now();
    if (next_tick < now) next_tick = now + period;  // fell behind; don't burst
    if (!wait_until(next_tick)) break;
  }
}

}  // namespace sr
