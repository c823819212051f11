// File: include/sr/core/util/clock.hpp
#pragma once

#include <atomic>
#include <chrono>

#include "sr/core/types.hpp"

namespace sr {

// Time contract:
//  - now()          = relative since run start (starts at 0)
//  - wall_start()   = absolute epoch ns at run start
//  - wall_at(t)     = wall_start + t
// All timestamps that flow through the trigger path come from one Clock.
class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimestampNs now() const = 0;
  virtual TimestampNs wall_start() const = 0;

  TimestampNs wall_at(TimestampNs t) const { return TimestampNs{wall_start().ns + t.ns}; }
};

// Steady clock anchored at construction.
class SteadyClock final : public Clock {
 public:
  SteadyClock();

  TimestampNs now() const override;
  TimestampNs wall_start() const override { return t0_wall_; }

 private:
  std::chrono::steady_clock::time_point t0_steady_;
  TimestampNs t0_wall_;
};

// Manually advanced clock; safe to read from sampler threads.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimestampNs start = TimestampNs{0}) : now_ns_(start.ns) {}

  TimestampNs now() const override { return TimestampNs{now_ns_.load()}; }
  TimestampNs wall_start() const override { return TimestampNs{0}; }

  void set(TimestampNs t) { now_ns_.store(t.ns); }
  void advance(DurationNs d) { now_ns_.fetch_add(d); }

 private:
  std::atomic<std::int64_t> now_ns_;
};

}  // namespace sr
