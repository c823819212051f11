// File: src/core/util/clock.cpp
#include "sr/core/util/clock.hpp"

namespace sr {
namespace {

TimestampNs wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

}  // namespace

SteadyClock::SteadyClock()
    : t0_steady_(std::chrono::steady_clock::now()), t0_wall_(wall_now_epoch_ns()) {}

TimestampNs SteadyClock::now() const {
  const auto now = std::chrono::steady_clock::now();
  const auto ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(now - t0_steady_).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

}  // namespace sr
