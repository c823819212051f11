// File: src/adapters/synth/synth_signal_source.cpp
#include "sr/adapters/synth/synth_signal_source.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace sr {

SynthSignalSource::SynthSignalSource(SynthSourceConfig cfg) : cfg_(std::move(cfg)), rng_(cfg_.seed) {
  cfg_.sample_interval_ms = std::max(1, cfg_.sample_interval_ms);
}

bool SynthSignalSource::in_burst(double t_s) const {
  if (t_s < cfg_.first_burst_s || cfg_.burst_period_s <= 0.0) return false;
  const double phase = std::fmod(t_s - cfg_.first_burst_s, cfg_.burst_period_s);
  return phase < cfg_.burst_length_s;
}

Result<float> SynthSignalSource::sample() {
  const std::int64_t tick = tick_++;

  if (cfg_.fail_every_n > 0 && (tick + 1) % cfg_.fail_every_n == 0) {
    return Result<float>::err(Status::unavailable("synth: simulated read failure at tick " + std::to_string(tick)));
  }

  const double t_s = static_cast<double>(tick) * static_cast<double>(cfg_.sample_interval_ms) * 1e-3;

  float v = in_burst(t_s) ? cfg_.burst_level : cfg_.baseline;
  if (cfg_.noise > 0.0f) {
    std::uniform_real_distribution<float> dist(-cfg_.noise, cfg_.noise);
    v += dist(rng_);
  }
  return Result<float>::ok(std::max(0.0f, v));
}

}  // namespace sr
