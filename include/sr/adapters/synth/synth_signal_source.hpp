// File: include/sr/adapters/synth/synth_signal_source.hpp
#pragma once

#include <cstdint>
#include <random>
#include <string>

#include "sr/core/io/signal_source.hpp"

namespace sr {

struct SynthSourceConfig {
  // Logical time advances by one interval per sample() call.
  int sample_interval_ms{100};

  float baseline{0.0f};
  float noise{0.0f};  // uniform in [-noise, +noise]

  // Bursts of `burst_level` lasting burst_length_s, every burst_period_s,
  // starting at first_burst_s.
  float burst_level{1.0f};
  double first_burst_s{5.0};
  double burst_period_s{60.0};
  double burst_length_s{1.0};

  // Every Nth sample reports unavailable (0 disables).
  int fail_every_n{0};

  std::uint32_t seed{1};
};

// Deterministic stand-in for a camera or microphone.
class SynthSignalSource final : public ISignalSource {
 public:
  explicit SynthSignalSource(SynthSourceConfig cfg);

  Result<float> sample() override;

  std::string name() const override { return "synth"; }

 private:
  bool in_burst(double t_s) const;

  SynthSourceConfig cfg_;
  std::int64_t tick_{0};
  std::mt19937 rng_;
};

}  // namespace sr
