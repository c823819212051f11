// File: include/sr/adapters/pcm_file/pcm_level_source.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "sr/core/io/signal_source.hpp"

namespace sr {

// Normalized to full scale (32768).
struct AudioLevels {
  float peak{0.0f};
  float rms{0.0f};
};

AudioLevels measure_levels(const std::int16_t* samples, std::size_t n);

enum class LevelMetric {
  kPeak,  // sharp sounds (claps, knocks)
  kRms,   // sustained sound
  kEither,  // max(peak, rms * rms_gain): a clap or a sustained sound
};

struct PcmLevelSourceConfig {
  std::string path;  // raw signed 16-bit little-endian, mono
  int chunk_samples{1024};
  LevelMetric metric{LevelMetric::kPeak};
  // kEither only. Set to peak_threshold / rms_threshold so that one sensor
  // threshold fires on whichever level crosses its own threshold first.
  float rms_gain{1.0f};
  bool loop{false};
};

// Audio level over a recorded PCM stream, one chunk per sample().
class PcmLevelSource final : public ISignalSource {
 public:
  explicit PcmLevelSource(PcmLevelSourceConfig cfg);

  Status open() override;
  Result<float> sample() override;
  void close() override;

  std::string name() const override { return "pcm_file"; }

 private:
  PcmLevelSourceConfig cfg_;
  std::ifstream f_;
  std::vector<std::int16_t> chunk_;
};

}  // namespace sr
