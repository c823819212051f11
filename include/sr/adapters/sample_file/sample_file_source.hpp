// File: include/sr/adapters/sample_file/sample_file_source.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sr/core/io/signal_source.hpp"

namespace sr {

struct SampleFileSourceConfig {
  std::string path;  // one float per line; '#' starts a comment
  bool loop{false};
};

// Replays recorded sensor values. Past the last value it either wraps (loop)
// or reports unavailable.
class SampleFileSource final : public ISignalSource {
 public:
  explicit SampleFileSource(SampleFileSourceConfig cfg);

  // Call once before sample(). Keeps ctor simple (no throwing / no implicit IO).
  Status open() override;
  Result<float> sample() override;
  void close() override;

  std::string name() const override { return "sample_file"; }

  [[nodiscard]] std::size_t size() const { return values_.size(); }

 private:
  SampleFileSourceConfig cfg_;
  bool opened_{false};
  std::vector<float> values_;
  std::size_t idx_{0};
};

}  // namespace sr
