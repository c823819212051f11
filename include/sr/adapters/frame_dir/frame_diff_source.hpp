// File: include/sr/adapters/frame_dir/frame_diff_source.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "sr/core/io/signal_source.hpp"

namespace sr {

struct FrameDiffSourceConfig {
  std::string path;  // contains 000000.gray, 000001.gray, ... (raw 8-bit grayscale)
  int width{640};
  int height{480};
  int pixel_delta{25};  // |a - b| must exceed this for a pixel to count as changed
  bool loop{false};
};

// Number of pixels whose absolute difference exceeds `pixel_delta`.
// Both frames must be the same size.
std::size_t count_changed_pixels(const std::vector<std::uint8_t>& prev,
                                 const std::vector<std::uint8_t>& cur, int pixel_delta);

// Vision metric over a directory of recorded frames: each sample() reads the
// next frame and returns the changed-pixel area against the previous one. The
// first frame (and the first frame after wrapping) yields 0.
class FrameDiffSource final : public ISignalSource {
 public:
  explicit FrameDiffSource(FrameDiffSourceConfig cfg);

  Status open() override;
  Result<float> sample() override;
  void close() override;

  std::string name() const override { return "frame_dir"; }

  [[nodiscard]] std::size_t frame_count() const { return frame_paths_.size(); }

 private:
  Status load_file_list();
  Result<std::vector<std::uint8_t>> read_frame(const std::string& path) const;

  FrameDiffSourceConfig cfg_;
  bool opened_{false};

  std::vector<std::string> frame_paths_;
  std::size_t idx_{0};

  std::vector<std::uint8_t> prev_;
};

}  // namespace sr
