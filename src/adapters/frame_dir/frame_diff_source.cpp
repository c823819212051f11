// File: src/adapters/frame_dir/frame_diff_source.cpp
#include "sr/adapters/frame_dir/frame_diff_source.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <utility>

namespace sr {

std::size_t count_changed_pixels(const std::vector<std::uint8_t>& prev,
                                 const std::vector<std::uint8_t>& cur, int pixel_delta) {
  const std::size_t n = std::min(prev.size(), cur.size());
  std::size_t changed = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const int d = std::abs(static_cast<int>(cur[i]) - static_cast<int>(prev[i]));
    if (d > pixel_delta) ++changed;
  }
  return changed;
}

FrameDiffSource::FrameDiffSource(FrameDiffSourceConfig cfg) : cfg_(std::move(cfg)) {}

Status FrameDiffSource::open() {
  if (cfg_.path.empty()) return Status::invalid_argument("FrameDiffSource: path is empty");
  if (cfg_.width <= 0 || cfg_.height <= 0) {
    return Status::invalid_argument("FrameDiffSource: width/height must be > 0");
  }
  close();
  SR_RETURN_IF_ERROR(load_file_list());
  opened_ = true;
  idx_ = 0;
  prev_.clear();
  return Status::ok_status();
}

Status FrameDiffSource::load_file_list() {
  namespace fs = std::filesystem;

  frame_paths_.clear();

  std::error_code ec;
  if (!fs::exists(cfg_.path, ec)) {
    return Status::not_found("FrameDiffSource: directory not found: " + cfg_.path);
  }
  if (!fs::is_directory(cfg_.path, ec)) {
    return Status::invalid_argument("FrameDiffSource: path is not a directory: " + cfg_.path);
  }

  std::vector<std::pair<std::string, std::string>> entries;
  for (const auto& it : fs::directory_iterator(cfg_.path, ec)) {
    if (ec) {
      return Status::io_error("FrameDiffSource: failed listing directory: " + cfg_.path);
    }
    if (!it.is_regular_file(ec)) continue;
    if (it.path().extension() != ".gray") continue;
    entries.push_back(std::make_pair(it.path().filename().string(), it.path().string()));
  }

  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  for (const auto& e : entries) frame_paths_.push_back(e.second);

  if (frame_paths_.empty()) {
    return Status::not_found("FrameDiffSource: no .gray files found in " + cfg_.path);
  }
  return Status::ok_status();
}

Result<std::vector<std::uint8_t>> FrameDiffSource::read_frame(const std::string& path) const {
  using Bytes = std::vector<std::uint8_t>;

  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) {
    return Result<Bytes>::err(Status::unavailable("FrameDiffSource: failed to open " + path));
  }

  f.seekg(0, std::ios::end);
  const std::streamoff nbytes = f.tellg();
  f.seekg(0, std::ios::beg);

  const std::streamoff expected =
      static_cast<std::streamoff>(cfg_.width) * static_cast<std::streamoff>(cfg_.height);
  if (nbytes != expected) {
    return Result<Bytes>::err(Status::corrupt_data(
        "FrameDiffSource: " + path + " is " + std::to_string(nbytes) + " bytes, expected " +
        std::to_string(expected)));
  }

  Bytes buf(static_cast<std::size_t>(expected));
  f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (!f) return Result<Bytes>::err(Status::unavailable("FrameDiffSource: short read on " + path));

  return Result<Bytes>::ok(std::move(buf));
}

Result<float> FrameDiffSource::sample() {
  if (!opened_) {
    return Result<float>::err(Status::unavailable("FrameDiffSource::sample: not opened"));
  }

  if (idx_ >= frame_paths_.size()) {
    if (!cfg_.loop) return Result<float>::err(Status::unavailable("FrameDiffSource: no more frames"));
    idx_ = 0;
    prev_.clear();  // the wrap is a cut, not motion
  }

  auto frame_r = read_frame(frame_paths_[idx_]);
  ++idx_;
  if (!frame_r.ok()) return Result<float>::err(frame_r.status());

  std::vector<std::uint8_t> frame = frame_r.take_value();
  const float area =
      prev_.empty() ? 0.0f : static_cast<float>(count_changed_pixels(prev_, frame, cfg_.pixel_delta));
  prev_ = std::move(frame);
  return Result<float>::ok(area);
}

void FrameDiffSource::close() {
  opened_ = false;
  frame_paths_.clear();
  prev_.clear();
  idx_ = 0;
}

}  // namespace sr
