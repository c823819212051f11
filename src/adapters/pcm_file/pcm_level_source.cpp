// File: src/adapters/pcm_file/pcm_level_source.cpp
#include "sr/adapters/pcm_file/pcm_level_source.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace sr {
namespace {

constexpr double kFullScale = 32768.0;

// Reads up to `max_samples` s16le samples; returns how many were decoded.
std::size_t read_s16le(std::ifstream& f, std::vector<std::int16_t>& out, std::size_t max_samples) {
  std::vector<unsigned char> raw(max_samples * 2);
  f.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
  const std::size_t n = static_cast<std::size_t>(f.gcount()) / 2;

  out.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    const auto lo = static_cast<std::uint16_t>(raw[2 * i]);
    const auto hi = static_cast<std::uint16_t>(raw[2 * i + 1]);
    out[i] = static_cast<std::int16_t>(static_cast<std::uint16_t>(lo | (hi << 8)));
  }
  return n;
}

}  // namespace

AudioLevels measure_levels(const std::int16_t* samples, std::size_t n) {
  AudioLevels lv;
  if (samples == nullptr || n == 0) return lv;

  int peak = 0;
  double sum_sq = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const int s = samples[i];
    peak = std::max(peak, std::abs(s));
    sum_sq += static_cast<double>(s) * static_cast<double>(s);
  }

  lv.peak = static_cast<float>(peak / kFullScale);
  lv.rms = static_cast<float>(std::sqrt(sum_sq / static_cast<double>(n)) / kFullScale);
  return lv;
}

PcmLevelSource::PcmLevelSource(PcmLevelSourceConfig cfg) : cfg_(std::move(cfg)) {
  cfg_.chunk_samples = std::max(1, cfg_.chunk_samples);
}

Status PcmLevelSource::open() {
  if (cfg_.path.empty()) return Status::invalid_argument("PcmLevelSource: path is empty");
  close();

  f_.open(cfg_.path, std::ios::binary);
  if (!f_.is_open()) return Status::not_found("PcmLevelSource: cannot open " + cfg_.path);
  return Status::ok_status();
}

Result<float> PcmLevelSource::sample() {
  if (!f_.is_open()) {
    return Result<float>::err(Status::unavailable("PcmLevelSource::sample: not opened"));
  }

  const auto want = static_cast<std::size_t>(cfg_.chunk_samples);
  std::size_t n = read_s16le(f_, chunk_, want);
  if (n == 0 && cfg_.loop) {
    f_.clear();
    f_.seekg(0, std::ios::beg);
    n = read_s16le(f_, chunk_, want);
  }
  if (n == 0) {
    if (f_.bad()) return Result<float>::err(Status::io_error("PcmLevelSource: read error in " + cfg_.path));
    return Result<float>::err(Status::unavailable("PcmLevelSource: end of " + cfg_.path));
  }

  const AudioLevels lv = measure_levels(chunk_.data(), n);
  switch (cfg_.metric) {
    case LevelMetric::kPeak: return Result<float>::ok(lv.peak);
    case LevelMetric::kRms: return Result<float>::ok(lv.rms);
    case LevelMetric::kEither: break;
  }
  return Result<float>::ok(std::max(lv.peak, lv.rms * cfg_.rms_gain));
}

void PcmLevelSource::close() {
  if (f_.is_open()) f_.close();
  f_.clear();
  chunk_.clear();
}

}  // namespace sr
