// File: src/adapters/sample_file/sample_file_source.cpp
#include "sr/adapters/sample_file/sample_file_source.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <utility>

namespace sr {
namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

}  // namespace

SampleFileSource::SampleFileSource(SampleFileSourceConfig cfg) : cfg_(std::move(cfg)) {}

Status SampleFileSource::open() {
  if (cfg_.path.empty()) return Status::invalid_argument("SampleFileSource: path is empty");
  close();

  std::ifstream f(cfg_.path);
  if (!f.is_open()) return Status::not_found("SampleFileSource: cannot open " + cfg_.path);

  std::string line;
  std::size_t lineno = 0;
  while (std::getline(f, line)) {
    ++lineno;
    const auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);
    line = trim(line);
    if (line.empty()) continue;

    char* end = nullptr;
    const float v = std::strtof(line.c_str(), &end);
    if (end == line.c_str() || *end != '\0') {
      values_.clear();
      return Status::parse_error("SampleFileSource: " + cfg_.path + ":" + std::to_string(lineno) +
                                 ": not a number: '" + line + "'");
    }
    if (!std::isfinite(v)) {
      values_.clear();
      return Status::parse_error("SampleFileSource: " + cfg_.path + ":" + std::to_string(lineno) +
                                 ": not a finite value: '" + line + "'");
    }
    values_.push_back(v);
  }
  if (f.bad()) return Status::io_error("SampleFileSource: read error in " + cfg_.path);

  if (values_.empty()) {
    return Status::not_found("SampleFileSource: no samples in " + cfg_.path);
  }

  opened_ = true;
  idx_ = 0;
  return Status::ok_status();
}

Result<float> SampleFileSource::sample() {
  if (!opened_) {
    return Result<float>::err(Status::unavailable("SampleFileSource::sample: not opened"));
  }

  if (idx_ >= values_.size()) {
    if (!cfg_.loop) return Result<float>::err(Status::unavailable("SampleFileSource: end of " + cfg_.path));
    idx_ = 0;
  }
  return Result<float>::ok(values_[idx_++]);
}

void SampleFileSource::close() {
  opened_ = false;
  values_.clear();
  idx_ = 0;
}

}  // namespace sr
