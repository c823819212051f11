// File: include/sr/core/events/jsonl_event_sink.hpp
#pragma once

#include <cstddef>
#include <fstream>
#include <string>

#include "sr/core/events/event_sink.hpp"
#include "sr/core/status.hpp"

namespace sr {

// JSONL sink for events.
// Writes every event line to:
//   1) a unique per-run file: events_<wall_start_time_ns>.jsonl
//   2) a stable "latest" file: events_latest.jsonl (truncated each run)
// Older per-run files beyond `keep_last` are pruned on open().
class JsonlEventSink final : public EventSink {
 public:
  explicit JsonlEventSink(std::size_t keep_last = 50) : keep_last_(keep_last) {}
  ~JsonlEventSink() override;

  const std::string& path() const { return path_; }
  const std::string& latest_path() const { return latest_path_; }

  Status open(const RunInfo& run) override;
  Status emit(const Event& e) override;
  Status flush() override;
  void close() override;

 private:
  Status write_line_(const std::string& line);
  static void prune_out_dir_(const std::string& out_dir, std::size_t keep_last);

  std::size_t keep_last_;
  bool open_{false};

  std::string path_;
  std::string latest_path_;

  std::ofstream f_;
  std::ofstream latest_;
};

}  // namespace sr
