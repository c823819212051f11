// File: src/core/events/jsonl_event_sink.cpp
#include "sr/core/events/jsonl_event_sink.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace sr {
namespace {

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

// Messages carry file paths and status text; quote the characters JSON cares about.
std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          std::ostringstream hex;
          hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(static_cast<unsigned char>(c));
          out += hex.str();
        } else {
          out += c;
        }
    }
  }
  return out;
}

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::int64_t parse_events_epoch_ns_from_name(const std::string& name) {
  const std::string prefix = "events_";
  const std::string suffix = ".jsonl";

  // Never touch the stable tail target.
  if (name == "events_latest.jsonl") return -1;

  if (name.rfind(prefix, 0) != 0) return -1;
  if (name.size() <= prefix.size() + suffix.size()) return -1;
  if (name.substr(name.size() - suffix.size()) != suffix) return -1;

  const std::string mid =
      name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  if (!is_digits(mid) || mid.size() > 18) return -1;

  return std::stoll(mid);
}

}  // namespace

JsonlEventSink::~JsonlEventSink() { close(); }

void JsonlEventSink::prune_out_dir_(const std::string& out_dir, std::size_t keep_last) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(out_dir, ec)) return;

  struct Entry {
    std::int64_t key_epoch_ns;
    fs::path path;
  };

  std::vector<Entry> files;
  for (const auto& it : fs::directory_iterator(out_dir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;

    const std::int64_t k = parse_events_epoch_ns_from_name(it.path().filename().string());
    if (k < 0) continue;

    files.push_back(Entry{k, it.path()});
  }

  if (files.size() <= keep_last) return;

  // Newest first, delete the tail.
  std::sort(files.begin(), files.end(),
            [](const Entry& a, const Entry& b) { return a.key_epoch_ns > b.key_epoch_ns; });

  for (std::size_t i = keep_last; i < files.size(); ++i) {
    fs::remove(files[i].path, ec);
    ec.clear();  // best-effort housekeeping
  }
}

Status JsonlEventSink::open(const RunInfo& run) {
  close();

  std::error_code ec;
  std::filesystem::create_directories(run.out_dir, ec);
  if (ec) {
    return Status::io_error("failed creating out_dir '" + run.out_dir + "': " + ec.message());
  }

  // Leave room for the file this run is about to create.
  prune_out_dir_(run.out_dir, keep_last_ > 0 ? keep_last_ - 1 : 0);

  const std::int64_t wall0 = run.wall_start_time_ns.ns;
  const std::int64_t t0 = run.start_time_ns.ns;

  path_ = join_path(run.out_dir, "events_" + std::to_string(wall0) + ".jsonl");
  latest_path_ = join_path(run.out_dir, "events_latest.jsonl");

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");

  open_ = true;

  // Run header line (written to BOTH files).
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);
  ss << "{"
     << "\"type\":\"run_started\","
     << "\"t_ns\":" << t0 << ","
     << "\"t_s\":" << ns_to_s(t0) << ","
     << "\"t_wall_ns\":" << wall0 << ","
     << "\"t_wall_s\":" << ns_to_s(wall0) << ","
     << "\"station_id\":\"" << escape(run.station_id) << "\","
     << "\"config_path\":\"" << escape(run.config_path) << "\","
     << "\"config_hash\":\"" << run.config_hash << "\""
     << "}";

  SR_RETURN_IF_ERROR(write_line_(ss.str()));
  return flush();
}

Status JsonlEventSink::emit(const Event& e) {
  if (!open_) return Status::invalid_argument("JsonlEventSink::emit called while not open");

  const std::int64_t t = e.t_ns.ns;
  const std::int64_t tw = e.t_wall_ns.ns;

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);

  ss << "{"
     << "\"type\":\"" << e.type << "\","
     << "\"t_ns\":" << t << ","
     << "\"t_s\":" << ns_to_s(t) << ","
     << "\"t_wall_ns\":" << tw << ","
     << "\"t_wall_s\":" << ns_to_s(tw);

  if (e.source) ss << ",\"source\":\"" << to_string(*e.source) << "\"";
  if (e.metric) {
    // JSON has no inf/nan literals.
    ss << ",\"metric\":";
    if (std::isfinite(*e.metric)) ss << *e.metric;
    else ss << "null";
  }
  if (e.from_state) ss << ",\"from\":\"" << to_string(*e.from_state) << "\"";
  if (e.state) ss << ",\"state\":\"" << to_string(*e.state) << "\"";
  if (!e.reason.empty()) ss << ",\"reason\":\"" << escape(e.reason) << "\"";
  if (!e.message.empty()) ss << ",\"message\":\"" << escape(e.message) << "\"";

  ss << "}";

  return write_line_(ss.str());
}

Status JsonlEventSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  latest_ << line << "\n";

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");

  return Status{};
}

Status JsonlEventSink::flush() {
  if (!open_) return Status{};

  f_.flush();
  latest_.flush();

  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");

  return Status{};
}

void JsonlEventSink::close() {
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace sr
