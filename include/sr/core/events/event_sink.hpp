// File: include/sr/core/events/event_sink.hpp
#pragma once

#include <optional>
#include <string>

#include "sr/core/status.hpp"
#include "sr/core/types.hpp"

namespace sr {

// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  StationId station_id;
  std::string config_path;
  std::string out_dir;
  std::string config_hash;

  // Contract: logical time starts at zero. Wall time is absolute epoch.
  TimestampNs start_time_ns{0};
  TimestampNs wall_start_time_ns{0};
};

struct Event {
  std::string type;  // e.g. "detection_accepted", "session_state", "heartbeat"
  TimestampNs t_ns;
  TimestampNs t_wall_ns;

  // Optional fields; omitted from output when unset.
  std::optional<SourceKind> source;
  std::optional<float> metric;
  std::optional<SessionState> state;       // resulting session state
  std::optional<SessionState> from_state;  // session_state events only
  std::string reason;

  std::string message;  // optional human-readable hint
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace sr
