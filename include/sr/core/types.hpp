// File: include/sr/core/types.hpp
#pragma once

#include <cstdint>
#include <string>

namespace sr {

// -----------------------------
// Basic identifiers
// -----------------------------

using StationId = std::string;  // e.g. "station_001"

// -----------------------------
// Time
// -----------------------------
// Timestamps are integer nanoseconds since run start (steady clock).
// Durations are plain int64 nanoseconds.

using DurationNs = std::int64_t;

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
  constexpr bool operator<=(const TimestampNs& other) const noexcept { return ns <= other.ns; }
  constexpr bool operator>(const TimestampNs& other) const noexcept { return ns > other.ns; }
  constexpr bool operator>=(const TimestampNs& other) const noexcept { return ns >= other.ns; }

  constexpr TimestampNs operator+(DurationNs d) const noexcept { return TimestampNs{ns + d}; }
  constexpr DurationNs operator-(const TimestampNs& other) const noexcept { return ns - other.ns; }
};

constexpr DurationNs seconds_to_ns(double seconds) {
  return static_cast<DurationNs>(seconds * 1'000'000'000.0);
}

constexpr DurationNs ms_to_ns(std::int64_t ms) { return ms * 1'000'000; }

constexpr double ns_to_s(std::int64_t ns) { return static_cast<double>(ns) * 1e-9; }

// -----------------------------
// Detection
// -----------------------------

enum class SourceKind {
  kVision,
  kAudio,
};

inline const char* to_string(SourceKind k) {
  return k == SourceKind::kVision ? "vision" : "audio";
}

// Emitted by a SensorPort on a below -> at/above threshold transition.
struct DetectionEvent {
  SourceKind source = SourceKind::kVision;
  TimestampNs observed_at;
  float metric = 0.0f;  // raw sample value that crossed the threshold
};

// -----------------------------
// Recording session
// -----------------------------

enum class SessionState {
  kIdle,
  kRecording,
  kStopping,  // stop issued, waiting for the recorder to confirm
};

inline const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::kIdle: return "idle";
    case SessionState::kRecording: return "recording";
    case SessionState::kStopping: return "stopping";
  }
  return "unknown";
}

// What an accepted event does to a session that is already recording.
enum class RetriggerPolicy {
  kIgnore,  // keep the original deadline
  kExtend,  // deadline = event time + recording duration
};

inline const char* to_string(RetriggerPolicy p) {
  return p == RetriggerPolicy::kIgnore ? "ignore" : "extend";
}

}  // namespace sr
