// File: include/sr/core/recording/session_manager.hpp
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "sr/core/recording/recorder_client.hpp"
#include "sr/core/types.hpp"

namespace sr {

struct SessionConfig {
  DurationNs recording_duration = seconds_to_ns(3600.0);
  RetriggerPolicy retrigger = RetriggerPolicy::kExtend;

  // Stopping is abandoned (forced back to Idle) after this long without confirmation.
  DurationNs stop_grace = seconds_to_ns(10.0);
  DurationNs stop_poll_interval = ms_to_ns(250);
};

struct RecordingSession {
  SessionState state = SessionState::kIdle;
  std::optional<TimestampNs> started_at;
  std::optional<TimestampNs> stop_deadline;
};

struct SessionTransition {
  SessionState from = SessionState::kIdle;
  SessionState to = SessionState::kIdle;
  TimestampNs at;
  std::string reason;  // e.g. "trigger:audio", "auto_stop", "stop_confirmed", "stop_timeout"
};

enum class TriggerOutcome {
  kStarted,   // Idle -> Recording
  kExtended,  // Recording, deadline pushed out
  kIgnored,   // Recording, ignore policy
  kFailed,    // nothing changed; the trigger did not take effect
};

inline const char* to_string(TriggerOutcome o) {
  switch (o) {
    case TriggerOutcome::kStarted: return "started";
    case TriggerOutcome::kExtended: return "extended";
    case TriggerOutcome::kIgnored: return "ignored";
    case TriggerOutcome::kFailed: return "failed";
  }
  return "unknown";
}

// Owns the one recording session and drives the recorder.
//
//   Idle      --trigger, start ok-------------> Recording
//   Idle      --trigger, start failed---------> Idle       (no cooldown consumed)
//   Recording --trigger-----------------------> Recording  (extend | ignore)
//   Recording --now >= stop_deadline----------> Stopping   (stop issued)
//   Stopping  --is_recording() == false-------> Idle
//   Stopping  --stop_grace elapsed------------> Idle       (forced, warning)
//
// A failed stop_recording() is re-issued on each poll until the grace period
// runs out. When the recorder is believed unreachable the next start first
// calls connect().
//
// Time only advances through the timestamps passed in; the manager never reads
// a clock. Single-threaded: call only from the consumer loop.
class RecordingSessionManager {
 public:
  using TransitionListener = std::function<void(const SessionTransition&)>;

  RecordingSessionManager(RecorderClient& recorder, SessionConfig cfg);

  void set_transition_listener(TransitionListener listener) { listener_ = std::move(listener); }

  // The caller has connected the recorder already (startup path).
  void mark_connected() { reachable_ = true; }

  TriggerOutcome on_trigger(const DetectionEvent& e);

  // Fires whatever timers are due at `now` (auto-stop, stop poll, stop timeout).
  void on_tick(TimestampNs now);

  // Begins a stop immediately if Recording (shutdown path). No-op otherwise.
  void stop_now(TimestampNs now, const std::string& reason);

  // Next time on_tick() has work to do, if any.
  [[nodiscard]] std::optional<TimestampNs> next_deadline() const;

  [[nodiscard]] const RecordingSession& session() const { return session_; }
  [[nodiscard]] SessionState state() const { return session_.state; }
  [[nodiscard]] bool recorder_reachable() const { return reachable_; }
  [[nodiscard]] const SessionConfig& config() const { return cfg_; }

 private:
  void transition(SessionState to, TimestampNs at, const std::string& reason);
  bool ensure_connected();
  void begin_stop(TimestampNs now, const std::string& reason);
  void advance_stop(TimestampNs now);

  RecorderClient& recorder_;
  SessionConfig cfg_;
  RecordingSession session_;
  TransitionListener listener_;

  bool reachable_{false};

  // Stopping bookkeeping.
  TimestampNs stop_issued_at_;
  TimestampNs next_poll_at_;
  bool stop_sent_{false};
};

}  // namespace sr
