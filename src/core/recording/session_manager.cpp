// File: src/core/recording/session_manager.cpp
#include "sr/core/recording/session_manager.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace sr {

RecordingSessionManager::RecordingSessionManager(RecorderClient& recorder, SessionConfig cfg)
    : recorder_(recorder), cfg_(std::move(cfg)) {}

void RecordingSessionManager::transition(SessionState to, TimestampNs at, const std::string& reason) {
  const SessionState from = session_.state;
  session_.state = to;
  if (to == SessionState::kIdle) {
    session_.started_at.reset();
    session_.stop_deadline.reset();
    stop_sent_ = false;
  }

  spdlog::info("SessionManager: {} -> {} ({}) t={:.3f}s", to_string(from), to_string(to), reason,
               ns_to_s(at.ns));

  if (listener_) listener_(SessionTransition{from, to, at, reason});
}

bool RecordingSessionManager::ensure_connected() {
  if (reachable_) return true;

  const Status st = recorder_.connect();
  if (!st.ok()) {
    spdlog::warn("SessionManager: recorder {} still unreachable: {}", recorder_.name(), st.message());
    return false;
  }
  spdlog::info("SessionManager: reconnected to recorder {}", recorder_.name());
  reachable_ = true;
  return true;
}

TriggerOutcome RecordingSessionManager::on_trigger(const DetectionEvent& e) {
  switch (session_.state) {
    case SessionState::kIdle: {
      if (!ensure_connected()) return TriggerOutcome::kFailed;

      const Status st = recorder_.start_recording();
      if (!st.ok()) {
        if (st.code() == Status::Code::kConnectionError) reachable_ = false;
        spdlog::warn("SessionManager: start failed ({}): {}", to_string(st.code()), st.message());
        return TriggerOutcome::kFailed;
      }

      session_.started_at = e.observed_at;
      session_.stop_deadline = e.observed_at + cfg_.recording_duration;
      transition(SessionState::kRecording, e.observed_at, std::string("trigger:") + to_string(e.source));
      return TriggerOutcome::kStarted;
    }

    case SessionState::kRecording: {
      if (cfg_.retrigger == RetriggerPolicy::kIgnore) {
        spdlog::info("SessionManager: already recording, retrigger from {} ignored", to_string(e.source));
        return TriggerOutcome::kIgnored;
      }
      const TimestampNs proposed = e.observed_at + cfg_.recording_duration;
      // Never pull the deadline in.
      if (!session_.stop_deadline || proposed > *session_.stop_deadline) {
        session_.stop_deadline = proposed;
      }
      spdlog::info("SessionManager: retrigger from {}, stop deadline now t={:.3f}s",
                   to_string(e.source), ns_to_s(session_.stop_deadline->ns));
      return TriggerOutcome::kExtended;
    }

    case SessionState::kStopping:
      spdlog::info("SessionManager: stop in progress, trigger from {} not taken", to_string(e.source));
      return TriggerOutcome::kFailed;
  }
  return TriggerOutcome::kFailed;
}

void RecordingSessionManager::on_tick(TimestampNs now) {
  if (session_.state == SessionState::kRecording) {
    if (session_.stop_deadline && now >= *session_.stop_deadline) {
      begin_stop(now, "auto_stop");
    }
    return;
  }

  if (session_.state == SessionState::kStopping) {
    if (now - stop_issued_at_ >= cfg_.stop_grace) {
      spdlog::warn("SessionManager: recorder did not confirm stop within {:.1f}s; assuming stopped",
                   ns_to_s(cfg_.stop_grace));
      transition(SessionState::kIdle, now, "stop_timeout");
      return;
    }
    if (now >= next_poll_at_) advance_stop(now);
  }
}

void RecordingSessionManager::stop_now(TimestampNs now, const std::string& reason) {
  if (session_.state != SessionState::kRecording) return;
  begin_stop(now, reason);
}

void RecordingSessionManager::begin_stop(TimestampNs now, const std::string& reason) {
  stop_issued_at_ = now;
  stop_sent_ = false;
  transition(SessionState::kStopping, now, reason);
  advance_stop(now);
}

void RecordingSessionManager::advance_stop(TimestampNs now) {
  next_poll_at_ = now + cfg_.stop_poll_interval;

  if (!stop_sent_) {
    if (!ensure_connected()) return;
    const Status st = recorder_.stop_recording();
    if (!st.ok()) {
      if (st.code() == Status::Code::kConnectionError) reachable_ = false;
      spdlog::warn("SessionManager: stop failed ({}): {}; will retry", to_string(st.code()), st.message());
      return;
    }
    stop_sent_ = true;
  }

  auto rec = recorder_.is_recording();
  if (!rec.ok()) {
    if (rec.status().code() == Status::Code::kConnectionError) reachable_ = false;
    spdlog::warn("SessionManager: status query failed: {}", rec.status().message());
    return;
  }
  if (!rec.value()) {
    transition(SessionState::kIdle, now, "stop_confirmed");
  }
}

std::optional<TimestampNs> RecordingSessionManager::next_deadline() const {
  switch (session_.state) {
    case SessionState::kIdle:
      return std::nullopt;
    case SessionState::kRecording:
      return session_.stop_deadline;
    case SessionState::kStopping:
      return std::min(next_poll_at_, stop_issued_at_ + cfg_.stop_grace);
  }
  return std::nullopt;
}

}  // namespace sr
