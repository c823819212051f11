// File: src/core/model/orchestrator.cpp
#include "sr/core/model/orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "sr/core/util/repro_hash.hpp"

namespace sr {
namespace {

// Upper bound on a single consumer wait when no timer is pending.
constexpr DurationNs kMaxIdleWaitNs = seconds_to_ns(1.0);

SessionConfig session_config_from(const RecordingConfig& r) {
  SessionConfig sc;
  sc.recording_duration = r.duration_ns;
  sc.retrigger = r.retrigger;
  sc.stop_grace = r.stop_grace_ns;
  sc.stop_poll_interval = r.stop_poll_ns;
  return sc;
}

ThresholdConfig threshold_for(const Config& cfg, SourceKind kind) {
  const SensorConfig& s = (kind == SourceKind::kVision) ? cfg.sensors.vision : cfg.sensors.audio;
  return ThresholdConfig{s.threshold, s.sample_interval_ms};
}

const char* status_word(SessionState s) {
  switch (s) {
    case SessionState::kIdle: return "MONITORING";
    case SessionState::kRecording: return "RECORDING";
    case SessionState::kStopping: return "STOPPING";
  }
  return "UNKNOWN";
}

void earliest(std::optional<TimestampNs>& acc, const std::optional<TimestampNs>& t) {
  if (!t) return;
  if (!acc || *t < *acc) acc = t;
}

}  // namespace

Orchestrator::Orchestrator(Config cfg, std::string config_path, const Clock& clock, EventSink& sink,
                           std::unique_ptr<RecorderClient> recorder)
    : cfg_(std::move(cfg)),
      config_path_(std::move(config_path)),
      clock_(clock),
      sink_(sink),
      recorder_(std::move(recorder)),
      bus_(static_cast<std::size_t>(std::max(1, cfg_.bus.capacity))),
      gate_(cfg_.trigger.cooldown_ns),
      manager_(*recorder_, session_config_from(cfg_.recording)) {
  manager_.set_transition_listener([this](const SessionTransition& t) { emit_transition(t); });
}

Orchestrator::~Orchestrator() { shutdown(); }

void Orchestrator::add_sensor(SourceKind kind, std::unique_ptr<ISignalSource> source) {
  pending_.push_back(PendingSensor{kind, std::move(source)});
}

void Orchestrator::add_handler(std::unique_ptr<DetectionHandler> handler) {
  if (handler) handlers_.push_back(std::move(handler));
}

void Orchestrator::emit(Event e) {
  if (!sink_open_) return;
  e.t_wall_ns = clock_.wall_at(e.t_ns);

  Status st = sink_.emit(e);
  if (st.ok()) st = sink_.flush();
  if (!st.ok()) spdlog::error("Orchestrator: event sink: {}", st.message());
}

void Orchestrator::emit_transition(const SessionTransition& t) {
  Event e;
  e.type = "session_state";
  e.t_ns = t.at;
  e.from_state = t.from;
  e.state = t.to;
  e.reason = t.reason;
  emit(std::move(e));
}

void Orchestrator::emit_heartbeat(TimestampNs now) {
  const SessionState s = manager_.state();
  spdlog::info("Status: {}", status_word(s));

  Event e;
  e.type = "heartbeat";
  e.t_ns = now;
  e.state = s;
  e.message = status_word(s);
  emit(std::move(e));
}

Status Orchestrator::start() {
  if (started_) return Status::ok_status();
  if (pending_.empty()) return Status::invalid_argument("Orchestrator: no sensors registered");

  RunInfo run;
  run.station_id = cfg_.station_id;
  run.config_path = config_path_;
  run.out_dir = cfg_.output.out_dir;
  run.config_hash = compute_config_hash(cfg_);
  run.start_time_ns = TimestampNs{0};
  run.wall_start_time_ns = clock_.wall_start();

  SR_RETURN_IF_ERROR(sink_.open(run));
  sink_open_ = true;

  const Status st = recorder_->connect();
  if (!st.ok()) {
    spdlog::error("Orchestrator: cannot reach recorder {} at {}:{}: {}", recorder_->name(),
                  cfg_.recorder.host, cfg_.recorder.port, st.message());
    Event e;
    e.type = "shutdown";
    e.t_ns = clock_.now();
    e.reason = "recorder_unreachable";
    e.message = st.message();
    emit(std::move(e));
    return st;
  }
  manager_.mark_connected();
  spdlog::info("Orchestrator: connected to recorder {} at {}:{}", recorder_->name(),
               cfg_.recorder.host, cfg_.recorder.port);

  for (auto& p : pending_) {
    ports_.push_back(std::make_unique<SensorPort>(p.kind, threshold_for(cfg_, p.kind),
                                                  std::move(p.source), bus_, clock_));
  }
  pending_.clear();

  for (auto& port : ports_) {
    SR_RETURN_IF_ERROR(port->start());
  }

  const TimestampNs now = clock_.now();
  if (cfg_.output.heartbeat_every_s > 0) {
    next_heartbeat_ = now + seconds_to_ns(cfg_.output.heartbeat_every_s);
  }
  if (cfg_.run.max_run_s > 0.0) {
    run_end_ = now + seconds_to_ns(cfg_.run.max_run_s);
  }

  started_ = true;
  spdlog::info("Orchestrator: monitoring with {} sensor(s); cooldown={:.1f}s duration={:.1f}s retrigger={}",
               ports_.size(), ns_to_s(cfg_.trigger.cooldown_ns), ns_to_s(cfg_.recording.duration_ns),
               to_string(cfg_.recording.retrigger));
  return Status::ok_status();
}

void Orchestrator::run_handlers(const DetectionEvent& e) {
  for (auto& h : handlers_) {
    const Status st = h->on_accepted(e, manager_.session());
    if (st.ok()) continue;

    spdlog::error("Orchestrator: handler '{}' failed: {}", h->name(), st.message());
    Event ev;
    ev.type = "handler_failed";
    ev.t_ns = e.observed_at;
    ev.source = e.source;
    ev.reason = h->name();
    ev.message = st.message();
    emit(std::move(ev));
  }
}

void Orchestrator::handle_event(const DetectionEvent& e) {
  if (!gate_.admits(e)) {
    spdlog::info("Orchestrator: {} event suppressed (cooldown) metric={:.4f} state={}",
                 to_string(e.source), e.metric, to_string(manager_.state()));
    Event ev;
    ev.type = "detection_suppressed";
    ev.t_ns = e.observed_at;
    ev.source = e.source;
    ev.metric = e.metric;
    ev.state = manager_.state();
    emit(std::move(ev));
    return;
  }

  const TriggerOutcome outcome = manager_.on_trigger(e);
  if (outcome == TriggerOutcome::kFailed) {
    // Cooldown stays armed so the next onset retries.
    spdlog::warn("Orchestrator: {} trigger did not take effect; state={}", to_string(e.source),
                 to_string(manager_.state()));
    Event ev;
    ev.type = "trigger_failed";
    ev.t_ns = e.observed_at;
    ev.source = e.source;
    ev.metric = e.metric;
    ev.state = manager_.state();
    emit(std::move(ev));
    return;
  }

  gate_.commit(e);
  spdlog::info("Orchestrator: {} event accepted metric={:.4f} -> {} state={}", to_string(e.source),
               e.metric, to_string(outcome), to_string(manager_.state()));
  Event ev;
  ev.type = "detection_accepted";
  ev.t_ns = e.observed_at;
  ev.source = e.source;
  ev.metric = e.metric;
  ev.state = manager_.state();
  ev.reason = to_string(outcome);
  emit(std::move(ev));

  run_handlers(e);
}

void Orchestrator::service_timers(TimestampNs now) {
  manager_.on_tick(now);

  if (next_heartbeat_ && now >= *next_heartbeat_) {
    emit_heartbeat(now);
    next_heartbeat_ = now + seconds_to_ns(cfg_.output.heartbeat_every_s);
  }
}

std::optional<TimestampNs> Orchestrator::next_wakeup() const {
  std::optional<TimestampNs> t = manager_.next_deadline();
  earliest(t, next_heartbeat_);
  earliest(t, run_end_);
  return t;
}

void Orchestrator::run() {
  if (!started_) {
    spdlog::error("Orchestrator: run() called before a successful start()");
    return;
  }

  bool bus_closed = false;
  while (!shutdown_requested_ && !bus_closed) {
    const TimestampNs now = clock_.now();
    if (run_end_ && now >= *run_end_) {
      spdlog::info("Orchestrator: max_run_s reached");
      Event e;
      e.type = "shutdown";
      e.t_ns = now;
      e.reason = "max_run";
      emit(std::move(e));
      break;
    }

    service_timers(now);

    DurationNs wait_ns = kMaxIdleWaitNs;
    if (const auto wake = next_wakeup()) {
      wait_ns = std::clamp<DurationNs>(*wake - clock_.now(), 0, kMaxIdleWaitNs);
    }

    DetectionEvent e;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::nanoseconds(wait_ns);
    switch (bus_.pop_until(e, deadline)) {
      case DetectionBus::PopResult::kEvent:
        handle_event(e);
        break;
      case DetectionBus::PopResult::kClosed:
        bus_closed = true;
        break;
      case DetectionBus::PopResult::kTimeout:
        break;
    }
  }
}

void Orchestrator::request_shutdown() {
  if (shutdown_requested_.exchange(true)) return;
  spdlog::info("Orchestrator: shutdown requested");
  bus_.close();
}

void Orchestrator::wait_for_stop_confirmation() {
  using clock = std::chrono::steady_clock;
  const auto give_up = clock::now() + std::chrono::nanoseconds(cfg_.recording.stop_grace_ns) +
                       std::chrono::seconds(1);

  while (manager_.state() == SessionState::kStopping) {
    if (clock::now() > give_up) {
      spdlog::warn("Orchestrator: gave up waiting for the recorder to confirm stop");
      break;
    }
    if (const auto dl = manager_.next_deadline()) {
      const DurationNs remaining =
          std::clamp<DurationNs>(*dl - clock_.now(), 0, cfg_.recording.stop_poll_ns);
      if (remaining > 0) std::this_thread::sleep_for(std::chrono::nanoseconds(remaining));
    }
    manager_.on_tick(clock_.now());
  }
}

void Orchestrator::shutdown() {
  if (shut_down_) return;
  shut_down_ = true;
  shutdown_requested_ = true;

  for (auto& port : ports_) port->stop();

  bus_.close();
  DetectionEvent e;
  std::size_t discarded = 0;
  while (bus_.try_pop(e)) {
    ++discarded;
    Event ev;
    ev.type = "detection_discarded";
    ev.t_ns = e.observed_at;
    ev.source = e.source;
    ev.metric = e.metric;
    ev.state = manager_.state();
    emit(std::move(ev));
  }
  if (discarded > 0) spdlog::info("Orchestrator: discarded {} pending event(s) at shutdown", discarded);

  if (manager_.state() == SessionState::kRecording) {
    spdlog::info("Orchestrator: stopping active recording before exit");
    manager_.stop_now(clock_.now(), "shutdown");
  }
  if (manager_.state() == SessionState::kStopping) wait_for_stop_confirmation();

  if (recorder_) recorder_->close();

  if (sink_open_) {
    Event ev;
    ev.type = "shutdown";
    ev.t_ns = clock_.now();
    ev.state = manager_.state();
    ev.reason = started_ ? "clean" : "aborted";
    emit(std::move(ev));
    sink_.close();
    sink_open_ = false;
  }
  if (started_) spdlog::info("Orchestrator: stopped");
}

}  // namespace sr
