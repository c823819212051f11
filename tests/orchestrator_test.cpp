// File: tests/orchestrator_test.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "support/memory_event_sink.hpp"
#include "support/scripted_source.hpp"
#include "sr/adapters/sim_recorder/sim_recorder_client.hpp"
#include "sr/core/model/orchestrator.hpp"

namespace sr {
namespace {

using namespace std::chrono_literals;
using testing::MemoryEventSink;
using testing::ScriptedSource;
using testing::ScriptState;

TimestampNs at_s(double s) { return TimestampNs{seconds_to_ns(s)}; }

DetectionEvent onset(double s, SourceKind k, float metric = 1.0f) {
  return DetectionEvent{k, at_s(s), metric};
}

Config base_config() {
  Config cfg;
  cfg.sensors.vision.enabled = false;
  cfg.sensors.audio.sample_interval_ms = 20;
  cfg.output.heartbeat_every_s = 0;
  cfg.recording.stop_grace_ns = seconds_to_ns(1.0);
  cfg.recording.stop_poll_ns = ms_to_ns(10);
  return cfg;
}

// Never crosses the threshold.
std::unique_ptr<ISignalSource> quiet_source() {
  return std::make_unique<ScriptedSource>(std::vector<std::optional<float>>{}, 0.0f,
                                          std::make_shared<ScriptState>());
}

class CountingHandler final : public DetectionHandler {
 public:
  explicit CountingHandler(std::shared_ptr<std::vector<SessionState>> seen) : seen_(std::move(seen)) {}
  Status on_accepted(const DetectionEvent&, const RecordingSession& s) override {
    seen_->push_back(s.state);
    return Status::ok_status();
  }
  std::string name() const override { return "counting"; }

 private:
  std::shared_ptr<std::vector<SessionState>> seen_;
};

class FailingHandler final : public DetectionHandler {
 public:
  Status on_accepted(const DetectionEvent&, const RecordingSession&) override {
    return Status::internal("notifier offline");
  }
  std::string name() const override { return "failing"; }
};

class OrchestratorTest : public ::testing::Test {
 protected:
  void make(Config cfg, SimRecorderConfig rc = {}) {
    auto rec = std::make_unique<SimRecorderClient>(rc);
    recorder_ = rec.get();
    orch_ = std::make_unique<Orchestrator>(cfg, "test.yaml", clock_, sink_, std::move(rec));
    orch_->add_sensor(SourceKind::kAudio, quiet_source());
  }

  ManualClock clock_;
  MemoryEventSink sink_;
  SimRecorderClient* recorder_{nullptr};
  std::unique_ptr<Orchestrator> orch_;
};

TEST_F(OrchestratorTest, CooldownExtendScenario) {
  make(base_config());  // cooldown 30 s, duration 3600 s, extend
  ASSERT_TRUE(orch_->start().ok());

  orch_->handle_event(onset(0.0, SourceKind::kVision));
  EXPECT_EQ(orch_->session().state(), SessionState::kRecording);
  EXPECT_EQ(*orch_->session().session().stop_deadline, at_s(3600.0));

  orch_->handle_event(onset(40.0, SourceKind::kAudio));
  EXPECT_EQ(*orch_->session().session().stop_deadline, at_s(3640.0));

  orch_->handle_event(onset(45.0, SourceKind::kVision));
  EXPECT_EQ(*orch_->session().session().stop_deadline, at_s(3640.0));
  EXPECT_EQ(*orch_->gate().last_accepted_at(), at_s(40.0));

  orch_->service_timers(at_s(3600.0));
  EXPECT_EQ(orch_->session().state(), SessionState::kRecording);
  orch_->service_timers(at_s(3640.0));
  EXPECT_EQ(orch_->session().state(), SessionState::kIdle);

  const auto accepted = sink_.of_type("detection_accepted");
  ASSERT_EQ(accepted.size(), 2u);
  EXPECT_EQ(accepted[0].reason, "started");
  EXPECT_EQ(accepted[1].reason, "extended");
  EXPECT_EQ(*accepted[1].source, SourceKind::kAudio);

  const auto suppressed = sink_.of_type("detection_suppressed");
  ASSERT_EQ(suppressed.size(), 1u);
  EXPECT_EQ(suppressed[0].t_ns, at_s(45.0));

  EXPECT_EQ(sink_.count("session_state"), 3u);
  EXPECT_EQ(recorder_->counters().starts, 1u);
  EXPECT_EQ(recorder_->counters().stops, 1u);
}

TEST_F(OrchestratorTest, FailedStartDoesNotConsumeCooldown) {
  make(base_config());
  ASSERT_TRUE(orch_->start().ok());

  recorder_->set_externally_recording(true);
  orch_->handle_event(onset(0.0, SourceKind::kAudio));
  EXPECT_EQ(orch_->session().state(), SessionState::kIdle);
  EXPECT_FALSE(orch_->gate().last_accepted_at().has_value());
  EXPECT_EQ(sink_.count("trigger_failed"), 1u);
  EXPECT_EQ(sink_.count("detection_accepted"), 0u);

  recorder_->set_externally_recording(false);
  orch_->handle_event(onset(1.0, SourceKind::kAudio));
  EXPECT_EQ(orch_->session().state(), SessionState::kRecording);
  EXPECT_EQ(*orch_->gate().last_accepted_at(), at_s(1.0));
}

TEST_F(OrchestratorTest, RecorderOutageRecoversOnLaterTrigger) {
  Config cfg = base_config();
  cfg.trigger.cooldown_ns = 0;
  make(cfg);
  ASSERT_TRUE(orch_->start().ok());

  recorder_->set_reachable(false);
  orch_->handle_event(onset(0.0, SourceKind::kVision));
  orch_->handle_event(onset(1.0, SourceKind::kVision));
  EXPECT_EQ(orch_->session().state(), SessionState::kIdle);
  EXPECT_EQ(sink_.count("trigger_failed"), 2u);

  recorder_->set_reachable(true);
  orch_->handle_event(onset(2.0, SourceKind::kVision));
  EXPECT_EQ(orch_->session().state(), SessionState::kRecording);
  EXPECT_TRUE(orch_->session().recorder_reachable());
}

TEST_F(OrchestratorTest, HandlerFailureDoesNotStopOthers) {
  make(base_config());
  auto seen = std::make_shared<std::vector<SessionState>>();
  orch_->add_handler(std::make_unique<FailingHandler>());
  orch_->add_handler(std::make_unique<CountingHandler>(seen));
  ASSERT_TRUE(orch_->start().ok());

  orch_->handle_event(onset(0.0, SourceKind::kAudio));
  orch_->handle_event(onset(5.0, SourceKind::kAudio));  // suppressed, no handlers

  ASSERT_EQ(seen->size(), 1u);
  EXPECT_EQ((*seen)[0], SessionState::kRecording);
  const auto failed = sink_.of_type("handler_failed");
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0].reason, "failing");
  EXPECT_EQ(orch_->session().state(), SessionState::kRecording);
}

TEST_F(OrchestratorTest, ShutdownWhileRecordingStopsTheRecorder) {
  make(base_config());
  ASSERT_TRUE(orch_->start().ok());
  orch_->handle_event(onset(0.0, SourceKind::kAudio));
  ASSERT_EQ(orch_->session().state(), SessionState::kRecording);

  clock_.set(at_s(12.0));
  orch_->shutdown();

  EXPECT_EQ(orch_->session().state(), SessionState::kIdle);
  EXPECT_EQ(recorder_->counters().stops, 1u);
  EXPECT_FALSE(recorder_->recording());
  EXPECT_FALSE(recorder_->connected());
  for (const auto& port : orch_->ports()) EXPECT_FALSE(port->running());

  const auto transitions = sink_.of_type("session_state");
  ASSERT_EQ(transitions.size(), 3u);
  EXPECT_EQ(transitions[1].reason, "shutdown");
  EXPECT_EQ(transitions[1].t_ns, at_s(12.0));

  const auto events = sink_.events();
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().type, "shutdown");
  EXPECT_EQ(events.back().reason, "clean");
  EXPECT_FALSE(sink_.is_open());

  orch_->shutdown();  // idempotent
  EXPECT_EQ(recorder_->counters().stops, 1u);
}

TEST_F(OrchestratorTest, ShutdownWhileIdleIssuesNoStop) {
  make(base_config());
  ASSERT_TRUE(orch_->start().ok());
  orch_->shutdown();

  EXPECT_EQ(recorder_->counters().stops, 0u);
  EXPECT_EQ(sink_.count("session_state"), 0u);
}

TEST_F(OrchestratorTest, PendingEventsAreDiscardedAtShutdown) {
  make(base_config());
  ASSERT_TRUE(orch_->start().ok());

  ASSERT_TRUE(orch_->bus().push_for(onset(1.0, SourceKind::kVision), 0ms));
  ASSERT_TRUE(orch_->bus().push_for(onset(2.0, SourceKind::kAudio), 0ms));
  orch_->shutdown();

  EXPECT_EQ(sink_.count("detection_discarded"), 2u);
  EXPECT_EQ(sink_.count("detection_accepted"), 0u);
  EXPECT_EQ(recorder_->counters().start_attempts, 0u);
}

TEST_F(OrchestratorTest, StartFailsWhenRecorderUnreachable) {
  SimRecorderConfig rc;
  rc.reachable = false;
  make(base_config(), rc);

  const Status st = orch_->start();
  EXPECT_EQ(st.code(), Status::Code::kConnectionError);
  EXPECT_TRUE(orch_->ports().empty());

  const auto shutdowns = sink_.of_type("shutdown");
  ASSERT_EQ(shutdowns.size(), 1u);
  EXPECT_EQ(shutdowns[0].reason, "recorder_unreachable");

  orch_->shutdown();
  EXPECT_EQ(sink_.of_type("shutdown").back().reason, "aborted");
}

TEST(OrchestratorStartTest, RequiresAtLeastOneSensor) {
  ManualClock clock;
  MemoryEventSink sink;
  Orchestrator orch(base_config(), "test.yaml", clock, sink, std::make_unique<SimRecorderClient>());
  EXPECT_EQ(orch.start().code(), Status::Code::kInvalidArgument);
}

TEST_F(OrchestratorTest, HeartbeatReportsCurrentState) {
  Config cfg = base_config();
  cfg.output.heartbeat_every_s = 30;
  make(cfg);
  ASSERT_TRUE(orch_->start().ok());

  orch_->service_timers(at_s(29.0));
  EXPECT_EQ(sink_.count("heartbeat"), 0u);

  orch_->service_timers(at_s(30.0));
  orch_->handle_event(onset(31.0, SourceKind::kAudio));
  orch_->service_timers(at_s(45.0));
  orch_->service_timers(at_s(60.0));

  const auto beats = sink_.of_type("heartbeat");
  ASSERT_EQ(beats.size(), 2u);
  EXPECT_EQ(beats[0].message, "MONITORING");
  EXPECT_EQ(*beats[0].state, SessionState::kIdle);
  EXPECT_EQ(beats[1].message, "RECORDING");
}

TEST_F(OrchestratorTest, RunInfoCarriesIdentity) {
  Config cfg = base_config();
  cfg.station_id = "garage";
  make(cfg);
  ASSERT_TRUE(orch_->start().ok());

  const RunInfo run = sink_.run();
  EXPECT_EQ(run.station_id, "garage");
  EXPECT_EQ(run.config_path, "test.yaml");
  EXPECT_EQ(run.config_hash.size(), 16u);
}

// Real threads and a real clock: one onset starts a short recording that stops
// on its own before the run ends.
TEST(OrchestratorLiveTest, OnsetRecordsThenAutoStops) {
  Config cfg = base_config();
  cfg.sensors.audio.sample_interval_ms = 5;
  cfg.trigger.cooldown_ns = 0;
  cfg.recording.duration_ns = ms_to_ns(200);
  cfg.run.max_run_s = 1.0;

  SteadyClock clock;
  MemoryEventSink sink;
  auto rec = std::make_unique<SimRecorderClient>();
  SimRecorderClient* recorder = rec.get();

  Orchestrator orch(cfg, "live.yaml", clock, sink, std::move(rec));
  auto state = std::make_shared<ScriptState>();
  orch.add_sensor(SourceKind::kAudio,
                  std::make_unique<ScriptedSource>(
                      std::vector<std::optional<float>>{0.0f, 0.1f, 0.9f}, 0.9f, state));
  ASSERT_TRUE(orch.start().ok());

  orch.run();
  orch.shutdown();

  EXPECT_EQ(sink.count("detection_accepted"), 1u);
  const auto transitions = sink.of_type("session_state");
  ASSERT_EQ(transitions.size(), 3u);
  EXPECT_EQ(transitions[0].reason, "trigger:audio");
  EXPECT_EQ(transitions[1].reason, "auto_stop");
  EXPECT_EQ(transitions[2].reason, "stop_confirmed");
  EXPECT_GE(transitions[1].t_ns - transitions[0].t_ns, ms_to_ns(200));

  EXPECT_EQ(recorder->counters().starts, 1u);
  EXPECT_EQ(recorder->counters().stops, 1u);

  const auto shutdowns = sink.of_type("shutdown");
  ASSERT_EQ(shutdowns.size(), 2u);
  EXPECT_EQ(shutdowns[0].reason, "max_run");
  EXPECT_EQ(shutdowns[1].reason, "clean");
}

TEST(OrchestratorLiveTest, RequestShutdownUnblocksRun) {
  Config cfg = base_config();
  SteadyClock clock;
  MemoryEventSink sink;
  Orchestrator orch(cfg, "live.yaml", clock, sink, std::make_unique<SimRecorderClient>());
  orch.add_sensor(SourceKind::kAudio, quiet_source());
  ASSERT_TRUE(orch.start().ok());

  std::atomic<bool> returned{false};
  std::thread runner([&] {
    orch.run();
    returned = true;
  });

  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(returned.load());
  const auto t0 = std::chrono::steady_clock::now();
  orch.request_shutdown();
  runner.join();

  EXPECT_LT(std::chrono::steady_clock::now() - t0, 1500ms);
  EXPECT_TRUE(orch.shutdown_requested());
  orch.shutdown();
  EXPECT_EQ(sink.of_type("shutdown").back().reason, "clean");
}

}  // namespace
}  // namespace sr
