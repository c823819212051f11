// File: include/sr/core/model/orchestrator.hpp
#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sr/core/config.hpp"
#include "sr/core/events/event_sink.hpp"
#include "sr/core/io/signal_source.hpp"
#include "sr/core/model/detection_handler.hpp"
#include "sr/core/recording/recorder_client.hpp"
#include "sr/core/recording/session_manager.hpp"
#include "sr/core/sensing/detection_bus.hpp"
#include "sr/core/sensing/sensor_port.hpp"
#include "sr/core/status.hpp"
#include "sr/core/trigger/cooldown_gate.hpp"
#include "sr/core/util/clock.hpp"

namespace sr {

// Orchestrator owns lifecycle and the single consumer loop.
//
// Startup:  recorder connect -> session manager ready -> sensor ports built
//           and started -> run().
// Shutdown: sensor ports stopped -> bus drained (events discarded) -> final
//           stop if a session is active, waiting up to stop_grace for the
//           recorder to confirm -> recorder closed.
//
// Everything that mutates cooldown or session state runs on the thread that
// calls run() / shutdown(). request_shutdown() may be called from any thread.
class Orchestrator {
 public:
  Orchestrator(Config cfg, std::string config_path, const Clock& clock, EventSink& sink,
               std::unique_ptr<RecorderClient> recorder);
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // Registers a sensor; thresholds come from cfg.sensors. Call before start().
  void add_sensor(SourceKind kind, std::unique_ptr<ISignalSource> source);
  void add_handler(std::unique_ptr<DetectionHandler> handler);

  // Opens the event sink, connects the recorder and starts the sensor ports.
  // connection_error when the recorder cannot be reached.
  Status start();

  // Consumer loop. Returns after request_shutdown() or once run.max_run_s elapsed.
  void run();

  void request_shutdown();
  [[nodiscard]] bool shutdown_requested() const { return shutdown_requested_.load(); }

  // Idempotent; also run by the destructor.
  void shutdown();

  // One step of the consumer loop, exposed for deterministic driving.
  void handle_event(const DetectionEvent& e);
  void service_timers(TimestampNs now);

  [[nodiscard]] const RecordingSessionManager& session() const { return manager_; }
  [[nodiscard]] const CooldownGate& gate() const { return gate_; }
  [[nodiscard]] DetectionBus& bus() { return bus_; }
  [[nodiscard]] const std::vector<std::unique_ptr<SensorPort>>& ports() const { return ports_; }

 private:
  struct PendingSensor {
    SourceKind kind;
    std::unique_ptr<ISignalSource> source;
  };

  void emit(Event e);
  void emit_transition(const SessionTransition& t);
  void emit_heartbeat(TimestampNs now);
  void run_handlers(const DetectionEvent& e);
  void wait_for_stop_confirmation();
  std::optional<TimestampNs> next_wakeup() const;

  Config cfg_;
  std::string config_path_;
  const Clock& clock_;
  EventSink& sink_;
  std::unique_ptr<RecorderClient> recorder_;

  DetectionBus bus_;
  CooldownGate gate_;
  RecordingSessionManager manager_;

  std::vector<PendingSensor> pending_;
  std::vector<std::unique_ptr<SensorPort>> ports_;
  std::vector<std::unique_ptr<DetectionHandler>> handlers_;

  std::optional<TimestampNs> next_heartbeat_;
  std::optional<TimestampNs> run_end_;

  std::atomic<bool> shutdown_requested_{false};
  bool started_{false};
  bool sink_open_{false};
  bool shut_down_{false};
};

}  // namespace sr
