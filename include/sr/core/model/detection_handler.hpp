// File: include/sr/core/model/detection_handler.hpp
#pragma once

#include <string>

#include "sr/core/recording/session_manager.hpp"
#include "sr/core/status.hpp"
#include "sr/core/types.hpp"

namespace sr {

// Extension point run by the orchestrator after an event has been accepted and
// applied to the session. Handlers run in registration order; an error from one
// is logged and does not stop the rest.
class DetectionHandler {
 public:
  virtual ~DetectionHandler() = default;

  virtual Status on_accepted(const DetectionEvent& e, const RecordingSession& session) = 0;

  virtual std::string name() const = 0;
};

// Logs each accepted activity onset.
class LogDetectionHandler final : public DetectionHandler {
 public:
  Status on_accepted(const DetectionEvent& e, const RecordingSession& session) override;
  std::string name() const override { return "log"; }
};

}  // namespace sr
