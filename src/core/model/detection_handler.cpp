// File: src/core/model/detection_handler.cpp
#include "sr/core/model/detection_handler.hpp"

#include <spdlog/spdlog.h>

namespace sr {

Status LogDetectionHandler::on_accepted(const DetectionEvent& e, const RecordingSession& session) {
  if (session.stop_deadline) {
    spdlog::info("Activity: {} onset metric={:.4f}; recording until t={:.3f}s", to_string(e.source),
                 e.metric, ns_to_s(session.stop_deadline->ns));
  } else {
    spdlog::info("Activity: {} onset metric={:.4f}", to_string(e.source), e.metric);
  }
  return Status::ok_status();
}

}  // namespace sr
