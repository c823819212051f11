// File: include/sr/core/trigger/cooldown_gate.hpp
#pragma once

#include <optional>

#include "sr/core/types.hpp"

namespace sr {

// Debounce over accepted triggers.
//
// An event is admitted iff nothing was accepted yet, or
//   event.observed_at - last_accepted_at >= window.
// The window is measured from the last *accepted* event only; rejected events
// never move it. A zero window admits everything.
//
// Two-phase: admits() is a pure check, commit() records the acceptance.
// Callers commit only once the trigger took effect, so a failed recording
// start leaves the gate armed.
//
// Owned by the consumer loop; not thread-safe.
class CooldownGate {
 public:
  explicit CooldownGate(DurationNs window) : window_(window < 0 ? 0 : window) {}

  [[nodiscard]] bool admits(const DetectionEvent& e) const;

  // last_accepted_at never moves backwards.
  void commit(const DetectionEvent& e);

  [[nodiscard]] DurationNs window() const { return window_; }
  [[nodiscard]] std::optional<TimestampNs> last_accepted_at() const { return last_accepted_at_; }

 private:
  DurationNs window_;
  std::optional<TimestampNs> last_accepted_at_;
};

}  // namespace sr
