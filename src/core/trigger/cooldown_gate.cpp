// File: src/core/trigger/cooldown_gate.cpp
#include "sr/core/trigger/cooldown_gate.hpp"

namespace sr {

bool CooldownGate::admits(const DetectionEvent& e) const {
  if (!last_accepted_at_) return true;
  if (window_ == 0) return true;
  return (e.observed_at - *last_accepted_at_) >= window_;
}

void CooldownGate::commit(const DetectionEvent& e) {
  // Cross-source arrival order is not timestamp order.
  if (last_accepted_at_ && e.observed_at < *last_accepted_at_) return;
  last_accepted_at_ = e.observed_at;
}

}  // namespace sr
