// File: src/core/sensing/detection_bus.cpp
#include "sr/core/sensing/detection_bus.hpp"

#include <algorithm>
#include <utility>

namespace sr {

DetectionBus::DetectionBus(std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {}

bool DetectionBus::push_for(const DetectionEvent& e, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  const bool has_room = cv_not_full_.wait_for(
      lock, timeout, [&] { return closed_ || queue_.size() < capacity_; });
  if (!has_room || closed_) return false;

  queue_.push_back(e);
  lock.unlock();
  cv_not_empty_.notify_one();
  return true;
}

DetectionBus::PopResult DetectionBus::pop_until(DetectionEvent& out,
                                                std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mu_);
  const bool ready =
      cv_not_empty_.wait_until(lock, deadline, [&] { return closed_ || !queue_.empty(); });

  if (!queue_.empty()) {
    out = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    cv_not_full_.notify_one();
    return PopResult::kEvent;
  }
  if (ready && closed_) return PopResult::kClosed;
  return PopResult::kTimeout;
}

bool DetectionBus::try_pop(DetectionEvent& out) {
  std::unique_lock<std::mutex> lock(mu_);
  if (queue_.empty()) return false;
  out = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();
  cv_not_full_.notify_one();
  return true;
}

void DetectionBus::close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
  }
  cv_not_empty_.notify_all();
  cv_not_full_.notify_all();
}

bool DetectionBus::closed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

std::size_t DetectionBus::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

}  // namespace sr
