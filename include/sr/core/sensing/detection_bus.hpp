// File: include/sr/core/sensing/detection_bus.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "sr/core/types.hpp"

namespace sr {

// Bounded multi-producer / single-consumer FIFO between the sensor threads and
// the consumer loop. Per-producer order is preserved; across producers events
// come out in arrival order.
class DetectionBus {
 public:
  enum class PopResult {
    kEvent,
    kTimeout,
    kClosed,  // closed and fully drained
  };

  explicit DetectionBus(std::size_t capacity = 16);

  DetectionBus(const DetectionBus&) = delete;
  DetectionBus& operator=(const DetectionBus&) = delete;

  // Blocks while full, at most `timeout`. Returns false on timeout or when closed.
  bool push_for(const DetectionEvent& e, std::chrono::milliseconds timeout);

  // Waits until an event is available, `deadline` passes, or the bus is closed.
  // Queued events are still delivered after close().
  PopResult pop_until(DetectionEvent& out, std::chrono::steady_clock::time_point deadline);

  bool try_pop(DetectionEvent& out);

  // Wakes every waiter. Later pushes fail; queued events remain poppable.
  void close();

  [[nodiscard]] bool closed() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;
  std::deque<DetectionEvent> queue_;
  bool closed_{false};

  mutable std::mutex mu_;
  std::condition_variable cv_not_empty_;
  std::condition_variable cv_not_full_;
};

}  // namespace sr
