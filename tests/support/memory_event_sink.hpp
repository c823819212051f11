// File: tests/support/memory_event_sink.hpp
#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "sr/core/events/event_sink.hpp"

namespace sr::testing {

// Collects events in memory.
class MemoryEventSink final : public EventSink {
 public:
  Status open(const RunInfo& run) override {
    std::lock_guard<std::mutex> lk(mu_);
    run_ = run;
    open_ = true;
    ++opens_;
    return Status::ok_status();
  }

  Status emit(const Event& e) override {
    std::lock_guard<std::mutex> lk(mu_);
    if (!open_) return Status::invalid_argument("MemoryEventSink: not open");
    events_.push_back(e);
    return Status::ok_status();
  }

  Status flush() override { return Status::ok_status(); }

  void close() override {
    std::lock_guard<std::mutex> lk(mu_);
    open_ = false;
  }

  std::vector<Event> events() const {
    std::lock_guard<std::mutex> lk(mu_);
    return events_;
  }

  std::vector<Event> of_type(const std::string& type) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Event> out;
    for (const auto& e : events_) {
      if (e.type == type) out.push_back(e);
    }
    return out;
  }

  std::size_t count(const std::string& type) const { return of_type(type).size(); }

  bool is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return open_;
  }

  RunInfo run() const {
    std::lock_guard<std::mutex> lk(mu_);
    return run_;
  }

 private:
  mutable std::mutex mu_;
  RunInfo run_;
  bool open_{false};
  int opens_{0};
  std::vector<Event> events_;
};

}  // namespace sr::testing
