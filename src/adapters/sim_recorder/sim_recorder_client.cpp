// File: src/adapters/sim_recorder/sim_recorder_client.cpp
#include "sr/adapters/sim_recorder/sim_recorder_client.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace sr {

SimRecorderClient::SimRecorderClient(SimRecorderConfig cfg) : cfg_(std::move(cfg)) {
  cfg_.stop_ack_polls = std::max(0, cfg_.stop_ack_polls);
}

Status SimRecorderClient::check_link_locked() const {
  if (!cfg_.reachable) return Status::connection_error("recorder unreachable at " + cfg_.endpoint);
  if (!connected_) return Status::connection_error("recorder not connected");
  return Status::ok_status();
}

Status SimRecorderClient::connect() {
  std::lock_guard<std::mutex> lk(mu_);
  ++counters_.connects;
  if (!cfg_.reachable) {
    connected_ = false;
    return Status::connection_error("recorder unreachable at " + cfg_.endpoint);
  }
  connected_ = true;
  spdlog::debug("SimRecorder: connected to {}", cfg_.endpoint);
  return Status::ok_status();
}

Status SimRecorderClient::start_recording() {
  std::lock_guard<std::mutex> lk(mu_);
  ++counters_.start_attempts;
  SR_RETURN_IF_ERROR(check_link_locked());

  if (cfg_.externally_recording) return Status::busy("recorder is already recording (external)");
  if (recording_ || pending_ack_polls_ > 0) return Status::busy("recorder is already recording");

  recording_ = true;
  ++counters_.starts;
  spdlog::debug("SimRecorder: recording started");
  return Status::ok_status();
}

Status SimRecorderClient::stop_recording() {
  std::lock_guard<std::mutex> lk(mu_);
  SR_RETURN_IF_ERROR(check_link_locked());

  if (recording_) {
    recording_ = false;
    pending_ack_polls_ = cfg_.stop_ack_polls;
    ++counters_.stops;
    spdlog::debug("SimRecorder: recording stopped (ack after {} polls)", pending_ack_polls_);
  }
  return Status::ok_status();
}

Result<bool> SimRecorderClient::is_recording() {
  std::lock_guard<std::mutex> lk(mu_);
  ++counters_.status_queries;
  const Status st = check_link_locked();
  if (!st.ok()) return Result<bool>::err(st);

  if (pending_ack_polls_ > 0) {
    --pending_ack_polls_;
    return Result<bool>::ok(true);
  }
  return Result<bool>::ok(recording_ || cfg_.externally_recording);
}

void SimRecorderClient::close() {
  std::lock_guard<std::mutex> lk(mu_);
  connected_ = false;
}

void SimRecorderClient::set_reachable(bool reachable) {
  std::lock_guard<std::mutex> lk(mu_);
  cfg_.reachable = reachable;
  if (!reachable) connected_ = false;
}

void SimRecorderClient::set_externally_recording(bool recording) {
  std::lock_guard<std::mutex> lk(mu_);
  cfg_.externally_recording = recording;
}

void SimRecorderClient::set_stop_ack_polls(int polls) {
  std::lock_guard<std::mutex> lk(mu_);
  cfg_.stop_ack_polls = std::max(0, polls);
}

SimRecorderClient::Counters SimRecorderClient::counters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

bool SimRecorderClient::connected() const {
  std::lock_guard<std::mutex> lk(mu_);
  return connected_;
}

bool SimRecorderClient::recording() const {
  std::lock_guard<std::mutex> lk(mu_);
  return recording_;
}

}  // namespace sr
