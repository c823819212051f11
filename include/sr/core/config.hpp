// File: include/sr/core/config.hpp
#pragma once

#include <cmath>
#include <cstdint>
#include <string>

#include "sr/core/status.hpp"
#include "sr/core/types.hpp"

namespace sr {

// Units policy:
// - YAML uses seconds (`*_s`) and milliseconds (`*_ms`)
// - Everything in memory is nanoseconds (DurationNs) except sample intervals,
//   which stay in ms because that is what the samplers sleep on.

// -----------------------------
// Logging
// -----------------------------
struct LoggingConfig {
  std::string level = "info";  // trace | debug | info | warn | error
  std::string file;            // empty disables the file sink
};

// -----------------------------
// Signal sources (one block per source type, selected by SensorConfig::source)
// -----------------------------
struct SynthInputConfig {
  std::uint32_t seed = 1;
  float baseline = 0.0f;
  float noise = 0.0f;          // uniform +/- noise around baseline
  float burst_level = 1.0f;    // value during a burst
  double first_burst_s = 5.0;
  double burst_period_s = 60.0;
  double burst_length_s = 1.0;
  int fail_every_n = 0;        // every Nth sample fails (0 disables)
};

struct SampleFileInputConfig {
  std::string path;  // text file, one float per line
  bool loop = false;
};

struct FrameDirInputConfig {
  std::string path;  // directory of *.gray frames
  int width = 640;
  int height = 480;
  int pixel_delta = 25;  // per-pixel change needed to count as motion
  bool loop = false;
};

struct PcmFileInputConfig {
  std::string path;  // raw s16le mono
  int chunk_samples = 1024;
  std::string metric = "peak";  // peak | rms | either
  float rms_gain = 1.0f;        // either: rms is scaled by this before max(peak, rms)
  bool loop = false;
};

struct SensorConfig {
  bool enabled = true;
  float threshold = 0.5f;
  int sample_interval_ms = 100;
  std::string source = "synth";  // synth | sample_file | frame_dir | pcm_file

  SynthInputConfig synth;
  SampleFileInputConfig sample_file;
  FrameDirInputConfig frame_dir;
  PcmFileInputConfig pcm_file;
};

struct SensorsConfig {
  SensorConfig vision;
  SensorConfig audio;

  SensorsConfig() {
    // Changed-pixel area; 100 ms between frames.
    vision.threshold = 1000.0f;
    vision.sample_interval_ms = 100;
    // Normalized peak level.
    audio.threshold = 0.5f;
    audio.sample_interval_ms = 50;
  }
};

// -----------------------------
// Trigger / recording
// -----------------------------
struct TriggerConfig {
  DurationNs cooldown_ns = seconds_to_ns(30.0);
};

struct RecordingConfig {
  DurationNs duration_ns = seconds_to_ns(3600.0);
  RetriggerPolicy retrigger = RetriggerPolicy::kExtend;

  // How long Stopping may wait for the recorder to confirm before forcing Idle.
  DurationNs stop_grace_ns = seconds_to_ns(10.0);
  DurationNs stop_poll_ns = ms_to_ns(250);
};

// -----------------------------
// Remote recorder
// -----------------------------
struct SimRecorderInputConfig {
  bool reachable = true;
  bool externally_recording = false;
  int stop_ack_polls = 0;  // status polls that still report "recording" after a stop
};

struct RecorderConfig {
  std::string type = "sim";  // sim | obs
  std::string host = "localhost";
  int port = 4444;
  std::string password;      // obs: obs-websocket server password, empty if auth is off
  double timeout_s = 3.0;    // obs: bound on each connect/request step

  SimRecorderInputConfig sim;
};

// -----------------------------
// Plumbing
// -----------------------------
struct BusConfig {
  int capacity = 16;
};

struct OutputConfig {
  // Where to write event JSONL.
  std::string out_dir = "out";

  // Status heartbeat every N seconds (0 disables).
  int heartbeat_every_s = 30;
};

struct RunConfig {
  double max_run_s = 0.0;  // 0 disables
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  StationId station_id = "station_001";

  LoggingConfig logging;
  SensorsConfig sensors;
  TriggerConfig trigger;
  RecordingConfig recording;
  RecorderConfig recorder;
  BusConfig bus;
  OutputConfig output;
  RunConfig run;
};

namespace detail {

inline Status validate_sensor(const SensorConfig& s, const std::string& name, bool normalized) {
  if (!s.enabled) return Status::ok_status();

  const std::string p = "sensors." + name + ".";
  if (!std::isfinite(s.threshold) || s.threshold < 0.0f) {
    return Status::invalid_argument(p + "threshold must be a finite value >= 0");
  }
  if (normalized && s.threshold > 1.0f) {
    return Status::invalid_argument(p + "threshold must be within [0, 1]");
  }
  if (s.sample_interval_ms <= 0) {
    return Status::invalid_argument(p + "sample_interval_ms must be > 0");
  }

  if (s.source == "synth") {
    if (!std::isfinite(s.synth.burst_period_s) || s.synth.burst_period_s <= 0.0) {
      return Status::invalid_argument(p + "synth.burst_period_s must be > 0");
    }
    if (!std::isfinite(s.synth.burst_length_s) || !std::isfinite(s.synth.first_burst_s) ||
        s.synth.burst_length_s < 0.0 || s.synth.first_burst_s < 0.0) {
      return Status::invalid_argument(p + "synth timings must be >= 0");
    }
    if (s.synth.fail_every_n < 0) {
      return Status::invalid_argument(p + "synth.fail_every_n must be >= 0");
    }
  } else if (s.source == "sample_file") {
    if (s.sample_file.path.empty()) {
      return Status::invalid_argument(p + "sample_file.path must not be empty");
    }
  } else if (s.source == "frame_dir" && !normalized) {
    if (s.frame_dir.path.empty()) {
      return Status::invalid_argument(p + "frame_dir.path must not be empty");
    }
    if (s.frame_dir.width <= 0 || s.frame_dir.height <= 0) {
      return Status::invalid_argument(p + "frame_dir.width/height must be > 0");
    }
    if (s.frame_dir.pixel_delta < 0 || s.frame_dir.pixel_delta > 255) {
      return Status::invalid_argument(p + "frame_dir.pixel_delta must be within [0, 255]");
    }
  } else if (s.source == "pcm_file" && normalized) {
    if (s.pcm_file.path.empty()) {
      return Status::invalid_argument(p + "pcm_file.path must not be empty");
    }
    if (s.pcm_file.chunk_samples <= 0) {
      return Status::invalid_argument(p + "pcm_file.chunk_samples must be > 0");
    }
    if (s.pcm_file.metric != "peak" && s.pcm_file.metric != "rms" && s.pcm_file.metric != "either") {
      return Status::invalid_argument(p + "pcm_file.metric must be 'peak', 'rms' or 'either'");
    }
    if (!std::isfinite(s.pcm_file.rms_gain) || s.pcm_file.rms_gain <= 0.0f) {
      return Status::invalid_argument(p + "pcm_file.rms_gain must be > 0");
    }
  } else {
    return Status::invalid_argument(p + "source '" + s.source + "' is not supported for " + name);
  }
  return Status::ok_status();
}

}  // namespace detail

// Strict validation; anything rejected here is fatal at startup.
inline Status validate_config(const Config& cfg) {
  if (cfg.station_id.empty()) {
    return Status::invalid_argument("station_id must not be empty");
  }

  if (!cfg.sensors.vision.enabled && !cfg.sensors.audio.enabled) {
    return Status::invalid_argument("at least one of sensors.vision / sensors.audio must be enabled");
  }
  SR_RETURN_IF_ERROR(detail::validate_sensor(cfg.sensors.vision, "vision", /*normalized=*/false));
  SR_RETURN_IF_ERROR(detail::validate_sensor(cfg.sensors.audio, "audio", /*normalized=*/true));

  if (cfg.trigger.cooldown_ns < 0) {
    return Status::invalid_argument("trigger.cooldown_s must be >= 0");
  }
  if (cfg.recording.duration_ns <= 0) {
    return Status::invalid_argument("recording.duration_s must be > 0");
  }
  if (cfg.recording.stop_grace_ns <= 0) {
    return Status::invalid_argument("recording.stop_grace_s must be > 0");
  }
  if (cfg.recording.stop_poll_ns <= 0) {
    return Status::invalid_argument("recording.stop_poll_ms must be > 0");
  }

  if (cfg.recorder.type != "sim" && cfg.recorder.type != "obs") {
    return Status::invalid_argument("recorder.type must be 'sim' or 'obs'");
  }
  if (!std::isfinite(cfg.recorder.timeout_s) || cfg.recorder.timeout_s <= 0.0 ||
      cfg.recorder.timeout_s > 3600.0) {
    return Status::invalid_argument("recorder.timeout_s must be within (0, 3600]");
  }
  if (cfg.recorder.host.empty()) {
    return Status::invalid_argument("recorder.host must not be empty");
  }
  if (cfg.recorder.port <= 0 || cfg.recorder.port > 65535) {
    return Status::invalid_argument("recorder.port must be within [1, 65535]");
  }
  if (cfg.recorder.sim.stop_ack_polls < 0) {
    return Status::invalid_argument("recorder.sim.stop_ack_polls must be >= 0");
  }

  if (cfg.bus.capacity <= 0) {
    return Status::invalid_argument("bus.capacity must be > 0");
  }
  if (cfg.output.out_dir.empty()) {
    return Status::invalid_argument("output.out_dir must not be empty");
  }
  if (cfg.output.heartbeat_every_s < 0 || cfg.output.heartbeat_every_s > 1'000'000'000) {
    return Status::invalid_argument("output.heartbeat_every_s must be within [0, 1e9]");
  }
  if (!std::isfinite(cfg.run.max_run_s) || cfg.run.max_run_s < 0.0 || cfg.run.max_run_s > 1e9) {
    return Status::invalid_argument("run.max_run_s must be within [0, 1e9]");
  }
  return Status::ok_status();
}

}  // namespace sr
