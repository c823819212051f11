// File: src/core/util/config_loader.cpp
#include "sr/core/util/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>

#include <yaml-cpp/yaml.h>

namespace sr {
namespace fs = std::filesystem;

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }
static bool is_scalar(const YAML::Node& n) { return n && n.IsScalar(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

// Durations past this would overflow int64 ns once added to a run timestamp.
constexpr double kMaxDurationSeconds = 1e9;

static Status maybe_set_seconds(const YAML::Node& n, const char* section, const char* key, DurationNs& out) {
  if (!n || !n[key]) return Status::ok_status();
  const double s = n[key].as<double>();
  if (!std::isfinite(s) || std::fabs(s) > kMaxDurationSeconds) {
    return Status::invalid_argument(std::string(section) + "." + key + " must be a finite value within +/-1e9 s");
  }
  out = seconds_to_ns(s);
  return Status::ok_status();
}

static Status maybe_set_millis(const YAML::Node& n, const char* section, const char* key, DurationNs& out) {
  if (!n || !n[key]) return Status::ok_status();
  const auto ms = n[key].as<std::int64_t>();
  if (ms < -static_cast<std::int64_t>(kMaxDurationSeconds * 1000.0) ||
      ms > static_cast<std::int64_t>(kMaxDurationSeconds * 1000.0)) {
    return Status::invalid_argument(std::string(section) + "." + key + " is out of range");
  }
  out = ms_to_ns(ms);
  return Status::ok_status();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth) {
  if (depth > 8) {
    return Result<YAML::Node>::err(Status::invalid_argument("includes nested too deeply at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, depth + 1);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  // Finally override with this file's contents (excluding includes itself).
  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static Result<RetriggerPolicy> parse_retrigger(const YAML::Node& n) {
  if (!is_scalar(n)) return Result<RetriggerPolicy>::err(Status::invalid_argument("recording.retrigger must be a string"));
  const auto s = to_lower(n.as<std::string>());
  if (s == "extend") return Result<RetriggerPolicy>::ok(RetriggerPolicy::kExtend);
  if (s == "ignore") return Result<RetriggerPolicy>::ok(RetriggerPolicy::kIgnore);
  return Result<RetriggerPolicy>::err(Status::invalid_argument("unknown recording.retrigger: " + s));
}

static void read_sensor(const YAML::Node& n, SensorConfig& s) {
  if (!is_map(n)) return;

  maybe_set(n, "enabled", s.enabled);
  maybe_set(n, "threshold", s.threshold);
  maybe_set(n, "sample_interval_ms", s.sample_interval_ms);
  if (n["source"]) s.source = to_lower(n["source"].as<std::string>());

  if (is_map(n["synth"])) {
    const auto y = n["synth"];
    maybe_set(y, "seed", s.synth.seed);
    maybe_set(y, "baseline", s.synth.baseline);
    maybe_set(y, "noise", s.synth.noise);
    maybe_set(y, "burst_level", s.synth.burst_level);
    maybe_set(y, "first_burst_s", s.synth.first_burst_s);
    maybe_set(y, "burst_period_s", s.synth.burst_period_s);
    maybe_set(y, "burst_length_s", s.synth.burst_length_s);
    maybe_set(y, "fail_every_n", s.synth.fail_every_n);
  }

  if (is_map(n["sample_file"])) {
    const auto f = n["sample_file"];
    maybe_set(f, "path", s.sample_file.path);
    maybe_set(f, "loop", s.sample_file.loop);
  }

  if (is_map(n["frame_dir"])) {
    const auto d = n["frame_dir"];
    maybe_set(d, "path", s.frame_dir.path);
    maybe_set(d, "width", s.frame_dir.width);
    maybe_set(d, "height", s.frame_dir.height);
    maybe_set(d, "pixel_delta", s.frame_dir.pixel_delta);
    maybe_set(d, "loop", s.frame_dir.loop);
  }

  if (is_map(n["pcm_file"])) {
    const auto p = n["pcm_file"];
    maybe_set(p, "path", s.pcm_file.path);
    maybe_set(p, "chunk_samples", s.pcm_file.chunk_samples);
    if (p["metric"]) s.pcm_file.metric = to_lower(p["metric"].as<std::string>());
    maybe_set(p, "rms_gain", s.pcm_file.rms_gain);
    maybe_set(p, "loop", s.pcm_file.loop);
  }
}

static Result<Config> config_from_yaml(const YAML::Node& y) {
  Config cfg;  // defaults

  try {
    // --- high-level
    maybe_set(y, "station_id", cfg.station_id);

    // --- logging
    if (is_map(y["logging"])) {
      const auto l = y["logging"];
      if (l["level"]) cfg.logging.level = to_lower(l["level"].as<std::string>());
      maybe_set(l, "file", cfg.logging.file);
    }

    // --- sensors
    if (is_map(y["sensors"])) {
      const auto s = y["sensors"];
      read_sensor(s["vision"], cfg.sensors.vision);
      read_sensor(s["audio"], cfg.sensors.audio);
    }

    // --- trigger
    if (is_map(y["trigger"])) {
      const Status st = maybe_set_seconds(y["trigger"], "trigger", "cooldown_s", cfg.trigger.cooldown_ns);
      if (!st.ok()) return Result<Config>::err(st);
    }

    // --- recording
    if (is_map(y["recording"])) {
      const auto r = y["recording"];
      for (const Status& st : {maybe_set_seconds(r, "recording", "duration_s", cfg.recording.duration_ns),
                               maybe_set_seconds(r, "recording", "stop_grace_s", cfg.recording.stop_grace_ns),
                               maybe_set_millis(r, "recording", "stop_poll_ms", cfg.recording.stop_poll_ns)}) {
        if (!st.ok()) return Result<Config>::err(st);
      }
      if (r["retrigger"]) {
        auto p = parse_retrigger(r["retrigger"]);
        if (!p.ok()) return Result<Config>::err(p.status());
        cfg.recording.retrigger = p.take_value();
      }
    }

    // --- recorder
    if (is_map(y["recorder"])) {
      const auto r = y["recorder"];
      if (r["type"]) cfg.recorder.type = to_lower(r["type"].as<std::string>());
      maybe_set(r, "host", cfg.recorder.host);
      maybe_set(r, "port", cfg.recorder.port);
      maybe_set(r, "password", cfg.recorder.password);
      maybe_set(r, "timeout_s", cfg.recorder.timeout_s);
      if (is_map(r["sim"])) {
        const auto s = r["sim"];
        maybe_set(s, "reachable", cfg.recorder.sim.reachable);
        maybe_set(s, "externally_recording", cfg.recorder.sim.externally_recording);
        maybe_set(s, "stop_ack_polls", cfg.recorder.sim.stop_ack_polls);
      }
    }

    // --- bus
    if (is_map(y["bus"])) {
      maybe_set(y["bus"], "capacity", cfg.bus.capacity);
    }

    // --- output
    if (is_map(y["output"])) {
      const auto o = y["output"];
      maybe_set(o, "out_dir", cfg.output.out_dir);
      maybe_set(o, "heartbeat_every_s", cfg.output.heartbeat_every_s);
    }

    // --- run
    if (is_map(y["run"])) {
      maybe_set(y["run"], "max_run_s", cfg.run.max_run_s);
    }
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("bad config value: ") + e.what()));
  }

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

Result<Config> load_config(const std::string& path_str) {
  auto yaml_r = load_with_includes(fs::path(path_str), 0);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  return config_from_yaml(yaml_r.value());
}

Result<Config> load_config_from_string(const std::string& yaml) {
  YAML::Node y;
  try {
    y = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("YAML parse error: ") + e.what()));
  }
  return config_from_yaml(y);
}

}  // namespace sr
