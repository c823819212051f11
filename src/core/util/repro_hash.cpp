// File: src/core/util/repro_hash.cpp
#include "sr/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <string>

namespace sr {
namespace {

// FNV-1a 64-bit. Not cryptographic; a fast, stable fingerprint.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_u32(std::uint32_t v) { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_float(float v) { add_u32(std::bit_cast<std::uint32_t>(v)); }
  void add_double(double v) { add_u64(std::bit_cast<std::uint64_t>(v)); }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

void add_sensor(Fnv1a64& h, const SensorConfig& s) {
  h.add_bool(s.enabled);
  h.add_float(s.threshold);
  h.add_i32(s.sample_interval_ms);
  h.add_string(s.source);

  h.add_u32(s.synth.seed);
  h.add_float(s.synth.baseline);
  h.add_float(s.synth.noise);
  h.add_float(s.synth.burst_level);
  h.add_double(s.synth.first_burst_s);
  h.add_double(s.synth.burst_period_s);
  h.add_double(s.synth.burst_length_s);
  h.add_i32(s.synth.fail_every_n);

  h.add_string(s.sample_file.path);
  h.add_bool(s.sample_file.loop);

  h.add_string(s.frame_dir.path);
  h.add_i32(s.frame_dir.width);
  h.add_i32(s.frame_dir.height);
  h.add_i32(s.frame_dir.pixel_delta);
  h.add_bool(s.frame_dir.loop);

  h.add_string(s.pcm_file.path);
  h.add_i32(s.pcm_file.chunk_samples);
  h.add_string(s.pcm_file.metric);
  h.add_float(s.pcm_file.rms_gain);
  h.add_bool(s.pcm_file.loop);
}

}  // namespace

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  h.add_string(cfg.station_id);

  // Logging settings are not part of the fingerprint.

  add_sensor(h, cfg.sensors.vision);
  add_sensor(h, cfg.sensors.audio);

  h.add_i64(cfg.trigger.cooldown_ns);

  h.add_i64(cfg.recording.duration_ns);
  h.add_i32(cfg.recording.retrigger == RetriggerPolicy::kExtend ? 1 : 2);
  h.add_i64(cfg.recording.stop_grace_ns);
  h.add_i64(cfg.recording.stop_poll_ns);

  // Password is never hashed: the hash is written to event logs.
  h.add_string(cfg.recorder.type);
  h.add_string(cfg.recorder.host);
  h.add_i32(cfg.recorder.port);
  h.add_double(cfg.recorder.timeout_s);
  h.add_bool(cfg.recorder.sim.reachable);
  h.add_bool(cfg.recorder.sim.externally_recording);
  h.add_i32(cfg.recorder.sim.stop_ack_polls);

  h.add_i32(cfg.bus.capacity);

  h.add_string(cfg.output.out_dir);
  h.add_i32(cfg.output.heartbeat_every_s);

  h.add_double(cfg.run.max_run_s);

  return to_hex(h.h);
}

}  // namespace sr
