// File: src/core/util/repro_hash.cpp
#include "pacer/core/util/repro_hash.hpp"

#include <cstdint>
#include <string>

namespace pacer {
namespace {

// FNV-1a 64-bit. Not cryptographic. Exactly what we want for fast, stable fingerprints.
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

  void add_string(std::string_view s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }
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

}  // namespace

std::string compute_document_hash(std::string_view document) {
  Fnv1a64 h;
  h.add_string(document);
  return to_hex(h.h);
}

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  // Timing.
  h.add_i32(cfg.timing.base_wpm);
  h.add_i32(cfg.timing.pause_comma_semicolon_ms);
  h.add_i32(cfg.timing.pause_colon_dash_ms);
  h.add_i32(cfg.timing.pause_sentence_end_ms);

  // Playback.
  h.add_i64(cfg.playback.wait_retry_ms);
  h.add_bool(cfg.playback.auto_play);
  h.add_i32(cfg.playback.wpm_step);

  // Stream.
  h.add_i64(cfg.stream.poll_interval_ms);
  h.add_u64(static_cast<std::uint64_t>(cfg.stream.max_line_bytes));

  // Producer.
  h.add_string(cfg.producer.type);

  h.add_u32(cfg.producer.synth.seed);
  h.add_i32(cfg.producer.synth.min_words);
  h.add_i32(cfg.producer.synth.max_words);
  h.add_u64(static_cast<std::uint64_t>(cfg.producer.synth.bytes_per_read));

  h.add_string(cfg.producer.ndjson_file.path);
  h.add_u64(static_cast<std::uint64_t>(cfg.producer.ndjson_file.bytes_per_read));

  h.add_string(cfg.producer.command.shell);

  // Output.
  h.add_string(cfg.output.out_dir);
  h.add_u64(static_cast<std::uint64_t>(cfg.output.keep_last));
  h.add_bool(cfg.output.record_events);

  return to_hex(h.h);
}

}  // namespace pacer
