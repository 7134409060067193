// include/pacer/core/config.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "pacer/core/status.hpp"
#include "pacer/core/types.hpp"

namespace pacer {

// Units policy:
// - Reading speed in words per minute
// - Pauses and intervals in integer milliseconds

// -----------------------------
// Timing (live, mutable during playback)
// -----------------------------
struct TimingLimits {
  static constexpr int kMinWpm = 60;
  static constexpr int kMaxWpm = 1500;
  static constexpr int kMaxPauseCommaSemicolonMs = 1000;
  static constexpr int kMaxPauseColonDashMs = 1500;
  static constexpr int kMaxPauseSentenceEndMs = 2000;
};

struct TimingConfig {
  int base_wpm = 300;

  // Added to chunks ending in the matching punctuation class.
  int pause_comma_semicolon_ms = 80;
  int pause_colon_dash_ms = 120;
  int pause_sentence_end_ms = 220;

  bool operator==(const TimingConfig& other) const noexcept {
    return base_wpm == other.base_wpm &&
           pause_comma_semicolon_ms == other.pause_comma_semicolon_ms &&
           pause_colon_dash_ms == other.pause_colon_dash_ms &&
           pause_sentence_end_ms == other.pause_sentence_end_ms;
  }
  bool operator!=(const TimingConfig& other) const noexcept { return !(*this == other); }
};

// -----------------------------
// Playback loop
// -----------------------------
struct PlaybackConfig {
  // Retry interval while the cursor has outrun the buffer and the stream is open.
  DurationMs wait_retry_ms = 50;

  // Start playback when the stream closes (normally or cancelled) with data buffered.
  bool auto_play = true;

  // Increment used by increase_wpm() / decrease_wpm().
  int wpm_step = 10;
};

// -----------------------------
// Stream consumer
// -----------------------------
struct StreamConfig {
  DurationMs poll_interval_ms = 10;

  // A line longer than this without a newline is dropped as malformed.
  std::size_t max_line_bytes = 64 * 1024;
};

// -----------------------------
// Producer selection
// -----------------------------
struct ProducerSynthConfig {
  std::uint32_t seed = 1;
  int min_words = 1;
  int max_words = 5;
  std::size_t bytes_per_read = 48;
};

struct ProducerNdjsonFileConfig {
  std::string path;
  std::size_t bytes_per_read = 256;
};

struct ProducerCommandConfig {
  // Run through /bin/sh -c; document text on stdin, NDJSON on stdout.
  std::string shell;
};

struct ProducerConfig {
  std::string type = "synth";  // synth | ndjson_file | command

  ProducerSynthConfig synth;
  ProducerNdjsonFileConfig ndjson_file;
  ProducerCommandConfig command;
};

// -----------------------------
// Output (event log)
// -----------------------------
struct OutputConfig {
  std::string out_dir = "out";
  std::size_t keep_last = 50;
  bool record_events = true;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  TimingConfig timing;
  PlaybackConfig playback;
  StreamConfig stream;
  ProducerConfig producer;
  OutputConfig output;
};

// Range checks for the live timing surface. Shared by the loader and the session setters.
inline Status validate_timing_config(const TimingConfig& t) {
  if (t.base_wpm < TimingLimits::kMinWpm || t.base_wpm > TimingLimits::kMaxWpm) {
    return Status::invalid_argument("timing.base_wpm must be in [" +
                                    std::to_string(TimingLimits::kMinWpm) + ", " +
                                    std::to_string(TimingLimits::kMaxWpm) + "]");
  }
  if (t.pause_comma_semicolon_ms < 0 ||
      t.pause_comma_semicolon_ms > TimingLimits::kMaxPauseCommaSemicolonMs) {
    return Status::invalid_argument("timing.pause_comma_semicolon_ms must be in [0, " +
                                    std::to_string(TimingLimits::kMaxPauseCommaSemicolonMs) + "]");
  }
  if (t.pause_colon_dash_ms < 0 || t.pause_colon_dash_ms > TimingLimits::kMaxPauseColonDashMs) {
    return Status::invalid_argument("timing.pause_colon_dash_ms must be in [0, " +
                                    std::to_string(TimingLimits::kMaxPauseColonDashMs) + "]");
  }
  if (t.pause_sentence_end_ms < 0 ||
      t.pause_sentence_end_ms > TimingLimits::kMaxPauseSentenceEndMs) {
    return Status::invalid_argument("timing.pause_sentence_end_ms must be in [0, " +
                                    std::to_string(TimingLimits::kMaxPauseSentenceEndMs) + "]");
  }
  return Status::ok_status();
}

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  PACER_RETURN_IF_ERROR(validate_timing_config(cfg.timing));

  if (cfg.playback.wait_retry_ms <= 0) {
    return Status::invalid_argument("playback.wait_retry_ms must be > 0");
  }
  if (cfg.playback.wpm_step <= 0) {
    return Status::invalid_argument("playback.wpm_step must be > 0");
  }
  if (cfg.stream.poll_interval_ms <= 0) {
    return Status::invalid_argument("stream.poll_interval_ms must be > 0");
  }
  if (cfg.stream.max_line_bytes == 0) {
    return Status::invalid_argument("stream.max_line_bytes must be > 0");
  }
  if (cfg.producer.type != "synth" && cfg.producer.type != "ndjson_file" &&
      cfg.producer.type != "command") {
    return Status::invalid_argument("producer.type must be 'synth', 'ndjson_file' or 'command'");
  }
  if (cfg.producer.synth.min_words <= 0) {
    return Status::invalid_argument("producer.synth.min_words must be > 0");
  }
  if (cfg.producer.synth.max_words < cfg.producer.synth.min_words) {
    return Status::invalid_argument("producer.synth.max_words must be >= min_words");
  }
  if (cfg.producer.synth.bytes_per_read == 0) {
    return Status::invalid_argument("producer.synth.bytes_per_read must be > 0");
  }
  if (cfg.producer.ndjson_file.bytes_per_read == 0) {
    return Status::invalid_argument("producer.ndjson_file.bytes_per_read must be > 0");
  }
  if (cfg.producer.type == "ndjson_file" && cfg.producer.ndjson_file.path.empty()) {
    return Status::invalid_argument("producer.ndjson_file.path must not be empty for ndjson_file");
  }
  if (cfg.producer.type == "command" && cfg.producer.command.shell.empty()) {
    return Status::invalid_argument("producer.command.shell must not be empty for command");
  }
  if (cfg.output.record_events && cfg.output.out_dir.empty()) {
    return Status::invalid_argument("output.out_dir must not be empty");
  }
  return Status::ok_status();
}

}  // namespace pacer
