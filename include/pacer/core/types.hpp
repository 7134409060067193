// include/pacer/core/types.hpp
#pragma once

#include <cstdint>
#include <string>

namespace pacer {

// -----------------------------
// Time
// -----------------------------
// Everything the scheduler touches is in integer milliseconds on the event-loop
// clock (0 = loop start). Wall-clock nanoseconds only appear in event logs.

using DurationMs = std::int64_t;

struct TimestampMs {
  std::int64_t ms = 0;

  constexpr bool operator==(const TimestampMs& other) const noexcept { return ms == other.ms; }
  constexpr bool operator!=(const TimestampMs& other) const noexcept { return ms != other.ms; }
  constexpr bool operator<(const TimestampMs& other) const noexcept { return ms < other.ms; }
  constexpr bool operator<=(const TimestampMs& other) const noexcept { return ms <= other.ms; }
  constexpr bool operator>(const TimestampMs& other) const noexcept { return ms > other.ms; }
  constexpr bool operator>=(const TimestampMs& other) const noexcept { return ms >= other.ms; }

  constexpr TimestampMs operator+(DurationMs d) const noexcept { return TimestampMs{ms + d}; }
  constexpr DurationMs operator-(const TimestampMs& other) const noexcept { return ms - other.ms; }
};

struct TimestampNs {
  std::int64_t ns = 0;
};

// -----------------------------
// Chunks
// -----------------------------

// Smallest unit shown at once. Immutable once accepted into a ChunkBuffer.
struct Chunk {
  std::string text;         // non-empty
  double complexity = 0.0;  // [0, 1]

  bool operator==(const Chunk& other) const noexcept {
    return text == other.text && complexity == other.complexity;
  }
  bool operator!=(const Chunk& other) const noexcept { return !(*this == other); }
};

// -----------------------------
// Playback
// -----------------------------

enum class PlaybackState {
  kIdle,
  kPlaying,
  kPaused,
  kFinished,
};

const char* to_string(PlaybackState s);

}  // namespace pacer
