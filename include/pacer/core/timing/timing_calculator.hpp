// include/pacer/core/timing/timing_calculator.hpp
#pragma once

#include <string_view>

#include "pacer/core/config.hpp"
#include "pacer/core/types.hpp"

namespace pacer {

// Display duration bounds. The floor avoids unreadable flicker; the ceiling
// keeps a pathological chunk from stalling playback.
inline constexpr DurationMs kMinChunkDurationMs = 50;
inline constexpr DurationMs kMaxChunkDurationMs = 5000;

// Whitespace-delimited token count, never less than 1.
int count_words(std::string_view text);

// 0.6 + 1.2 * clamp(complexity, 0, 1). Non-finite input is treated as 0.
double complexity_multiplier(double complexity);

// Sum of the pause bonuses whose punctuation class matches the final character.
// Rules are independent; each one that matches adds its pause.
DurationMs punctuation_bonus_ms(std::string_view text, const TimingConfig& timing);

// Pure and deterministic. Result is always in [kMinChunkDurationMs, kMaxChunkDurationMs].
DurationMs compute_duration_ms(const Chunk& chunk, const TimingConfig& timing);

// round(words / max(1, ms) * 60000).
int words_per_minute(std::int64_t words, DurationMs ms);

}  // namespace pacer
