// File: src/core/timing/timing_calculator.cpp
#include "pacer/core/timing/timing_calculator.hpp"

#include <algorithm>
#include <cmath>

namespace pacer {
namespace {

// UTF-8 encodings of U+2013 (en dash) and U+2014 (em dash).
constexpr std::string_view kEnDash = "\xE2\x80\x93";
constexpr std::string_view kEmDash = "\xE2\x80\x94";

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

bool ends_with_any_of(std::string_view s, std::string_view chars) {
  return !s.empty() && chars.find(s.back()) != std::string_view::npos;
}

}  // namespace

int count_words(std::string_view text) {
  int words = 0;
  bool in_word = false;
  for (char c : text) {
    if (is_space(c)) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++words;
    }
  }
  return std::max(1, words);
}

double complexity_multiplier(double complexity) {
  const double c = std::isfinite(complexity) ? std::clamp(complexity, 0.0, 1.0) : 0.0;
  return 0.6 + 1.2 * c;
}

DurationMs punctuation_bonus_ms(std::string_view text, const TimingConfig& timing) {
  DurationMs bonus = 0;
  if (ends_with_any_of(text, ",;")) bonus += timing.pause_comma_semicolon_ms;
  if (ends_with_any_of(text, ":-") || ends_with(text, kEnDash) || ends_with(text, kEmDash)) {
    bonus += timing.pause_colon_dash_ms;
  }
  if (ends_with_any_of(text, ".!?")) bonus += timing.pause_sentence_end_ms;
  return bonus;
}

DurationMs compute_duration_ms(const Chunk& chunk, const TimingConfig& timing) {
  // base_wpm is range-checked upstream; guard anyway so this stays total.
  const int wpm = std::max(1, timing.base_wpm);
  const double base_ms = (60000.0 / static_cast<double>(wpm)) * count_words(chunk.text);
  const double raw = base_ms * complexity_multiplier(chunk.complexity) +
                     static_cast<double>(punctuation_bonus_ms(chunk.text, timing));
  const auto ms = static_cast<DurationMs>(std::llround(raw));
  return std::clamp(ms, kMinChunkDurationMs, kMaxChunkDurationMs);
}

int words_per_minute(std::int64_t words, DurationMs ms) {
  const double wpm =
      static_cast<double>(words) / static_cast<double>(std::max<DurationMs>(1, ms)) * 60000.0;
  return static_cast<int>(std::llround(wpm));
}

}  // namespace pacer
