// File: src/core/metrics/metrics_tracker.cpp
#include "pacer/core/metrics/metrics_tracker.hpp"

#include <algorithm>

#include "pacer/core/timing/timing_calculator.hpp"

namespace pacer {

void MetricsTracker::on_display(const DisplayFrame& frame) {
  // A cleared display (finish/reset) keeps the last reading.
  if (!frame.chunk) return;
  inst_wpm_ = frame.inst_wpm;
}

void MetricsTracker::on_advance(const AdvanceRecord& record) {
  total_words_ += record.words;
  total_ms_ += record.duration_ms;
  ++advances_;
  dynamic_wpm_ = words_per_minute(total_words_, total_ms_);
}

void MetricsTracker::on_reset() {
  inst_wpm_ = 0;
  dynamic_wpm_ = 0;
  total_words_ = 0;
  total_ms_ = 0;
  advances_ = 0;
}

double MetricsTracker::progress(std::size_t cursor, std::size_t total) {
  const double p = static_cast<double>(cursor) / static_cast<double>(std::max<std::size_t>(1, total));
  return std::clamp(p, 0.0, 1.0);
}

}  // namespace pacer
