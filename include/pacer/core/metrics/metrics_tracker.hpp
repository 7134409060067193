// include/pacer/core/metrics/metrics_tracker.hpp
#pragma once

#include <cstddef>
#include <cstdint>

#include "pacer/core/sched/playback_observer.hpp"
#include "pacer/core/types.hpp"

namespace pacer {

// Reading-speed metrics derived from scheduler events.
//  - instantaneous: speed of the chunk currently shown (every display frame)
//  - running average: cumulative words over cumulative ms, advances only
class MetricsTracker final : public PlaybackObserver {
 public:
  void on_display(const DisplayFrame& frame) override;
  void on_advance(const AdvanceRecord& record) override;
  void on_reset() override;

  [[nodiscard]] int inst_wpm() const noexcept { return inst_wpm_; }
  [[nodiscard]] int dynamic_wpm() const noexcept { return dynamic_wpm_; }

  [[nodiscard]] std::int64_t total_words() const noexcept { return total_words_; }
  [[nodiscard]] DurationMs total_ms() const noexcept { return total_ms_; }
  [[nodiscard]] std::size_t advances() const noexcept { return advances_; }

  // clamp(cursor / max(1, total), 0, 1)
  static double progress(std::size_t cursor, std::size_t total);

 private:
  int inst_wpm_{0};
  int dynamic_wpm_{0};

  std::int64_t total_words_{0};
  DurationMs total_ms_{0};
  std::size_t advances_{0};
};

}  // namespace pacer
