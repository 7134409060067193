// include/pacer/core/sched/playback_scheduler.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "pacer/core/buffer/chunk_buffer.hpp"
#include "pacer/core/config.hpp"
#include "pacer/core/sched/event_loop.hpp"
#include "pacer/core/sched/playback_observer.hpp"
#include "pacer/core/types.hpp"

namespace pacer {

// The chunk whose advance timer is currently pending.
struct ActiveTiming {
  std::size_t index = 0;
  TimestampMs started;
  DurationMs duration_ms = 0;
  int words = 0;
};

// Drives the display loop over a ChunkBuffer that may still be growing.
//
// State machine over {Idle, Playing, Paused, Finished}. Named transitions:
//  - step:          show buffer[cursor] and arm "advance", or finish, or wait
//  - advance:       cursor += 1, report the finished chunk, step
//  - wait_for_data: cursor outran an open buffer; retry step after wait_retry_ms
//  - repace:        timing changed; re-time the active chunk from now
//  - finish:        closed buffer exhausted; clear display, stop the loop
//
// Every operation is infallible: inputs are clamped. The buffer and timing
// config are borrowed and read on every step.
class PlaybackScheduler {
 public:
  PlaybackScheduler(IEventLoop& loop, const ChunkBuffer& buffer, const TimingConfig& timing,
                    PlaybackConfig cfg = {});

  PlaybackScheduler(const PlaybackScheduler&) = delete;
  PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

  // Observers are notified in registration order and must outlive the scheduler
  // or be removed first.
  void add_observer(PlaybackObserver* observer);
  void remove_observer(PlaybackObserver* observer);

  void play();
  void pause();
  void seek(std::int64_t index);
  void reset();

  // Call after the borrowed TimingConfig changed.
  void repace();

  // Cancels every pending timer without notifying anyone (teardown).
  void halt();

  [[nodiscard]] PlaybackState state() const noexcept { return st_.state; }
  [[nodiscard]] bool is_playing() const noexcept { return st_.state == PlaybackState::kPlaying; }
  [[nodiscard]] std::size_t cursor() const noexcept { return st_.cursor; }
  [[nodiscard]] bool loop_active() const noexcept { return st_.loop_active; }
  [[nodiscard]] const DisplayFrame& displayed() const noexcept { return st_.displayed; }
  [[nodiscard]] const std::optional<ActiveTiming>& active_timing() const noexcept { return st_.active; }

  // Due time of the pending advance, if a chunk is actively timed.
  [[nodiscard]] std::optional<TimestampMs> advance_due() const;
  [[nodiscard]] bool waiting_for_data() const noexcept { return retry_timer_.armed(); }

 private:
  struct State {
    PlaybackState state = PlaybackState::kIdle;
    std::size_t cursor = 0;
    bool loop_active = false;
    std::optional<ActiveTiming> active;
    DisplayFrame displayed;
  };

  void step();
  void advance();
  void wait_for_data();
  void finish();

  // Publishes buffer[index]; when `timed`, also records the active timing and
  // arms the advance timer before observers hear about it.
  void show(std::size_t index, DisplayReason reason, bool timed);
  void clear_display(DisplayReason reason);

  void cancel_timers();
  void set_state(PlaybackState next);

  IEventLoop& loop_;
  const ChunkBuffer& buffer_;
  const TimingConfig& timing_;
  PlaybackConfig cfg_;

  State st_;
  TimerSlot advance_timer_;
  TimerSlot retry_timer_;

  std::vector<PlaybackObserver*> observers_;
};

}  // namespace pacer
