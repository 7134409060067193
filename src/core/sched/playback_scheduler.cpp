// File: src/core/sched/playback_scheduler.cpp
#include "pacer/core/sched/playback_scheduler.hpp"

#include <algorithm>

#include "pacer/core/timing/timing_calculator.hpp"

namespace pacer {

const char* to_string(DisplayReason r) {
  switch (r) {
    case DisplayReason::kStep: return "step";
    case DisplayReason::kRepace: return "repace";
    case DisplayReason::kSeek: return "seek";
    case DisplayReason::kFinished: return "finished";
    case DisplayReason::kReset: return "reset";
  }
  return "unknown";
}

PlaybackScheduler::PlaybackScheduler(IEventLoop& loop, const ChunkBuffer& buffer,
                                     const TimingConfig& timing, PlaybackConfig cfg)
    : loop_(loop),
      buffer_(buffer),
      timing_(timing),
      cfg_(cfg),
      advance_timer_(loop),
      retry_timer_(loop) {}

void PlaybackScheduler::add_observer(PlaybackObserver* observer) {
  if (!observer) return;
  if (std::find(observers_.begin(), observers_.end(), observer) != observers_.end()) return;
  observers_.push_back(observer);
}

void PlaybackScheduler::remove_observer(PlaybackObserver* observer) {
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

std::optional<TimestampMs> PlaybackScheduler::advance_due() const {
  if (!st_.active || !advance_timer_.armed()) return std::nullopt;
  return advance_timer_.due();
}

// -----------------------------
// Public transitions
// -----------------------------

void PlaybackScheduler::play() {
  const std::size_t len = buffer_.size();
  bool rewound = false;
  if (len > 0 && st_.cursor >= len) {
    st_.cursor = 0;
    rewound = true;
  }

  if (st_.state != PlaybackState::kPlaying) set_state(PlaybackState::kPlaying);

  // A loop parked in wait_for_data at the old end must pick up the rewind now.
  if (!st_.loop_active || rewound) step();
}

void PlaybackScheduler::pause() {
  if (st_.state != PlaybackState::kPlaying) return;
  cancel_timers();
  st_.loop_active = false;
  st_.active.reset();
  set_state(PlaybackState::kPaused);
}

void PlaybackScheduler::seek(std::int64_t index) {
  const std::size_t len = buffer_.size();
  if (len == 0) return;

  const std::int64_t last = static_cast<std::int64_t>(len - 1);
  st_.cursor = static_cast<std::size_t>(std::clamp<std::int64_t>(index, 0, last));

  if (st_.state == PlaybackState::kPlaying) {
    step();
    return;
  }

  cancel_timers();
  st_.loop_active = false;
  st_.active.reset();
  show(st_.cursor, DisplayReason::kSeek, /*timed=*/false);

  // A positioned, stopped cursor is paused; Finished no longer holds once the
  // cursor is back inside the buffer.
  if (st_.state != PlaybackState::kPaused) set_state(PlaybackState::kPaused);
}

void PlaybackScheduler::reset() {
  cancel_timers();
  st_.loop_active = false;
  st_.active.reset();
  st_.cursor = 0;

  const auto observers = observers_;
  for (PlaybackObserver* o : observers) o->on_reset();

  clear_display(DisplayReason::kReset);
  if (st_.state != PlaybackState::kIdle) set_state(PlaybackState::kIdle);
}

void PlaybackScheduler::repace() {
  if (st_.state != PlaybackState::kPlaying) return;

  if (st_.active && advance_timer_.armed()) {
    // Re-time from now; time already spent on this chunk is not credited.
    show(st_.active->index, DisplayReason::kRepace, /*timed=*/true);
    return;
  }
  step();
}

void PlaybackScheduler::halt() {
  cancel_timers();
  st_.loop_active = false;
  st_.active.reset();
}

// -----------------------------
// Loop transitions
// -----------------------------

void PlaybackScheduler::step() {
  cancel_timers();
  st_.active.reset();

  if (st_.state != PlaybackState::kPlaying) {
    st_.loop_active = false;
    return;
  }
  st_.loop_active = true;

  const std::size_t len = buffer_.size();
  if (st_.cursor < len) {
    show(st_.cursor, DisplayReason::kStep, /*timed=*/true);
  } else if (buffer_.closed()) {
    finish();
  } else {
    wait_for_data();
  }
}

void PlaybackScheduler::advance() {
  if (!st_.active) {
    step();
    return;
  }

  AdvanceRecord rec;
  rec.index = st_.active->index;
  rec.words = st_.active->words;
  rec.duration_ms = st_.active->duration_ms;
  rec.at = loop_.now();

  st_.active.reset();
  st_.cursor = std::min(st_.cursor + 1, buffer_.size());

  const auto observers = observers_;
  for (PlaybackObserver* o : observers) o->on_advance(rec);

  step();
}

void PlaybackScheduler::wait_for_data() {
  retry_timer_.arm(cfg_.wait_retry_ms, [this] { step(); });
}

void PlaybackScheduler::finish() {
  cancel_timers();
  st_.loop_active = false;
  st_.active.reset();
  st_.cursor = buffer_.size();
  clear_display(DisplayReason::kFinished);
  set_state(PlaybackState::kFinished);
}

// -----------------------------
// Helpers
// -----------------------------

void PlaybackScheduler::show(std::size_t index, DisplayReason reason, bool timed) {
  const Chunk& chunk = buffer_.at(index);
  const int words = count_words(chunk.text);
  const DurationMs duration = compute_duration_ms(chunk, timing_);

  DisplayFrame frame;
  frame.index = index;
  frame.chunk = chunk;
  frame.duration_ms = duration;
  frame.words = words;
  frame.inst_wpm = words_per_minute(words, duration);
  frame.at = loop_.now();
  frame.reason = reason;

  if (timed) {
    st_.active = ActiveTiming{index, frame.at, duration, words};
    advance_timer_.arm(duration, [this] { advance(); });
  }
  st_.displayed = frame;

  const auto observers = observers_;
  for (PlaybackObserver* o : observers) o->on_display(st_.displayed);
}

void PlaybackScheduler::clear_display(DisplayReason reason) {
  DisplayFrame frame;
  frame.index = st_.cursor;
  frame.at = loop_.now();
  frame.reason = reason;
  st_.displayed = frame;

  const auto observers = observers_;
  for (PlaybackObserver* o : observers) o->on_display(st_.displayed);
}

void PlaybackScheduler::cancel_timers() {
  advance_timer_.cancel();
  retry_timer_.cancel();
}

void PlaybackScheduler::set_state(PlaybackState next) {
  const PlaybackState prev = st_.state;
  if (prev == next) return;
  st_.state = next;

  const auto observers = observers_;
  for (PlaybackObserver* o : observers) o->on_state_changed(prev, next);
}

}  // namespace pacer
