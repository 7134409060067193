// File: src/core/sched/event_loop.cpp
#include "pacer/core/sched/event_loop.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace pacer {
namespace {

// Upper bound on one sleep so stop() is noticed promptly.
constexpr std::chrono::milliseconds kMaxSleep{50};

}  // namespace

// -----------------------------
// TimerQueue
// -----------------------------

TimerId TimerQueue::call_after(DurationMs delay, std::function<void()> fn) {
  const TimerId id = next_id_++;
  const TimestampMs due = now() + std::max<DurationMs>(0, delay);
  timers_.emplace(Key{due, id}, std::move(fn));
  due_by_id_.emplace(id, due);
  return id;
}

bool TimerQueue::cancel(TimerId id) {
  if (id == kNoTimer) return false;
  const auto it = due_by_id_.find(id);
  if (it == due_by_id_.end()) return false;
  timers_.erase(Key{it->second, id});
  due_by_id_.erase(it);
  return true;
}

std::optional<TimestampMs> TimerQueue::next_due() const {
  if (timers_.empty()) return std::nullopt;
  return timers_.begin()->first.due;
}

bool TimerQueue::run_one_due(TimestampMs limit) {
  if (timers_.empty()) return false;
  auto it = timers_.begin();
  if (it->first.due > limit) return false;

  // Detach before running: the callback may cancel or arm timers.
  std::function<void()> fn = std::move(it->second);
  due_by_id_.erase(it->first.id);
  timers_.erase(it);

  if (fn) fn();
  return true;
}

// -----------------------------
// ManualEventLoop
// -----------------------------

std::size_t ManualEventLoop::advance(DurationMs delta) {
  return advance_to(now_ + std::max<DurationMs>(0, delta));
}

std::size_t ManualEventLoop::advance_to(TimestampMs t) {
  std::size_t fired = 0;
  while (true) {
    const auto due = next_due();
    if (!due || *due > t) break;
    now_ = std::max(now_, *due);
    if (run_one_due(now_)) ++fired;
  }
  now_ = std::max(now_, t);
  return fired;
}

std::size_t ManualEventLoop::run_until_idle(std::size_t max_callbacks) {
  std::size_t fired = 0;
  while (fired < max_callbacks) {
    const auto due = next_due();
    if (!due) break;
    now_ = std::max(now_, *due);
    if (run_one_due(now_)) ++fired;
  }
  return fired;
}

// -----------------------------
// SteadyEventLoop
// -----------------------------

SteadyEventLoop::SteadyEventLoop() : t0_(std::chrono::steady_clock::now()) {}

TimestampMs SteadyEventLoop::now() const {
  const auto d = std::chrono::steady_clock::now() - t0_;
  return TimestampMs{std::chrono::duration_cast<std::chrono::milliseconds>(d).count()};
}

void SteadyEventLoop::run() {
  run_until([] { return false; });
}

void SteadyEventLoop::run_until(const std::function<bool()>& done) {
  while (!stop_requested()) {
    if (done && done()) return;

    const auto due = next_due();
    if (!due) return;

    const TimestampMs t = now();
    if (*due <= t) {
      (void)run_one_due(t);
      continue;
    }

    const auto wake = t0_ + std::chrono::milliseconds(due->ms);
    std::this_thread::sleep_until(std::min(wake, std::chrono::steady_clock::now() + kMaxSleep));
  }
}

// -----------------------------
// TimerSlot
// -----------------------------

void TimerSlot::arm(DurationMs delay, std::function<void()> fn) {
  cancel();
  due_ = loop_.now() + std::max<DurationMs>(0, delay);
  id_ = loop_.call_after(delay, [this, fn = std::move(fn)]() {
    // Cleared first so the callback may re-arm this slot.
    id_ = kNoTimer;
    fn();
  });
}

bool TimerSlot::cancel() {
  if (id_ == kNoTimer) return false;
  const bool removed = loop_.cancel(id_);
  id_ = kNoTimer;
  return removed;
}

}  // namespace pacer
