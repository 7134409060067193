// include/pacer/core/sched/event_loop.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>

#include "pacer/core/types.hpp"

namespace pacer {

using TimerId = std::uint64_t;
inline constexpr TimerId kNoTimer = 0;

// Single-threaded execution context. All scheduling and buffer mutation happen
// inside callbacks run by one of these; nothing is thread-safe.
//
// Time contract:
//  - now() is milliseconds since the loop was created (starts at 0)
//  - a callback armed with delay d runs at now() + max(d, 0) or later
//  - callbacks never run from inside call_after()/cancel()
class IEventLoop {
 public:
  virtual ~IEventLoop() = default;

  virtual TimestampMs now() const = 0;

  virtual TimerId call_after(DurationMs delay, std::function<void()> fn) = 0;

  // Idempotent. Returns true if a pending timer was removed.
  virtual bool cancel(TimerId id) = 0;

  virtual std::size_t pending() const = 0;
};

// Due-ordered timer bookkeeping shared by the concrete loops.
// Timers with equal due time fire in arming order.
class TimerQueue : public IEventLoop {
 public:
  TimerId call_after(DurationMs delay, std::function<void()> fn) override;
  bool cancel(TimerId id) override;
  std::size_t pending() const override { return timers_.size(); }

 protected:
  std::optional<TimestampMs> next_due() const;

  // Runs the earliest timer if it is due at or before `limit`.
  bool run_one_due(TimestampMs limit);

 private:
  struct Key {
    TimestampMs due;
    TimerId id;

    bool operator<(const Key& other) const noexcept {
      if (due != other.due) return due < other.due;
      return id < other.id;
    }
  };

  std::map<Key, std::function<void()>> timers_;
  std::unordered_map<TimerId, TimestampMs> due_by_id_;
  TimerId next_id_{1};
};

// Virtual clock. Time only moves when the caller advances it, so tests can
// check exact timer behaviour without sleeping.
class ManualEventLoop final : public TimerQueue {
 public:
  ManualEventLoop() = default;

  TimestampMs now() const override { return now_; }

  // Moves the clock forward, firing every timer that comes due on the way with
  // now() equal to its due time. Returns the number of callbacks run.
  std::size_t advance(DurationMs delta);
  std::size_t advance_to(TimestampMs t);

  // Fires timers in due order until none remain (or max_callbacks ran).
  std::size_t run_until_idle(std::size_t max_callbacks = 100000);

 private:
  TimestampMs now_{0};
};

// Real time on std::chrono::steady_clock.
class SteadyEventLoop final : public TimerQueue {
 public:
  SteadyEventLoop();

  TimestampMs now() const override;

  // Runs until no timers are pending or stop() is called.
  void run();

  // Runs until `done()` holds, the loop goes idle, or stop() is called.
  void run_until(const std::function<bool()>& done);

  // Safe to call from a signal handler.
  void stop() noexcept { stop_requested_.store(true); }
  [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_.load(); }

 private:
  std::chrono::steady_clock::time_point t0_;
  std::atomic<bool> stop_requested_{false};
};

// One slot per timer responsibility ("advance", "retry", "poll").
// arm() always cancels the previous timer first, so a slot never has two
// callbacks pending. The owner must outlive the loop's pending callbacks;
// the destructor cancels.
class TimerSlot {
 public:
  explicit TimerSlot(IEventLoop& loop) : loop_(loop) {}
  ~TimerSlot() { cancel(); }

  TimerSlot(const TimerSlot&) = delete;
  TimerSlot& operator=(const TimerSlot&) = delete;

  void arm(DurationMs delay, std::function<void()> fn);

  // Idempotent. Returns true if a pending timer was removed.
  bool cancel();

  [[nodiscard]] bool armed() const noexcept { return id_ != kNoTimer; }

  // When the pending callback is due. Meaningless unless armed().
  [[nodiscard]] TimestampMs due() const noexcept { return due_; }

 private:
  IEventLoop& loop_;
  TimerId id_{kNoTimer};
  TimestampMs due_{0};
};

}  // namespace pacer
