// include/pacer/core/sched/playback_observer.hpp
#pragma once

#include <cstddef>
#include <optional>

#include "pacer/core/types.hpp"

namespace pacer {

enum class DisplayReason {
  kStep,      // loop step made buffer[cursor] current
  kRepace,    // timing changed while the chunk was timed
  kSeek,      // seek while not playing
  kFinished,  // buffer exhausted and closed; display cleared
  kReset,     // session reset; display cleared
};

const char* to_string(DisplayReason r);

// What is on screen. The chunk and its instantaneous speed are always
// published together and always describe buffer[index] when chunk is set.
struct DisplayFrame {
  std::size_t index = 0;
  std::optional<Chunk> chunk;

  DurationMs duration_ms = 0;
  int words = 0;
  int inst_wpm = 0;

  TimestampMs at;
  DisplayReason reason = DisplayReason::kReset;
};

// Emitted when the advance timer fires, before the cursor moves on.
struct AdvanceRecord {
  std::size_t index = 0;  // chunk that was just displayed
  int words = 0;
  DurationMs duration_ms = 0;
  TimestampMs at;
};

class PlaybackObserver {
 public:
  virtual ~PlaybackObserver() = default;

  virtual void on_display(const DisplayFrame& /*frame*/) {}
  virtual void on_advance(const AdvanceRecord& /*record*/) {}
  virtual void on_state_changed(PlaybackState /*from*/, PlaybackState /*to*/) {}
  virtual void on_reset() {}
};

}  // namespace pacer
