// File: src/core/types.cpp
#include "pacer/core/types.hpp"

namespace pacer {

const char* to_string(PlaybackState s) {
  switch (s) {
    case PlaybackState::kIdle: return "idle";
    case PlaybackState::kPlaying: return "playing";
    case PlaybackState::kPaused: return "paused";
    case PlaybackState::kFinished: return "finished";
  }
  return "unknown";
}

}  // namespace pacer
