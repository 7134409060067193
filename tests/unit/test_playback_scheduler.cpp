// File: tests/unit/test_playback_scheduler.cpp
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "pacer/core/buffer/chunk_buffer.hpp"
#include "pacer/core/sched/event_loop.hpp"
#include "pacer/core/sched/playback_scheduler.hpp"

namespace pacer {
namespace {

struct FrameLog final : PlaybackObserver {
  std::vector<DisplayFrame> frames;
  std::vector<AdvanceRecord> advances;
  std::vector<std::pair<PlaybackState, PlaybackState>> transitions;
  int resets = 0;

  void on_display(const DisplayFrame& f) override { frames.push_back(f); }
  void on_advance(const AdvanceRecord& r) override { advances.push_back(r); }
  void on_state_changed(PlaybackState from, PlaybackState to) override {
    transitions.emplace_back(from, to);
  }
  void on_reset() override { ++resets; }

  std::vector<std::size_t> shown_indices() const {
    std::vector<std::size_t> out;
    for (const auto& f : frames) {
      if (f.chunk) out.push_back(f.index);
    }
    return out;
  }
};

// 300 wpm reference timing:
//   "Hello,"       c=0.0 -> 200 ms
//   "big world"    c=0.5 -> 480 ms
//   "complicated." c=1.0 -> 580 ms
class PlaybackSchedulerTest : public ::testing::Test {
 protected:
  PlaybackSchedulerTest() : sched_(loop_, buffer_, timing_, PlaybackConfig{}) {
    sched_.add_observer(&log_);
  }

  void fill(bool close) {
    ASSERT_TRUE(buffer_.append(Chunk{"Hello,", 0.0}).ok());
    ASSERT_TRUE(buffer_.append(Chunk{"big world", 0.5}).ok());
    ASSERT_TRUE(buffer_.append(Chunk{"complicated.", 1.0}).ok());
    if (close) buffer_.close();
  }

  ManualEventLoop loop_;
  ChunkBuffer buffer_;
  TimingConfig timing_;
  PlaybackScheduler sched_;
  FrameLog log_;
};

TEST_F(PlaybackSchedulerTest, PlaysEachChunkForItsComputedDuration) {
  fill(/*close=*/true);
  sched_.play();

  ASSERT_EQ(log_.frames.size(), 1u);
  EXPECT_EQ(log_.frames[0].index, 0u);
  EXPECT_EQ(log_.frames[0].duration_ms, 200);
  EXPECT_EQ(log_.frames[0].inst_wpm, 300);
  EXPECT_EQ(log_.frames[0].reason, DisplayReason::kStep);

  loop_.advance(199);
  EXPECT_EQ(sched_.cursor(), 0u);
  loop_.advance(1);
  EXPECT_EQ(sched_.cursor(), 1u);
  EXPECT_EQ(log_.frames.back().at.ms, 200);

  loop_.advance(480);
  EXPECT_EQ(sched_.cursor(), 2u);
  EXPECT_EQ(log_.frames.back().at.ms, 680);

  ASSERT_EQ(log_.advances.size(), 2u);
  EXPECT_EQ(log_.advances[1].index, 1u);
  EXPECT_EQ(log_.advances[1].words, 2);
  EXPECT_EQ(log_.advances[1].duration_ms, 480);
}

TEST_F(PlaybackSchedulerTest, FinishesWhenTheClosedBufferIsExhausted) {
  fill(/*close=*/true);
  sched_.play();
  loop_.advance(200 + 480 + 580);

  EXPECT_EQ(sched_.state(), PlaybackState::kFinished);
  EXPECT_EQ(sched_.cursor(), 3u);
  EXPECT_FALSE(sched_.displayed().chunk.has_value());
  EXPECT_EQ(log_.frames.back().reason, DisplayReason::kFinished);
  EXPECT_FALSE(sched_.loop_active());
  EXPECT_EQ(loop_.pending(), 0u);
}

TEST_F(PlaybackSchedulerTest, PlayAfterFinishRewinds) {
  fill(/*close=*/true);
  sched_.play();
  loop_.run_until_idle();
  ASSERT_EQ(sched_.state(), PlaybackState::kFinished);

  sched_.play();
  EXPECT_EQ(sched_.state(), PlaybackState::kPlaying);
  EXPECT_EQ(sched_.cursor(), 0u);
  ASSERT_TRUE(sched_.displayed().chunk.has_value());
  EXPECT_EQ(sched_.displayed().chunk->text, "Hello,");
}

TEST_F(PlaybackSchedulerTest, SeekClampsIntoTheBuffer) {
  fill(/*close=*/false);
  sched_.seek(10);
  EXPECT_EQ(sched_.cursor(), 2u);
  sched_.seek(-4);
  EXPECT_EQ(sched_.cursor(), 0u);
}

TEST_F(PlaybackSchedulerTest, SeekOnEmptyBufferIsANoOp) {
  sched_.seek(3);
  EXPECT_EQ(sched_.cursor(), 0u);
  EXPECT_EQ(sched_.state(), PlaybackState::kIdle);
  EXPECT_TRUE(log_.frames.empty());
}

TEST_F(PlaybackSchedulerTest, SeekWhileStoppedShowsUntimedAndPauses) {
  fill(/*close=*/true);
  sched_.seek(1);

  EXPECT_EQ(sched_.state(), PlaybackState::kPaused);
  ASSERT_EQ(log_.frames.size(), 1u);
  EXPECT_EQ(log_.frames[0].reason, DisplayReason::kSeek);
  EXPECT_EQ(log_.frames[0].inst_wpm, 250);  // 2 words in 480 ms
  EXPECT_EQ(loop_.pending(), 0u);
  EXPECT_FALSE(sched_.advance_due().has_value());
}

TEST_F(PlaybackSchedulerTest, SeekWhilePlayingRestartsTimingAtTheTarget) {
  fill(/*close=*/true);
  sched_.play();
  loop_.advance(100);
  sched_.seek(2);

  EXPECT_EQ(sched_.cursor(), 2u);
  ASSERT_TRUE(sched_.advance_due().has_value());
  EXPECT_EQ(sched_.advance_due()->ms, 100 + 580);
  EXPECT_EQ(loop_.pending(), 1u);

  loop_.advance(580);
  EXPECT_EQ(sched_.state(), PlaybackState::kFinished);
  // Index 0 was cut short: only the sought chunk counts as advanced.
  ASSERT_EQ(log_.advances.size(), 1u);
  EXPECT_EQ(log_.advances[0].index, 2u);
}

TEST_F(PlaybackSchedulerTest, RepaceRetimesTheActiveChunkFromNow) {
  fill(/*close=*/true);
  sched_.play();
  loop_.advance(100);

  timing_.base_wpm = 150;  // "Hello," -> 400 * 0.6 + 80 = 320 ms
  sched_.repace();

  EXPECT_EQ(sched_.cursor(), 0u);
  ASSERT_TRUE(sched_.advance_due().has_value());
  EXPECT_EQ(sched_.advance_due()->ms, 420);
  EXPECT_EQ(log_.frames.back().reason, DisplayReason::kRepace);
  EXPECT_EQ(log_.frames.back().duration_ms, 320);
  EXPECT_EQ(log_.frames.back().inst_wpm, 188);

  loop_.advance(100);  // old due time (200) passes without an advance
  EXPECT_EQ(sched_.cursor(), 0u);
  loop_.advance(220);
  EXPECT_EQ(sched_.cursor(), 1u);
  EXPECT_EQ(loop_.pending(), 1u);
}

TEST_F(PlaybackSchedulerTest, RepaceWhileWaitingRestartsTheLoopStep) {
  sched_.play();  // open, empty buffer: retry due at t=50
  loop_.advance(30);
  ASSERT_TRUE(sched_.waiting_for_data());

  timing_.base_wpm = 600;
  sched_.repace();
  EXPECT_EQ(sched_.state(), PlaybackState::kPlaying);
  EXPECT_TRUE(sched_.waiting_for_data());
  EXPECT_EQ(loop_.pending(), 1u);

  ASSERT_TRUE(buffer_.append(Chunk{"Hello,", 0.0}).ok());

  // The retry was re-armed from t=30, so nothing fires at the old t=50.
  loop_.advance(49);
  EXPECT_TRUE(log_.frames.empty());

  loop_.advance(1);
  ASSERT_EQ(log_.frames.size(), 1u);
  EXPECT_EQ(log_.frames[0].at.ms, 80);
  // 1 word at 600 wpm: 100 * 0.6 + 80.
  EXPECT_EQ(log_.frames[0].duration_ms, 140);
  ASSERT_TRUE(sched_.advance_due().has_value());
  EXPECT_EQ(sched_.advance_due()->ms, 220);
}

TEST_F(PlaybackSchedulerTest, RepaceWhenNotPlayingDoesNothing) {
  fill(/*close=*/true);
  sched_.seek(1);
  const std::size_t frames = log_.frames.size();
  timing_.base_wpm = 600;
  sched_.repace();
  EXPECT_EQ(log_.frames.size(), frames);
  EXPECT_EQ(loop_.pending(), 0u);
}

TEST_F(PlaybackSchedulerTest, PauseThenPlayRestartsTheChunkAtFullDuration) {
  fill(/*close=*/true);
  sched_.play();
  loop_.advance(150);
  sched_.pause();

  EXPECT_EQ(sched_.state(), PlaybackState::kPaused);
  EXPECT_EQ(loop_.pending(), 0u);
  ASSERT_TRUE(sched_.displayed().chunk.has_value());  // paused chunk stays visible

  loop_.advance(1000);
  EXPECT_EQ(sched_.cursor(), 0u);

  sched_.play();
  ASSERT_TRUE(sched_.advance_due().has_value());
  EXPECT_EQ(sched_.advance_due()->ms, 1150 + 200);
}

TEST_F(PlaybackSchedulerTest, PauseWhenNotPlayingIsANoOp) {
  sched_.pause();
  EXPECT_EQ(sched_.state(), PlaybackState::kIdle);
  EXPECT_TRUE(log_.transitions.empty());
}

TEST_F(PlaybackSchedulerTest, WaitsForDataWhileTheStreamIsOpen) {
  sched_.play();
  EXPECT_EQ(sched_.state(), PlaybackState::kPlaying);
  EXPECT_TRUE(sched_.waiting_for_data());
  EXPECT_TRUE(log_.frames.empty());

  loop_.advance(30);
  ASSERT_TRUE(buffer_.append(Chunk{"Hello,", 0.0}).ok());
  EXPECT_TRUE(log_.frames.empty());

  loop_.advance(20);  // retry at t=50 picks it up
  ASSERT_EQ(log_.frames.size(), 1u);
  EXPECT_EQ(log_.frames[0].at.ms, 50);
  EXPECT_FALSE(sched_.waiting_for_data());

  // Consumed the only chunk; keeps polling until the stream closes.
  loop_.advance(200);
  EXPECT_EQ(sched_.cursor(), 1u);
  EXPECT_TRUE(sched_.waiting_for_data());

  buffer_.close();
  loop_.advance(50);
  EXPECT_EQ(sched_.state(), PlaybackState::kFinished);
}

TEST_F(PlaybackSchedulerTest, RepeatedPlayNeverDoublesTheLoop) {
  fill(/*close=*/true);
  sched_.play();
  sched_.play();
  sched_.play();
  EXPECT_EQ(loop_.pending(), 1u);

  loop_.advance(200);
  EXPECT_EQ(sched_.cursor(), 1u);
  EXPECT_EQ(log_.advances.size(), 1u);
}

TEST_F(PlaybackSchedulerTest, PlayRewindsALoopParkedAtTheEnd) {
  fill(/*close=*/false);
  sched_.play();
  loop_.advance(200 + 480 + 580);
  ASSERT_EQ(sched_.cursor(), 3u);
  ASSERT_TRUE(sched_.waiting_for_data());

  sched_.play();
  EXPECT_EQ(sched_.cursor(), 0u);
  EXPECT_FALSE(sched_.waiting_for_data());
  EXPECT_EQ(loop_.pending(), 1u);
}

TEST_F(PlaybackSchedulerTest, ResetClearsEverything) {
  fill(/*close=*/true);
  sched_.play();
  loop_.advance(250);
  sched_.reset();

  EXPECT_EQ(sched_.state(), PlaybackState::kIdle);
  EXPECT_EQ(sched_.cursor(), 0u);
  EXPECT_FALSE(sched_.displayed().chunk.has_value());
  EXPECT_EQ(log_.resets, 1);
  EXPECT_EQ(loop_.pending(), 0u);
  EXPECT_EQ(log_.frames.back().reason, DisplayReason::kReset);
}

TEST_F(PlaybackSchedulerTest, DisplayedFrameAlwaysMatchesTheBuffer) {
  fill(/*close=*/true);
  sched_.play();
  loop_.run_until_idle();

  for (const auto& f : log_.frames) {
    if (!f.chunk) continue;
    EXPECT_EQ(*f.chunk, buffer_.at(f.index));
  }
  EXPECT_EQ(log_.shown_indices(), (std::vector<std::size_t>{0, 1, 2}));
}

TEST_F(PlaybackSchedulerTest, StateTransitionsAreReported) {
  fill(/*close=*/true);
  sched_.play();
  sched_.pause();
  sched_.play();
  loop_.run_until_idle();

  using S = PlaybackState;
  const std::vector<std::pair<S, S>> expected = {
      {S::kIdle, S::kPlaying},
      {S::kPlaying, S::kPaused},
      {S::kPaused, S::kPlaying},
      {S::kPlaying, S::kFinished},
  };
  EXPECT_EQ(log_.transitions, expected);
}

}  // namespace
}  // namespace pacer
