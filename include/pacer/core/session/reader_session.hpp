// include/pacer/core/session/reader_session.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pacer/core/buffer/chunk_buffer.hpp"
#include "pacer/core/config.hpp"
#include "pacer/core/io/chunk_producer.hpp"
#include "pacer/core/metrics/metrics_tracker.hpp"
#include "pacer/core/sched/event_loop.hpp"
#include "pacer/core/sched/playback_observer.hpp"
#include "pacer/core/sched/playback_scheduler.hpp"
#include "pacer/core/status.hpp"
#include "pacer/core/stream/stream_consumer.hpp"
#include "pacer/core/types.hpp"

namespace pacer {

// Everything a renderer needs, copied out in one go.
struct SessionSnapshot {
  std::string document_text;
  bool processing = false;
  bool stream_done = false;

  std::size_t total_chunks = 0;
  std::size_t current_index = 0;
  std::optional<Chunk> current_chunk;

  PlaybackState state = PlaybackState::kIdle;
  bool playing = false;

  TimingConfig timing;
  int inst_wpm = 0;
  int dynamic_wpm = 0;
  double progress = 0.0;
};

// Control surface: owns the buffer, timing config, metrics, scheduler and
// stream consumer for one reader, and routes every external request to them.
//
// Lifetime: observers attached here must outlive the session (or be detached).
// Destroying the session cancels all timers and the in-flight stream.
class ReaderSession {
 public:
  ReaderSession(IEventLoop& loop, std::unique_ptr<IChunkProducer> producer, const Config& cfg);
  ~ReaderSession();

  ReaderSession(const ReaderSession&) = delete;
  ReaderSession& operator=(const ReaderSession&) = delete;

  void add_playback_observer(PlaybackObserver* observer) { scheduler_.add_observer(observer); }
  void remove_playback_observer(PlaybackObserver* observer) { scheduler_.remove_observer(observer); }
  void add_stream_observer(StreamObserver* observer) { consumer_.add_observer(observer); }
  void remove_stream_observer(StreamObserver* observer) { consumer_.remove_observer(observer); }

  // --- document / ingestion
  const std::string& document_text() const noexcept { return document_; }
  void set_document_text(std::string text) { document_ = std::move(text); }

  // Resets the session, then streams chunks for the trimmed text. An empty
  // (all-whitespace) document is rejected before anything changes.
  Status process_document();
  Status process_document(const std::string& text);

  // Ends the in-flight stream; whatever arrived so far is kept (and auto-played).
  void cancel_processing();

  bool is_processing() const noexcept { return processing_; }
  bool stream_done() const noexcept { return buffer_.closed(); }
  const StreamSummary& stream_summary() const noexcept { return consumer_.summary(); }
  std::string producer_name() const;

  // --- chunks
  const std::vector<Chunk>& chunks() const noexcept { return buffer_.chunks(); }
  std::size_t total_chunks() const noexcept { return buffer_.size(); }
  std::size_t current_index() const noexcept { return scheduler_.cursor(); }
  const std::optional<Chunk>& current_chunk() const noexcept { return scheduler_.displayed().chunk; }

  // --- playback
  PlaybackState state() const noexcept { return scheduler_.state(); }
  bool is_playing() const noexcept { return scheduler_.is_playing(); }
  void play();
  void pause();
  void toggle_play();
  void reset();
  void seek(std::int64_t index);
  void seek_ratio(double ratio);
  void next();
  void prev();

  // --- timing (each setter validates, then re-paces the active chunk)
  const TimingConfig& timing() const noexcept { return timing_; }
  Status set_timing(const TimingConfig& timing);
  Status set_base_wpm(int wpm);
  Status set_pause_comma_semicolon_ms(int ms);
  Status set_pause_colon_dash_ms(int ms);
  Status set_pause_sentence_end_ms(int ms);
  void increase_wpm();
  void decrease_wpm();

  // --- metrics
  int inst_wpm() const noexcept { return metrics_.inst_wpm(); }
  int dynamic_wpm() const noexcept { return metrics_.dynamic_wpm(); }
  double progress() const { return MetricsTracker::progress(scheduler_.cursor(), buffer_.size()); }

  // --- presentation helpers
  std::string preview_for_index(std::size_t index) const;
  std::string status_label() const;
  std::string chunk_counter_label() const;

  SessionSnapshot snapshot() const;

  const PlaybackScheduler& scheduler() const noexcept { return scheduler_; }

 private:
  void on_stream_done(const StreamSummary& summary);
  void apply_timing(const TimingConfig& timing);

  std::unique_ptr<IChunkProducer> producer_;
  PlaybackConfig playback_cfg_;

  // Declaration order matters: the scheduler and consumer borrow these.
  TimingConfig timing_;
  ChunkBuffer buffer_;
  MetricsTracker metrics_;
  PlaybackScheduler scheduler_;
  StreamConsumer consumer_;

  std::string document_;
  bool processing_{false};
  bool suppress_autoplay_{false};
};

}  // namespace pacer
