// File: include/pacer/core/events/session_recorder.hpp
#pragma once

#include <cstddef>
#include <string>

#include "pacer/core/config.hpp"
#include "pacer/core/events/event_sink.hpp"
#include "pacer/core/sched/event_loop.hpp"
#include "pacer/core/sched/playback_observer.hpp"
#include "pacer/core/status.hpp"
#include "pacer/core/stream/stream_consumer.hpp"
#include "pacer/core/types.hpp"

namespace pacer {

// Turns playback and stream notifications into JSONL events.
// Time contract:
//  - t_ms      = event-loop clock (starts at 0 for a fresh loop)
//  - t_wall_ns = absolute epoch ns anchored at start (wall_start + elapsed)
//
// Observer callbacks cannot fail, so the first sink error is kept in status()
// and reported once on stderr; later events are dropped.
class SessionRecorder final : public PlaybackObserver, public StreamObserver {
 public:
  SessionRecorder(IEventLoop& loop, EventSink& sink, Config cfg, std::string config_path);

  SessionRecorder(const SessionRecorder&) = delete;
  SessionRecorder& operator=(const SessionRecorder&) = delete;

  // Prunes old logs under output.out_dir and opens the sink.
  Status start(const std::string& producer);
  void stop();

  [[nodiscard]] bool started() const noexcept { return started_; }
  [[nodiscard]] const Status& status() const noexcept { return status_; }
  [[nodiscard]] std::size_t events_written() const noexcept { return events_written_; }

  // Free-form lifecycle event (e.g. "shutdown").
  Status emit_event(const std::string& type, const std::string& message);

  // PlaybackObserver
  void on_display(const DisplayFrame& frame) override;
  void on_advance(const AdvanceRecord& record) override;
  void on_state_changed(PlaybackState from, PlaybackState to) override;
  void on_reset() override;

  // StreamObserver
  void on_stream_started(const std::string& producer, const std::string& document) override;
  void on_chunk_accepted(std::size_t index, const Chunk& chunk) override;
  void on_record_rejected(std::size_t line_no, const Status& why) override;
  void on_stream_closed(const StreamSummary& summary) override;

  // Keeps the newest `keep_last` events_<epoch_ns>.jsonl files; never touches
  // events_latest.jsonl. Best effort.
  static void prune_out_dir(const std::string& out_dir, std::size_t keep_last);

 private:
  static TimestampNs wall_now_epoch_ns();
  Event make_event(std::string type) const;
  void record(const Event& e, bool flush);

  IEventLoop& loop_;
  EventSink& sink_;
  Config cfg_;
  std::string config_path_;

  TimestampMs t0_{};
  TimestampNs t0_wall_ns_{0};
  bool started_{false};

  Status status_;
  std::size_t events_written_{0};
};

}  // namespace pacer
