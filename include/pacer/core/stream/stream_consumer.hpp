// include/pacer/core/stream/stream_consumer.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "pacer/core/buffer/chunk_buffer.hpp"
#include "pacer/core/config.hpp"
#include "pacer/core/io/chunk_producer.hpp"
#include "pacer/core/sched/event_loop.hpp"
#include "pacer/core/status.hpp"
#include "pacer/core/stream/line_framer.hpp"
#include "pacer/core/types.hpp"

namespace pacer {

enum class StreamEnd {
  kCompleted,  // producer reported eof
  kFailed,     // producer start/read error
  kCancelled,  // cancel() or teardown
};

const char* to_string(StreamEnd e);

struct StreamSummary {
  std::string producer;
  std::size_t accepted = 0;
  std::size_t rejected = 0;
  std::size_t bytes_read = 0;

  StreamEnd end = StreamEnd::kCompleted;
  Status status;  // why it failed; OK for a clean end
};

class StreamObserver {
 public:
  virtual ~StreamObserver() = default;

  virtual void on_stream_started(const std::string& /*producer*/, const std::string& /*document*/) {}
  virtual void on_chunk_accepted(std::size_t /*index*/, const Chunk& /*chunk*/) {}
  virtual void on_record_rejected(std::size_t /*line_no*/, const Status& /*why*/) {}
  virtual void on_stream_closed(const StreamSummary& /*summary*/) {}
};

// Pulls newline-framed records from a producer on a poll timer, validates them
// and appends them to the buffer. Sole writer of the buffer.
//
// Whatever happens (eof, producer error, cancel) the stream ends the same way:
// the buffer is closed exactly once, observers hear on_stream_closed, then the
// completion handler passed to start() runs.
class StreamConsumer {
 public:
  using CompletionHandler = std::function<void(const StreamSummary&)>;

  StreamConsumer(IEventLoop& loop, ChunkBuffer& buffer, StreamConfig cfg = {});
  ~StreamConsumer();

  StreamConsumer(const StreamConsumer&) = delete;
  StreamConsumer& operator=(const StreamConsumer&) = delete;

  void add_observer(StreamObserver* observer);
  void remove_observer(StreamObserver* observer);
  void clear_observers() { observers_.clear(); }

  // Issues producer.start(document) and begins polling. A producer start
  // failure is not returned here: it ends the stream as kFailed on the next
  // loop turn. Fails only if a stream is already active or the buffer is closed.
  // `producer` must stay alive until the stream ends.
  Status start(IChunkProducer& producer, const std::string& document,
               CompletionHandler on_done = nullptr);

  // Idempotent; a no-op once the stream has ended.
  void cancel();

  [[nodiscard]] bool active() const noexcept { return active_; }
  [[nodiscard]] const StreamSummary& summary() const noexcept { return summary_; }

 private:
  void pump();
  void handle_line(std::string line);
  void reject_overlong();
  void finish(StreamEnd end, Status status);

  ChunkBuffer& buffer_;
  StreamConfig cfg_;

  IChunkProducer* producer_{nullptr};
  CompletionHandler on_done_;
  TimerSlot poll_timer_;
  LineFramer framer_;

  bool active_{false};
  std::size_t line_no_{0};
  StreamSummary summary_;

  std::vector<StreamObserver*> observers_;
};

}  // namespace pacer
