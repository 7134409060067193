// File: src/core/stream/stream_consumer.cpp
#include "pacer/core/stream/stream_consumer.hpp"

#include <algorithm>
#include <utility>

#include "pacer/core/stream/record_parser.hpp"

namespace pacer {
namespace {

bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
  });
}

}  // namespace

const char* to_string(StreamEnd e) {
  switch (e) {
    case StreamEnd::kCompleted: return "completed";
    case StreamEnd::kFailed: return "failed";
    case StreamEnd::kCancelled: return "cancelled";
  }
  return "unknown";
}

StreamConsumer::StreamConsumer(IEventLoop& loop, ChunkBuffer& buffer, StreamConfig cfg)
    : buffer_(buffer),
      cfg_(cfg),
      poll_timer_(loop),
      framer_(cfg.max_line_bytes) {}

StreamConsumer::~StreamConsumer() {
  observers_.clear();
  on_done_ = nullptr;
  cancel();
}

void StreamConsumer::add_observer(StreamObserver* observer) {
  if (!observer) return;
  if (std::find(observers_.begin(), observers_.end(), observer) != observers_.end()) return;
  observers_.push_back(observer);
}

void StreamConsumer::remove_observer(StreamObserver* observer) {
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

Status StreamConsumer::start(IChunkProducer& producer, const std::string& document,
                             CompletionHandler on_done) {
  if (active_) return Status::invalid_argument("StreamConsumer::start: a stream is already active");
  if (buffer_.closed()) {
    return Status::invalid_argument("StreamConsumer::start: buffer is closed; reset it first");
  }

  producer_ = &producer;
  on_done_ = std::move(on_done);
  framer_.clear();
  line_no_ = 0;
  summary_ = StreamSummary{};
  summary_.producer = producer.name();
  active_ = true;

  const auto observers = observers_;
  for (StreamObserver* o : observers) o->on_stream_started(summary_.producer, document);
  if (!active_) return Status::ok_status();  // an observer cancelled

  const Status st = producer.start(document);
  if (!st.ok()) {
    poll_timer_.arm(0, [this, st] { finish(StreamEnd::kFailed, st); });
    return Status::ok_status();
  }

  poll_timer_.arm(0, [this] { pump(); });
  return Status::ok_status();
}

void StreamConsumer::cancel() {
  finish(StreamEnd::kCancelled, Status::cancelled("stream cancelled"));
}

void StreamConsumer::pump() {
  if (!active_ || !producer_) return;

  std::string bytes;
  const Status st = producer_->read(&bytes);

  if (!bytes.empty()) {
    summary_.bytes_read += bytes.size();

    std::vector<FramedLine> lines;
    framer_.push(bytes, &lines);

    for (auto& line : lines) {
      if (line.overlong) {
        reject_overlong();
      } else {
        handle_line(std::move(line.text));
      }
      if (!active_) return;  // cancelled from an observer
    }
  }

  if (st.is_eof()) {
    if (auto tail = framer_.flush()) {
      handle_line(std::move(*tail));
      if (!active_) return;
    }
    finish(StreamEnd::kCompleted, Status::ok_status());
    return;
  }
  if (!st.ok()) {
    // A partial tail from a broken response is not a record.
    finish(StreamEnd::kFailed, st);
    return;
  }

  poll_timer_.arm(cfg_.poll_interval_ms, [this] { pump(); });
}

void StreamConsumer::handle_line(std::string line) {
  ++line_no_;
  if (is_blank(line)) return;

  auto rec = parse_chunk_record(line);
  Status st = rec.ok() ? buffer_.append(rec.take_value()) : rec.status();

  const auto observers = observers_;
  if (!st.ok()) {
    ++summary_.rejected;
    for (StreamObserver* o : observers) o->on_record_rejected(line_no_, st);
    return;
  }

  ++summary_.accepted;
  const std::size_t index = buffer_.size() - 1;
  for (StreamObserver* o : observers) o->on_chunk_accepted(index, buffer_.at(index));
}

void StreamConsumer::reject_overlong() {
  ++line_no_;
  ++summary_.rejected;
  const Status why = Status::invalid_argument("record exceeds stream.max_line_bytes (" +
                                              std::to_string(cfg_.max_line_bytes) + ")");
  const auto observers = observers_;
  for (StreamObserver* o : observers) o->on_record_rejected(line_no_, why);
}

void StreamConsumer::finish(StreamEnd end, Status status) {
  if (!active_) return;
  active_ = false;
  poll_timer_.cancel();

  if (producer_) producer_->cancel();  // releases a finished request as well
  producer_ = nullptr;

  summary_.end = end;
  summary_.status = std::move(status);
  (void)buffer_.close();  // false only if someone else closed it; closed either way

  const auto observers = observers_;
  for (StreamObserver* o : observers) o->on_stream_closed(summary_);

  CompletionHandler done = std::move(on_done_);
  on_done_ = nullptr;
  if (done) done(summary_);
}

}  // namespace pacer
