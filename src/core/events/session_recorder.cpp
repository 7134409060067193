// File: src/core/events/session_recorder.cpp
#include "pacer/core/events/session_recorder.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "pacer/core/timing/timing_calculator.hpp"
#include "pacer/core/util/repro_hash.hpp"

namespace pacer {
namespace {

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::int64_t parse_events_epoch_ns_from_name(const std::string& name) {
  const std::string prefix = "events_";
  const std::string suffix = ".jsonl";

  // Never touch the stable tail target.
  if (name == "events_latest.jsonl") return -1;

  if (name.rfind(prefix, 0) != 0) return -1;
  if (name.size() <= prefix.size() + suffix.size()) return -1;
  if (name.substr(name.size() - suffix.size()) != suffix) return -1;

  const std::string mid =
      name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  if (!is_digits(mid)) return -1;

  std::int64_t v = -1;
  const auto [p, ec] = std::from_chars(mid.data(), mid.data() + mid.size(), v);
  if (ec != std::errc() || p != mid.data() + mid.size()) return -1;
  return v;
}

}  // namespace

SessionRecorder::SessionRecorder(IEventLoop& loop, EventSink& sink, Config cfg,
                                 std::string config_path)
    : loop_(loop), sink_(sink), cfg_(std::move(cfg)), config_path_(std::move(config_path)) {}

TimestampNs SessionRecorder::wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

void SessionRecorder::prune_out_dir(const std::string& out_dir, std::size_t keep_last) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(out_dir, ec)) return;

  struct Entry {
    std::int64_t key_epoch_ns;
    fs::path path;
  };

  std::vector<Entry> files;
  for (const auto& it : fs::directory_iterator(out_dir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;

    const std::string name = it.path().filename().string();
    const std::int64_t k = parse_events_epoch_ns_from_name(name);
    if (k < 0) continue;

    files.push_back(Entry{k, it.path()});
  }

  if (files.size() <= keep_last) return;

  // Newest first, delete the tail.
  std::sort(files.begin(), files.end(),
            [](const Entry& a, const Entry& b) { return a.key_epoch_ns > b.key_epoch_ns; });

  for (std::size_t i = keep_last; i < files.size(); ++i) {
    fs::remove(files[i].path, ec);
    ec.clear();  // best-effort housekeeping
  }
}

Status SessionRecorder::start(const std::string& producer) {
  // keep_last counts the file this session is about to create.
  prune_out_dir(cfg_.output.out_dir, cfg_.output.keep_last > 0 ? cfg_.output.keep_last - 1 : 0);

  t0_ = loop_.now();
  t0_wall_ns_ = wall_now_epoch_ns();

  RunInfo run;
  run.config_path = config_path_;
  run.out_dir = cfg_.output.out_dir;
  run.config_hash = compute_config_hash(cfg_);
  run.producer = producer;
  run.start_time = t0_;
  run.wall_start_time_ns = t0_wall_ns_;

  status_ = sink_.open(run);
  started_ = status_.ok();
  if (started_) events_written_ = 1;  // header line
  return status_;
}

void SessionRecorder::stop() {
  if (!started_) return;
  (void)sink_.flush();  // a flush error here has nowhere left to go
  sink_.close();
  started_ = false;
}

Event SessionRecorder::make_event(std::string type) const {
  Event e;
  e.type = std::move(type);
  e.t_ms = loop_.now();
  // Wall time follows the loop clock so manual-clock sessions stay consistent.
  e.t_wall_ns = TimestampNs{t0_wall_ns_.ns + (e.t_ms - t0_) * 1000000};
  return e;
}

void SessionRecorder::record(const Event& e, bool flush) {
  if (!started_ || !status_.ok()) return;

  Status st = sink_.emit(e);
  if (st.ok() && flush) st = sink_.flush();
  if (!st.ok()) {
    status_ = st;
    std::cerr << "event log disabled: " << st.message() << "\n";
    return;
  }
  ++events_written_;
}

Status SessionRecorder::emit_event(const std::string& type, const std::string& message) {
  Event e = make_event(type);
  e.message = message;
  record(e, /*flush=*/true);
  return status_;
}

// -----------------------------
// PlaybackObserver
// -----------------------------

void SessionRecorder::on_display(const DisplayFrame& frame) {
  if (!frame.chunk) return;  // cleared displays show up as state changes

  Event e = make_event(frame.reason == DisplayReason::kRepace ? "repaced" : "chunk_shown");
  e.add_int("index", static_cast<std::int64_t>(frame.index))
      .add_str("text", frame.chunk->text)
      .add_double("complexity", frame.chunk->complexity)
      .add_int("words", frame.words)
      .add_int("duration_ms", frame.duration_ms)
      .add_int("inst_wpm", frame.inst_wpm)
      .add_str("reason", to_string(frame.reason));
  record(e, /*flush=*/false);
}

void SessionRecorder::on_advance(const AdvanceRecord& rec) {
  Event e = make_event("chunk_advanced");
  e.add_int("index", static_cast<std::int64_t>(rec.index))
      .add_int("words", rec.words)
      .add_int("duration_ms", rec.duration_ms);
  record(e, /*flush=*/false);
}

void SessionRecorder::on_state_changed(PlaybackState from, PlaybackState to) {
  Event e = make_event("state_changed");
  e.add_str("from", to_string(from)).add_str("to", to_string(to));
  record(e, /*flush=*/true);
}

void SessionRecorder::on_reset() {
  record(make_event("session_reset"), /*flush=*/true);
}

// -----------------------------
// StreamObserver
// -----------------------------

void SessionRecorder::on_stream_started(const std::string& producer, const std::string& document) {
  Event e = make_event("stream_started");
  e.add_str("producer", producer)
      .add_int("document_bytes", static_cast<std::int64_t>(document.size()))
      .add_int("document_words", count_words(document))
      .add_str("document_hash", compute_document_hash(document));
  record(e, /*flush=*/true);
}

void SessionRecorder::on_chunk_accepted(std::size_t index, const Chunk& chunk) {
  Event e = make_event("chunk_accepted");
  e.add_int("index", static_cast<std::int64_t>(index))
      .add_str("text", chunk.text)
      .add_double("complexity", chunk.complexity);
  record(e, /*flush=*/false);
}

void SessionRecorder::on_record_rejected(std::size_t line_no, const Status& why) {
  Event e = make_event("record_rejected");
  e.message = why.message();
  e.add_int("line", static_cast<std::int64_t>(line_no)).add_str("code", to_string(why.code()));
  record(e, /*flush=*/false);
}

void SessionRecorder::on_stream_closed(const StreamSummary& summary) {
  Event e = make_event("stream_closed");
  if (!summary.status.ok()) e.message = summary.status.message();
  e.add_str("end", to_string(summary.end))
      .add_int("accepted", static_cast<std::int64_t>(summary.accepted))
      .add_int("rejected", static_cast<std::int64_t>(summary.rejected))
      .add_int("bytes_read", static_cast<std::int64_t>(summary.bytes_read));
  record(e, /*flush=*/true);
}

}  // namespace pacer
