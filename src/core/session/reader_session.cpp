// File: src/core/session/reader_session.cpp
#include "pacer/core/session/reader_session.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "pacer/core/util/json_text.hpp"

namespace pacer {
namespace {

constexpr std::size_t kPreviewChunks = 12;
constexpr std::size_t kPreviewMaxBytes = 140;
constexpr const char* kEllipsis = "\xE2\x80\xA6";  // U+2026

std::string trim(const std::string& s) {
  const auto is_ws = [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
  };
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && is_ws(s[b])) ++b;
  while (e > b && is_ws(s[e - 1])) --e;
  return s.substr(b, e - b);
}

}  // namespace

ReaderSession::ReaderSession(IEventLoop& loop, std::unique_ptr<IChunkProducer> producer,
                             const Config& cfg)
    : producer_(std::move(producer)),
      playback_cfg_(cfg.playback),
      timing_(cfg.timing),
      scheduler_(loop, buffer_, timing_, cfg.playback),
      consumer_(loop, buffer_, cfg.stream) {
  // Metrics first so other observers read fresh values inside their callbacks.
  scheduler_.add_observer(&metrics_);
}

ReaderSession::~ReaderSession() {
  suppress_autoplay_ = true;
  scheduler_.halt();
  consumer_.clear_observers();
  consumer_.cancel();
}

std::string ReaderSession::producer_name() const {
  return producer_ ? producer_->name() : std::string("none");
}

// -----------------------------
// Document / ingestion
// -----------------------------

Status ReaderSession::process_document() {
  const std::string text = document_;
  return process_document(text);
}

Status ReaderSession::process_document(const std::string& text) {
  std::string trimmed = trim(text);
  if (trimmed.empty()) return Status::invalid_argument("document is empty");
  if (!producer_) return Status::invalid_argument("no chunk producer configured");

  // Fresh reading state; playback waits for the stream (or the user).
  reset();
  document_ = std::move(trimmed);
  processing_ = true;

  const Status st = consumer_.start(*producer_, document_,
                                    [this](const StreamSummary& s) { on_stream_done(s); });
  if (!st.ok()) {
    processing_ = false;
    return st;
  }
  return Status::ok_status();
}

void ReaderSession::cancel_processing() {
  consumer_.cancel();
  processing_ = false;
}

void ReaderSession::on_stream_done(const StreamSummary& /*summary*/) {
  processing_ = false;
  if (suppress_autoplay_ || !playback_cfg_.auto_play) return;
  if (!buffer_.empty()) scheduler_.play();
}

// -----------------------------
// Playback
// -----------------------------

void ReaderSession::play() {
  // Nothing loaded and nothing coming: do not start a loop that would poll forever.
  if (buffer_.empty() && !processing_ && !buffer_.closed()) return;
  scheduler_.play();
}

void ReaderSession::pause() { scheduler_.pause(); }

void ReaderSession::toggle_play() {
  if (scheduler_.is_playing()) {
    pause();
  } else {
    play();
  }
}

void ReaderSession::reset() {
  scheduler_.halt();

  suppress_autoplay_ = true;
  consumer_.cancel();
  suppress_autoplay_ = false;

  buffer_.clear();
  processing_ = false;
  document_.clear();

  // Clears cursor, display, metrics (via MetricsTracker::on_reset) and goes Idle.
  scheduler_.reset();
}

void ReaderSession::seek(std::int64_t index) { scheduler_.seek(index); }

void ReaderSession::seek_ratio(double ratio) {
  const std::size_t total = buffer_.size();
  if (total == 0) return;
  const double r = std::isfinite(ratio) ? std::clamp(ratio, 0.0, 1.0) : 0.0;
  const auto idx = static_cast<std::int64_t>(std::floor(r * static_cast<double>(total)));
  seek(std::min<std::int64_t>(idx, static_cast<std::int64_t>(total) - 1));
}

void ReaderSession::next() {
  const std::size_t total = buffer_.size();
  if (total == 0) return;
  const auto cur = static_cast<std::int64_t>(scheduler_.cursor());
  seek(std::min<std::int64_t>(cur + 1, static_cast<std::int64_t>(total) - 1));
}

void ReaderSession::prev() {
  if (buffer_.empty()) return;
  const auto cur = static_cast<std::int64_t>(scheduler_.cursor());
  seek(std::max<std::int64_t>(cur - 1, 0));
}

// -----------------------------
// Timing
// -----------------------------

Status ReaderSession::set_timing(const TimingConfig& timing) {
  PACER_RETURN_IF_ERROR(validate_timing_config(timing));
  apply_timing(timing);
  return Status::ok_status();
}

Status ReaderSession::set_base_wpm(int wpm) {
  TimingConfig t = timing_;
  t.base_wpm = wpm;
  return set_timing(t);
}

Status ReaderSession::set_pause_comma_semicolon_ms(int ms) {
  TimingConfig t = timing_;
  t.pause_comma_semicolon_ms = ms;
  return set_timing(t);
}

Status ReaderSession::set_pause_colon_dash_ms(int ms) {
  TimingConfig t = timing_;
  t.pause_colon_dash_ms = ms;
  return set_timing(t);
}

Status ReaderSession::set_pause_sentence_end_ms(int ms) {
  TimingConfig t = timing_;
  t.pause_sentence_end_ms = ms;
  return set_timing(t);
}

void ReaderSession::increase_wpm() {
  TimingConfig t = timing_;
  t.base_wpm = std::min(t.base_wpm + playback_cfg_.wpm_step, TimingLimits::kMaxWpm);
  apply_timing(t);
}

void ReaderSession::decrease_wpm() {
  TimingConfig t = timing_;
  t.base_wpm = std::max(t.base_wpm - playback_cfg_.wpm_step, TimingLimits::kMinWpm);
  apply_timing(t);
}

void ReaderSession::apply_timing(const TimingConfig& timing) {
  if (timing == timing_) return;
  timing_ = timing;
  scheduler_.repace();
}

// -----------------------------
// Presentation helpers
// -----------------------------

std::string ReaderSession::preview_for_index(std::size_t index) const {
  const auto& all = buffer_.chunks();
  if (index >= all.size()) return "No preview";

  std::string text;
  const std::size_t end = std::min(index + kPreviewChunks, all.size());
  for (std::size_t i = index; i < end; ++i) {
    if (i > index) text += ' ';
    text += all[i].text;
  }
  if (text.empty()) return "No preview";
  if (text.size() > kPreviewMaxBytes) {
    return std::string(utf8_prefix(text, kPreviewMaxBytes)) + kEllipsis;
  }
  return text;
}

std::string ReaderSession::status_label() const {
  if (processing_) return "Processing\xE2\x80\xA6";
  if (buffer_.empty()) return "Ready";
  if (!scheduler_.is_playing()) return "Paused";
  return "";
}

std::string ReaderSession::chunk_counter_label() const {
  const std::size_t total = buffer_.size();
  if (total == 0) return "No document loaded";
  const std::size_t shown = std::min(scheduler_.cursor() + 1, total);
  std::string label = "Chunk " + std::to_string(shown) + " / " + std::to_string(total);
  if (!buffer_.closed()) label += " (streaming\xE2\x80\xA6)";
  return label;
}

SessionSnapshot ReaderSession::snapshot() const {
  SessionSnapshot s;
  s.document_text = document_;
  s.processing = processing_;
  s.stream_done = buffer_.closed();
  s.total_chunks = buffer_.size();
  s.current_index = scheduler_.cursor();
  s.current_chunk = scheduler_.displayed().chunk;
  s.state = scheduler_.state();
  s.playing = scheduler_.is_playing();
  s.timing = timing_;
  s.inst_wpm = metrics_.inst_wpm();
  s.dynamic_wpm = metrics_.dynamic_wpm();
  s.progress = progress();
  return s;
}

}  // namespace pacer
