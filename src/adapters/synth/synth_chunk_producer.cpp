// File: src/adapters/synth/synth_chunk_producer.cpp
#include "pacer/adapters/synth/synth_chunk_producer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "pacer/core/stream/record_parser.hpp"

namespace pacer {
namespace {

constexpr std::size_t kLongWordBytes = 8;

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

// A token ending a clause or sentence closes the phrase it belongs to.
bool closes_phrase(std::string_view token) {
  if (token.empty()) return false;
  switch (token.back()) {
    case ',': case ';': case ':': case '.': case '!': case '?': case '-':
      return true;
    default:
      break;
  }
  return ends_with(token, "\xE2\x80\x93") || ends_with(token, "\xE2\x80\x94");
}

std::vector<std::string_view> tokenize(std::string_view text) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && is_space(text[i])) ++i;
    const std::size_t b = i;
    while (i < text.size() && !is_space(text[i])) ++i;
    if (i > b) out.push_back(text.substr(b, i - b));
  }
  return out;
}

std::string join(const std::vector<std::string_view>& words) {
  std::string s;
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (i > 0) s += ' ';
    s.append(words[i].data(), words[i].size());
  }
  return s;
}

}  // namespace

SynthChunkProducer::SynthChunkProducer(SynthProducerConfig cfg)
    : cfg_(std::move(cfg)), rng_(cfg_.seed) {
  cfg_.min_words = std::max(1, cfg_.min_words);
  cfg_.max_words = std::max(cfg_.min_words, cfg_.max_words);
  cfg_.bytes_per_read = std::max<std::size_t>(1, cfg_.bytes_per_read);
}

double SynthChunkProducer::score_complexity(const std::vector<std::string_view>& words) {
  if (words.empty()) return 0.0;

  std::size_t letters = 0;
  std::size_t long_words = 0;
  for (const auto w : words) {
    letters += w.size();
    if (w.size() >= kLongWordBytes) ++long_words;
  }
  const double avg = static_cast<double>(letters) / static_cast<double>(words.size());
  const double long_ratio = static_cast<double>(long_words) / static_cast<double>(words.size());

  // avg 3 bytes -> 0, avg 9+ bytes -> 1.
  const double length_score = std::clamp((avg - 3.0) / 6.0, 0.0, 1.0);
  const double c = std::clamp(0.5 * length_score + 0.5 * long_ratio, 0.0, 1.0);
  return std::round(c * 100.0) / 100.0;
}

std::vector<Chunk> SynthChunkProducer::segment(std::string_view document,
                                               const SynthProducerConfig& cfg) {
  const int min_words = std::max(1, cfg.min_words);
  const int max_words = std::max(min_words, cfg.max_words);

  std::mt19937 rng(cfg.seed);
  std::uniform_int_distribution<int> len_dist(min_words, max_words);

  std::vector<Chunk> chunks;
  std::vector<std::string_view> phrase;
  int target = len_dist(rng);

  const auto emit = [&] {
    if (phrase.empty()) return;
    chunks.push_back(Chunk{join(phrase), score_complexity(phrase)});
    phrase.clear();
    target = len_dist(rng);
  };

  for (const auto token : tokenize(document)) {
    phrase.push_back(token);
    if (static_cast<int>(phrase.size()) >= target || closes_phrase(token)) emit();
  }
  emit();
  return chunks;
}

Status SynthChunkProducer::start(const std::string& document) {
  cancel();

  response_.clear();
  for (const auto& c : segment(document, cfg_)) {
    response_ += format_chunk_record(c);
    response_ += '\n';
  }
  pos_ = 0;
  rng_.seed(cfg_.seed);
  active_ = true;
  return Status::ok_status();
}

Status SynthChunkProducer::read(std::string* out) {
  if (!out) return Status::invalid_argument("SynthChunkProducer::read: out is null");
  if (!active_) return Status::cancelled("SynthChunkProducer::read: no active request");
  if (pos_ >= response_.size()) return Status::out_of_range("eof");

  std::uniform_int_distribution<std::size_t> n_dist(1, cfg_.bytes_per_read);
  const std::size_t n = std::min(n_dist(rng_), response_.size() - pos_);
  out->append(response_, pos_, n);
  pos_ += n;
  return Status::ok_status();
}

void SynthChunkProducer::cancel() {
  active_ = false;
  response_.clear();
  pos_ = 0;
}

}  // namespace pacer
