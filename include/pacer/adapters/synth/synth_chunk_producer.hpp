// File: include/pacer/adapters/synth/synth_chunk_producer.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "pacer/core/io/chunk_producer.hpp"
#include "pacer/core/types.hpp"

namespace pacer {

struct SynthProducerConfig {
  std::uint32_t seed{1};

  // Phrase length bounds, in words. A phrase also ends early after trailing
  // punctuation.
  int min_words{1};
  int max_words{5};

  // Upper bound on bytes released per read(); the actual size is random in
  // [1, bytes_per_read] so records regularly straddle reads.
  std::size_t bytes_per_read{48};
};

// Offline stand-in for the segmentation service: splits the document into
// short phrases locally and serves them as an NDJSON response. Deterministic
// for a given seed.
class SynthChunkProducer final : public IChunkProducer {
 public:
  explicit SynthChunkProducer(SynthProducerConfig cfg);

  Status start(const std::string& document) override;
  Status read(std::string* out) override;
  void cancel() override;

  std::string name() const override { return "synth"; }

  // The chunks start(document) would serve, in order.
  static std::vector<Chunk> segment(std::string_view document, const SynthProducerConfig& cfg);

  // Heuristic in [0, 1] from average word length and the share of long words.
  static double score_complexity(const std::vector<std::string_view>& words);

 private:
  SynthProducerConfig cfg_;
  std::mt19937 rng_;

  std::string response_;
  std::size_t pos_{0};
  bool active_{false};
};

}  // namespace pacer
