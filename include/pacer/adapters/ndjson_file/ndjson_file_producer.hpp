// File: include/pacer/adapters/ndjson_file/ndjson_file_producer.hpp
#pragma once

#include <cstddef>
#include <fstream>
#include <string>

#include "pacer/core/io/chunk_producer.hpp"

namespace pacer {

struct NdjsonFileProducerConfig {
  std::string path;  // recorded producer response, one record per line
  std::size_t bytes_per_read{256};
};

// Replays a recorded response. The document passed to start() is ignored.
class NdjsonFileProducer final : public IChunkProducer {
 public:
  explicit NdjsonFileProducer(NdjsonFileProducerConfig cfg);

  Status start(const std::string& document) override;
  Status read(std::string* out) override;
  void cancel() override;

  std::string name() const override { return "ndjson_file"; }

 private:
  NdjsonFileProducerConfig cfg_;
  std::ifstream f_;
};

}  // namespace pacer
