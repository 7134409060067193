// File: include/pacer/core/io/chunk_producer.hpp
#pragma once

#include <string>

#include "pacer/core/status.hpp"

namespace pacer {

// One logical request at a time: start(document) issues it, read() drains the
// newline-delimited JSON response, cancel() aborts it.
class IChunkProducer {
 public:
  virtual ~IChunkProducer() = default;

  // Issues a request for `document`, abandoning any previous one.
  virtual Status start(const std::string& document) = 0;

  // Non-blocking. Returns:
  //  - OK after appending whatever bytes are available (possibly none) to `out`
  //  - out_of_range("eof") when the response is complete
  //  - other error codes on failure
  virtual Status read(std::string* out) = 0;

  // Idempotent.
  virtual void cancel() = 0;

  virtual std::string name() const = 0;
};

}  // namespace pacer
