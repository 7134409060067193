// include/pacer/core/buffer/chunk_buffer.hpp
#pragma once

#include <cstddef>
#include <vector>

#include "pacer/core/status.hpp"
#include "pacer/core/types.hpp"

namespace pacer {

// Append-only, document-ordered chunk sequence.
//
// One writer (StreamConsumer) appends and closes; the scheduler reads by index.
// Nothing is ever removed or reordered except by clear(), which only the session
// calls on reset.
class ChunkBuffer {
 public:
  ChunkBuffer() = default;

  ChunkBuffer(const ChunkBuffer&) = delete;
  ChunkBuffer& operator=(const ChunkBuffer&) = delete;

  // Fails with invalid_argument on an empty text and out_of_range once closed.
  Status append(Chunk chunk);

  // Marks the stream complete. Returns false if it was already closed.
  bool close();

  // Back to an empty, open buffer.
  void clear();

  [[nodiscard]] std::size_t size() const noexcept { return chunks_.size(); }
  [[nodiscard]] bool empty() const noexcept { return chunks_.empty(); }
  [[nodiscard]] bool closed() const noexcept { return closed_; }

  // Precondition: index < size().
  [[nodiscard]] const Chunk& at(std::size_t index) const { return chunks_.at(index); }

  [[nodiscard]] const std::vector<Chunk>& chunks() const noexcept { return chunks_; }

 private:
  std::vector<Chunk> chunks_;
  bool closed_{false};
};

}  // namespace pacer
