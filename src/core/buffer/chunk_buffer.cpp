// File: src/core/buffer/chunk_buffer.cpp
#include "pacer/core/buffer/chunk_buffer.hpp"

#include <utility>

namespace pacer {

Status ChunkBuffer::append(Chunk chunk) {
  if (closed_) return Status::out_of_range("ChunkBuffer::append: buffer is closed");
  if (chunk.text.empty()) return Status::invalid_argument("ChunkBuffer::append: empty chunk text");
  chunks_.push_back(std::move(chunk));
  return Status::ok_status();
}

bool ChunkBuffer::close() {
  if (closed_) return false;
  closed_ = true;
  return true;
}

void ChunkBuffer::clear() {
  chunks_.clear();
  closed_ = false;
}

}  // namespace pacer
