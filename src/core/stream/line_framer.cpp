// File: src/core/stream/line_framer.cpp
#include "pacer/core/stream/line_framer.hpp"

#include <utility>

namespace pacer {

void LineFramer::push(std::string_view bytes, std::vector<FramedLine>* out) {
  while (!bytes.empty()) {
    const std::size_t nl = bytes.find('\n');
    const std::string_view piece = bytes.substr(0, nl);

    if (!discarding_) {
      if (partial_.size() + piece.size() > max_line_bytes_) {
        partial_.clear();
        discarding_ = true;
        ++dropped_overlong_;
        if (out) out->push_back(FramedLine{std::string(), true});
      } else {
        partial_.append(piece);
      }
    }

    if (nl == std::string_view::npos) return;

    if (!discarding_) {
      std::string line = std::move(partial_);
      partial_.clear();
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (out) out->push_back(FramedLine{std::move(line), false});
    }
    discarding_ = false;
    bytes.remove_prefix(nl + 1);
  }
}

std::optional<std::string> LineFramer::flush() {
  discarding_ = false;
  if (partial_.empty()) return std::nullopt;
  std::string tail = std::move(partial_);
  partial_.clear();
  if (!tail.empty() && tail.back() == '\r') tail.pop_back();
  return tail;
}

void LineFramer::clear() {
  partial_.clear();
  discarding_ = false;
  dropped_overlong_ = 0;
}

}  // namespace pacer
