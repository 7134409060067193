// include/pacer/core/stream/line_framer.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pacer {

// One framed line, in arrival order. A line longer than the limit is reported
// as an `overlong` entry with empty text at the point where it was dropped.
struct FramedLine {
  std::string text;
  bool overlong{false};
};

// Reassembles newline-delimited records from arbitrarily split reads.
// A trailing '\r' is stripped. Lines longer than max_line_bytes are dropped
// whole (counted in dropped_overlong()).
class LineFramer {
 public:
  explicit LineFramer(std::size_t max_line_bytes) : max_line_bytes_(max_line_bytes) {}

  // Appends `bytes`; every line completed or dropped by them is pushed onto `out`.
  void push(std::string_view bytes, std::vector<FramedLine>* out);

  // Takes the unterminated tail left at end of stream, if any.
  std::optional<std::string> flush();

  void clear();

  [[nodiscard]] std::size_t pending_bytes() const noexcept { return partial_.size(); }
  [[nodiscard]] std::size_t dropped_overlong() const noexcept { return dropped_overlong_; }

 private:
  std::size_t max_line_bytes_;
  std::string partial_;
  bool discarding_{false};  // inside an overlong line, skipping to its newline
  std::size_t dropped_overlong_{0};
};

}  // namespace pacer
