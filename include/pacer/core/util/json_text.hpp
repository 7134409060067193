// include/pacer/core/util/json_text.hpp
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace pacer {

// Escapes `s` for use inside a JSON string literal (quotes not included).
// Bytes >= 0x80 pass through unchanged, so valid UTF-8 stays valid.
std::string json_escape(std::string_view s);

// Largest prefix of `s` no longer than `max_bytes` that does not split a
// UTF-8 sequence.
std::string_view utf8_prefix(std::string_view s, std::size_t max_bytes);

}  // namespace pacer
