// include/pacer/core/stream/record_parser.hpp
#pragma once

#include <string>
#include <string_view>

#include "pacer/core/status.hpp"
#include "pacer/core/types.hpp"

namespace pacer {

// Strict boundary check for one producer record.
//
// Accepts a single JSON object with
//   "text":       a non-empty JSON string
//   "complexity": a finite JSON number (clamped into [0, 1])
// Other keys are ignored. Anything else yields parse_error (malformed) or
// invalid_argument (well-formed but wrong shape).
Result<Chunk> parse_chunk_record(std::string_view line);

// Serialises a chunk as one NDJSON record (no trailing newline).
std::string format_chunk_record(const Chunk& chunk);

}  // namespace pacer
