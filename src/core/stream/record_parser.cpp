// File: src/core/stream/record_parser.cpp
#include "pacer/core/stream/record_parser.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace pacer {

using json = nlohmann::json;

Result<Chunk> parse_chunk_record(std::string_view line) {
  // No exceptions: a discarded value marks a syntax error.
  const json root = json::parse(line.begin(), line.end(), nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded()) return Result<Chunk>::err(Status::parse_error("malformed record"));
  if (!root.is_object()) return Result<Chunk>::err(Status::parse_error("record is not a JSON object"));

  const auto text = root.find("text");
  const auto complexity = root.find("complexity");

  if (text == root.end()) return Result<Chunk>::err(Status::invalid_argument("record has no \"text\""));
  if (!text->is_string()) {
    return Result<Chunk>::err(Status::invalid_argument("\"text\" must be a string"));
  }
  if (complexity == root.end()) {
    return Result<Chunk>::err(Status::invalid_argument("record has no \"complexity\""));
  }
  // is_number() is false for booleans and null.
  if (!complexity->is_number()) {
    return Result<Chunk>::err(Status::invalid_argument("\"complexity\" must be a number"));
  }

  Chunk chunk;
  chunk.text = text->get<std::string>();
  const double c = complexity->get<double>();

  if (chunk.text.empty()) {
    return Result<Chunk>::err(Status::invalid_argument("\"text\" must not be empty"));
  }
  // 1e999 overflows to inf.
  if (!std::isfinite(c)) {
    return Result<Chunk>::err(Status::invalid_argument("\"complexity\" must be finite"));
  }
  chunk.complexity = std::clamp(c, 0.0, 1.0);

  return Result<Chunk>::ok(std::move(chunk));
}

std::string format_chunk_record(const Chunk& chunk) {
  const json rec = {{"text", chunk.text}, {"complexity", chunk.complexity}};
  // Invalid UTF-8 is replaced rather than thrown on.
  return rec.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace pacer
