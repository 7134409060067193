// File: src/adapters/ndjson_file/ndjson_file_producer.cpp
#include "pacer/adapters/ndjson_file/ndjson_file_producer.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

namespace pacer {

NdjsonFileProducer::NdjsonFileProducer(NdjsonFileProducerConfig cfg) : cfg_(std::move(cfg)) {
  cfg_.bytes_per_read = std::max<std::size_t>(1, cfg_.bytes_per_read);
}

Status NdjsonFileProducer::start(const std::string& /*document*/) {
  namespace fs = std::filesystem;

  cancel();
  if (cfg_.path.empty()) return Status::invalid_argument("NdjsonFileProducer: path is empty");

  std::error_code ec;
  if (!fs::exists(cfg_.path, ec)) {
    return Status::not_found("NdjsonFileProducer: file not found: " + cfg_.path);
  }
  if (!fs::is_regular_file(cfg_.path, ec)) {
    return Status::invalid_argument("NdjsonFileProducer: not a regular file: " + cfg_.path);
  }

  f_.open(cfg_.path, std::ios::binary);
  if (!f_.is_open()) return Status::io_error("NdjsonFileProducer: failed to open " + cfg_.path);
  return Status::ok_status();
}

Status NdjsonFileProducer::read(std::string* out) {
  if (!out) return Status::invalid_argument("NdjsonFileProducer::read: out is null");
  if (!f_.is_open()) return Status::cancelled("NdjsonFileProducer::read: no active request");

  std::vector<char> buf(cfg_.bytes_per_read);
  f_.read(buf.data(), static_cast<std::streamsize>(buf.size()));
  const std::streamsize n = f_.gcount();
  if (f_.bad()) return Status::io_error("NdjsonFileProducer: read failed: " + cfg_.path);

  if (n > 0) {
    out->append(buf.data(), static_cast<std::size_t>(n));
    return Status::ok_status();
  }
  if (f_.eof()) return Status::out_of_range("eof");
  return Status::ok_status();
}

void NdjsonFileProducer::cancel() {
  if (f_.is_open()) f_.close();
  f_.clear();
}

}  // namespace pacer
