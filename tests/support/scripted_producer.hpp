// File: tests/support/scripted_producer.hpp
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "pacer/core/io/chunk_producer.hpp"

namespace pacer::testing {

// Producer that replays a fixed script, one step per read().
// After the script runs out it keeps answering `tail` (eof by default), so a
// script of byte pieces alone behaves like a complete response.
class ScriptedProducer final : public IChunkProducer {
 public:
  struct Step {
    std::string bytes;
    Status status;  // returned after appending bytes
  };

  ScriptedProducer() = default;
  explicit ScriptedProducer(std::vector<Step> script) : script_(std::move(script)) {}

  static Step bytes(std::string b) { return Step{std::move(b), Status::ok_status()}; }
  static Step idle() { return Step{"", Status::ok_status()}; }
  static Step fail(std::string why) { return Step{"", Status::io_error(std::move(why))}; }
  static Step eof() { return Step{"", Status::out_of_range("eof")}; }

  // Script used for the next start().
  void set_script(std::vector<Step> script) { script_ = std::move(script); }
  void set_start_status(Status st) { start_status_ = std::move(st); }
  void set_tail(Status st) { tail_ = std::move(st); }

  Status start(const std::string& document) override {
    ++starts_;
    last_document_ = document;
    pos_ = 0;
    active_ = start_status_.ok();
    return start_status_;
  }

  Status read(std::string* out) override {
    ++reads_;
    if (!active_) return Status::cancelled("not started");
    if (pos_ >= script_.size()) return tail_;
    const Step& s = script_[pos_++];
    out->append(s.bytes);
    return s.status;
  }

  void cancel() override {
    ++cancels_;
    active_ = false;
  }

  std::string name() const override { return "scripted"; }

  int starts() const { return starts_; }
  int reads() const { return reads_; }
  int cancels() const { return cancels_; }
  const std::string& last_document() const { return last_document_; }

 private:
  std::vector<Step> script_;
  std::size_t pos_{0};
  Status start_status_;
  Status tail_{Status::out_of_range("eof")};
  bool active_{false};

  int starts_{0};
  int reads_{0};
  int cancels_{0};
  std::string last_document_;
};

// Builds one NDJSON record line (newline included).
inline std::string record(const std::string& text, double complexity) {
  return "{\"text\":\"" + text + "\",\"complexity\":" + std::to_string(complexity) + "}\n";
}

}  // namespace pacer::testing
