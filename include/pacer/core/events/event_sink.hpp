// File: include/pacer/core/events/event_sink.hpp
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "pacer/core/status.hpp"
#include "pacer/core/types.hpp"

namespace pacer {

// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  std::string config_path;
  std::string out_dir;
  std::string config_hash;
  std::string producer;

  TimestampMs start_time;          // loop clock at session start
  TimestampNs wall_start_time_ns;  // epoch ns at session start
};

// One typed payload field, stored pre-rendered as a JSON value.
struct EventField {
  std::string key;
  std::string json;
};

struct Event {
  std::string type;  // e.g. "session_started", "chunk_shown", "repaced"
  TimestampMs t_ms;
  TimestampNs t_wall_ns;

  std::string message;  // optional human-readable hint
  std::vector<EventField> fields;

  Event& add_int(std::string key, std::int64_t v);
  Event& add_double(std::string key, double v);
  Event& add_str(std::string key, const std::string& v);
  Event& add_bool(std::string key, bool v);
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace pacer
