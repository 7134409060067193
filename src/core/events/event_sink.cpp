// File: src/core/events/event_sink.cpp
#include "pacer/core/events/event_sink.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

#include "pacer/core/util/json_text.hpp"

namespace pacer {

Event& Event::add_int(std::string key, std::int64_t v) {
  fields.push_back(EventField{std::move(key), std::to_string(v)});
  return *this;
}

Event& Event::add_double(std::string key, double v) {
  // JSON has no NaN/Inf.
  if (!std::isfinite(v)) {
    fields.push_back(EventField{std::move(key), "null"});
    return *this;
  }
  std::ostringstream ss;
  ss << std::setprecision(6) << v;
  fields.push_back(EventField{std::move(key), ss.str()});
  return *this;
}

Event& Event::add_str(std::string key, const std::string& v) {
  fields.push_back(EventField{std::move(key), "\"" + json_escape(v) + "\""});
  return *this;
}

Event& Event::add_bool(std::string key, bool v) {
  fields.push_back(EventField{std::move(key), v ? "true" : "false"});
  return *this;
}

}  // namespace pacer
