// src/core/util/config_loader.cpp
#include "pacer/core/util/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

#include <yaml-cpp/yaml.h>

namespace pacer {
namespace fs = std::filesystem;

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> resolve_includes(YAML::Node root, const fs::path& dir,
                                           std::set<std::string>& stack);

static Result<YAML::Node> load_with_includes(const fs::path& path, std::set<std::string>& stack) {
  std::error_code ec;
  const fs::path canon = fs::weakly_canonical(path, ec);
  const std::string key = ec ? path.string() : canon.string();
  if (stack.count(key) != 0) {
    return Result<YAML::Node>::err(Status::invalid_argument("include cycle at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());

  stack.insert(key);
  auto out = resolve_includes(root_r.take_value(), path.parent_path(), stack);
  stack.erase(key);
  return out;
}

static Result<YAML::Node> resolve_includes(YAML::Node root, const fs::path& dir,
                                           std::set<std::string>& stack) {
  if (root && !root.IsNull() && !root.IsMap()) {
    return Result<YAML::Node>::err(Status::invalid_argument("config root must be a YAML map"));
  }

  YAML::Node merged;  // empty

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, stack);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  // Finally override with this file's contents (excluding includes itself).
  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static Result<Config> parse_config(const YAML::Node& y) {
  Config cfg;  // defaults

  // --- timing
  if (is_map(y["timing"])) {
    const auto t = y["timing"];
    maybe_set(t, "base_wpm", cfg.timing.base_wpm);
    maybe_set(t, "pause_comma_semicolon_ms", cfg.timing.pause_comma_semicolon_ms);
    maybe_set(t, "pause_colon_dash_ms", cfg.timing.pause_colon_dash_ms);
    maybe_set(t, "pause_sentence_end_ms", cfg.timing.pause_sentence_end_ms);
  }

  // --- playback
  if (is_map(y["playback"])) {
    const auto p = y["playback"];
    maybe_set(p, "wait_retry_ms", cfg.playback.wait_retry_ms);
    maybe_set(p, "auto_play", cfg.playback.auto_play);
    maybe_set(p, "wpm_step", cfg.playback.wpm_step);
  }

  // --- stream
  if (is_map(y["stream"])) {
    const auto s = y["stream"];
    maybe_set(s, "poll_interval_ms", cfg.stream.poll_interval_ms);
    maybe_set(s, "max_line_bytes", cfg.stream.max_line_bytes);
  }

  // --- producer
  if (is_map(y["producer"])) {
    const auto p = y["producer"];
    if (p["type"]) cfg.producer.type = to_lower(p["type"].as<std::string>());

    if (is_map(p["synth"])) {
      const auto s = p["synth"];
      maybe_set(s, "seed", cfg.producer.synth.seed);
      maybe_set(s, "min_words", cfg.producer.synth.min_words);
      maybe_set(s, "max_words", cfg.producer.synth.max_words);
      maybe_set(s, "bytes_per_read", cfg.producer.synth.bytes_per_read);
    }
    if (is_map(p["ndjson_file"])) {
      const auto f = p["ndjson_file"];
      maybe_set(f, "path", cfg.producer.ndjson_file.path);
      maybe_set(f, "bytes_per_read", cfg.producer.ndjson_file.bytes_per_read);
    }
    if (is_map(p["command"])) {
      maybe_set(p["command"], "shell", cfg.producer.command.shell);
    }
  }

  // --- output
  if (is_map(y["output"])) {
    const auto o = y["output"];
    maybe_set(o, "out_dir", cfg.output.out_dir);
    maybe_set(o, "keep_last", cfg.output.keep_last);
    maybe_set(o, "record_events", cfg.output.record_events);
  }

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

// yaml-cpp reports type mismatches (e.g. `base_wpm: fast`) by throwing.
static Result<Config> parse_config_checked(const YAML::Node& y) {
  try {
    return parse_config(y);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::invalid_argument(std::string("bad config value: ") + e.what()));
  }
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  std::set<std::string> stack;
  auto yaml_r = load_with_includes(path, stack);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());

  auto cfg_r = parse_config_checked(yaml_r.take_value());
  if (!cfg_r.ok()) {
    return Result<Config>::err(Status(cfg_r.status().code(), path.string() + ": " + cfg_r.status().message()));
  }

  // Relative producer paths follow the config file, like includes do.
  Config cfg = cfg_r.take_value();
  const fs::path in = cfg.producer.ndjson_file.path;
  if (!in.empty() && in.is_relative()) {
    cfg.producer.ndjson_file.path = (path.parent_path() / in).lexically_normal().string();
  }
  return Result<Config>::ok(cfg);
}

Result<Config> load_config_from_string(const std::string& yaml, const std::string& base_dir) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("YAML parse error: ") + e.what()));
  }

  std::set<std::string> stack;
  auto yaml_r = resolve_includes(root, fs::path(base_dir), stack);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  return parse_config_checked(yaml_r.take_value());
}

}  // namespace pacer
