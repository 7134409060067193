// File: include/pacer/core/util/repro_hash.hpp
#pragma once

#include <string>
#include <string_view>

#include "pacer/core/config.hpp"

namespace pacer {

// Hash the full runtime config (timing, stream, producer and output settings).
// Goal: if the session setup changes, this hash should change.
std::string compute_config_hash(const Config& cfg);

// Hash of the document text as submitted, so two logs of the same document
// can be matched without storing it.
std::string compute_document_hash(std::string_view document);

}  // namespace pacer
