#pragma once

#include "model/Catalogue.hpp"
#include "model/Record.hpp"
#include <string>

namespace strata::backend {

/// Schema version written into both persisted artifacts.
inline constexpr int STATE_VERSION = 1;

// JSON encoding of the persisted artifacts. Output is deterministic: record
// maps are written in path order and attribute maps in key order.
// Decoders throw CacheCorruptionError on malformed JSON or schema mismatch.

std::string encode_records(const model::RecordMap& records);
model::RecordMap decode_records(const std::string& json);

std::string encode_catalogue(const model::Catalogue& catalogue);
model::Catalogue decode_catalogue(const std::string& json);

}  // namespace strata::backend
