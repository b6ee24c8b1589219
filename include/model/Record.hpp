#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace strata::model {

/// Tag value as extracted from a file: a scalar or an ordered list of strings
/// (artists, genres, ratings).
using AttributeValue = std::variant<bool, int64_t, double, std::string, std::vector<std::string>>;

/// Ordered so that serialized caches are byte-stable between runs.
using AttributeMap = std::map<std::string, AttributeValue>;

struct Record {
    std::string path;                          // Relative to the music root, '/'-separated
    AttributeMap attributes;                   // Common tags (title, album, artists, ...)
    AttributeMap category_attributes;          // Extra tags requested by the owning category
    AttributeMap format_info;                  // Container, codec, duration, ... (never grouped on)
    std::optional<std::string> category_code;  // Primary category that claimed this file
    int64_t modified_time = 0;                 // ns since epoch, compared exactly
    int64_t scanned_at = 0;                    // ms since epoch
    std::string extension;                     // Lower-case, no dot
    std::optional<std::string> error;          // Set => error-only record

    bool is_error() const { return error.has_value(); }

    bool operator==(const Record&) const = default;
};

using RecordMap = std::unordered_map<std::string, Record>;

// Attribute helpers (src/model/Attributes.cpp)

/// True for empty strings, empty lists (or an empty first element), zero and false.
bool is_empty_value(const AttributeValue& value);

/// Scalar rendering used for group values; lists render their first element.
std::string value_to_string(const AttributeValue& value);

/// Numeric view of a value (first element for lists); nullopt when not numeric.
std::optional<double> value_to_number(const AttributeValue& value);

/// Every element as a string: one entry for scalars, all entries for lists.
std::vector<std::string> value_elements(const AttributeValue& value);

/// Common tags overlaid with category tags, the view used for grouping.
AttributeMap merged_attributes(const Record& record);

/// Looks a tag up in the merged view without building it.
const AttributeValue* find_attribute(const Record& record, const std::string& name);

}  // namespace strata::model
