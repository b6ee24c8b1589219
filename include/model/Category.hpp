#pragma once

#include "model/Record.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace strata::model {

/// One taxonomy level: alternative attribute names, first non-empty wins.
struct KeySpec {
    std::vector<std::string> alternatives;

    /// "albumartist|artists" form, used for logs and persisted output.
    std::string label() const;

    bool operator==(const KeySpec&) const = default;
};

using RecordPredicate = std::function<bool(const Record&)>;

struct PrimaryCategory {
    std::string code;
    std::string name;
    std::string basedir;                  // First path segment this category claims
    std::vector<KeySpec> taxonomy;
    std::optional<std::string> sort;      // Ordering hint for consumers
    std::vector<std::string> extra_tags;  // Raw tag names copied into category_attributes
};

struct SecondaryCategory {
    std::string code;
    std::string name;
    std::string inherits;                 // Code of a primary category
    std::string filter;                   // Source text, kept for logs
    RecordPredicate predicate;
    std::optional<std::vector<KeySpec>> taxonomy;
    std::optional<std::string> sort;
};

struct CategoryDefinitions {
    std::vector<PrimaryCategory> primary;
    std::vector<SecondaryCategory> secondary;

    /// Primary category owning a relative path (matched on its first segment).
    const PrimaryCategory* category_for_path(const std::string& path) const;
};

}  // namespace strata::model
