#pragma once

#include "model/Catalogue.hpp"
#include <string>
#include <utility>
#include <vector>

namespace strata::backend {

/// Groups records into a tree, one level per key spec.
class TaxonomyBuilder {
public:
    /// Top-level nodes sorted by group value. Throws std::invalid_argument
    /// when `keys` is empty.
    static model::Taxonomy build(const std::vector<const model::Record*>& records,
                                 const std::vector<model::KeySpec>& keys);

    static model::Taxonomy build(const std::vector<model::Record>& records,
                                 const std::vector<model::KeySpec>& keys);

    /// First non-empty alternative rendered as text; {UNGROUPED, true} if none.
    static std::pair<std::string, bool> group_value(const model::Record& record, const model::KeySpec& key);

    /// Leaf member order: disk, track, path, title; missing values last.
    static bool member_less(const model::Record& a, const model::Record& b);

private:
    static model::Taxonomy build_level(const std::vector<const model::Record*>& records,
                                       const std::vector<model::KeySpec>& keys, size_t depth);
};

}  // namespace strata::backend
