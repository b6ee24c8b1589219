#pragma once

#include "model/Catalogue.hpp"

namespace strata::backend {

class CategoryDeriver {
public:
    /// Filters a copy of a primary tree down to the records matching
    /// `predicate`. Leaves and branches left empty are removed; a predicate
    /// rejecting everything yields an empty tree.
    static model::Taxonomy derive(model::Taxonomy tree, const model::RecordPredicate& predicate);

private:
    // False when the node ends up empty and must be dropped.
    static bool filter_node(model::TaxonomyNode& node, const model::RecordPredicate& predicate);
};

}  // namespace strata::backend
