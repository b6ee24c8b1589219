#include "backend/CategoryDeriver.hpp"
#include <algorithm>

namespace strata::backend {

bool CategoryDeriver::filter_node(model::TaxonomyNode& node, const model::RecordPredicate& predicate) {
    if (node.is_leaf()) {
        auto& members = node.leaf().members;
        std::erase_if(members, [&](const model::Record& r) { return !predicate(r); });
        return !members.empty();
    }

    auto& children = node.branch().children;
    std::erase_if(children, [&](model::TaxonomyNode& child) { return !filter_node(child, predicate); });
    return !children.empty();
}

model::Taxonomy CategoryDeriver::derive(model::Taxonomy tree, const model::RecordPredicate& predicate) {
    if (!predicate) return tree;
    std::erase_if(tree, [&](model::TaxonomyNode& node) { return !filter_node(node, predicate); });
    return tree;
}

}  // namespace strata::backend
