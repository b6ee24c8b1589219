#include "model/Catalogue.hpp"
#include <algorithm>

namespace strata::model {

namespace {
    const TaxonomyNode* lookup(const std::vector<TaxonomyNode>& nodes, const std::string& value) {
        auto it = std::lower_bound(nodes.begin(), nodes.end(), value,
            [](const TaxonomyNode& node, const std::string& v) { return node.group_value < v; });
        if (it != nodes.end() && it->group_value == value) return &*it;
        return nullptr;
    }

    size_t count_node(const TaxonomyNode& node) {
        if (node.is_leaf()) return node.leaf().members.size();
        size_t total = 0;
        for (const auto& child : node.branch().children) total += count_node(child);
        return total;
    }
}

bool TaxonomyBranch::operator==(const TaxonomyBranch& other) const {
    return children == other.children;
}

const TaxonomyNode* TaxonomyNode::child(const std::string& value) const {
    if (is_leaf()) return nullptr;
    return lookup(branch().children, value);
}

const TaxonomyNode* find_group(const Taxonomy& taxonomy, const std::string& value) {
    return lookup(taxonomy, value);
}

size_t count_members(const Taxonomy& taxonomy) {
    size_t total = 0;
    for (const auto& node : taxonomy) total += count_node(node);
    return total;
}

}  // namespace strata::model
