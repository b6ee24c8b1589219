#include "backend/TaxonomyBuilder.hpp"
#include "backend/TagNormalizer.hpp"
#include <algorithm>
#include <map>
#include <optional>
#include <stdexcept>

namespace strata::backend {

namespace {
    std::optional<double> numeric_tag(const model::Record& r, const char* name) {
        const model::AttributeValue* v = model::find_attribute(r, name);
        if (!v || model::is_empty_value(*v)) return std::nullopt;
        return model::value_to_number(*v);
    }

    std::optional<std::string> text_tag(const model::Record& r, const char* name) {
        const model::AttributeValue* v = model::find_attribute(r, name);
        if (!v || model::is_empty_value(*v)) return std::nullopt;
        return model::value_to_string(*v);
    }

    // -1, 0, 1 with absent values after present ones
    template <typename T>
    int compare_optional(const std::optional<T>& a, const std::optional<T>& b) {
        if (a && b) return *a < *b ? -1 : (*b < *a ? 1 : 0);
        if (a) return -1;
        if (b) return 1;
        return 0;
    }
}

std::pair<std::string, bool> TaxonomyBuilder::group_value(const model::Record& record, const model::KeySpec& key) {
    for (const auto& name : key.alternatives) {
        const model::AttributeValue* value = model::find_attribute(record, name);
        if (value && !model::is_empty_value(*value)) {
            return {model::value_to_string(*value), false};
        }
    }
    return {model::UNGROUPED, true};
}

bool TaxonomyBuilder::member_less(const model::Record& a, const model::Record& b) {
    if (int c = compare_optional(numeric_tag(a, "disk"), numeric_tag(b, "disk"))) return c < 0;
    if (int c = compare_optional(numeric_tag(a, "track"), numeric_tag(b, "track"))) return c < 0;
    if (a.path != b.path) return a.path < b.path;
    return compare_optional(text_tag(a, "title"), text_tag(b, "title")) < 0;
}

model::Taxonomy TaxonomyBuilder::build(const std::vector<const model::Record*>& records,
                                       const std::vector<model::KeySpec>& keys) {
    if (keys.empty()) {
        throw std::invalid_argument("TaxonomyBuilder: no key specs");
    }
    return build_level(records, keys, 0);
}

model::Taxonomy TaxonomyBuilder::build(const std::vector<model::Record>& records,
                                       const std::vector<model::KeySpec>& keys) {
    std::vector<const model::Record*> pointers;
    pointers.reserve(records.size());
    for (const auto& r : records) pointers.push_back(&r);
    return build(pointers, keys);
}

model::Taxonomy TaxonomyBuilder::build_level(const std::vector<const model::Record*>& records,
                                             const std::vector<model::KeySpec>& keys, size_t depth) {
    const model::KeySpec& key = keys[depth];
    const bool last_level = depth + 1 == keys.size();

    // std::map keeps groups in byte order; members keep input order
    std::map<std::string, std::vector<const model::Record*>> groups;
    std::map<std::string, bool> ungrouped;
    for (const model::Record* record : records) {
        auto [value, is_ungrouped] = group_value(*record, key);
        groups[value].push_back(record);
        if (is_ungrouped) ungrouped[value] = true;
    }

    model::Taxonomy level;
    level.reserve(groups.size());
    for (auto& [value, members] : groups) {
        model::TaxonomyNode node;
        node.key = key;
        node.group_value = value;
        node.ungrouped = ungrouped.contains(value);

        if (last_level) {
            model::TaxonomyLeaf leaf;
            leaf.members.reserve(members.size());
            for (const model::Record* r : members) leaf.members.push_back(*r);
            std::stable_sort(leaf.members.begin(), leaf.members.end(), member_less);

            leaf.representative_attributes = model::merged_attributes(leaf.members.front());
            for (auto item_tag : TagNormalizer::ITEM_TAGS) {
                leaf.representative_attributes.erase(std::string(item_tag));
            }
            node.content = std::move(leaf);
        } else {
            node.content = model::TaxonomyBranch{build_level(members, keys, depth + 1)};
        }
        level.push_back(std::move(node));
    }
    return level;
}

}  // namespace strata::backend
