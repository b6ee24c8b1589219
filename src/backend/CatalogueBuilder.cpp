#include "backend/CatalogueBuilder.hpp"
#include "backend/CategoryDeriver.hpp"
#include "backend/Errors.hpp"
#include "backend/TaxonomyBuilder.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <format>

namespace strata::backend {

std::vector<const model::Record*> CatalogueBuilder::records_for(const model::RecordMap& records,
                                                                const std::string& category_code) {
    std::vector<const model::Record*> out;
    for (const auto& [path, record] : records) {
        if (record.is_error()) continue;
        if (record.category_code && *record.category_code == category_code) {
            out.push_back(&record);
        }
    }
    // RecordMap is unordered; fix the input order so equal trees come out equal
    std::sort(out.begin(), out.end(),
              [](const model::Record* a, const model::Record* b) { return a->path < b->path; });
    return out;
}

model::CategoryResult CatalogueBuilder::derive_secondary(const model::SecondaryCategory& category,
                                                         const std::vector<model::CategoryResult>& primaries) {
    auto base = std::find_if(primaries.begin(), primaries.end(),
                             [&](const model::CategoryResult& c) { return c.code == category.inherits; });
    if (base == primaries.end()) {
        throw MissingInheritanceTargetError(category.code, category.inherits);
    }

    model::CategoryResult result;
    result.kind = model::CategoryKind::Secondary;
    result.code = category.code;
    result.name = category.name.empty() ? base->name : category.name;
    result.inherits = category.inherits;
    result.taxonomy = category.taxonomy.value_or(base->taxonomy);
    result.sort = category.sort ? category.sort : base->sort;
    result.groups = CategoryDeriver::derive(base->groups, category.predicate);
    return result;
}

std::vector<model::CategoryResult> CatalogueBuilder::build(const model::RecordMap& records,
                                                           const model::CategoryDefinitions& categories) {
    std::vector<model::CategoryResult> primaries;

    for (const auto& category : categories.primary) {
        if (category.taxonomy.empty()) {
            util::Logger::warn(std::format("Category '{}' has no taxonomy, skipping", category.code));
            continue;
        }

        model::CategoryResult result;
        result.kind = model::CategoryKind::Primary;
        result.code = category.code;
        result.name = category.name;
        result.taxonomy = category.taxonomy;
        result.sort = category.sort;

        auto members = records_for(records, category.code);
        result.groups = TaxonomyBuilder::build(members, category.taxonomy);

        util::Logger::info(std::format("Category '{}': {} records in {} groups",
                                       category.code, members.size(), result.groups.size()));
        primaries.push_back(std::move(result));
    }

    std::vector<model::CategoryResult> out = primaries;
    for (const auto& category : categories.secondary) {
        try {
            auto result = derive_secondary(category, primaries);
            util::Logger::info(std::format("Category '{}' ({} of '{}'): {} records",
                                           category.code, category.filter, category.inherits,
                                           model::count_members(result.groups)));
            out.push_back(std::move(result));
        } catch (const MissingInheritanceTargetError& e) {
            util::Logger::warn(std::string(e.what()) + ", skipping");
        }
    }
    return out;
}

}  // namespace strata::backend
