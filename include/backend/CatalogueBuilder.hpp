#pragma once

#include "model/Catalogue.hpp"
#include <vector>

namespace strata::backend {

/// Builds every category tree of a run from the scanned record set.
class CatalogueBuilder {
public:
    /// Primary categories in declaration order, then secondary categories in
    /// declaration order. Primary categories without a taxonomy and secondary
    /// categories whose base is missing are skipped with a warning.
    static std::vector<model::CategoryResult> build(const model::RecordMap& records,
                                                    const model::CategoryDefinitions& categories);

    /// Non-error records claimed by a primary category, sorted by path.
    static std::vector<const model::Record*> records_for(const model::RecordMap& records,
                                                         const std::string& category_code);

    /// Throws MissingInheritanceTargetError when `base` is not among `primaries`.
    static model::CategoryResult derive_secondary(const model::SecondaryCategory& category,
                                                  const std::vector<model::CategoryResult>& primaries);
};

}  // namespace strata::backend
