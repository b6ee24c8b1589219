#include "model/Category.hpp"

namespace strata::model {

std::string KeySpec::label() const {
    std::string out;
    for (const auto& alt : alternatives) {
        if (!out.empty()) out += '|';
        out += alt;
    }
    return out;
}

const PrimaryCategory* CategoryDefinitions::category_for_path(const std::string& path) const {
    std::string rel = path.starts_with('/') ? path.substr(1) : path;
    std::string basedir = rel.substr(0, rel.find('/'));
    for (const auto& cat : primary) {
        if (cat.basedir == basedir) return &cat;
    }
    return nullptr;
}

}  // namespace strata::model
