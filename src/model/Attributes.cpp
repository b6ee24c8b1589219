#include "model/Record.hpp"
#include <cmath>
#include <cstdlib>
#include <format>

namespace strata::model {

namespace {
    std::optional<double> parse_number(const std::string& text) {
        if (text.empty()) return std::nullopt;
        char* end = nullptr;
        double v = std::strtod(text.c_str(), &end);
        if (end == text.c_str() || *end != '\0' || !std::isfinite(v)) return std::nullopt;
        return v;
    }
}

bool is_empty_value(const AttributeValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) return !*b;
    if (const auto* i = std::get_if<int64_t>(&value)) return *i == 0;
    if (const auto* d = std::get_if<double>(&value)) return *d == 0.0 || std::isnan(*d);
    if (const auto* s = std::get_if<std::string>(&value)) return s->empty();
    const auto& list = std::get<std::vector<std::string>>(value);
    return list.empty() || list.front().empty();
}

std::string value_to_string(const AttributeValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) return *b ? "true" : "false";
    if (const auto* i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&value)) return std::format("{}", *d);
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    const auto& list = std::get<std::vector<std::string>>(value);
    return list.empty() ? std::string() : list.front();
}

std::optional<double> value_to_number(const AttributeValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&value)) return *d;
    if (std::holds_alternative<bool>(value)) return std::nullopt;
    return parse_number(value_to_string(value));
}

std::vector<std::string> value_elements(const AttributeValue& value) {
    if (const auto* list = std::get_if<std::vector<std::string>>(&value)) return *list;
    return {value_to_string(value)};
}

AttributeMap merged_attributes(const Record& record) {
    AttributeMap merged = record.attributes;
    for (const auto& [key, value] : record.category_attributes) {
        merged[key] = value;
    }
    return merged;
}

const AttributeValue* find_attribute(const Record& record, const std::string& name) {
    auto it = record.category_attributes.find(name);
    if (it != record.category_attributes.end()) return &it->second;
    it = record.attributes.find(name);
    if (it != record.attributes.end()) return &it->second;
    return nullptr;
}

}  // namespace strata::model
