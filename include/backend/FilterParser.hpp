#pragma once

#include "model/Category.hpp"
#include <memory>
#include <string>
#include <vector>

namespace strata::backend {

/// Parsed filter expression node.
class FilterNode {
public:
    virtual ~FilterNode() = default;
    virtual bool accept(const model::Record& record) const = 0;
};

/// Parses the record filter language used by secondary categories:
///
///   genre:jazz AND -(year:<1960 OR rating:=20)
///
/// Terms are `attribute:prefix?value` with prefixes = != < > <= >=. A term
/// without prefix is a case- and diacritic-insensitive substring match.
/// Adjacent terms are ANDed, '-' negates. `path` and `extension` address
/// the record itself. Throws ConfigError on malformed input.
class FilterParser {
public:
    explicit FilterParser(std::string filter);

    std::unique_ptr<FilterNode> parse();

    /// Convenience: parse and wrap into a copyable predicate.
    static model::RecordPredicate compile(const std::string& filter);

private:
    std::unique_ptr<FilterNode> parse_or_group();
    std::unique_ptr<FilterNode> parse_and_group();
    std::unique_ptr<FilterNode> parse_search_expression();
    std::unique_ptr<FilterNode> parse_search_term();

    void skip_space();
    bool at_keyword(const char* keyword) const;
    bool at_end() const { return pos_ >= filter_.size(); }
    [[noreturn]] void fail(const std::string& what) const;

    std::string filter_;
    size_t pos_ = 0;
};

}  // namespace strata::backend
