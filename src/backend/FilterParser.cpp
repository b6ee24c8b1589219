#include "backend/FilterParser.hpp"
#include "backend/Errors.hpp"
#include "util/UnicodeUtils.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string_view>

namespace strata::backend {

namespace {
    enum class Comparison { Contains, Equal, NotEqual, Less, Greater, LessEqual, GreaterEqual };

    class OrNode : public FilterNode {
    public:
        void add(std::unique_ptr<FilterNode> child) { children_.push_back(std::move(child)); }
        bool accept(const model::Record& record) const override {
            for (const auto& child : children_) {
                if (child->accept(record)) return true;
            }
            return false;
        }
    private:
        std::vector<std::unique_ptr<FilterNode>> children_;
    };

    class AndNode : public FilterNode {
    public:
        void add(std::unique_ptr<FilterNode> child) { children_.push_back(std::move(child)); }
        bool accept(const model::Record& record) const override {
            for (const auto& child : children_) {
                if (!child->accept(record)) return false;
            }
            return true;
        }
    private:
        std::vector<std::unique_ptr<FilterNode>> children_;
    };

    class NotNode : public FilterNode {
    public:
        explicit NotNode(std::unique_ptr<FilterNode> child) : child_(std::move(child)) {}
        bool accept(const model::Record& record) const override { return !child_->accept(record); }
    private:
        std::unique_ptr<FilterNode> child_;
    };

    class TermNode : public FilterNode {
    public:
        TermNode(std::string attribute, Comparison cmp, const std::string& value)
            : attribute_(std::move(attribute)), cmp_(cmp), needle_(util::normalize_for_search(value)) {
            if (is_numeric()) {
                char* end = nullptr;
                number_ = std::strtod(value.c_str(), &end);
            }
        }

        bool is_numeric() const {
            return cmp_ == Comparison::Less || cmp_ == Comparison::Greater ||
                   cmp_ == Comparison::LessEqual || cmp_ == Comparison::GreaterEqual;
        }

        bool accept(const model::Record& record) const override {
            std::vector<std::string> elements;
            std::optional<double> number;

            if (attribute_ == "path") {
                elements.push_back(record.path);
            } else if (attribute_ == "extension") {
                elements.push_back(record.extension);
            } else {
                const model::AttributeValue* value = model::find_attribute(record, attribute_);
                if (!value) return false;
                elements = model::value_elements(*value);
                number = model::value_to_number(*value);
            }

            switch (cmp_) {
                case Comparison::Contains:
                    for (const auto& e : elements) {
                        if (util::normalize_for_search(e).find(needle_) != std::string::npos) return true;
                    }
                    return false;
                case Comparison::Equal:
                    return any_equal(elements);
                case Comparison::NotEqual:
                    return !any_equal(elements);
                case Comparison::Less:
                    return number && *number < number_;
                case Comparison::Greater:
                    return number && *number > number_;
                case Comparison::LessEqual:
                    return number && *number <= number_;
                case Comparison::GreaterEqual:
                    return number && *number >= number_;
            }
            return false;
        }

    private:
        bool any_equal(const std::vector<std::string>& elements) const {
            for (const auto& e : elements) {
                if (util::normalize_for_search(e) == needle_) return true;
            }
            return false;
        }

        std::string attribute_;
        Comparison cmp_;
        std::string needle_;
        double number_ = 0.0;
    };

    bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

    bool is_number(const std::string& text) {
        if (text.empty()) return false;
        char* end = nullptr;
        double v = std::strtod(text.c_str(), &end);
        return *end == '\0' && std::isfinite(v);
    }
}

FilterParser::FilterParser(std::string filter) : filter_(std::move(filter)) {}

void FilterParser::fail(const std::string& what) const {
    throw ConfigError("Malformed filter \"" + filter_ + "\" at offset " + std::to_string(pos_) + ": " + what);
}

void FilterParser::skip_space() {
    while (!at_end() && is_space(filter_[pos_])) ++pos_;
}

// Keywords must be followed by a space, '-' or '(' to count
bool FilterParser::at_keyword(const char* keyword) const {
    std::string_view kw(keyword);
    if (filter_.compare(pos_, kw.size(), kw) != 0) return false;
    size_t after = pos_ + kw.size();
    return after < filter_.size() && (is_space(filter_[after]) || filter_[after] == '-' || filter_[after] == '(');
}

std::unique_ptr<FilterNode> FilterParser::parse() {
    pos_ = 0;
    skip_space();
    if (at_end()) fail("empty expression");

    auto tree = parse_or_group();
    skip_space();
    if (!at_end()) fail("unexpected ')'");
    return tree;
}

model::RecordPredicate FilterParser::compile(const std::string& filter) {
    std::shared_ptr<FilterNode> tree = FilterParser(filter).parse();
    return [tree](const model::Record& record) { return tree->accept(record); };
}

std::unique_ptr<FilterNode> FilterParser::parse_or_group() {
    auto group = std::make_unique<OrNode>();
    group->add(parse_and_group());
    skip_space();
    while (at_keyword("OR")) {
        pos_ += 2;
        skip_space();
        group->add(parse_and_group());
        skip_space();
    }
    return group;
}

std::unique_ptr<FilterNode> FilterParser::parse_and_group() {
    auto group = std::make_unique<AndNode>();
    for (;;) {
        skip_space();
        if (at_end()) fail("expected a term");
        group->add(parse_search_expression());
        skip_space();
        if (at_end() || filter_[pos_] == ')' || at_keyword("OR")) break;
        if (at_keyword("AND")) {
            pos_ += 3;
        }
    }
    return group;
}

std::unique_ptr<FilterNode> FilterParser::parse_search_expression() {
    skip_space();
    if (at_end()) fail("expected a term");

    if (filter_[pos_] == '(') {
        ++pos_;
        skip_space();
        auto tree = parse_or_group();
        skip_space();
        if (at_end() || filter_[pos_] != ')') fail("missing ')'");
        ++pos_;
        return tree;
    }
    if (filter_[pos_] == '-') {
        ++pos_;
        return std::make_unique<NotNode>(parse_search_expression());
    }
    if (filter_[pos_] == ')') fail("unexpected ')'");
    return parse_search_term();
}

std::unique_ptr<FilterNode> FilterParser::parse_search_term() {
    std::string attribute;
    while (!at_end() && filter_[pos_] != ':') {
        char c = filter_[pos_];
        if (is_space(c) || c == '(' || c == ')' || c == '"') fail("expected attribute:value");
        attribute.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        ++pos_;
    }
    if (at_end() || attribute.empty()) fail("expected attribute:value");
    ++pos_;  // ':'

    std::string prefix;
    while (!at_end() && (filter_[pos_] == '<' || filter_[pos_] == '>' ||
                         filter_[pos_] == '=' || filter_[pos_] == '!')) {
        prefix.push_back(filter_[pos_++]);
    }

    Comparison cmp = Comparison::Contains;
    if (prefix.empty()) cmp = Comparison::Contains;
    else if (prefix == "=") cmp = Comparison::Equal;
    else if (prefix == "!=") cmp = Comparison::NotEqual;
    else if (prefix == "<") cmp = Comparison::Less;
    else if (prefix == ">") cmp = Comparison::Greater;
    else if (prefix == "<=") cmp = Comparison::LessEqual;
    else if (prefix == ">=") cmp = Comparison::GreaterEqual;
    else fail("unknown operator '" + prefix + "'");

    std::string value;
    bool quoted = false;
    if (!at_end() && filter_[pos_] == '"') {
        quoted = true;
        ++pos_;
        while (!at_end() && filter_[pos_] != '"') value.push_back(filter_[pos_++]);
        if (at_end()) fail("unterminated quote");
        ++pos_;
    } else {
        while (!at_end()) {
            char c = filter_[pos_];
            if (is_space(c) || c == '(' || c == ')') break;
            value.push_back(c);
            ++pos_;
        }
    }

    if (value.empty() && !quoted) fail("missing value for '" + attribute + "'");

    auto node = std::make_unique<TermNode>(attribute, cmp, value);
    if (node->is_numeric() && !is_number(value)) {
        fail("'" + value + "' is not a number");
    }
    return node;
}

}  // namespace strata::backend
