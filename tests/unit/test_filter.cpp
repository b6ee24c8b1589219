#include "../framework/SimpleTest.hpp"
#include "../support/Records.hpp"
#include "backend/Errors.hpp"
#include "backend/FilterParser.hpp"

using namespace strata;
using namespace strata::backend;
using strata::test::make_record;
using strata::test::Strings;

namespace {

model::Record bjork() {
    return make_record("pop/homogenic/01.flac", {
        {"artists", Strings{"Björk"}},
        {"album", std::string("Homogenic")},
        {"genre", Strings{"Electronic", "Art Pop"}},
        {"year", int64_t{1997}},
        {"rating", Strings{"80"}},
    });
}

model::Record coltrane() {
    return make_record("jazz/blue_train/01.mp3", {
        {"artists", Strings{"John Coltrane"}},
        {"album", std::string("Blue Train")},
        {"genre", Strings{"Jazz"}},
        {"year", int64_t{1957}},
    });
}

bool matches(const std::string& filter, const model::Record& record) {
    return FilterParser::compile(filter)(record);
}

}  // namespace

TEST_CASE(test_filter_substring_ignores_case_and_diacritics) {
    ASSERT_TRUE(matches("artists:bjork", bjork()));
    ASSERT_TRUE(matches("artists:BJÖ", bjork()));
    ASSERT_TRUE(matches("album:mogen", bjork()));
    ASSERT_FALSE(matches("artists:bjork", coltrane()));
}

TEST_CASE(test_filter_matches_any_list_element) {
    ASSERT_TRUE(matches("genre:\"art pop\"", bjork()));
    ASSERT_TRUE(matches("genre:=electronic", bjork()));
    ASSERT_FALSE(matches("genre:=pop", bjork()));
}

TEST_CASE(test_filter_not_equal) {
    ASSERT_TRUE(matches("genre:!=jazz", bjork()));
    ASSERT_FALSE(matches("genre:!=jazz", coltrane()));
}

TEST_CASE(test_filter_numeric_comparisons) {
    ASSERT_TRUE(matches("year:<1960", coltrane()));
    ASSERT_FALSE(matches("year:<1960", bjork()));
    ASSERT_TRUE(matches("year:>=1997", bjork()));
    ASSERT_TRUE(matches("year:<=1957", coltrane()));
    ASSERT_TRUE(matches("rating:>60", bjork()));
    // Non-numeric values never satisfy a numeric term
    ASSERT_FALSE(matches("album:>1", bjork()));
}

TEST_CASE(test_filter_missing_attribute_never_matches_positive_term) {
    ASSERT_FALSE(matches("rating:>0", coltrane()));
    ASSERT_FALSE(matches("composer:bach", coltrane()));
    ASSERT_TRUE(matches("-composer:bach", coltrane()));
}

TEST_CASE(test_filter_boolean_operators) {
    ASSERT_TRUE(matches("genre:jazz OR genre:electronic", bjork()));
    ASSERT_TRUE(matches("genre:jazz OR genre:electronic", coltrane()));
    ASSERT_FALSE(matches("genre:jazz AND year:>1990", coltrane()));
    ASSERT_TRUE(matches("genre:jazz year:<1990", coltrane()));
    ASSERT_TRUE(matches("-genre:jazz", bjork()));
    ASSERT_FALSE(matches("-(genre:jazz OR genre:electronic)", bjork()));
    ASSERT_TRUE(matches("(genre:jazz OR genre:electronic) AND -year:<1960", bjork()));
    ASSERT_FALSE(matches("(genre:jazz OR genre:electronic) AND -year:<1960", coltrane()));
}

TEST_CASE(test_filter_record_fields) {
    ASSERT_TRUE(matches("path:blue_train", coltrane()));
    ASSERT_TRUE(matches("extension:=flac", bjork()));
    ASSERT_FALSE(matches("extension:=flac", coltrane()));
}

TEST_CASE(test_filter_category_attributes_are_visible) {
    auto r = coltrane();
    r.category_attributes["label"] = std::string("Blue Note");
    ASSERT_TRUE(matches("label:=\"blue note\"", r));
}

TEST_CASE(test_filter_malformed_expressions) {
    ASSERT_THROWS(FilterParser::compile(""), ConfigError);
    ASSERT_THROWS(FilterParser::compile("   "), ConfigError);
    ASSERT_THROWS(FilterParser::compile("jazz"), ConfigError);
    ASSERT_THROWS(FilterParser::compile("(genre:jazz"), ConfigError);
    ASSERT_THROWS(FilterParser::compile("genre:jazz)"), ConfigError);
    ASSERT_THROWS(FilterParser::compile("genre:"), ConfigError);
    ASSERT_THROWS(FilterParser::compile("year:<abc"), ConfigError);
    ASSERT_THROWS(FilterParser::compile("year:=<1990"), ConfigError);
    ASSERT_THROWS(FilterParser::compile("title:\"open"), ConfigError);
    ASSERT_THROWS(FilterParser::compile("genre:jazz OR"), ConfigError);
    ASSERT_THROWS(FilterParser::compile("-"), ConfigError);
}

int main() {
    return strata::test::TestRunner::instance().run_all();
}
