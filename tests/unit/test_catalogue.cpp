#include "../framework/SimpleTest.hpp"
#include "../support/Records.hpp"
#include "backend/CatalogueBuilder.hpp"
#include "backend/CategoryDeriver.hpp"
#include "backend/Errors.hpp"
#include "backend/TaxonomyBuilder.hpp"
#include "util/Logger.hpp"

using namespace strata;
using namespace strata::backend;
using strata::test::key;
using strata::test::make_record;
using strata::test::Strings;

namespace {

std::vector<model::Record> jazz_records() {
    return {
        make_record("jazz/kob/1.flac", {{"albumartist", std::string("Miles Davis")}, {"album", std::string("Kind of Blue")},
                                        {"genre", Strings{"Jazz"}}, {"track", int64_t{1}}}, "jazz"),
        make_record("jazz/kob/2.flac", {{"albumartist", std::string("Miles Davis")}, {"album", std::string("Kind of Blue")},
                                        {"genre", Strings{"Modal"}}, {"track", int64_t{2}}}, "jazz"),
        make_record("jazz/bt/1.flac", {{"albumartist", std::string("John Coltrane")}, {"album", std::string("Blue Train")},
                                       {"genre", Strings{"Hard Bop"}}}, "jazz"),
    };
}

model::RecordMap to_map(const std::vector<model::Record>& records) {
    model::RecordMap map;
    for (const auto& r : records) map[r.path] = r;
    return map;
}

bool has_genre(const model::Record& r, const std::string& genre) {
    const auto* v = model::find_attribute(r, "genre");
    if (!v) return false;
    for (const auto& g : model::value_elements(*v)) {
        if (g == genre) return true;
    }
    return false;
}

model::CategoryDefinitions jazz_categories() {
    model::CategoryDefinitions defs;
    model::PrimaryCategory jazz;
    jazz.code = "jazz";
    jazz.name = "Jazz";
    jazz.basedir = "jazz";
    jazz.taxonomy = {key({"albumartist", "artists"}), key({"album"})};
    jazz.sort = "name";
    defs.primary.push_back(jazz);

    model::SecondaryCategory modal;
    modal.code = "modal";
    modal.name = "Modal";
    modal.inherits = "jazz";
    modal.filter = "genre:=Modal";
    modal.predicate = [](const model::Record& r) { return has_genre(r, "Modal"); };
    defs.secondary.push_back(modal);
    return defs;
}

struct QuietLogs {
    QuietLogs() { util::Logger::set_echo(false); }
};
QuietLogs quiet_logs;

}  // namespace

TEST_CASE(test_derive_keeps_matching_members_only) {
    auto tree = TaxonomyBuilder::build(jazz_records(), {key({"albumartist"}), key({"album"})});
    auto derived = CategoryDeriver::derive(tree, [](const model::Record& r) { return has_genre(r, "Modal"); });

    ASSERT_EQ(derived.size(), 1u);
    ASSERT_EQ(derived[0].group_value, "Miles Davis");
    const auto& albums = derived[0].branch().children;
    ASSERT_EQ(albums.size(), 1u);
    ASSERT_EQ(albums[0].leaf().members.size(), 1u);
    ASSERT_EQ(albums[0].leaf().members[0].path, "jazz/kob/2.flac");

    // The source tree is untouched
    ASSERT_EQ(model::count_members(tree), 3u);
    ASSERT_EQ(tree.size(), 2u);
}

TEST_CASE(test_derive_rejecting_everything_yields_empty_tree) {
    auto tree = TaxonomyBuilder::build(jazz_records(), {key({"albumartist"}), key({"album"})});
    auto derived = CategoryDeriver::derive(tree, [](const model::Record&) { return false; });
    ASSERT_TRUE(derived.empty());
}

TEST_CASE(test_derive_accepting_everything_is_identity) {
    auto tree = TaxonomyBuilder::build(jazz_records(), {key({"albumartist"}), key({"album"})});
    auto derived = CategoryDeriver::derive(tree, [](const model::Record&) { return true; });
    ASSERT_TRUE(derived == tree);
}

TEST_CASE(test_derive_drops_emptied_branches_at_every_depth) {
    auto tree = TaxonomyBuilder::build(jazz_records(), {key({"genre"}), key({"albumartist"}), key({"album"})});
    auto derived = CategoryDeriver::derive(tree, [](const model::Record& r) { return r.path == "jazz/bt/1.flac"; });
    ASSERT_EQ(derived.size(), 1u);
    ASSERT_EQ(derived[0].group_value, "Hard Bop");
    ASSERT_EQ(model::count_members(derived), 1u);
}

TEST_CASE(test_catalogue_primary_then_secondary) {
    auto result = CatalogueBuilder::build(to_map(jazz_records()), jazz_categories());

    ASSERT_EQ(result.size(), 2u);
    ASSERT_EQ(result[0].code, "jazz");
    ASSERT_TRUE(result[0].kind == model::CategoryKind::Primary);
    ASSERT_EQ(model::count_members(result[0].groups), 3u);

    ASSERT_EQ(result[1].code, "modal");
    ASSERT_TRUE(result[1].kind == model::CategoryKind::Secondary);
    ASSERT_EQ(result[1].inherits.value_or(""), "jazz");
    ASSERT_EQ(result[1].name, "Modal");
    ASSERT_TRUE(result[1].taxonomy == result[0].taxonomy);
    ASSERT_EQ(result[1].sort.value_or(""), "name");
    ASSERT_EQ(model::count_members(result[1].groups), 1u);
}

TEST_CASE(test_catalogue_secondary_overrides_metadata) {
    auto defs = jazz_categories();
    defs.secondary[0].taxonomy = std::vector<model::KeySpec>{key({"album"})};
    defs.secondary[0].sort = "year";

    auto result = CatalogueBuilder::build(to_map(jazz_records()), defs);
    ASSERT_EQ(result[1].taxonomy.size(), 1u);
    ASSERT_EQ(result[1].sort.value_or(""), "year");
    // The tree still comes from the base
    ASSERT_EQ(result[1].groups.at(0).group_value, "Miles Davis");
}

TEST_CASE(test_catalogue_skips_secondary_with_missing_base) {
    auto defs = jazz_categories();
    defs.secondary[0].inherits = "classical";

    auto result = CatalogueBuilder::build(to_map(jazz_records()), defs);
    ASSERT_EQ(result.size(), 1u);
    ASSERT_EQ(result[0].code, "jazz");

    ASSERT_THROWS(CatalogueBuilder::derive_secondary(defs.secondary[0], result), MissingInheritanceTargetError);
}

TEST_CASE(test_catalogue_skips_primary_without_taxonomy) {
    auto defs = jazz_categories();
    defs.primary[0].taxonomy.clear();

    auto result = CatalogueBuilder::build(to_map(jazz_records()), defs);
    // Its secondary loses its base too
    ASSERT_TRUE(result.empty());
}

TEST_CASE(test_catalogue_excludes_error_and_foreign_records) {
    auto records = jazz_records();
    auto broken = make_record("jazz/broken.flac", {}, "jazz");
    broken.error = "not a FLAC file";
    records.push_back(broken);
    records.push_back(make_record("rock/1.mp3", {{"albumartist", std::string("Can")}}, "rock"));
    records.push_back(make_record("loose.mp3", {{"albumartist", std::string("Nobody")}}));

    auto result = CatalogueBuilder::build(to_map(records), jazz_categories());
    ASSERT_EQ(model::count_members(result[0].groups), 3u);

    auto members = CatalogueBuilder::records_for(to_map(records), "jazz");
    ASSERT_EQ(members.size(), 3u);
    ASSERT_EQ(members[0]->path, "jazz/bt/1.flac");
}

TEST_CASE(test_catalogue_secondary_with_no_matches_is_reported_empty) {
    auto defs = jazz_categories();
    defs.secondary[0].predicate = [](const model::Record&) { return false; };

    auto result = CatalogueBuilder::build(to_map(jazz_records()), defs);
    ASSERT_EQ(result.size(), 2u);
    ASSERT_TRUE(result[1].groups.empty());
}

TEST_CASE(test_catalogue_primary_without_records_is_reported_empty) {
    auto result = CatalogueBuilder::build({}, jazz_categories());
    ASSERT_EQ(result.size(), 2u);
    ASSERT_EQ(result[0].code, "jazz");
    ASSERT_TRUE(result[0].groups.empty());
    ASSERT_TRUE(result[1].groups.empty());
}

int main() {
    return strata::test::TestRunner::instance().run_all();
}
