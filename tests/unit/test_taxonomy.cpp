#include "../framework/SimpleTest.hpp"
#include "../support/Records.hpp"
#include "backend/TaxonomyBuilder.hpp"
#include <stdexcept>

using namespace strata;
using namespace strata::backend;
using strata::test::key;
using strata::test::make_record;
using strata::test::Strings;

TEST_CASE(test_group_value_first_non_empty_alternative) {
    auto r = make_record("a/1.mp3", {{"albumartist", std::string("")}, {"artists", Strings{"Miles Davis", "Gil Evans"}}});
    auto [value, ungrouped] = TaxonomyBuilder::group_value(r, key({"albumartist", "artists"}));
    ASSERT_EQ(value, "Miles Davis");
    ASSERT_FALSE(ungrouped);
}

TEST_CASE(test_group_value_falls_back_to_sentinel) {
    auto r = make_record("a/1.mp3", {{"title", std::string("Untitled")}});
    auto [value, ungrouped] = TaxonomyBuilder::group_value(r, key({"albumartist", "artists"}));
    ASSERT_EQ(value, model::UNGROUPED);
    ASSERT_TRUE(ungrouped);
}

TEST_CASE(test_group_value_zero_false_and_empty_list_are_empty) {
    auto r = make_record("a/1.mp3", {{"year", int64_t{0}}, {"compilation", false}, {"genre", Strings{}},
                                     {"album", std::string("Kind of Blue")}});
    ASSERT_EQ(TaxonomyBuilder::group_value(r, key({"year", "compilation", "genre", "album"})).first, "Kind of Blue");
}

TEST_CASE(test_group_value_renders_numbers) {
    auto r = make_record("a/1.mp3", {{"year", int64_t{1959}}, {"replaygain_track_gain", -6.5}});
    ASSERT_EQ(TaxonomyBuilder::group_value(r, key({"year"})).first, "1959");
    ASSERT_EQ(TaxonomyBuilder::group_value(r, key({"replaygain_track_gain"})).first, "-6.5");
}

TEST_CASE(test_category_attributes_override_common) {
    auto r = make_record("a/1.mp3", {{"album", std::string("Common")}});
    r.category_attributes["album"] = std::string("Category");
    ASSERT_EQ(TaxonomyBuilder::group_value(r, key({"album"})).first, "Category");
}

TEST_CASE(test_build_two_levels_sorted) {
    std::vector<model::Record> records = {
        make_record("j/b1.mp3", {{"albumartist", std::string("Coltrane")}, {"album", std::string("Blue Train")}}),
        make_record("j/a1.mp3", {{"albumartist", std::string("Adderley")}, {"album", std::string("Somethin' Else")}}),
        make_record("j/c1.mp3", {{"albumartist", std::string("Coltrane")}, {"album", std::string("Ballads")}}),
        make_record("j/x.mp3", {{"title", std::string("Loose")}}),
    };

    auto tree = TaxonomyBuilder::build(records, {key({"albumartist"}), key({"album"})});

    ASSERT_EQ(tree.size(), 3u);
    ASSERT_EQ(tree[0].group_value, "Adderley");
    ASSERT_EQ(tree[1].group_value, "Coltrane");
    ASSERT_EQ(tree[2].group_value, "__NONE__");
    ASSERT_TRUE(tree[2].ungrouped);
    ASSERT_FALSE(tree[1].is_leaf());

    const auto& coltrane = tree[1].branch().children;
    ASSERT_EQ(coltrane.size(), 2u);
    ASSERT_EQ(coltrane[0].group_value, "Ballads");
    ASSERT_EQ(coltrane[1].group_value, "Blue Train");
    ASSERT_TRUE(coltrane[0].is_leaf());
    ASSERT_EQ(coltrane[0].key.label(), "album");

    // The ungrouped record is still grouped one level down
    const auto* loose = tree[2].child(model::UNGROUPED);
    ASSERT_TRUE(loose != nullptr);
    ASSERT_EQ(loose->leaf().members.size(), 1u);
    ASSERT_EQ(model::count_members(tree), 4u);
}

TEST_CASE(test_group_values_sort_by_bytes) {
    std::vector<model::Record> records = {
        make_record("1.mp3", {{"artist", std::string("beta")}}),
        make_record("2.mp3", {{"artist", std::string("Zeta")}}),
        make_record("3.mp3", {{"artist", std::string("Alpha")}}),
    };
    auto tree = TaxonomyBuilder::build(records, {key({"artist"})});
    ASSERT_EQ(tree[0].group_value, "Alpha");
    ASSERT_EQ(tree[1].group_value, "Zeta");
    ASSERT_EQ(tree[2].group_value, "beta");
    ASSERT_TRUE(model::find_group(tree, "Zeta") != nullptr);
    ASSERT_TRUE(model::find_group(tree, "zeta") == nullptr);
}

TEST_CASE(test_leaf_members_by_disk_track_path_title) {
    std::vector<model::Record> records = {
        make_record("al/z.mp3", {{"album", std::string("A")}, {"disk", int64_t{2}}, {"track", int64_t{1}}}),
        make_record("al/y.mp3", {{"album", std::string("A")}, {"disk", int64_t{1}}, {"track", int64_t{2}}}),
        make_record("al/x.mp3", {{"album", std::string("A")}, {"disk", int64_t{1}}, {"track", int64_t{1}}}),
        make_record("al/w.mp3", {{"album", std::string("A")}}),
        make_record("al/v.mp3", {{"album", std::string("A")}, {"disk", int64_t{1}}}),
    };

    auto tree = TaxonomyBuilder::build(records, {key({"album"})});
    const auto& members = tree.at(0).leaf().members;
    ASSERT_EQ(members.size(), 5u);
    ASSERT_EQ(members[0].path, "al/x.mp3");
    ASSERT_EQ(members[1].path, "al/y.mp3");
    ASSERT_EQ(members[2].path, "al/v.mp3");  // disk 1, no track
    ASSERT_EQ(members[3].path, "al/z.mp3");
    ASSERT_EQ(members[4].path, "al/w.mp3");  // no disk at all
}

TEST_CASE(test_member_less_title_breaks_path_ties) {
    auto a = make_record("same.mp3", {{"title", std::string("A")}});
    auto b = make_record("same.mp3", {{"title", std::string("B")}});
    auto untitled = make_record("same.mp3", {});
    ASSERT_TRUE(TaxonomyBuilder::member_less(a, b));
    ASSERT_FALSE(TaxonomyBuilder::member_less(b, a));
    ASSERT_TRUE(TaxonomyBuilder::member_less(b, untitled));
}

TEST_CASE(test_representative_attributes_come_from_first_member) {
    std::vector<model::Record> records = {
        make_record("al/2.mp3", {{"album", std::string("Kind of Blue")}, {"track", int64_t{2}},
                                 {"title", std::string("Freddie Freeloader")}, {"genre", Strings{"Modal"}}}),
        make_record("al/1.mp3", {{"album", std::string("Kind of Blue")}, {"track", int64_t{1}},
                                 {"title", std::string("So What")}, {"genre", Strings{"Jazz"}}, {"disk", int64_t{1}}}),
    };

    auto tree = TaxonomyBuilder::build(records, {key({"album"})});
    const auto& leaf = tree.at(0).leaf();
    ASSERT_EQ(leaf.members[0].path, "al/1.mp3");

    const auto& rep = leaf.representative_attributes;
    ASSERT_FALSE(rep.contains("title"));
    ASSERT_FALSE(rep.contains("track"));
    ASSERT_FALSE(rep.contains("disk"));
    ASSERT_TRUE(rep.at("genre") == model::AttributeValue(Strings{"Jazz"}));
}

TEST_CASE(test_build_without_keys_is_rejected) {
    std::vector<model::Record> records = {make_record("1.mp3", {})};
    ASSERT_THROWS(TaxonomyBuilder::build(records, {}), std::invalid_argument);
}

TEST_CASE(test_build_is_deterministic) {
    std::vector<model::Record> records = {
        make_record("b.mp3", {{"artist", std::string("X")}, {"album", std::string("1")}}),
        make_record("a.mp3", {{"artist", std::string("X")}, {"album", std::string("1")}}),
    };
    auto specs = std::vector<model::KeySpec>{key({"artist"}), key({"album"})};
    ASSERT_TRUE(TaxonomyBuilder::build(records, specs) == TaxonomyBuilder::build(records, specs));
}

TEST_CASE(test_two_tracks_one_album) {
    std::vector<model::Record> records = {
        make_record("b.mp3", {{"artist", std::string("X")}, {"album", std::string("Y")}, {"track", int64_t{2}}}),
        make_record("a.mp3", {{"artist", std::string("X")}, {"album", std::string("Y")}, {"track", int64_t{1}}}),
    };

    auto tree = TaxonomyBuilder::build(records, {key({"artist"}), key({"album"})});
    ASSERT_EQ(tree.size(), 1u);
    ASSERT_EQ(tree[0].group_value, "X");
    const auto* album = tree[0].child("Y");
    ASSERT_TRUE(album != nullptr);

    const auto& leaf = album->leaf();
    ASSERT_EQ(leaf.members.size(), 2u);
    ASSERT_EQ(leaf.members[0].path, "a.mp3");
    ASSERT_EQ(leaf.members[1].path, "b.mp3");

    model::AttributeMap expected = {{"artist", std::string("X")}, {"album", std::string("Y")}};
    ASSERT_TRUE(leaf.representative_attributes == expected);
}

int main() {
    return strata::test::TestRunner::instance().run_all();
}
