#include "../framework/SimpleTest.hpp"
#include "../support/Records.hpp"
#include "backend/Config.hpp"
#include "backend/Errors.hpp"
#include "util/Logger.hpp"

using namespace strata;
using namespace strata::backend;
using strata::test::make_record;
using strata::test::Strings;
using strata::test::TempDir;

namespace {

const char* SAMPLE_CONFIG = R"(# strata config
[paths]
music_directory = "/srv/music"
cache_directory = "/var/cache/strata"

[scan]
workers = 4
force_refresh = false

[logging]
level = "debug"

[playlists]
enabled = true
winamp_directory = "/mnt/winamp"
win32_base_dir = "D:\Music"
title_prefix = "[mp] "

[category.jazz]
name = "Jazz"
basedir = "Jazz"
taxonomy = "albumartist|artists, album"
sort = "name"
extra_tags = "label, CATALOGNUMBER"

[category.classical]
name = "Classical"
basedir = "Classical"
taxonomy = "composer, album"

[category.bebop]
name = "Bebop"
inherits = "jazz"
filter = "genre:bebop AND year:<1960"
taxonomy = "album"
)";

struct QuietLogs {
    QuietLogs() { util::Logger::set_echo(false); }
};
QuietLogs quiet_logs;

}  // namespace

TEST_CASE(test_config_sections) {
    Config cfg = ConfigLoader::parse(SAMPLE_CONFIG, "sample");

    ASSERT_EQ(cfg.music_directory, std::filesystem::path("/srv/music"));
    ASSERT_EQ(cfg.cache_directory, std::filesystem::path("/var/cache/strata"));
    ASSERT_EQ(cfg.workers, 4u);
    ASSERT_FALSE(cfg.force_refresh);
    ASSERT_EQ(cfg.log_level, "debug");

    ASSERT_TRUE(cfg.playlists.enabled);
    ASSERT_EQ(cfg.playlists.winamp_directory, std::filesystem::path("/mnt/winamp"));
    ASSERT_EQ(cfg.playlists.win32_base_dir, "D:\\Music");
    ASSERT_EQ(cfg.playlists.title_prefix.value_or(""), "[mp] ");
}

TEST_CASE(test_config_categories_keep_declaration_order) {
    Config cfg = ConfigLoader::parse(SAMPLE_CONFIG, "sample");
    const auto& primary = cfg.categories.primary;
    ASSERT_EQ(primary.size(), 2u);
    ASSERT_EQ(primary[0].code, "jazz");
    ASSERT_EQ(primary[1].code, "classical");
    ASSERT_EQ(primary[0].basedir, "Jazz");
    ASSERT_EQ(primary[0].sort.value_or(""), "name");
    ASSERT_TRUE(primary[0].extra_tags == (Strings{"label", "CATALOGNUMBER"}));
    ASSERT_FALSE(primary[1].sort.has_value());

    ASSERT_EQ(primary[0].taxonomy.size(), 2u);
    ASSERT_TRUE(primary[0].taxonomy[0].alternatives == (Strings{"albumartist", "artists"}));
    ASSERT_EQ(primary[0].taxonomy[1].label(), "album");

    ASSERT_EQ(cfg.categories.secondary.size(), 1u);
    const auto& bebop = cfg.categories.secondary[0];
    ASSERT_EQ(bebop.inherits, "jazz");
    ASSERT_TRUE(bebop.taxonomy.has_value());
    ASSERT_EQ(bebop.taxonomy->size(), 1u);
}

TEST_CASE(test_config_compiles_filters) {
    Config cfg = ConfigLoader::parse(SAMPLE_CONFIG, "sample");
    const auto& predicate = cfg.categories.secondary[0].predicate;

    ASSERT_TRUE(predicate(make_record("Jazz/a.mp3", {{"genre", Strings{"Bebop"}}, {"year", int64_t{1949}}})));
    ASSERT_FALSE(predicate(make_record("Jazz/b.mp3", {{"genre", Strings{"Bebop"}}, {"year", int64_t{1961}}})));
    ASSERT_FALSE(predicate(make_record("Jazz/c.mp3", {{"genre", Strings{"Swing"}}, {"year", int64_t{1938}}})));
}

TEST_CASE(test_config_category_for_path) {
    Config cfg = ConfigLoader::parse(SAMPLE_CONFIG, "sample");
    const auto* jazz = cfg.categories.category_for_path("Jazz/Miles Davis/01.flac");
    ASSERT_TRUE(jazz != nullptr);
    ASSERT_EQ(jazz->code, "jazz");
    ASSERT_TRUE(cfg.categories.category_for_path("Jazzier/01.flac") == nullptr);
    ASSERT_TRUE(cfg.categories.category_for_path("loose.mp3") == nullptr);
}

TEST_CASE(test_config_taxonomy_parsing) {
    auto levels = ConfigLoader::parse_taxonomy(" albumartist | artists ,album,, year ");
    ASSERT_EQ(levels.size(), 3u);
    ASSERT_TRUE(levels[0].alternatives == (Strings{"albumartist", "artists"}));
    ASSERT_EQ(levels[2].label(), "year");
    ASSERT_TRUE(ConfigLoader::parse_taxonomy("").empty());
}

TEST_CASE(test_config_unknown_keys_are_ignored) {
    Config cfg = ConfigLoader::parse("[ui]\ntheme = dark\n[scan]\nturbo = yes\n", "sample");
    ASSERT_EQ(cfg.workers, 0u);
    ASSERT_TRUE(cfg.categories.primary.empty());
}

TEST_CASE(test_config_invalid_values) {
    ASSERT_THROWS(ConfigLoader::parse("[scan]\nworkers = many\n", "t"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("[scan]\nworkers = -2\n", "t"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("[scan]\nworkers = \xC3\xA9\xE2\x91\xA0\n", "t"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("[scan]\nforce_refresh = maybe\n", "t"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("[logging]\nlevel = loud\n", "t"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("[paths\n", "t"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("[paths]\nmusic_directory\n", "t"), ConfigError);
}

TEST_CASE(test_config_invalid_categories) {
    // Neither basedir nor inherits
    ASSERT_THROWS(ConfigLoader::parse("[category.x]\nname = X\n", "t"), ConfigError);
    // Both
    ASSERT_THROWS(ConfigLoader::parse("[category.x]\nbasedir = X\ninherits = y\nfilter = a:b\n", "t"), ConfigError);
    // Secondary without filter
    ASSERT_THROWS(ConfigLoader::parse("[category.x]\ninherits = y\n", "t"), ConfigError);
    // Malformed filter
    ASSERT_THROWS(ConfigLoader::parse("[category.x]\ninherits = y\nfilter = \"(genre:jazz\"\n", "t"), ConfigError);
    // Duplicate code
    ASSERT_THROWS(ConfigLoader::parse("[category.x]\nbasedir = X\n[category.x]\nbasedir = Y\n", "t"), ConfigError);
    // Nested basedir
    ASSERT_THROWS(ConfigLoader::parse("[category.x]\nbasedir = a/b\n", "t"), ConfigError);
}

TEST_CASE(test_config_primary_without_taxonomy_is_accepted) {
    Config cfg = ConfigLoader::parse("[category.misc]\nbasedir = Misc\n", "t");
    ASSERT_EQ(cfg.categories.primary.size(), 1u);
    ASSERT_TRUE(cfg.categories.primary[0].taxonomy.empty());
    ASSERT_EQ(cfg.categories.primary[0].name, "misc");
}

TEST_CASE(test_config_load_from_file) {
    TempDir dir;
    auto file = dir.write("config.toml", SAMPLE_CONFIG);
    Config cfg = ConfigLoader::load_from_file(file);
    ASSERT_EQ(cfg.categories.primary.size(), 2u);
    ASSERT_THROWS(ConfigLoader::load_from_file(dir.path() / "missing.toml"), ConfigError);
}

int main() {
    return strata::test::TestRunner::instance().run_all();
}
