#include "../framework/SimpleTest.hpp"
#include "../support/Records.hpp"
#include "backend/Errors.hpp"
#include "backend/FreshnessCache.hpp"
#include "backend/Serialization.hpp"
#include "backend/StateStore.hpp"
#include "backend/TaxonomyBuilder.hpp"
#include "util/Gzip.hpp"
#include "util/Logger.hpp"

using namespace strata;
using namespace strata::backend;
using strata::test::key;
using strata::test::make_record;
using strata::test::Strings;
using strata::test::TempDir;

namespace {

model::RecordMap sample_records() {
    auto a = make_record("jazz/kob/01 So What.flac", {
        {"title", std::string("So What")},
        {"artists", Strings{"Miles Davis", "John Coltrane"}},
        {"track", int64_t{1}},
        {"replaygain_track_gain", -7.25},
        {"rating", Strings{"100"}},
    }, "jazz");
    a.category_attributes["label"] = std::string("Columbia");
    a.format_info["duration"] = 562.5;
    a.format_info["lossless"] = true;
    a.format_info["sampleRate"] = int64_t{44100};
    a.modified_time = 1'700'000'000'123'456'789;

    auto b = make_record("jazz/broken.flac", {}, "jazz");
    b.error = "avformat_open_input: Invalid data found when processing input";

    auto c = make_record("Ünïcode/日本語.mp3", {{"title", std::string("Ōkami")}});

    model::RecordMap map;
    for (auto& r : {a, b, c}) map[r.path] = r;
    return map;
}

struct QuietLogs {
    QuietLogs() { util::Logger::set_echo(false); }
};
QuietLogs quiet_logs;

}  // namespace

TEST_CASE(test_gzip_round_trip) {
    std::string data;
    for (int i = 0; i < 20000; ++i) data += "line " + std::to_string(i) + "\n";
    data.push_back('\0');
    data += "tail";

    std::string packed = util::Gzip::compress(data);
    ASSERT_TRUE(util::Gzip::has_gzip_header(packed));
    ASSERT_TRUE(packed.size() < data.size());
    ASSERT_EQ(util::Gzip::decompress(packed), data);
    ASSERT_EQ(util::Gzip::decompress(util::Gzip::compress("")), "");
}

TEST_CASE(test_gzip_rejects_malformed_input) {
    ASSERT_FALSE(util::Gzip::has_gzip_header("plain text"));
    ASSERT_THROWS(util::Gzip::decompress("plain text, not gzip"), CodecError);

    std::string packed = util::Gzip::compress(std::string(4096, 'x'));
    ASSERT_THROWS(util::Gzip::decompress(packed.substr(0, packed.size() / 2)), CodecError);
}

TEST_CASE(test_records_json_round_trip) {
    auto records = sample_records();
    auto decoded = decode_records(encode_records(records));
    ASSERT_EQ(decoded.size(), 3u);
    ASSERT_TRUE(decoded == records);
    ASSERT_TRUE(decoded.at("jazz/broken.flac").is_error());
    ASSERT_TRUE(std::holds_alternative<double>(decoded.at("jazz/kob/01 So What.flac").attributes.at("replaygain_track_gain")));
}

TEST_CASE(test_records_encoding_is_deterministic) {
    auto records = sample_records();
    model::RecordMap reversed;
    std::vector<std::string> keys;
    for (const auto& [path, r] : records) keys.push_back(path);
    for (auto it = keys.rbegin(); it != keys.rend(); ++it) reversed[*it] = records.at(*it);
    ASSERT_EQ(encode_records(records), encode_records(reversed));
}

TEST_CASE(test_decode_rejects_bad_documents) {
    ASSERT_THROWS(decode_records("{not json"), CacheCorruptionError);
    ASSERT_THROWS(decode_records("[]"), CacheCorruptionError);
    ASSERT_THROWS(decode_records("{\"version\": 99, \"records\": {}}"), CacheCorruptionError);
    ASSERT_THROWS(decode_records("{\"version\": 1, \"records\": {\"a.mp3\": {\"file\": 5}}}"), CacheCorruptionError);
    ASSERT_THROWS(decode_catalogue("{\"version\": 1}"), CacheCorruptionError);
}

TEST_CASE(test_catalogue_json_round_trip) {
    std::vector<model::Record> records;
    for (const auto& [path, r] : sample_records()) {
        if (!r.is_error()) records.push_back(r);
    }

    model::Catalogue catalogue;
    model::CategoryResult jazz;
    jazz.code = "jazz";
    jazz.name = "Jazz";
    jazz.taxonomy = {key({"albumartist", "artists"}), key({"album"})};
    jazz.sort = "name";
    jazz.groups = TaxonomyBuilder::build(records, jazz.taxonomy);
    catalogue.categories.push_back(jazz);

    model::CategoryResult modal = jazz;
    modal.kind = model::CategoryKind::Secondary;
    modal.code = "modal";
    modal.inherits = "jazz";
    modal.sort.reset();
    modal.groups.clear();
    catalogue.categories.push_back(modal);

    model::Playlist playlist;
    playlist.id = "{2B1D}";
    playlist.title = "Late night";
    playlist.source = "plf1.m3u8";
    playlist.tracks.push_back({records[0].path, records[0]});
    playlist.tracks.push_back({"missing/track.mp3", std::nullopt});
    catalogue.playlists.push_back(playlist);

    catalogue.tree_hash = std::string(64, 'a');
    catalogue.generated_at = 1'700'000'000'000;

    auto decoded = decode_catalogue(encode_catalogue(catalogue));
    ASSERT_TRUE(decoded == catalogue);
    ASSERT_FALSE(decoded.playlists[0].tracks[1].resolved());
}

TEST_CASE(test_state_store_missing_file_is_nullopt) {
    TempDir dir;
    ASSERT_FALSE(StateStore::read_blob(dir.path() / "absent.json.gz").has_value());
}

TEST_CASE(test_state_store_replaces_atomically) {
    TempDir dir;
    auto file = dir.path() / "state.json.gz";
    StateStore::write_blob(file, "first");
    StateStore::write_blob(file, "second");
    ASSERT_EQ(StateStore::read_blob(file).value_or(""), "second");
    ASSERT_FALSE(std::filesystem::exists(file.string() + ".tmp"));
}

TEST_CASE(test_state_store_non_gzip_is_corruption) {
    TempDir dir;
    auto file = dir.write("state.json.gz", "{\"version\":1}");
    ASSERT_THROWS(StateStore::read_blob(file), CacheCorruptionError);
}

TEST_CASE(test_freshness_cache_round_trip) {
    TempDir dir;
    FreshnessCache cache(dir.path() / "records.json.gz");
    ASSERT_TRUE(cache.load().empty());

    auto records = sample_records();
    cache.save(records);
    ASSERT_TRUE(cache.load() == records);

    cache.save({});
    ASSERT_TRUE(std::filesystem::exists(cache.path()));
    ASSERT_TRUE(cache.load().empty());
}

TEST_CASE(test_freshness_cache_recovers_from_corruption) {
    TempDir dir;
    auto file = dir.write("records.json.gz", "garbage that is not gzip");
    ASSERT_TRUE(FreshnessCache(file).load().empty());

    StateStore::write_blob(file, "{\"version\": 1, \"records\": [1, 2]}");
    ASSERT_TRUE(FreshnessCache(file).load().empty());

    StateStore::write_blob(file, "{\"version\": 2, \"records\": {}}");
    ASSERT_TRUE(FreshnessCache(file).load().empty());
}

TEST_CASE(test_freshness_is_exact_mtime_equality) {
    auto r = make_record("a.mp3", {});
    r.modified_time = 1'000'000'001;
    ASSERT_TRUE(FreshnessCache::is_fresh(&r, 1'000'000'001));
    ASSERT_FALSE(FreshnessCache::is_fresh(&r, 1'000'000'002));
    ASSERT_FALSE(FreshnessCache::is_fresh(&r, 1'000'000'000));
    ASSERT_FALSE(FreshnessCache::is_fresh(nullptr, 1'000'000'001));

    // Error records are stamped too and count as fresh
    r.error = "broken";
    ASSERT_TRUE(FreshnessCache::is_fresh(&r, 1'000'000'001));
}

TEST_CASE(test_catalogue_store_corrupt_snapshot_is_nullopt) {
    TempDir dir;
    auto file = dir.write("catalogue.json.gz", "\x1f\x8b broken");
    ASSERT_FALSE(CatalogueStore(file).load().has_value());

    model::Catalogue empty;
    CatalogueStore(file).save(empty);
    ASSERT_TRUE(CatalogueStore(file).load() == std::optional<model::Catalogue>(empty));
}

int main() {
    return strata::test::TestRunner::instance().run_all();
}
