#include "backend/FreshnessCache.hpp"
#include "backend/Errors.hpp"
#include "backend/Serialization.hpp"
#include "backend/StateStore.hpp"
#include "util/Logger.hpp"

namespace strata::backend {

FreshnessCache::FreshnessCache(std::filesystem::path cache_file)
    : cache_file_(std::move(cache_file)) {}

model::RecordMap FreshnessCache::load() const {
    try {
        auto json = StateStore::read_blob(cache_file_);
        if (!json) {
            util::Logger::info("FreshnessCache: No record cache at " + cache_file_.string() + ", starting empty");
            return {};
        }
        auto records = decode_records(*json);
        util::Logger::info("FreshnessCache: Loaded " + std::to_string(records.size()) + " records");
        return records;
    } catch (const CacheCorruptionError& e) {
        // Rewritten from scratch at the end of this run
        util::Logger::warn("FreshnessCache: Discarding corrupt record cache (" + std::string(e.what()) + ")");
        return {};
    }
}

void FreshnessCache::save(const model::RecordMap& records) const {
    StateStore::write_blob(cache_file_, encode_records(records));
    util::Logger::info("FreshnessCache: Saved " + std::to_string(records.size()) + " records");
}

bool FreshnessCache::is_fresh(const model::Record* record, int64_t current_mtime) {
    return record != nullptr && record->modified_time == current_mtime;
}

CatalogueStore::CatalogueStore(std::filesystem::path snapshot_file)
    : snapshot_file_(std::move(snapshot_file)) {}

std::optional<model::Catalogue> CatalogueStore::load() const {
    try {
        auto json = StateStore::read_blob(snapshot_file_);
        if (!json) return std::nullopt;
        return decode_catalogue(*json);
    } catch (const CacheCorruptionError& e) {
        util::Logger::warn("CatalogueStore: Ignoring corrupt snapshot (" + std::string(e.what()) + ")");
        return std::nullopt;
    }
}

void CatalogueStore::save(const model::Catalogue& catalogue) const {
    StateStore::write_blob(snapshot_file_, encode_catalogue(catalogue));
    util::Logger::info("CatalogueStore: Saved " + std::to_string(catalogue.categories.size()) +
                       " categories and " + std::to_string(catalogue.playlists.size()) + " playlists");
}

}  // namespace strata::backend
