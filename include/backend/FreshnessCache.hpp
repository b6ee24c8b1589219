#pragma once

#include "model/Catalogue.hpp"
#include "model/Record.hpp"
#include <filesystem>
#include <optional>

namespace strata::backend {

/**
 * Persisted path -> Record map from the previous run.
 *
 * A record is fresh when its stored modification time equals the file's
 * current one exactly; fresh files are not re-extracted.
 */
class FreshnessCache {
public:
    explicit FreshnessCache(std::filesystem::path cache_file);

    /// Missing or corrupt state yields an empty map (corruption is logged).
    [[nodiscard]] model::RecordMap load() const;

    /// Overwrites the persisted state with the full record set.
    void save(const model::RecordMap& records) const;

    [[nodiscard]] static bool is_fresh(const model::Record* record, int64_t current_mtime);

    const std::filesystem::path& path() const { return cache_file_; }

private:
    std::filesystem::path cache_file_;
};

/// The catalogue snapshot artifact, rewritten in full by every run.
class CatalogueStore {
public:
    explicit CatalogueStore(std::filesystem::path snapshot_file);

    /// nullopt when missing or corrupt.
    [[nodiscard]] std::optional<model::Catalogue> load() const;
    void save(const model::Catalogue& catalogue) const;

    const std::filesystem::path& path() const { return snapshot_file_; }

private:
    std::filesystem::path snapshot_file_;
};

}  // namespace strata::backend
