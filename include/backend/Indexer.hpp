#pragma once

#include "backend/AttributeExtractor.hpp"
#include "backend/Config.hpp"
#include "backend/Library.hpp"
#include "model/Catalogue.hpp"
#include <filesystem>
#include <string>

namespace strata::backend {

struct RunOptions {
    bool force_refresh = false;
    bool skip_scan = false;   // Rebuild the catalogue from the cached records only
    bool playlists = true;
    size_t workers = 0;
};

/// State of one indexing run. Built at the start of Indexer::run() and
/// discarded at the end.
struct IndexContext {
    const Config& config;
    RunOptions options;
    std::filesystem::path music_directory;
    std::filesystem::path cache_directory;
    model::RecordMap records;
    ScanStats stats;
    std::string tree_hash;
};

/**
 * One run of the pipeline:
 *   lock -> load records -> scan + save records -> catalogue -> playlists -> snapshot
 *
 * The snapshot is written last, so a run that fails part way leaves the
 * previous snapshot in place.
 */
class Indexer {
public:
    Indexer(const Config& config, const AttributeExtractor& extractor);

    model::Catalogue run(const RunOptions& options) const;

    static std::filesystem::path records_path(const std::filesystem::path& cache_directory);
    static std::filesystem::path catalogue_path(const std::filesystem::path& cache_directory);
    static std::filesystem::path lock_path(const std::filesystem::path& cache_directory);

private:
    void scan(IndexContext& ctx) const;
    std::vector<model::Playlist> read_playlists(const IndexContext& ctx) const;

    const Config& config_;
    const AttributeExtractor& extractor_;
};

}  // namespace strata::backend
