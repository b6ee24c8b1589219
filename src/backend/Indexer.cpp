#include "backend/Indexer.hpp"
#include "backend/CatalogueBuilder.hpp"
#include "backend/Errors.hpp"
#include "backend/FreshnessCache.hpp"
#include "backend/PlaylistResolver.hpp"
#include "backend/PlaylistSource.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/RunLock.hpp"
#include <format>

namespace strata::backend {

Indexer::Indexer(const Config& config, const AttributeExtractor& extractor)
    : config_(config), extractor_(extractor) {}

std::filesystem::path Indexer::records_path(const std::filesystem::path& cache_directory) {
    return cache_directory / "records.json.gz";
}

std::filesystem::path Indexer::catalogue_path(const std::filesystem::path& cache_directory) {
    return cache_directory / "catalogue.json.gz";
}

std::filesystem::path Indexer::lock_path(const std::filesystem::path& cache_directory) {
    return cache_directory / "strata.lock";
}

void Indexer::scan(IndexContext& ctx) const {
    Library library(extractor_, config_.categories);

    ScanOptions scan_options;
    scan_options.force_refresh = ctx.options.force_refresh;
    scan_options.skip_scan = ctx.options.skip_scan;
    scan_options.workers = ctx.options.workers;

    auto progress = [](size_t done, size_t total) {
        util::Logger::debug(std::format("Indexer: {}/{} files", done, total));
    };

    ScanOutcome outcome = library.scan(ctx.music_directory, std::move(ctx.records), scan_options, progress);
    ctx.records = std::move(outcome.records);
    ctx.stats = outcome.stats;
    ctx.tree_hash = std::move(outcome.tree_hash);
}

std::vector<model::Playlist> Indexer::read_playlists(const IndexContext& ctx) const {
    const auto& settings = config_.playlists;
    if (!ctx.options.playlists || !settings.enabled) {
        util::Logger::info("Indexer: Playlists disabled");
        return {};
    }
    if (settings.winamp_directory.empty()) {
        util::Logger::info("Indexer: No Winamp directory configured, skipping playlists");
        return {};
    }

    PlaylistProfile profile;
    profile.title_prefix = settings.title_prefix;
    profile.win32_base_dir = settings.win32_base_dir;

    PlaylistSource source(settings.winamp_directory, profile);
    auto definitions = source.read();
    util::Logger::info(std::format("Indexer: {} playlists in {}", definitions.size(),
                                   source.store_directory().string()));
    return PlaylistResolver::resolve(definitions, ctx.records);
}

model::Catalogue Indexer::run(const RunOptions& options) const {
    IndexContext ctx{config_, options, config_.music_directory, config_.cache_directory, {}, {}, {}};

    std::error_code ec;
    std::filesystem::create_directories(ctx.cache_directory, ec);
    if (ec) {
        throw FileSystemError("Cannot create cache directory " + ctx.cache_directory.string() + ": " + ec.message());
    }

    util::RunLock lock(lock_path(ctx.cache_directory));
    util::Logger::info("Indexer: Indexing " + ctx.music_directory.string());

    FreshnessCache cache(records_path(ctx.cache_directory));
    ctx.records = cache.load();
    util::Logger::info(std::format("Indexer: {} cached records", ctx.records.size()));

    scan(ctx);
    if (!options.skip_scan) {
        cache.save(ctx.records);
    }

    model::Catalogue catalogue;
    catalogue.categories = CatalogueBuilder::build(ctx.records, config_.categories);
    catalogue.playlists = read_playlists(ctx);
    catalogue.tree_hash = ctx.tree_hash;
    catalogue.generated_at = util::Platform::now_ms();

    // Last step: readers only ever see a complete snapshot
    CatalogueStore(catalogue_path(ctx.cache_directory)).save(catalogue);

    util::Logger::info(std::format("Indexer: Wrote {} categories and {} playlists to {}",
                                   catalogue.categories.size(), catalogue.playlists.size(),
                                   catalogue_path(ctx.cache_directory).string()));
    return catalogue;
}

}  // namespace strata::backend
