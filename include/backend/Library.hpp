#pragma once

#include "backend/AttributeExtractor.hpp"
#include "model/Category.hpp"
#include "model/Record.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace strata::backend {

struct ScanOptions {
    bool force_refresh = false;  // Re-extract fresh files too
    bool skip_scan = false;      // Return the cached records untouched
    size_t workers = 0;          // 0 = hardware concurrency
};

struct ScanStats {
    size_t total = 0;
    size_t extracted = 0;
    size_t reused = 0;
    size_t failed = 0;
    size_t pruned = 0;
};

struct ScanOutcome {
    model::RecordMap records;
    ScanStats stats;
    std::string tree_hash;  // Empty when the scan was skipped
};

/// A file whose tags could not be read. Folded into an error-only record.
struct ExtractionFailure {
    std::string path;
    std::string reason;
    int64_t modified_time = 0;
};

using FileResult = std::variant<model::Record, ExtractionFailure>;

/**
 * Scan orchestrator: brings the record set up to date with the music
 * directory. New and modified files go through the extractor on a bounded
 * worker pool, unchanged files keep their cached record and records of
 * files that no longer exist are pruned.
 */
class Library {
public:
    using ProgressCallback = std::function<void(size_t done, size_t total)>;

    Library(const AttributeExtractor& extractor, const model::CategoryDefinitions& categories);

    /// Throws FileSystemError when the root cannot be enumerated or a file's
    /// existence cannot be determined while pruning.
    ScanOutcome scan(const std::filesystem::path& root, model::RecordMap cached, const ScanOptions& options,
                     const ProgressCallback& progress_callback = nullptr) const;

    /// Extracts a single file. Never throws for per-file problems.
    FileResult process_file(const std::filesystem::path& root, const std::string& rel_path, int64_t modified_time) const;

    /// Error-only record for a failure.
    model::Record failure_record(const ExtractionFailure& failure) const;

private:
    const AttributeExtractor& extractor_;
    const model::CategoryDefinitions& categories_;
};

}  // namespace strata::backend
