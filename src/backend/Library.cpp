#include "backend/Library.hpp"
#include "backend/Errors.hpp"
#include "backend/FreshnessCache.hpp"
#include "backend/MetadataHacks.hpp"
#include "backend/TagNormalizer.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <format>
#include <thread>
#include <unordered_set>

namespace strata::backend {

namespace {
    std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}

Library::Library(const AttributeExtractor& extractor, const model::CategoryDefinitions& categories)
    : extractor_(extractor), categories_(categories) {}

model::Record Library::failure_record(const ExtractionFailure& failure) const {
    model::Record record;
    record.path = failure.path;
    record.error = failure.reason;
    record.modified_time = failure.modified_time;
    record.scanned_at = util::Platform::now_ms();
    record.extension = util::Platform::extension_of(failure.path);
    if (const auto* category = categories_.category_for_path(failure.path)) {
        record.category_code = category->code;
    }
    return record;
}

FileResult Library::process_file(const std::filesystem::path& root, const std::string& rel_path,
                                 int64_t modified_time) const {
    std::filesystem::path file = root / rel_path;
    std::string extension = util::Platform::extension_of(rel_path);

    try {
        ExtractedTags tags = extractor_.extract(file, extension);

        model::AttributeMap merged = std::move(tags.common);
        for (auto& [key, value] : MetadataHacks::read(file, extension)) {
            merged[key] = std::move(value);
        }

        model::Record record;
        record.path = rel_path;
        record.attributes = TagNormalizer::normalize(std::move(merged));
        record.format_info = std::move(tags.format);
        record.modified_time = modified_time;
        record.scanned_at = util::Platform::now_ms();
        record.extension = extension;

        if (const auto* category = categories_.category_for_path(rel_path)) {
            record.category_code = category->code;
            for (const auto& tag : category->extra_tags) {
                auto it = tags.raw.find(upper(tag));
                if (it != tags.raw.end()) {
                    record.category_attributes[lower(tag)] = it->second;
                }
            }
        }
        return record;
    } catch (const std::exception& e) {
        // Extractor and decoder failures stay with this one file
        return ExtractionFailure{rel_path, e.what(), modified_time};
    }
}

ScanOutcome Library::scan(const std::filesystem::path& root, model::RecordMap cached, const ScanOptions& options,
                          const ProgressCallback& progress_callback) const {
    ScanOutcome outcome;

    if (options.skip_scan) {
        util::Logger::info("Library: Scan skipped, using " + std::to_string(cached.size()) + " cached records");
        outcome.stats.total = cached.size();
        outcome.stats.reused = cached.size();
        outcome.records = std::move(cached);
        return outcome;
    }

    util::DirectoryScanner::ScanResult scan_result = util::DirectoryScanner::scan_directory(root);
    const std::vector<std::string>& files = scan_result.audio_files;
    const size_t num_files = files.size();
    outcome.tree_hash = scan_result.tree_hash;
    outcome.stats.total = num_files;

    util::Logger::info("Library: Found " + std::to_string(num_files) + " audio files in " + root.string());

    size_t num_threads = options.workers > 0 ? options.workers : std::thread::hardware_concurrency();
    num_threads = std::clamp<size_t>(num_threads, 1, std::max<size_t>(num_files, 1));

    std::atomic<size_t> work_index{0};
    std::atomic<size_t> completed{0};
    std::vector<FileResult> results(num_files);
    std::vector<char> reused(num_files, 0);

    // Each worker writes only the slots it claimed; `cached` is read-only here
    std::vector<std::thread> workers;
    for (size_t t = 0; t < num_threads; ++t) {
        workers.emplace_back([&]() {
            while (true) {
                size_t idx = work_index.fetch_add(1);
                if (idx >= num_files) break;

                const std::string& rel_path = files[idx];
                try {
                    int64_t mtime = util::Platform::modification_time(root / rel_path);
                    auto it = cached.find(rel_path);
                    const model::Record* previous = it != cached.end() ? &it->second : nullptr;

                    if (!options.force_refresh && FreshnessCache::is_fresh(previous, mtime)) {
                        results[idx] = *previous;
                        reused[idx] = 1;
                    } else {
                        results[idx] = process_file(root, rel_path, mtime);
                    }
                } catch (const Error& e) {
                    // File vanished or became unreadable between enumeration and stat
                    results[idx] = ExtractionFailure{rel_path, e.what(), 0};
                }

                size_t done = completed.fetch_add(1) + 1;
                if (progress_callback && done % 100 == 0) {
                    progress_callback(done, num_files);
                }
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    if (progress_callback && num_files > 0) {
        progress_callback(num_files, num_files);
    }

    // Merge results (single-threaded)
    model::RecordMap records;
    records.reserve(std::max(num_files, cached.size()));
    for (size_t i = 0; i < num_files; ++i) {
        if (auto* failure = std::get_if<ExtractionFailure>(&results[i])) {
            util::Logger::warn("Library: Cannot read " + failure->path + ": " + failure->reason);
            records[files[i]] = failure_record(*failure);
            ++outcome.stats.failed;
        } else {
            if (reused[i]) ++outcome.stats.reused;
            else ++outcome.stats.extracted;
            records[files[i]] = std::move(std::get<model::Record>(results[i]));
        }
    }

    // Cached records the walk did not see stay until the existence check below
    std::unordered_set<std::string> seen(files.begin(), files.end());
    for (auto& [path, record] : cached) {
        if (!seen.contains(path)) {
            records.emplace(path, std::move(record));
        }
    }

    // Enumeration is not proof of existence: a file may vanish during the
    // pass. file_exists() throws on anything but absence
    outcome.stats.pruned = std::erase_if(records, [&](const auto& entry) {
        return !util::Platform::file_exists(root / entry.first);
    });

    outcome.records = std::move(records);
    util::Logger::info(std::format("Library: {} extracted, {} reused, {} failed, {} pruned",
                                   outcome.stats.extracted, outcome.stats.reused,
                                   outcome.stats.failed, outcome.stats.pruned));
    return outcome;
}

}  // namespace strata::backend
