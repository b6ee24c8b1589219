#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace strata::backend {

/**
 * Compressed on-disk blobs for the persisted artifacts.
 *
 * Writes go to a sibling temporary file which is renamed over the target, so
 * a reader never sees a partially written artifact and a failed run leaves
 * the previous one intact.
 */
class StateStore {
public:
    /// Decompressed contents, or nullopt if the file does not exist.
    /// A stream that is not valid gzip throws CacheCorruptionError;
    /// other read failures throw FileSystemError.
    [[nodiscard]] static std::optional<std::string> read_blob(const std::filesystem::path& path);

    /// Compresses and atomically replaces path. Throws FileSystemError.
    static void write_blob(const std::filesystem::path& path, const std::string& data);
};

}  // namespace strata::backend
