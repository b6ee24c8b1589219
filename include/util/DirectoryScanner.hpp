#pragma once

#include <filesystem>
#include <vector>
#include <string>
#include <cstdint>

namespace strata::util {

/**
 * DirectoryScanner: recursive audio file enumeration using the getdents64 syscall.
 *
 * Uses 256KB buffers to batch syscalls and the d_type field to avoid stat()
 * calls, falling back to fstatat() on filesystems that report DT_UNKNOWN.
 */
class DirectoryScanner {
public:
    struct ScanResult {
        std::vector<std::string> audio_files;  // Relative to the root, '/'-separated, sorted, unique
        std::string tree_hash;                 // SHA-256 (hex) of the sorted path list
    };

    /**
     * Enumerates every file with a recognized audio extension below root_dir.
     *
     * Unreadable subdirectories are logged and skipped. A root that cannot be
     * opened throws FileSystemError.
     */
    [[nodiscard]] static ScanResult scan_directory(const std::filesystem::path& root_dir);

    /**
     * Checks if a filename has a recognized audio extension (case-insensitive).
     */
    [[nodiscard]] static bool is_audio_extension(const char* filename);

    /**
     * SHA-256 over the paths joined with newlines, hex encoded.
     */
    [[nodiscard]] static std::string compute_tree_hash(const std::vector<std::string>& sorted_paths);

private:
    static constexpr size_t BUFFER_SIZE = 256 * 1024;  // 256KB buffer for getdents64

    static void scan_directory_recursive(
        const std::string& dir_path,
        const std::string& rel_prefix,
        std::vector<std::string>& files
    );
};

}  // namespace strata::util
