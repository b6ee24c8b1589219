#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace strata::util {

class Platform {
public:
    /// Recognized audio extensions (lower-case, without the dot).
    static constexpr std::array<std::string_view, 12> AUDIO_EXTENSIONS = {
        "aac", "aiff", "alac", "ape", "flac", "m4a",
        "mp3", "mp4", "ogg", "opus", "wav", "wma"
    };

    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_cache_directory();

    /// Lower-case extension without the leading dot ("" if none).
    static std::string extension_of(const std::filesystem::path& path);

    /// False when the file is missing or not accessible (ENOENT, ENOTDIR, EACCES).
    /// Any other stat() failure throws FileSystemError.
    static bool file_exists(const std::filesystem::path& path);

    /// Modification time in nanoseconds since the epoch. Throws FileSystemError.
    static int64_t modification_time(const std::filesystem::path& path);

    /// Wall clock in milliseconds since the epoch.
    static int64_t now_ms();
};

}  // namespace strata::util
