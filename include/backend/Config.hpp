#pragma once

#include "model/Category.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata::backend {

struct PlaylistSettings {
    bool enabled = true;
    std::filesystem::path winamp_directory;    // Empty = no playlist store
    std::string win32_base_dir;
    std::optional<std::string> title_prefix;
};

struct Config {
    // [paths]
    std::filesystem::path music_directory;
    std::filesystem::path cache_directory;

    // [scan]
    size_t workers = 0;          // 0 = hardware concurrency
    bool force_refresh = false;

    // [logging]
    std::string log_level = "info";
    std::filesystem::path log_file;  // Empty = <cache_directory>/strata.log

    PlaylistSettings playlists;

    // [category.<code>] sections in declaration order
    model::CategoryDefinitions categories;
};

class ConfigLoader {
public:
    /// Reads the default config file; defaults only when it does not exist.
    static Config load_config();

    /// Throws ConfigError when the file is unreadable or a value is invalid.
    static Config load_from_file(const std::filesystem::path& path);

    /// Parses config text; `origin` names the source in error messages.
    static Config parse(const std::string& text, const std::string& origin);

    /// "albumartist|artist, album" -> [[albumartist, artist], [album]].
    static std::vector<model::KeySpec> parse_taxonomy(const std::string& value);

    static std::filesystem::path get_config_file();

private:
    static Config create_default_config();
};

}  // namespace strata::backend
