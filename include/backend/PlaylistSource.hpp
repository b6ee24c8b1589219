#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata::backend {

struct PlaylistProfile {
    std::optional<std::string> title_prefix;  // Keep only titles with this prefix (stripped)
    std::string win32_base_dir;               // Windows directory track URIs are made relative to
};

/// Playlist as listed by the store, before resolution.
struct PlaylistDefinition {
    std::string id;
    std::string title;
    std::string source;               // M3U8 file name in the store
    std::vector<std::string> tracks;  // Record-key form: relative, '/'-separated, NFC
};

/// Reads the playlists of a Winamp Media Library:
/// <winamp>/Plugins/ml/playlists/playlists.xml plus one M3U8 file per playlist.
class PlaylistSource {
public:
    PlaylistSource(std::filesystem::path winamp_directory, PlaylistProfile profile);

    /// Empty when the store does not exist. Throws PlaylistSourceError when
    /// playlists.xml cannot be parsed.
    std::vector<PlaylistDefinition> read() const;

    std::filesystem::path store_directory() const;

    /// Track URIs of an M3U8 document, comments and blank lines skipped.
    static std::vector<std::string> parse_m3u8(const std::string& content);

    /// "D:\Music\Album\01.mp3" with base "D:\Music" -> "Album/01.mp3".
    static std::string win32_relative_path(const std::string& uri, const std::string& base_dir);

private:
    std::filesystem::path winamp_directory_;
    PlaylistProfile profile_;
};

}  // namespace strata::backend
