#include "backend/PlaylistSource.hpp"
#include "backend/Errors.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <iterator>
#include <pugixml.hpp>
#include <sstream>

namespace strata::backend {

namespace {
    std::vector<std::string> split_win32(const std::string& path) {
        std::vector<std::string> parts;
        std::string current;
        for (char c : path) {
            if (c == '\\' || c == '/') {
                if (!current.empty() && current != ".") parts.push_back(current);
                current.clear();
            } else {
                current.push_back(c);
            }
        }
        if (!current.empty() && current != ".") parts.push_back(current);
        return parts;
    }

    // Windows paths compare case-insensitively
    bool same_segment(const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
               });
    }

    bool is_drive(const std::string& segment) {
        return segment.size() == 2 && std::isalpha(static_cast<unsigned char>(segment[0])) && segment[1] == ':';
    }

    bool is_absolute_win32(const std::string& path) {
        if (path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':') return true;
        return path.starts_with("\\") || path.starts_with("/");
    }
}

PlaylistSource::PlaylistSource(std::filesystem::path winamp_directory, PlaylistProfile profile)
    : winamp_directory_(std::move(winamp_directory)), profile_(std::move(profile)) {}

std::filesystem::path PlaylistSource::store_directory() const {
    return winamp_directory_ / "Plugins" / "ml" / "playlists";
}

std::vector<std::string> PlaylistSource::parse_m3u8(const std::string& content) {
    std::vector<std::string> uris;
    std::istringstream stream(content);
    std::string line;
    bool first = true;
    while (std::getline(stream, line)) {
        if (first && line.starts_with("\xEF\xBB\xBF")) line.erase(0, 3);
        first = false;

        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos) continue;
        size_t end = line.find_last_not_of(" \t\r");
        line = line.substr(start, end - start + 1);
        if (line.starts_with('#')) continue;
        uris.push_back(line);
    }
    return uris;
}

std::string PlaylistSource::win32_relative_path(const std::string& uri, const std::string& base_dir) {
    std::vector<std::string> target = split_win32(uri);
    if (target.empty()) return "";

    std::vector<std::string> relative;
    if (is_absolute_win32(uri) && !base_dir.empty()) {
        std::vector<std::string> base = split_win32(base_dir);
        // Another drive cannot be reached relatively
        if (!base.empty() && is_drive(base[0]) && is_drive(target[0]) && !same_segment(base[0], target[0])) {
            base.clear();
        }
        size_t common = 0;
        while (common < base.size() && common + 1 < target.size() && same_segment(base[common], target[common])) {
            ++common;
        }
        for (size_t i = common; i < base.size(); ++i) relative.push_back("..");
        relative.insert(relative.end(), target.begin() + static_cast<std::ptrdiff_t>(common), target.end());
    } else {
        relative = std::move(target);
    }

    std::string out;
    for (const auto& part : relative) {
        if (!out.empty()) out += '/';
        out += part;
    }
    return out;
}

std::vector<PlaylistDefinition> PlaylistSource::read() const {
    std::filesystem::path store = store_directory() / "playlists.xml";

    std::error_code ec;
    if (!std::filesystem::exists(store, ec)) {
        util::Logger::warn("No Winamp playlist store at " + store.string());
        return {};
    }

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(store.c_str(), pugi::parse_default, pugi::encoding_utf16_le);
    if (!result) {
        throw PlaylistSourceError(std::format("{}: {} at offset {}", store.string(), result.description(),
                                              static_cast<long long>(result.offset)));
    }

    pugi::xml_node root = doc.child("playlists");
    if (!root) {
        throw PlaylistSourceError(store.string() + ": missing <playlists> element");
    }

    std::vector<PlaylistDefinition> playlists;
    for (pugi::xml_node node : root.children("playlist")) {
        PlaylistDefinition def;
        def.source = node.attribute("filename").as_string();
        def.title = node.attribute("title").as_string();
        def.id = node.attribute("id").as_string();

        if (profile_.title_prefix) {
            if (!def.title.starts_with(*profile_.title_prefix)) continue;
            def.title.erase(0, profile_.title_prefix->size());
        }
        if (def.source.empty()) {
            util::Logger::warn("Playlist '" + def.title + "' has no filename, skipping");
            continue;
        }

        std::filesystem::path m3u8 = store_directory() / def.source;
        std::ifstream in(m3u8, std::ios::binary);
        if (!in) {
            util::Logger::warn("Cannot read playlist file " + m3u8.string() + ", skipping");
            continue;
        }
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        for (const auto& uri : parse_m3u8(content)) {
            def.tracks.push_back(util::to_nfc(win32_relative_path(uri, profile_.win32_base_dir)));
        }

        util::Logger::debug(std::format("Playlist '{}': {} tracks", def.title, def.tracks.size()));
        playlists.push_back(std::move(def));
    }
    return playlists;
}

}  // namespace strata::backend
