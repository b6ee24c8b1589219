#include "backend/PlaylistResolver.hpp"
#include "util/Logger.hpp"
#include <format>

namespace strata::backend {

std::vector<model::Playlist> PlaylistResolver::resolve(const std::vector<PlaylistDefinition>& definitions,
                                                       const model::RecordMap& records) {
    std::vector<model::Playlist> playlists;
    playlists.reserve(definitions.size());

    for (const auto& def : definitions) {
        model::Playlist playlist;
        playlist.id = def.id;
        playlist.title = def.title;
        playlist.source = def.source;
        playlist.tracks.reserve(def.tracks.size());

        size_t unresolved = 0;
        for (const auto& path : def.tracks) {
            model::PlaylistTrack track;
            track.path = path;
            auto it = records.find(path);
            if (it != records.end() && !it->second.is_error()) {
                track.record = it->second;
            } else {
                ++unresolved;
            }
            playlist.tracks.push_back(std::move(track));
        }

        if (unresolved > 0) {
            util::Logger::warn(std::format("Playlist '{}': {} of {} tracks not in the catalogue",
                                           playlist.title, unresolved, playlist.tracks.size()));
        }
        playlists.push_back(std::move(playlist));
    }
    return playlists;
}

}  // namespace strata::backend
