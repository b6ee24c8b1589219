#pragma once

#include "backend/PlaylistSource.hpp"
#include "model/Catalogue.hpp"
#include <vector>

namespace strata::backend {

class PlaylistResolver {
public:
    /// Attaches records to playlist tracks. Order is preserved; tracks with
    /// no record (or only an error record) are kept as unresolved.
    static std::vector<model::Playlist> resolve(const std::vector<PlaylistDefinition>& definitions,
                                                const model::RecordMap& records);
};

}  // namespace strata::backend
