#pragma once

#include "model/Record.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace strata::backend {

/// Byte-level readers for tags that the decoder libraries do not expose.
class MetadataHacks {
public:
    /// Winamp writes its rating into M4A files as a private "rate" atom.
    /// Returns the cleaned value, or nullopt when the bytes do not match.
    static std::optional<std::string> find_m4a_winamp_rating(std::string_view data);

    /// Winamp stores MP3 ratings in an ID3v2 POPM frame owned by
    /// "rating@winamp.com". `data` starts at the ID3v2 header. Returns the
    /// rating as a 0..1 fraction; a zero byte (unrated) yields nullopt.
    static std::optional<double> find_mp3_winamp_rating(std::string_view data);

    /// Extra attributes for a file; empty on any read failure or mismatch.
    static model::AttributeMap read(const std::filesystem::path& file, const std::string& extension);
};

}  // namespace strata::backend
