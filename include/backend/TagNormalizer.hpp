#pragma once

#include "model/Record.hpp"
#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::backend {

/// Native tags grouped under canonical lower-case names ("title", "artist",
/// "albumartist", "track", "replaygain_track_gain", ...), in file order.
using NativeTags = std::map<std::string, std::vector<std::string>>;

class TagNormalizer {
public:
    /// Tags kept in Record::attributes.
    static constexpr std::array<std::string_view, 13> COMMON_TAGS = {
        "title", "album", "artists", "albumartist", "genre", "year", "rating",
        "track", "disk",
        "replaygain_album_gain", "replaygain_album_peak",
        "replaygain_track_gain", "replaygain_track_peak",
    };

    /// Per-item tags dropped from a group's representative attributes.
    static constexpr std::array<std::string_view, 3> ITEM_TAGS = {"title", "track", "disk"};

    /// Converts canonical native tags into typed attributes.
    static model::AttributeMap common_from_native(const NativeTags& native);

    /// Fills artists/albumartist defaults, normalizes rating and keeps only COMMON_TAGS.
    static model::AttributeMap normalize(model::AttributeMap tags);

    /// Winamp stores ratings as a 0..1 fraction; returns "20".."100".
    static std::string winamp_rating_to_percent(double fraction);

    /// Leading number of "3", "03/12" or "3 of 12"; nullopt if none.
    static std::optional<int64_t> parse_index(const std::string& text);

    /// Leading decimal of values like "-6.20 dB".
    static std::optional<double> parse_decimal(const std::string& text);
};

}  // namespace strata::backend
