#pragma once

#include "backend/AttributeExtractor.hpp"
#include "backend/TagNormalizer.hpp"
#include <optional>
#include <string>

namespace strata::backend {

/// Tag reader backed by the native decoder libraries: mpg123 for MP3,
/// libsndfile for WAV/AIFF and libavformat for everything else.
class MetadataParser : public AttributeExtractor {
public:
    ExtractedTags extract(const std::filesystem::path& file, const std::string& extension) const override;

    // Maps a native tag key (ID3 frame id, Vorbis comment, MP4 atom name) to
    // the canonical name used by TagNormalizer.
    static std::optional<std::string> canonical_tag_name(const std::string& native_key);

private:
    static void parse_mp3(const std::string& path, ExtractedTags& out, NativeTags& native);
    static void parse_sndfile(const std::string& path, ExtractedTags& out, NativeTags& native);
    static void parse_libav(const std::string& path, ExtractedTags& out, NativeTags& native);

    static void add_native(ExtractedTags& out, NativeTags& native, const std::string& key, const std::string& value);
};

}  // namespace strata::backend
