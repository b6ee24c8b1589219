#pragma once

#include "model/Record.hpp"
#include <filesystem>
#include <map>
#include <string>

namespace strata::backend {

struct ExtractedTags {
    model::AttributeMap common;               // Typed common tags (title, artists, track, ...)
    model::AttributeMap format;               // container, codec, duration, sampleRate, ...
    std::map<std::string, std::string> raw;   // Every native tag, key upper-cased
};

/// Reads descriptive tags from an audio file. Implementations must be safe to
/// call from several scan workers at once.
class AttributeExtractor {
public:
    virtual ~AttributeExtractor() = default;

    /// Throws ExtractionError when the file cannot be read or decoded.
    virtual ExtractedTags extract(const std::filesystem::path& file, const std::string& extension) const = 0;
};

}  // namespace strata::backend
