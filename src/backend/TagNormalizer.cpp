#include "backend/TagNormalizer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace strata::backend {

namespace {
    const std::vector<std::string>* values_of(const NativeTags& native, const char* name) {
        auto it = native.find(name);
        if (it == native.end() || it->second.empty()) return nullptr;
        return &it->second;
    }

    std::vector<std::string> non_empty(const std::vector<std::string>& values) {
        std::vector<std::string> out;
        for (const auto& v : values) {
            if (!v.empty()) out.push_back(v);
        }
        return out;
    }

    void set_first(model::AttributeMap& out, const NativeTags& native, const char* from, const char* to) {
        if (const auto* values = values_of(native, from)) {
            auto kept = non_empty(*values);
            if (!kept.empty()) out[to] = kept.front();
        }
    }

    void set_list(model::AttributeMap& out, const NativeTags& native, const char* from, const char* to) {
        if (const auto* values = values_of(native, from)) {
            auto kept = non_empty(*values);
            if (!kept.empty()) out[to] = std::move(kept);
        }
    }

    void set_index(model::AttributeMap& out, const NativeTags& native, const char* name) {
        if (const auto* values = values_of(native, name)) {
            if (auto index = TagNormalizer::parse_index(values->front())) out[name] = *index;
        }
    }

    void set_decimal(model::AttributeMap& out, const NativeTags& native, const char* name) {
        if (const auto* values = values_of(native, name)) {
            if (auto v = TagNormalizer::parse_decimal(values->front())) out[name] = *v;
        }
    }
}

std::optional<int64_t> TagNormalizer::parse_index(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    size_t start = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
    if (pos == start || pos - start > 18) return std::nullopt;
    return std::stoll(text.substr(start, pos - start));
}

std::optional<double> TagNormalizer::parse_decimal(const std::string& text) {
    if (text.empty()) return std::nullopt;
    const char* begin = text.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(v)) return std::nullopt;
    return v;
}

model::AttributeMap TagNormalizer::common_from_native(const NativeTags& native) {
    model::AttributeMap out;

    set_first(out, native, "title", "title");
    set_first(out, native, "album", "album");
    set_first(out, native, "artist", "artist");
    set_first(out, native, "albumartist", "albumartist");
    if (values_of(native, "artists")) {
        set_list(out, native, "artists", "artists");
    } else {
        set_list(out, native, "artist", "artists");
    }
    set_list(out, native, "genre", "genre");
    set_list(out, native, "rating", "rating");

    // "2004-05-01" and "2004" both carry the year first
    const auto* date = values_of(native, "date");
    if (!date) date = values_of(native, "year");
    if (date) {
        if (auto year = parse_index(date->front())) out["year"] = *year;
    }

    set_index(out, native, "track");
    set_index(out, native, "disk");

    set_decimal(out, native, "replaygain_album_gain");
    set_decimal(out, native, "replaygain_album_peak");
    set_decimal(out, native, "replaygain_track_gain");
    set_decimal(out, native, "replaygain_track_peak");

    return out;
}

std::string TagNormalizer::winamp_rating_to_percent(double fraction) {
    auto stars = static_cast<int64_t>(std::round(fraction / 0.25)) + 1;
    return std::to_string(stars * 20);
}

model::AttributeMap TagNormalizer::normalize(model::AttributeMap tags) {
    auto artist = tags.find("artist");
    if (artist != tags.end() && !model::is_empty_value(artist->second)) {
        if (!tags.contains("artists")) {
            tags["artists"] = model::value_elements(artist->second);
        }
        if (!tags.contains("albumartist")) {
            tags["albumartist"] = model::value_to_string(artist->second);
        }
    }

    auto albumartist = tags.find("albumartist");
    if (albumartist != tags.end()) {
        if (std::holds_alternative<std::vector<std::string>>(albumartist->second)) {
            albumartist->second = model::value_to_string(albumartist->second);
        }
    }

    auto rating = tags.find("rating");
    if (rating != tags.end()) {
        auto& value = rating->second;
        if (const auto* d = std::get_if<double>(&value); d && *d >= 0.0 && *d <= 1.0) {
            value = std::vector<std::string>{winamp_rating_to_percent(*d)};
        } else if (!std::holds_alternative<std::vector<std::string>>(value)) {
            value = std::vector<std::string>{model::value_to_string(value)};
        }
    }

    model::AttributeMap picked;
    for (auto& [key, value] : tags) {
        if (std::find(COMMON_TAGS.begin(), COMMON_TAGS.end(), key) != COMMON_TAGS.end()) {
            picked.emplace(key, std::move(value));
        }
    }
    return picked;
}

}  // namespace strata::backend
