#include "backend/MetadataHacks.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iterator>

namespace strata::backend {

namespace {
    constexpr std::string_view M4A_BRAND = "ftypM4A";
    constexpr std::string_view RATE_ATOM{"rate\0\0\0", 7};
    constexpr std::string_view WINAMP_RATING_EMAIL = "rating@winamp.com";
    constexpr size_t ID3_HEADER_SIZE = 10;

    uint32_t read_be32(std::string_view bytes) {
        uint32_t v = 0;
        for (char c : bytes) v = (v << 8) | static_cast<unsigned char>(c);
        return v;
    }

    // ID3v2 sizes keep the high bit of every byte clear
    uint32_t read_syncsafe(std::string_view bytes) {
        uint32_t v = 0;
        for (char c : bytes) v = (v << 7) | (static_cast<unsigned char>(c) & 0x7f);
        return v;
    }

    // Tag size from an ID3v2 header, header excluded; 0 when not a tag
    size_t id3_tag_size(std::string_view header) {
        if (header.size() < ID3_HEADER_SIZE || header.substr(0, 3) != "ID3") return 0;
        return read_syncsafe(header.substr(6, 4));
    }

    std::optional<double> winamp_popm_rating(std::string_view body) {
        size_t nul = body.find('\0');
        if (nul == std::string_view::npos || nul + 1 >= body.size()) return std::nullopt;
        if (body.substr(0, nul) != WINAMP_RATING_EMAIL) return std::nullopt;

        auto rating = static_cast<unsigned char>(body[nul + 1]);
        if (rating == 0) return std::nullopt;
        return (rating - 1) / 254.0;
    }
}

std::optional<std::string> MetadataHacks::find_m4a_winamp_rating(std::string_view data) {
    if (data.size() < 4 + M4A_BRAND.size() || data.substr(4, M4A_BRAND.size()) != M4A_BRAND) {
        return std::nullopt;
    }

    size_t n = data.find(RATE_ATOM);
    while (n != std::string_view::npos) {
        size_t after = n + RATE_ATOM.size();
        if (after < data.size()) {
            size_t offset = static_cast<unsigned char>(data[after]);
            if (n + offset + 4 <= data.size()) {
                std::string value;
                for (char c : data.substr(n + offset + 1, 3)) {
                    auto u = static_cast<unsigned char>(c);
                    if (!std::iscntrl(u) && !std::isspace(u)) value.push_back(c);
                }
                return value;
            }
        }
        n = data.find(RATE_ATOM, n + 1);
    }
    return std::nullopt;
}

std::optional<double> MetadataHacks::find_mp3_winamp_rating(std::string_view data) {
    size_t tag_size = id3_tag_size(data);
    if (tag_size == 0) return std::nullopt;

    auto major = static_cast<unsigned char>(data[3]);
    auto flags = static_cast<unsigned char>(data[5]);
    if (major < 2 || major > 4) return std::nullopt;

    size_t end = std::min(data.size(), ID3_HEADER_SIZE + tag_size);
    size_t pos = ID3_HEADER_SIZE;

    // Extended header (v2.3 size excludes its own 4 bytes, v2.4 includes them)
    if (major >= 3 && (flags & 0x40) && pos + 4 <= end) {
        uint32_t ext = major == 3 ? read_be32(data.substr(pos, 4)) + 4 : read_syncsafe(data.substr(pos, 4));
        pos += ext;
    }

    const size_t id_len = major == 2 ? 3 : 4;
    const size_t frame_header = major == 2 ? 6 : 10;
    const std::string_view popm_id = major == 2 ? "POP" : "POPM";

    while (pos + frame_header <= end) {
        std::string_view id = data.substr(pos, id_len);
        if (id[0] == '\0') break;  // Padding

        size_t size = 0;
        if (major == 2) size = read_be32(data.substr(pos + 3, 3));
        else if (major == 3) size = read_be32(data.substr(pos + 4, 4));
        else size = read_syncsafe(data.substr(pos + 4, 4));

        size_t body = pos + frame_header;
        if (size > end - body) break;

        if (id == popm_id) {
            if (auto rating = winamp_popm_rating(data.substr(body, size))) return rating;
        }
        pos = body + size;
    }
    return std::nullopt;
}

model::AttributeMap MetadataHacks::read(const std::filesystem::path& file, const std::string& extension) {
    model::AttributeMap out;
    if (extension != "m4a" && extension != "mp3") return out;

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        util::Logger::debug("MetadataHacks: cannot open " + file.string());
        return out;
    }

    std::string data;
    if (extension == "mp3") {
        // Only the leading ID3v2 tag is needed
        data.resize(ID3_HEADER_SIZE);
        in.read(data.data(), static_cast<std::streamsize>(data.size()));
        size_t tag_size = in ? id3_tag_size(data) : 0;
        if (tag_size == 0) return out;
        data.resize(ID3_HEADER_SIZE + tag_size);
        in.read(data.data() + ID3_HEADER_SIZE, static_cast<std::streamsize>(tag_size));
        data.resize(ID3_HEADER_SIZE + static_cast<size_t>(in.gcount()));
    } else {
        data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    if (in.bad()) {
        util::Logger::debug("MetadataHacks: read failed for " + file.string());
        return out;
    }

    if (extension == "mp3") {
        if (auto rating = find_mp3_winamp_rating(data)) out["rating"] = *rating;
    } else if (auto rating = find_m4a_winamp_rating(data)) {
        out["rating"] = std::vector<std::string>{*rating};
    }
    return out;
}

}  // namespace strata::backend
