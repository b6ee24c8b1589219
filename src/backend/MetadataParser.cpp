#include "backend/MetadataParser.hpp"
#include "backend/Errors.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <format>
#include <mpg123.h>
#include <sndfile.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/dict.h>
}

/*
 * Tag extraction reuses the decoder libraries instead of a tagging library.
 *
 * mpg123 exposes ID3v2 text frames (TIT2, TPE1, TRCK, ...) plus TXXX user
 * frames, with ID3v1 as a fallback. libsndfile only knows a fixed SF_STR_*
 * set and no album artist or disc number, so it handles the PCM containers
 * only. FLAC, Ogg, Opus and the MP4 family go through libavformat, which
 * reports every Vorbis comment and iTunes atom in its metadata dictionaries.
 */

namespace strata::backend {

namespace {
    std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    std::string from_mpg123(const mpg123_string* s) {
        if (!s || !s->p || s->fill == 0) return "";
        return trim(std::string(s->p, ::strnlen(s->p, s->fill)));
    }

    std::string from_fixed(const char* data, size_t size) {
        return trim(std::string(data, ::strnlen(data, size)));
    }

    void set_finite(model::AttributeMap& map, const char* key, double value) {
        if (std::isfinite(value)) map[key] = value;
    }

    // libavformat joins repeated Vorbis comments with ';'
    bool is_multi_valued(const std::string& canonical) {
        return canonical == "artist" || canonical == "artists" || canonical == "genre";
    }

    struct Mpg123Initializer {
        Mpg123Initializer() { mpg123_init(); }
        ~Mpg123Initializer() { mpg123_exit(); }
    };
    Mpg123Initializer g_mpg123_init;
}

std::optional<std::string> MetadataParser::canonical_tag_name(const std::string& native_key) {
    std::string key = upper(native_key);

    if (key == "TITLE" || key == "TIT2") return "title";
    if (key == "ARTIST" || key == "TPE1") return "artist";
    if (key == "ARTISTS") return "artists";
    if (key == "ALBUM" || key == "TALB") return "album";
    if (key == "ALBUMARTIST" || key == "ALBUM_ARTIST" || key == "ALBUM ARTIST" || key == "TPE2") return "albumartist";
    if (key == "GENRE" || key == "TCON") return "genre";
    if (key == "DATE" || key == "TDRC" || key == "TYER") return "date";
    if (key == "YEAR") return "year";
    if (key == "TRACK" || key == "TRACKNUMBER" || key == "TRCK") return "track";
    if (key == "DISC" || key == "DISK" || key == "DISCNUMBER" || key == "TPOS") return "disk";
    if (key == "RATING") return "rating";
    if (key.starts_with("REPLAYGAIN_")) {
        std::string lower = native_key;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
    }
    return std::nullopt;
}

void MetadataParser::add_native(ExtractedTags& out, NativeTags& native, const std::string& key, const std::string& value) {
    std::string v = trim(value);
    if (key.empty() || v.empty()) return;

    out.raw.emplace(upper(key), v);

    auto canonical = canonical_tag_name(key);
    if (!canonical) return;

    auto& values = native[*canonical];
    if (is_multi_valued(*canonical)) {
        size_t start = 0;
        while (start <= v.size()) {
            size_t end = v.find(';', start);
            if (end == std::string::npos) end = v.size();
            std::string part = trim(v.substr(start, end - start));
            if (!part.empty()) values.push_back(part);
            start = end + 1;
        }
    } else {
        values.push_back(v);
    }
}

ExtractedTags MetadataParser::extract(const std::filesystem::path& file, const std::string& extension) const {
    ExtractedTags out;
    NativeTags native;
    std::string path = file.string();

    if (extension == "mp3") {
        parse_mp3(path, out, native);
    } else if (extension == "wav" || extension == "aiff") {
        parse_sndfile(path, out, native);
    } else {
        parse_libav(path, out, native);
    }

    out.common = TagNormalizer::common_from_native(native);
    util::Logger::debug(std::format("MetadataParser: {} tags from {}", out.raw.size(), path));
    return out;
}

void MetadataParser::parse_mp3(const std::string& path, ExtractedTags& out, NativeTags& native) {
    int err = MPG123_OK;
    mpg123_handle* mh = mpg123_new(nullptr, &err);
    if (!mh) {
        throw ExtractionError(path, std::string("mpg123_new: ") + mpg123_plain_strerror(err));
    }

    if (mpg123_open(mh, path.c_str()) != MPG123_OK) {
        std::string reason = mpg123_strerror(mh);
        mpg123_delete(mh);
        throw ExtractionError(path, "mpg123_open: " + reason);
    }

    // Scan for an accurate length; this also parses the ID3 tags
    mpg123_scan(mh);

    long rate = 0;
    int channels = 0, encoding = 0;
    if (mpg123_getformat(mh, &rate, &channels, &encoding) != MPG123_OK) {
        std::string reason = mpg123_strerror(mh);
        mpg123_close(mh);
        mpg123_delete(mh);
        throw ExtractionError(path, "not an MPEG audio stream: " + reason);
    }

    out.format["container"] = std::string("MPEG");
    out.format["sampleRate"] = static_cast<int64_t>(rate);
    out.format["numberOfChannels"] = static_cast<int64_t>(channels);
    out.format["lossless"] = false;

    mpg123_frameinfo mi;
    if (mpg123_info(mh, &mi) == MPG123_OK) {
        const char* version = mi.version == MPG123_1_0 ? "1" : mi.version == MPG123_2_0 ? "2" : "2.5";
        out.format["codec"] = std::format("MPEG {} Layer {}", version, mi.layer);
    }

    off_t length = mpg123_length(mh);
    if (length > 0 && rate > 0) {
        set_finite(out.format, "duration", static_cast<double>(length) / static_cast<double>(rate));
    }

    mpg123_id3v1* v1 = nullptr;
    mpg123_id3v2* v2 = nullptr;
    if (mpg123_id3(mh, &v1, &v2) == MPG123_OK) {
        if (v2) {
            for (size_t i = 0; i < v2->texts; ++i) {
                add_native(out, native, std::string(v2->text[i].id, 4), from_mpg123(&v2->text[i].text));
            }
            // TXXX frames: the description is the key
            for (size_t i = 0; i < v2->extras; ++i) {
                add_native(out, native, from_mpg123(&v2->extra[i].description), from_mpg123(&v2->extra[i].text));
            }
        } else if (v1) {
            add_native(out, native, "TITLE", from_fixed(v1->title, sizeof(v1->title)));
            add_native(out, native, "ARTIST", from_fixed(v1->artist, sizeof(v1->artist)));
            add_native(out, native, "ALBUM", from_fixed(v1->album, sizeof(v1->album)));
            add_native(out, native, "YEAR", from_fixed(v1->year, sizeof(v1->year)));

            // ID3v1.1: track number lives in comment[29] when comment[28] is null
            if (v1->comment[28] == 0 && v1->comment[29] != 0) {
                add_native(out, native, "TRACK", std::to_string(static_cast<unsigned char>(v1->comment[29])));
            }
        }
    }

    mpg123_close(mh);
    mpg123_delete(mh);
}

void MetadataParser::parse_sndfile(const std::string& path, ExtractedTags& out, NativeTags& native) {
    SF_INFO sfinfo;
    std::memset(&sfinfo, 0, sizeof(sfinfo));

    SNDFILE* sndfile = sf_open(path.c_str(), SFM_READ, &sfinfo);
    if (!sndfile) {
        throw ExtractionError(path, std::string("sf_open: ") + sf_strerror(nullptr));
    }

    int type = sfinfo.format & SF_FORMAT_TYPEMASK;
    int subformat = sfinfo.format & SF_FORMAT_SUBMASK;

    out.format["container"] = std::string(type == SF_FORMAT_AIFF ? "AIFF" : type == SF_FORMAT_WAV ? "WAVE" : "PCM");
    out.format["sampleRate"] = static_cast<int64_t>(sfinfo.samplerate);
    out.format["numberOfChannels"] = static_cast<int64_t>(sfinfo.channels);
    if (sfinfo.samplerate > 0) {
        set_finite(out.format, "duration", static_cast<double>(sfinfo.frames) / sfinfo.samplerate);
    }

    int bits = 0;
    switch (subformat) {
        case SF_FORMAT_PCM_S8:
        case SF_FORMAT_PCM_U8: bits = 8; break;
        case SF_FORMAT_PCM_16: bits = 16; break;
        case SF_FORMAT_PCM_24: bits = 24; break;
        case SF_FORMAT_PCM_32:
        case SF_FORMAT_FLOAT: bits = 32; break;
        case SF_FORMAT_DOUBLE: bits = 64; break;
        default: break;
    }
    out.format["codec"] = std::string(bits > 0 ? "PCM" : "ADPCM");
    out.format["lossless"] = bits > 0;
    if (bits > 0) out.format["bitsPerSample"] = static_cast<int64_t>(bits);

    auto get_tag = [&](int tag_id, const char* key) {
        const char* val = sf_get_string(sndfile, tag_id);
        if (val) add_native(out, native, key, val);
    };

    get_tag(SF_STR_TITLE, "TITLE");
    get_tag(SF_STR_ARTIST, "ARTIST");
    get_tag(SF_STR_ALBUM, "ALBUM");
    get_tag(SF_STR_DATE, "DATE");
    get_tag(SF_STR_GENRE, "GENRE");
    get_tag(SF_STR_TRACKNUMBER, "TRACKNUMBER");
    get_tag(SF_STR_COMMENT, "COMMENT");

    sf_close(sndfile);
}

void MetadataParser::parse_libav(const std::string& path, ExtractedTags& out, NativeTags& native) {
    AVFormatContext* format_ctx = nullptr;
    int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        char errbuf[256];
        av_strerror(ret, errbuf, sizeof(errbuf));
        throw ExtractionError(path, std::string("avformat_open_input: ") + errbuf);
    }

    ret = avformat_find_stream_info(format_ctx, nullptr);
    if (ret < 0) {
        avformat_close_input(&format_ctx);
        throw ExtractionError(path, "no stream info");
    }

    int stream_index = av_find_best_stream(format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (stream_index < 0) {
        avformat_close_input(&format_ctx);
        throw ExtractionError(path, "no audio stream");
    }

    AVStream* stream = format_ctx->streams[stream_index];
    AVCodecParameters* codecpar = stream->codecpar;

    // "mov,mp4,m4a,3gp,3g2,mj2" -> "mov"
    std::string container = format_ctx->iformat->name;
    container = container.substr(0, container.find(','));
    out.format["container"] = container;
    out.format["codec"] = std::string(avcodec_get_name(codecpar->codec_id));
    out.format["sampleRate"] = static_cast<int64_t>(codecpar->sample_rate);
    out.format["numberOfChannels"] = static_cast<int64_t>(codecpar->ch_layout.nb_channels);
    if (codecpar->bits_per_raw_sample > 0) {
        out.format["bitsPerSample"] = static_cast<int64_t>(codecpar->bits_per_raw_sample);
    }
    const AVCodecDescriptor* descriptor = avcodec_descriptor_get(codecpar->codec_id);
    out.format["lossless"] = descriptor && (descriptor->props & AV_CODEC_PROP_LOSSLESS) != 0;

    if (stream->duration != AV_NOPTS_VALUE) {
        set_finite(out.format, "duration", stream->duration * av_q2d(stream->time_base));
    } else if (format_ctx->duration != AV_NOPTS_VALUE) {
        set_finite(out.format, "duration", format_ctx->duration / static_cast<double>(AV_TIME_BASE));
    }

    // Container tags first (MP4 atoms), then stream tags (Ogg Vorbis comments)
    for (AVDictionary* dict : {format_ctx->metadata, stream->metadata}) {
        const AVDictionaryEntry* tag = nullptr;
        while ((tag = av_dict_get(dict, "", tag, AV_DICT_IGNORE_SUFFIX))) {
            add_native(out, native, tag->key, tag->value);
        }
    }

    avformat_close_input(&format_ctx);
}

}  // namespace strata::backend
