#include "util/Gzip.hpp"
#include "backend/Errors.hpp"
#include <zlib.h>
#include <array>

namespace strata::util {

namespace {
    constexpr int GZIP_WINDOW_BITS = 15 + 16;  // 32K window, gzip wrapper
    constexpr size_t CHUNK_SIZE = 64 * 1024;

    std::string zlib_message(const z_stream& stream, int code) {
        if (stream.msg) return stream.msg;
        return "zlib error " + std::to_string(code);
    }
}

bool Gzip::has_gzip_header(std::string_view data) {
    return data.size() >= 2 &&
           static_cast<unsigned char>(data[0]) == 0x1f &&
           static_cast<unsigned char>(data[1]) == 0x8b;
}

std::string Gzip::compress(std::string_view data) {
    z_stream stream{};
    int ret = deflateInit2(&stream, Z_BEST_SPEED, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        throw CodecError("deflateInit2 failed: " + zlib_message(stream, ret));
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    std::string out;
    std::array<char, CHUNK_SIZE> chunk;
    do {
        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());
        ret = deflate(&stream, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&stream);
            throw CodecError("deflate failed: " + zlib_message(stream, ret));
        }
        out.append(chunk.data(), chunk.size() - stream.avail_out);
    } while (ret != Z_STREAM_END);

    deflateEnd(&stream);
    return out;
}

std::string Gzip::decompress(std::string_view data) {
    if (!has_gzip_header(data)) {
        throw CodecError("Not a gzip stream");
    }

    z_stream stream{};
    int ret = inflateInit2(&stream, GZIP_WINDOW_BITS);
    if (ret != Z_OK) {
        throw CodecError("inflateInit2 failed: " + zlib_message(stream, ret));
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    std::string out;
    std::array<char, CHUNK_SIZE> chunk;
    do {
        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());
        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
            std::string msg = zlib_message(stream, ret);
            inflateEnd(&stream);
            throw CodecError("inflate failed: " + msg);
        }
        out.append(chunk.data(), chunk.size() - stream.avail_out);
        if (ret == Z_BUF_ERROR && stream.avail_in == 0) {
            inflateEnd(&stream);
            throw CodecError("inflate failed: truncated gzip stream");
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&stream);
    return out;
}

}  // namespace strata::util
