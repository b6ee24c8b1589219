#include "backend/StateStore.hpp"
#include "backend/Errors.hpp"
#include "util/Gzip.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace strata::backend {

std::optional<std::string> StateStore::read_blob(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        int err = errno;
        if (err == ENOENT) {
            return std::nullopt;
        }
        throw FileSystemError("Cannot read " + path.string() + ": " + std::strerror(err));
    }

    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw FileSystemError("Read error on " + path.string());
    }

    try {
        return util::Gzip::decompress(raw);
    } catch (const CodecError& e) {
        throw CacheCorruptionError(path.string() + ": " + e.what());
    }
}

void StateStore::write_blob(const std::filesystem::path& path, const std::string& data) {
    std::string compressed = util::Gzip::compress(data);

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw FileSystemError("Cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    auto tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            int err = errno;
            throw FileSystemError("Cannot write " + tmp_path.string() + ": " + std::strerror(err));
        }
        out.write(compressed.data(), static_cast<std::streamsize>(compressed.size()));
        out.flush();
        if (!out) {
            throw FileSystemError("Write error on " + tmp_path.string());
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::string reason = ec.message();
        std::filesystem::remove(tmp_path, ec);
        throw FileSystemError("Cannot replace " + path.string() + ": " + reason);
    }

    util::Logger::debug("StateStore: Wrote " + std::to_string(compressed.size()) + " bytes to " + path.string());
}

}  // namespace strata::backend
