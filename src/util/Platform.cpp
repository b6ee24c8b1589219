#include "util/Platform.hpp"
#include "backend/Errors.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>

namespace strata::util {

std::filesystem::path Platform::get_config_directory() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) {
        return std::filesystem::path(xdg_config) / "strata";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "strata";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/strata");
    return ".config/strata";
}

std::filesystem::path Platform::get_cache_directory() {
    const char* xdg_cache = std::getenv("XDG_CACHE_HOME");
    if (xdg_cache && *xdg_cache) {
        return std::filesystem::path(xdg_cache) / "strata";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".cache" / "strata";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: /tmp/strata_cache");
    return "/tmp/strata_cache";
}

std::string Platform::extension_of(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool Platform::file_exists(const std::filesystem::path& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) return true;

    int err = errno;
    if (err == ENOENT || err == ENOTDIR || err == EACCES) {
        return false;
    }
    throw FileSystemError("stat failed for " + path.string() + ": " + std::strerror(err));
}

int64_t Platform::modification_time(const std::filesystem::path& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        int err = errno;
        throw FileSystemError("stat failed for " + path.string() + ": " + std::strerror(err));
    }
    return static_cast<int64_t>(st.st_mtim.tv_sec) * 1'000'000'000 + st.st_mtim.tv_nsec;
}

int64_t Platform::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace strata::util
