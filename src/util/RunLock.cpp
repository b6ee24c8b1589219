#include "util/RunLock.hpp"
#include "util/Logger.hpp"
#include "backend/Errors.hpp"
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace strata::util {

RunLock::RunLock(const std::filesystem::path& lock_path) : path_(lock_path) {
    std::error_code ec;
    std::filesystem::create_directories(lock_path.parent_path(), ec);

    fd_ = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        int err = errno;
        throw FileSystemError("Cannot open lock file " + lock_path.string() + ": " + std::strerror(err));
    }

    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        close(fd_);
        fd_ = -1;
        if (err == EWOULDBLOCK) {
            throw RunLockedError("Another indexing run holds " + lock_path.string());
        }
        throw FileSystemError("flock failed on " + lock_path.string() + ": " + std::strerror(err));
    }

    Logger::debug("RunLock: Acquired " + lock_path.string());
}

RunLock::~RunLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
        Logger::debug("RunLock: Released " + path_.string());
    }
}

}  // namespace strata::util
