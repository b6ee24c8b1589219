#pragma once

#include <filesystem>

namespace strata::util {

/**
 * Exclusive advisory lock (flock) on a lock file, held for the lifetime of
 * the object. Only one indexing run may own a cache directory at a time.
 */
class RunLock {
public:
    /// Throws RunLockedError when another process holds the lock,
    /// FileSystemError when the lock file cannot be created.
    explicit RunLock(const std::filesystem::path& lock_path);
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

private:
    int fd_ = -1;
    std::filesystem::path path_;
};

}  // namespace strata::util
