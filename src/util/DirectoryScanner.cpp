#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "backend/Errors.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <memory>
#include <sstream>

namespace strata::util {

namespace {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;           // Inode number
    int64_t  d_off;           // Offset to next structure
    uint16_t d_reclen;        // Size of this dirent
    uint8_t  d_type;          // File type
    char     d_name[];        // Filename (null-terminated)
};

// Closes the directory descriptor on every exit path
struct FdGuard {
    int fd;
    ~FdGuard() { if (fd >= 0) close(fd); }
};

}  // namespace

bool DirectoryScanner::is_audio_extension(const char* filename) {
    const char* ext = strrchr(filename, '.');
    if (!ext || ext == filename) return false;

    std::string lowered(ext + 1);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& ae : Platform::AUDIO_EXTENSIONS) {
        if (ae == lowered) return true;
    }
    return false;
}

DirectoryScanner::ScanResult DirectoryScanner::scan_directory(const std::filesystem::path& root_dir) {
    ScanResult result;

    // Normalize: strip trailing slashes to prevent // in paths
    std::string root_str = root_dir.string();
    while (root_str.length() > 1 && root_str.back() == '/') {
        root_str.pop_back();
    }
    Logger::info("DirectoryScanner: Starting getdents64 scan of " + root_str);

    int fd = open(root_str.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        int err = errno;
        throw FileSystemError("Cannot open music directory " + root_str + ": " + std::strerror(err));
    }
    close(fd);

    scan_directory_recursive(root_str, "", result.audio_files);

    // getdents64 order is filesystem-defined; sort for reproducible runs
    std::sort(result.audio_files.begin(), result.audio_files.end());
    result.audio_files.erase(std::unique(result.audio_files.begin(), result.audio_files.end()),
                             result.audio_files.end());

    result.tree_hash = compute_tree_hash(result.audio_files);

    Logger::info("DirectoryScanner: Found " + std::to_string(result.audio_files.size()) + " audio files");
    return result;
}

void DirectoryScanner::scan_directory_recursive(
    const std::string& dir_path,
    const std::string& rel_prefix,
    std::vector<std::string>& files
) {
    FdGuard guard{open(dir_path.c_str(), O_RDONLY | O_DIRECTORY)};
    if (guard.fd < 0) {
        Logger::warn("DirectoryScanner: Failed to open directory: " + dir_path);
        return;
    }

    auto buffer = std::make_unique<char[]>(BUFFER_SIZE);

    while (true) {
        long nread = syscall(SYS_getdents64, guard.fd, buffer.get(), BUFFER_SIZE);

        if (nread == -1) {
            Logger::error("DirectoryScanner: getdents64 failed for " + dir_path);
            break;
        }
        if (nread == 0) break;

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.get() + pos);
            pos += d->d_reclen;

            if (strcmp(d->d_name, ".") == 0 || strcmp(d->d_name, "..") == 0) {
                continue;
            }

            std::string full_path = dir_path + "/" + d->d_name;
            std::string rel_path = rel_prefix.empty() ? std::string(d->d_name) : rel_prefix + "/" + d->d_name;

            uint8_t type = d->d_type;
            if (type == DT_UNKNOWN || type == DT_LNK) {
                // Filesystem doesn't support d_type (or symlink), fall back to stat.
                // Symlinked directories are not followed so link cycles cannot recurse.
                struct stat entry_stat;
                if (fstatat(guard.fd, d->d_name, &entry_stat, 0) != 0) continue;
                if (S_ISREG(entry_stat.st_mode)) type = DT_REG;
                else if (S_ISDIR(entry_stat.st_mode) && d->d_type == DT_UNKNOWN) type = DT_DIR;
                else continue;
            }

            if (type == DT_REG) {
                if (is_audio_extension(d->d_name)) {
                    files.push_back(std::move(rel_path));
                }
            } else if (type == DT_DIR) {
                scan_directory_recursive(full_path, rel_path, files);
            }
        }
    }
}

std::string DirectoryScanner::compute_tree_hash(const std::vector<std::string>& sorted_paths) {
    std::string concatenated;
    for (const auto& path : sorted_paths) {
        concatenated += path;
        concatenated += '\n';
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(concatenated.data()), concatenated.size(), hash);

    std::ostringstream hex;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return hex.str();
}

}  // namespace strata::util
