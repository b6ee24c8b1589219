#pragma once

#include <stdexcept>
#include <string>

namespace strata {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed persisted state; callers recover by starting empty.
class CacheCorruptionError : public Error {
public:
    explicit CacheCorruptionError(const std::string& msg) : Error(msg) {}
};

// Per-file tag extraction failure; becomes an error-only record.
class ExtractionError : public Error {
public:
    explicit ExtractionError(const std::string& msg) : Error(msg) {}
    ExtractionError(const std::string& file, const std::string& reason) : Error(file + ": " + reason) {}
};

// Secondary category whose base is not among this run's primary categories.
class MissingInheritanceTargetError : public Error {
public:
    MissingInheritanceTargetError(const std::string& code, const std::string& inherits)
        : Error("Category '" + code + "' inherits unknown category '" + inherits + "'") {}
};

class FileSystemError : public Error {
public:
    explicit FileSystemError(const std::string& msg) : Error(msg) {}
};

class CodecError : public Error {
public:
    explicit CodecError(const std::string& msg) : Error(msg) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg) : Error(msg) {}
};

class RunLockedError : public Error {
public:
    explicit RunLockedError(const std::string& msg) : Error(msg) {}
};

class PlaylistSourceError : public Error {
public:
    explicit PlaylistSourceError(const std::string& msg) : Error(msg) {}
};

}  // namespace strata
