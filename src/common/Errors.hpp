#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace fxb {

// Structural errors. They reach the caller before any I/O happens and fail the run.

class InvalidRangeError : public std::invalid_argument {
public:
    explicit InvalidRangeError(const std::string& message) : std::invalid_argument(message) {}
};

class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message) : std::invalid_argument(message) {}
};

class InvalidBarError : public std::invalid_argument {
public:
    explicit InvalidBarError(const std::string& message) : std::invalid_argument(message) {}
};

// Raised by partition codecs when an existing file cannot be decoded.
// PartitionStore turns it into a per-partition failure during writes.
class CorruptPartitionError : public std::runtime_error {
public:
    CorruptPartitionError(std::string path, const std::string& reason)
        : std::runtime_error("corrupt partition " + path + ": " + reason), path_(std::move(path)) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

}  // namespace fxb
