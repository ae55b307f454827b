#pragma once
#include <stdexcept>
#include <string>

namespace core::types {

class TrackerException : public std::runtime_error {
public:
    explicit TrackerException(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Durable store I/O failure (open, prepare, step, commit).
class StoreException : public TrackerException {
public:
    explicit StoreException(const std::string& msg)
        : TrackerException("Store error: " + msg) {}
};

// File locked, vanished or only partially readable. Retried on the next notification.
class FileAccessException : public TrackerException {
public:
    FileAccessException(const std::string& path, const std::string& reason)
        : TrackerException("Cannot read " + path + ": " + reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class ConfigException : public TrackerException {
public:
    explicit ConfigException(const std::string& msg)
        : TrackerException("Invalid configuration: " + msg) {}
};

}
