#pragma once

#include <stdexcept>
#include <string>

// Base for every failure raised inside a sync run.
class SyncError : public std::runtime_error {
public:
    explicit SyncError(const std::string& msg) : std::runtime_error(msg) {}
};

// Missing key, wrong type or contradictory flags. Raised before any network activity.
class ConfigurationError : public SyncError {
public:
    explicit ConfigurationError(const std::string& msg) : SyncError(msg) {}
};

// Connect, list or download failure. Fatal for the run.
class TransportError : public SyncError {
public:
    explicit TransportError(const std::string& msg) : SyncError(msg) {}
};

// Failed to remove one remote target. Callers log it and move on.
class DeletionError : public SyncError {
public:
    DeletionError(const std::string& path, const std::string& msg)
        : SyncError(msg), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
