#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// How remote entries are chosen for download. Fixed for a whole run.
enum class SelectionMode {
    FLAT,               // explicit file list, flattened into target_dir
    RECURSIVE_CLONE,    // whole subtree, paths relative to the remote root
    EXACT_DIRECTORY,    // direct file children of the remote root only
    PATTERN_FILTERED,   // recursive walk, collect names matching a prefix
    MIRROR,             // whole subtree, full remote path recreated under target_dir
};

const char* selection_mode_name(SelectionMode mode);

// Connection settings for the remote store
struct RemoteConfig {
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> private_key;          // PEM key material, not a path
    std::optional<std::string> private_key_passphrase;
    int timeout = 30;                                // TCP connect timeout (seconds)
};

// Everything a single run needs, resolved from the config file
struct SyncSettings {
    RemoteConfig remote;
    SelectionMode mode = SelectionMode::MIRROR;
    std::string path_prefix;                         // remote root ("" in flat mode)
    std::vector<std::string> files;                  // flat mode sources
    std::vector<std::string> tables;                 // pattern-filtered prefixes
    std::string target_dir;                          // local root
    bool delete_after_sync = false;
    std::optional<int> max_file_count;               // deletion (and download) cap
    bool incremental_mode = false;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
