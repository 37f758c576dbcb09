#pragma once

#include <string>
#include <ctime>
#include <filesystem>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Lowercase hex MD5 of a file, read in HASH_BLOCK_SIZE blocks.
// Throws std::runtime_error if the file cannot be read.
std::string compute_file_md5(const std::filesystem::path& path);

// Join remote (POSIX) path components without doubling slashes.
std::string remote_join(const std::string& dir, const std::string& name);

// Last component of a remote path ("/x/y/1.csv" -> "1.csv").
std::string remote_basename(const std::string& path);

// Strip trailing slashes, keeping a lone "/".
std::string remote_normalize(const std::string& path);

// True when `path` is `root` itself or lies below it. "" and "/" contain everything.
bool remote_is_within(const std::string& path, const std::string& root);
