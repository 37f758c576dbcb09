#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Private key material written to a 0600 temp file for the lifetime of an
// SSH session. libssh2 reads keys from disk; the file is removed on destruction.
class ScopedKeyFile {
public:
    // Throws TransportError if the file can't be written.
    explicit ScopedKeyFile(const std::string& key_material);
    ~ScopedKeyFile();

    ScopedKeyFile(const ScopedKeyFile&) = delete;
    ScopedKeyFile& operator=(const ScopedKeyFile&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};
