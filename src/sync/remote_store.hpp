#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace fs = std::filesystem;

class RunLog;

enum class RemoteEntryKind { FILE, DIRECTORY };

// One row of a directory listing. Never persisted.
struct RemoteEntry {
    std::string path;       // full remote path (listing dir joined with name)
    std::string name;       // last path component
    RemoteEntryKind kind = RemoteEntryKind::FILE;

    bool is_directory() const { return kind == RemoteEntryKind::DIRECTORY; }
};

// The file host being synced from. Transport failures throw TransportError,
// failed removals throw DeletionError.
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    // Entries of a directory, in server order, without "." and "..".
    virtual std::vector<RemoteEntry> list(const std::string& path) = 0;

    virtual bool is_directory(const std::string& path) = 0;

    // Download one file, creating local parent directories as needed.
    // Returns false if the store chose not to fetch it.
    virtual bool get(const std::string& remote_path, const fs::path& local_path) = 0;

    virtual void remove(const std::string& remote_path) = 0;

    // Fails unless the directory is empty.
    virtual void remove_directory(const std::string& remote_path) = 0;
};

// Opens an authenticated session. Throws TransportError on failure.
using RemoteConnector =
    std::function<std::unique_ptr<RemoteStore>(const RemoteConfig& remote, RunLog& log)>;
