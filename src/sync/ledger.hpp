#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>
#include "deletion.hpp"
#include "remote_store.hpp"

namespace fs = std::filesystem;

class RunLog;

// Persisted map of remote path -> MD5 hex digest of the content last captured
// from it. Entries are added or overwritten, never pruned.
class Ledger {
public:
    // Missing file -> empty ledger. Anything but a JSON object of strings
    // throws ConfigurationError.
    static Ledger load(const fs::path& path);

    // Indented JSON, written to a sibling temp file then renamed into place.
    // Throws SyncError on failure.
    void save(const fs::path& path) const;

    std::optional<std::string> get(const std::string& remote_path) const;
    void put(const std::string& remote_path, const std::string& hash);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::map<std::string, std::string>& entries() const { return entries_; }

private:
    std::map<std::string, std::string> entries_;
};

struct ReconcileStats {
    int kept = 0;           // new or changed, local copy kept
    int discarded = 0;      // identical to a previous run, local copy deleted
    int remote_deleted = 0;
    int untracked = 0;      // no remote origin could be established, left as is
};

// Incremental pass over freshly downloaded files: drops local copies whose
// content was already captured, keeps the rest, and removes the remote
// originals of kept files when delete-after-sync is on.
class Reconciler {
public:
    Reconciler(const SyncSettings& settings, DeletionBudget& budget,
               RemoteConnector connector, RunLog& log);

    // `origins` maps a local file (generic string) to the remote path it was
    // downloaded from. Other files are mapped by their position under
    // local_root, except in flat mode where they are left untouched. A remote
    // deletion is only issued for a recorded origin or a path under remote_root.
    ReconcileStats reconcile(const fs::path& local_root,
                             const std::string& remote_root,
                             Ledger& ledger,
                             const std::map<std::string, std::string>& origins = {});

    // remote_root joined with the file's path relative to local_root;
    // nullopt when the file is not below local_root.
    static std::optional<std::string> derive_remote_path(const fs::path& local_file,
                                                         const fs::path& local_root,
                                                         const std::string& remote_root);

private:
    const SyncSettings& settings_;
    DeletionBudget& budget_;
    RemoteConnector connector_;
    RunLog& log_;
    std::unique_ptr<RemoteStore> session_;

    // Opened on the first remote deletion of the phase, then reused.
    RemoteStore& session();
    int delete_remote(const std::string& remote_path);
};
