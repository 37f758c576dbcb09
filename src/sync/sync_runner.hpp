#pragma once

#include <filesystem>
#include <optional>
#include <nlohmann/json.hpp>
#include <core/config.hpp>
#include "remote_store.hpp"

namespace fs = std::filesystem;

class RunLog;

struct SyncReport {
    int downloaded = 0;
    int skipped = 0;            // not fetched because of the download cap
    int remote_deleted = 0;     // across the delete and incremental phases
    int left_behind = 0;        // remote files kept because the deletion budget ran out
    int kept = 0;               // incremental: new or changed files kept locally
    int discarded = 0;          // incremental: unchanged files removed locally
};

// Drives one run:
//   Validate -> Connect -> Select & Download -> [Delete] -> [Reconcile] -> Persist
// Any failure aborts the run before the ledger is written.
class SyncRunner {
public:
    SyncRunner(RemoteConnector connector, RunLog& log);

    // Load and validate the config file, then run. Bad config throws
    // ConfigurationError before anything connects.
    SyncReport run_file(const fs::path& config_path, const std::optional<fs::path>& state_path);
    SyncReport run_json(const nlohmann::json& config, const std::optional<fs::path>& state_path);
    SyncReport run(const Config& config, const std::optional<fs::path>& state_path);

private:
    RemoteConnector connector_;
    RunLog& log_;
};
