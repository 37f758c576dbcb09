#include "ledger.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/run_log.hpp>
#include <core/utils.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fstream>
#include <vector>

using nlohmann::json;

// ── Ledger ──────────────────────────────────────────────────

Ledger Ledger::load(const fs::path& path) {
    Ledger ledger;
    if (path.empty() || !fs::exists(path)) {
        return ledger;
    }

    json root;
    try {
        std::ifstream in(path);
        if (!in) {
            throw ConfigurationError("Cannot read state file: " + path.string());
        }
        root = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(fmt::format("Invalid JSON in state file {}: {}", path.string(), e.what()));
    }

    if (!root.is_object()) {
        throw ConfigurationError("State file must contain a JSON object: " + path.string());
    }
    for (const auto& item : root.items()) {
        if (!item.value().is_string()) {
            throw ConfigurationError(fmt::format("State entry '{}' is not a hash string", item.key()));
        }
        ledger.entries_[item.key()] = item.value().get<std::string>();
    }
    return ledger;
}

void Ledger::save(const fs::path& path) const {
    json root = json::object();
    for (const auto& [remote_path, hash] : entries_) {
        root[remote_path] = hash;
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw SyncError("Cannot write state file: " + tmp.string());
        }
        out << root.dump(LEDGER_JSON_INDENT) << "\n";
        if (!out) {
            throw SyncError("Write failed for state file: " + tmp.string());
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        throw SyncError(fmt::format("Cannot replace state file {}: {}", path.string(), ec.message()));
    }
}

std::optional<std::string> Ledger::get(const std::string& remote_path) const {
    auto it = entries_.find(remote_path);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void Ledger::put(const std::string& remote_path, const std::string& hash) {
    entries_[remote_path] = hash;
}

// ── Reconciler ──────────────────────────────────────────────

Reconciler::Reconciler(const SyncSettings& settings, DeletionBudget& budget,
                       RemoteConnector connector, RunLog& log)
    : settings_(settings), budget_(budget), connector_(std::move(connector)), log_(log) {
}

std::optional<std::string> Reconciler::derive_remote_path(const fs::path& local_file,
                                                          const fs::path& local_root,
                                                          const std::string& remote_root) {
    std::error_code ec;
    fs::path file = fs::absolute(local_file, ec).lexically_normal();
    if (ec) return std::nullopt;
    fs::path root = fs::absolute(local_root, ec).lexically_normal();
    if (ec) return std::nullopt;
    if (!root.has_filename() && root.has_relative_path()) root = root.parent_path();

    fs::path rel = file.lexically_relative(root);
    if (rel.empty() || rel == "." || *rel.begin() == "..") {
        return std::nullopt;
    }

    std::string base = remote_root.empty() ? "/" : remote_normalize(remote_root);
    return remote_join(base, rel.generic_string());
}

RemoteStore& Reconciler::session() {
    if (!session_) {
        log_.debug("Opening session for incremental deletions");
        session_ = connector_(settings_.remote, log_);
    }
    return *session_;
}

int Reconciler::delete_remote(const std::string& remote_path) {
    if (!settings_.delete_after_sync) return 0;
    if (budget_.already_removed(remote_path)) return 0;
    if (!budget_.has_capacity()) {
        log_.debug("Deletion limit reached, keeping remote {}", remote_path);
        return 0;
    }

    Deleter deleter(session(), settings_.delete_after_sync, log_);
    return deleter.apply_deletion(DeletionKind::SINGLE_FILE, remote_path, budget_);
}

ReconcileStats Reconciler::reconcile(const fs::path& local_root,
                                     const std::string& remote_root,
                                     Ledger& ledger,
                                     const std::map<std::string, std::string>& origins) {
    ReconcileStats stats;
    if (!fs::exists(local_root)) {
        log_.info("Nothing to reconcile, {} does not exist", local_root.string());
        return stats;
    }

    // Gather first: local files are deleted during the pass
    std::vector<fs::path> files;
    for (const auto& entry : fs::recursive_directory_iterator(local_root)) {
        if (entry.is_regular_file()) files.push_back(entry.path());
    }

    for (const auto& file : files) {
        std::optional<std::string> remote_path;
        bool downloaded_now = false;
        auto origin = origins.find(file.lexically_normal().generic_string());
        if (origin != origins.end()) {
            remote_path = origin->second;
            downloaded_now = true;
        } else if (settings_.mode != SelectionMode::FLAT) {
            // Flat layouts are not an image of any remote root
            remote_path = derive_remote_path(file, local_root, remote_root);
        }

        if (!remote_path) {
            stats.untracked++;
            log_.debug("No remote origin for {}, left untouched", file.string());
            continue;
        }

        std::string hash;
        try {
            hash = compute_file_md5(file);
        } catch (const std::runtime_error& e) {
            throw SyncError(fmt::format("Cannot hash {}: {}", file.string(), e.what()));
        }

        auto previous = ledger.get(*remote_path);
        if (previous && *previous == hash) {
            // Captured byte-identical in an earlier run
            fs::remove(file);
            stats.discarded++;
            log_.debug("Unchanged since last run, discarded {}", file.string());
        } else {
            stats.kept++;
            log_.debug("{} {}", previous ? "Changed" : "New", file.string());
            if (downloaded_now || remote_is_within(*remote_path, remote_root)) {
                stats.remote_deleted += delete_remote(*remote_path);
            }
        }

        ledger.put(*remote_path, hash);
    }

    log_.info("Incremental pass: {} kept, {} discarded, {} remote deletions",
              stats.kept, stats.discarded, stats.remote_deleted);
    if (stats.untracked > 0) {
        log_.info("{} local file(s) without a known remote origin were left untouched", stats.untracked);
    }
    return stats;
}
