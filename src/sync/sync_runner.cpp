#include "sync_runner.hpp"
#include "bounded_store.hpp"
#include "deletion.hpp"
#include "ledger.hpp"
#include "selection.hpp"
#include <core/errors.hpp>
#include <core/run_log.hpp>
#include <map>
#include <vector>

SyncRunner::SyncRunner(RemoteConnector connector, RunLog& log)
    : connector_(std::move(connector)), log_(log) {
}

SyncReport SyncRunner::run_file(const fs::path& config_path, const std::optional<fs::path>& state_path) {
    auto loaded = Config::load(config_path);
    if (loaded.is_err()) {
        throw ConfigurationError(loaded.error);
    }
    return run(loaded.value, state_path);
}

SyncReport SyncRunner::run_json(const nlohmann::json& config, const std::optional<fs::path>& state_path) {
    auto parsed = Config::parse(config);
    if (parsed.is_err()) {
        throw ConfigurationError(parsed.error);
    }
    return run(parsed.value, state_path);
}

SyncReport SyncRunner::run(const Config& config, const std::optional<fs::path>& state_path) {
    const SyncSettings& settings = config.settings();
    SyncReport report;

    // ── Validate ───────────────────────────────────────────
    if (settings.incremental_mode && !state_path) {
        throw ConfigurationError("'incremental_mode' requires a state file (--state)");
    }
    Ledger ledger = state_path ? Ledger::load(*state_path) : Ledger{};
    if (state_path) {
        log_.debug("Loaded {} ledger entries from {}", ledger.size(), state_path->string());
    }

    // ── Connect ────────────────────────────────────────────
    std::unique_ptr<RemoteStore> session = connector_(settings.remote, log_);
    RemoteStore* store = session.get();

    std::unique_ptr<BoundedDownloadStore> bounded;
    if (settings.max_file_count) {
        bounded = std::make_unique<BoundedDownloadStore>(*session, *settings.max_file_count, log_);
        store = bounded.get();
    }

    // ── Select & download ──────────────────────────────────
    log_.info("Downloading data from {} -> {} ({} mode)",
              settings.mode == SelectionMode::FLAT ? "file list" : settings.path_prefix,
              settings.target_dir, selection_mode_name(settings.mode));

    Selector selector(settings, *store, log_);
    std::vector<Transfer> downloaded;
    std::map<std::string, std::string> origins;

    selector.select([&](const Transfer& t) {
        log_.info("Downloading: {} -> {}", t.remote_path, t.local_path.string());
        if (!store->get(t.remote_path, t.local_path)) {
            report.skipped++;
            return;
        }
        report.downloaded++;
        downloaded.push_back(t);
        origins[t.local_path.lexically_normal().generic_string()] = t.remote_path;
    });
    log_.info("Data downloaded: {} file(s)", report.downloaded);

    // ── Delete ─────────────────────────────────────────────
    DeletionBudget budget(settings.max_file_count);

    if (settings.delete_after_sync) {
        Deleter deleter(*store, true, log_);
        switch (settings.mode) {
        case SelectionMode::RECURSIVE_CLONE:
        case SelectionMode::MIRROR:
            report.remote_deleted += deleter.apply_deletion(
                DeletionKind::DIRECTORY_TREE, settings.path_prefix, budget);
            break;
        default:
            for (const auto& t : downloaded) {
                report.remote_deleted += deleter.apply_deletion(
                    DeletionKind::SINGLE_FILE, t.remote_path, budget);
            }
            break;
        }
        report.left_behind = deleter.left_behind();
        log_.info("Deleted {} remote file(s)", report.remote_deleted);
    }

    // Main-phase session is done; the incremental pass opens its own if needed
    bounded.reset();
    session.reset();

    // ── Reconcile ──────────────────────────────────────────
    if (settings.incremental_mode) {
        Reconciler reconciler(settings, budget, connector_, log_);
        auto stats = reconciler.reconcile(selector.local_root(), settings.path_prefix, ledger, origins);
        report.kept = stats.kept;
        report.discarded = stats.discarded;
        report.remote_deleted += stats.remote_deleted;
    }

    // ── Persist ────────────────────────────────────────────
    if (state_path) {
        ledger.save(*state_path);
        log_.debug("Wrote {} ledger entries to {}", ledger.size(), state_path->string());
    }

    return report;
}
