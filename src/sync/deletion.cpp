#include "deletion.hpp"
#include <core/errors.hpp>
#include <core/run_log.hpp>

// ── DeletionBudget ──────────────────────────────────────────

DeletionBudget::DeletionBudget(std::optional<int> max_count)
    : max_count_(max_count) {
}

bool DeletionBudget::has_capacity() const {
    return unlimited() || removed_count_ < *max_count_;
}

void DeletionBudget::record(const std::string& path) {
    removed_count_++;
    removed_.insert(path);
}

bool DeletionBudget::already_removed(const std::string& path) const {
    return removed_.count(path) > 0;
}

// ── Deleter ─────────────────────────────────────────────────

Deleter::Deleter(RemoteStore& store, bool delete_after_sync, RunLog& log)
    : store_(store), enabled_(delete_after_sync), log_(log) {
}

int Deleter::apply_deletion(DeletionKind kind, const std::string& target, DeletionBudget& budget) {
    if (!enabled_) return 0;

    if (kind == DeletionKind::SINGLE_FILE) {
        return delete_file(target, budget);
    }

    int delta = 0;
    int left_before = left_behind_;
    delete_tree(target, budget, delta);

    int left = left_behind_ - left_before;
    if (left > 0) {
        log_.info("Deletion limit reached: removed {} file(s) under {}, left {} in place",
                  delta, target, left);
    } else {
        log_.debug("Removed {} file(s) under {}", delta, target);
    }
    return delta;
}

int Deleter::delete_file(const std::string& path, DeletionBudget& budget) {
    if (budget.already_removed(path)) return 0;
    if (!budget.has_capacity()) {
        left_behind_++;
        log_.debug("Deletion limit reached, keeping remote {}", path);
        return 0;
    }

    try {
        store_.remove(path);
    } catch (const DeletionError& e) {
        log_.warning("Failed to delete {}: {}", path, e.what());
        return 0;
    }

    budget.record(path);
    log_.info("Deleted remote file {}", path);
    return 1;
}

// Files go in listing order. Nested directories that end up empty are removed
// leaf-first; the directory passed to apply_deletion is always kept.
bool Deleter::delete_tree(const std::string& dir, DeletionBudget& budget, int& delta) {
    bool emptied = true;

    for (const auto& entry : store_.list(dir)) {
        if (entry.is_directory()) {
            if (!delete_tree(entry.path, budget, delta)) {
                emptied = false;
                continue;
            }
            try {
                store_.remove_directory(entry.path);
                log_.debug("Removed empty remote directory {}", entry.path);
            } catch (const DeletionError& e) {
                log_.warning("Failed to delete directory {}: {}", entry.path, e.what());
                emptied = false;
            }
            continue;
        }

        if (budget.already_removed(entry.path)) continue;
        int removed = delete_file(entry.path, budget);
        delta += removed;
        if (removed == 0) emptied = false;
    }

    return emptied;
}
