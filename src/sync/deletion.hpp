#pragma once

#include <optional>
#include <set>
#include <string>
#include "remote_store.hpp"

class RunLog;

enum class DeletionKind { SINGLE_FILE, DIRECTORY_TREE };

// Run-scoped cap on remote deletions. One instance is shared by every
// deletion made during a run; removed_count never exceeds max_count.
class DeletionBudget {
public:
    explicit DeletionBudget(std::optional<int> max_count = std::nullopt);

    bool unlimited() const { return !max_count_.has_value(); }
    bool has_capacity() const;

    int removed_count() const { return removed_count_; }
    std::optional<int> max_count() const { return max_count_; }

    // Count one successful removal of `path`.
    void record(const std::string& path);
    bool already_removed(const std::string& path) const;

private:
    int removed_count_ = 0;
    std::optional<int> max_count_;
    std::set<std::string> removed_;
};

// Removes remote entries after they were downloaded, charging a DeletionBudget.
// A failed removal is logged and counted as "not removed"; it never aborts the run.
class Deleter {
public:
    Deleter(RemoteStore& store, bool delete_after_sync, RunLog& log);

    // Returns the number of files removed by this call (0 when disabled).
    int apply_deletion(DeletionKind kind, const std::string& target, DeletionBudget& budget);

    // Files a tree deletion had to leave because the budget ran out.
    int left_behind() const { return left_behind_; }

private:
    RemoteStore& store_;
    bool enabled_;
    RunLog& log_;
    int left_behind_ = 0;

    int delete_file(const std::string& path, DeletionBudget& budget);

    // Returns true if nothing is left below `dir`.
    bool delete_tree(const std::string& dir, DeletionBudget& budget, int& delta);
};
