#include "selection.hpp"
#include <core/errors.hpp>
#include <core/run_log.hpp>
#include <core/utils.hpp>

Selector::Selector(const SyncSettings& settings, RemoteStore& store, RunLog& log)
    : settings_(settings), store_(store), log_(log) {
}

void Selector::select(const TransferVisitor& visit) {
    emitted_.clear();

    switch (settings_.mode) {
    case SelectionMode::FLAT:
        select_flat(visit);
        break;
    case SelectionMode::RECURSIVE_CLONE:
    case SelectionMode::MIRROR:
        require_directory(settings_.path_prefix);
        select_tree(settings_.path_prefix, visit);
        break;
    case SelectionMode::EXACT_DIRECTORY:
        require_directory(settings_.path_prefix);
        select_exact(visit);
        break;
    case SelectionMode::PATTERN_FILTERED:
        require_directory(settings_.path_prefix);
        select_patterns(settings_.path_prefix, false, visit);
        break;
    }
}

std::vector<Transfer> Selector::collect() {
    std::vector<Transfer> out;
    select([&out](const Transfer& t) { out.push_back(t); });
    return out;
}

fs::path Selector::local_root() const {
    fs::path target(settings_.target_dir);
    if (settings_.mode != SelectionMode::MIRROR) return target;

    std::string rel = settings_.path_prefix;
    while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
    return rel.empty() ? target : target / rel;
}

fs::path Selector::local_path_for(const std::string& remote_path) const {
    fs::path target(settings_.target_dir);

    switch (settings_.mode) {
    case SelectionMode::FLAT:
        // Structure is flattened: "/x/1.csv" and "/y/1.csv" both land on target/1.csv
        return target / remote_basename(remote_path);
    case SelectionMode::MIRROR: {
        std::string rel = remote_path;
        while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
        return target / rel;
    }
    default:
        return target / relative_to_root(remote_path);
    }
}

std::string Selector::relative_to_root(const std::string& remote_path) const {
    const std::string& root = settings_.path_prefix;
    std::string rel = remote_path;
    if (root == "/") {
        rel = remote_path.substr(1);
    } else if (remote_path.compare(0, root.size(), root) == 0 &&
               remote_path.size() > root.size() && remote_path[root.size()] == '/') {
        rel = remote_path.substr(root.size() + 1);
    }
    while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
    return rel;
}

void Selector::require_directory(const std::string& path) {
    if (!store_.is_directory(path)) {
        throw TransportError("Remote path is not a directory: " + path);
    }
}

bool Selector::matches_pattern(const std::string& name) const {
    for (const auto& prefix : settings_.tables) {
        if (name.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

// ── Modes ───────────────────────────────────────────────────

void Selector::select_flat(const TransferVisitor& visit) {
    for (const auto& file : settings_.files) {
        visit(Transfer{file, local_path_for(file)});
    }
}

void Selector::select_tree(const std::string& dir, const TransferVisitor& visit) {
    for (const auto& entry : store_.list(dir)) {
        if (entry.is_directory()) {
            select_tree(entry.path, visit);
        } else {
            visit(Transfer{entry.path, local_path_for(entry.path)});
        }
    }
}

void Selector::select_exact(const TransferVisitor& visit) {
    for (const auto& entry : store_.list(settings_.path_prefix)) {
        if (entry.is_directory()) {
            log_.debug("Not descending into {}", entry.path);
            continue;
        }
        visit(Transfer{entry.path, local_path_for(entry.path)});
    }
}

// Every subdirectory is descended regardless of match. A matching directory
// collects everything below it; otherwise a file is collected when its own
// name matches. Each remote file is emitted at most once per run.
void Selector::select_patterns(const std::string& dir, bool inside_match, const TransferVisitor& visit) {
    for (const auto& entry : store_.list(dir)) {
        bool match = inside_match || matches_pattern(entry.name);

        if (entry.is_directory()) {
            select_patterns(entry.path, match, visit);
            continue;
        }
        if (!match) continue;

        if (!emitted_.insert(entry.path).second) {
            log_.debug("Already selected: {}", entry.path);
            continue;
        }
        visit(Transfer{entry.path, local_path_for(entry.path)});
    }
}
