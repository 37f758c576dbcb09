#pragma once

#include <functional>
#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "remote_store.hpp"

class RunLog;

// One file to fetch and where it lands locally
struct Transfer {
    std::string remote_path;
    fs::path local_path;
};

using TransferVisitor = std::function<void(const Transfer&)>;

// Decides which remote files are fetched for the configured SelectionMode and
// maps each to its local destination. Listing failures propagate as TransportError.
class Selector {
public:
    Selector(const SyncSettings& settings, RemoteStore& store, RunLog& log);

    // Walk the remote side and hand each transfer to `visit` as soon as it is
    // found, so downloads interleave with listing.
    void select(const TransferVisitor& visit);

    // Same walk, gathered into a vector.
    std::vector<Transfer> collect();

    // Local directory that mirrors remote_root() for the configured mode.
    fs::path local_root() const;
    const std::string& remote_root() const { return settings_.path_prefix; }

    // Local destination for a remote file under the configured mode.
    fs::path local_path_for(const std::string& remote_path) const;

private:
    const SyncSettings& settings_;
    RemoteStore& store_;
    RunLog& log_;
    std::set<std::string> emitted_;

    void select_flat(const TransferVisitor& visit);
    void select_tree(const std::string& dir, const TransferVisitor& visit);
    void select_exact(const TransferVisitor& visit);
    void select_patterns(const std::string& dir, bool inside_match, const TransferVisitor& visit);

    bool matches_pattern(const std::string& name) const;
    void require_directory(const std::string& path);

    // Path of remote_path below the remote root, without a leading slash
    std::string relative_to_root(const std::string& remote_path) const;
};
