#pragma once

#include <memory>
#include "remote_store.hpp"

class RunLog;

// Forwards everything to the wrapped store, but stops fetching once `cap`
// downloads have been issued through it. Listing, stat and removal are never capped.
class BoundedDownloadStore : public RemoteStore {
public:
    BoundedDownloadStore(RemoteStore& inner, int cap, RunLog& log);

    std::vector<RemoteEntry> list(const std::string& path) override;
    bool is_directory(const std::string& path) override;
    bool get(const std::string& remote_path, const fs::path& local_path) override;
    void remove(const std::string& remote_path) override;
    void remove_directory(const std::string& remote_path) override;

    int fetched() const { return fetched_; }
    int skipped() const { return skipped_; }
    bool exhausted() const { return fetched_ >= cap_; }

private:
    RemoteStore& inner_;
    int cap_;
    int fetched_ = 0;
    int skipped_ = 0;
    RunLog& log_;
};
