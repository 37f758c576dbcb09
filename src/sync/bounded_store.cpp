#include "bounded_store.hpp"
#include <core/run_log.hpp>

BoundedDownloadStore::BoundedDownloadStore(RemoteStore& inner, int cap, RunLog& log)
    : inner_(inner), cap_(cap), log_(log) {
}

std::vector<RemoteEntry> BoundedDownloadStore::list(const std::string& path) {
    return inner_.list(path);
}

bool BoundedDownloadStore::is_directory(const std::string& path) {
    return inner_.is_directory(path);
}

bool BoundedDownloadStore::get(const std::string& remote_path, const fs::path& local_path) {
    if (exhausted()) {
        if (skipped_ == 0) {
            log_.info("Download cap of {} files reached, skipping the rest", cap_);
        }
        skipped_++;
        log_.debug("Skipped (cap): {}", remote_path);
        return false;
    }

    bool fetched = inner_.get(remote_path, local_path);
    if (fetched) fetched_++;
    return fetched;
}

void BoundedDownloadStore::remove(const std::string& remote_path) {
    inner_.remove(remote_path);
}

void BoundedDownloadStore::remove_directory(const std::string& remote_path) {
    inner_.remove_directory(remote_path);
}
