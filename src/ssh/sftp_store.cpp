#include "sftp_store.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/run_log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <fstream>
#include <vector>

static const char* sftp_status_name(unsigned long code) {
    switch (code) {
    case LIBSSH2_FX_NO_SUCH_FILE:        return "no such file";
    case LIBSSH2_FX_PERMISSION_DENIED:   return "permission denied";
    case LIBSSH2_FX_FAILURE:             return "failure";
    case LIBSSH2_FX_NO_SUCH_PATH:        return "no such path";
    case LIBSSH2_FX_DIR_NOT_EMPTY:       return "directory not empty";
    case LIBSSH2_FX_NOT_A_DIRECTORY:     return "not a directory";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
    case LIBSSH2_FX_CONNECTION_LOST:     return "connection lost";
    default:                             return "sftp error";
    }
}

std::unique_ptr<RemoteStore> SftpStore::connect(const RemoteConfig& remote, RunLog& log) {
    auto session = std::make_unique<SessionManager>(remote);
    auto result = session->establish(log.status());
    if (result.is_err()) {
        throw TransportError(fmt::format("Cannot connect to {}:{}: {}",
                                         remote.host, remote.port, result.error));
    }

    LIBSSH2_SFTP* sftp = libssh2_sftp_init(session->get_raw_session());
    if (!sftp) {
        throw TransportError("SFTP subsystem init failed: " + session->last_error());
    }

    log.debug("SFTP session open on {}", session->get_target());
    return std::make_unique<SftpStore>(std::move(session), sftp, log);
}

SftpStore::SftpStore(std::unique_ptr<SessionManager> session, LIBSSH2_SFTP* sftp, RunLog& log)
    : session_(std::move(session)), sftp_(sftp), log_(log) {
}

SftpStore::~SftpStore() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    session_->close();
}

std::string SftpStore::describe_error(const std::string& what) const {
    int err = libssh2_session_last_errno(session_->get_raw_session());
    if (err == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        return fmt::format("{}: {}", what, sftp_status_name(libssh2_sftp_last_error(sftp_)));
    }
    return fmt::format("{}: {}", what, session_->last_error());
}

std::vector<RemoteEntry> SftpStore::list(const std::string& path) {
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        throw TransportError(describe_error("Cannot list " + path));
    }

    std::vector<RemoteEntry> entries;
    char name[SFTP_NAME_BUF_SIZE];
    char longentry[SFTP_NAME_BUF_SIZE];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    for (;;) {
        int n = libssh2_sftp_readdir_ex(dir, name, sizeof(name), longentry, sizeof(longentry), &attrs);
        if (n == 0) break;
        if (n < 0) {
            std::string err = describe_error("Listing " + path + " failed");
            libssh2_sftp_closedir(dir);
            throw TransportError(err);
        }

        std::string entry_name(name, static_cast<size_t>(n));
        if (entry_name == "." || entry_name == "..") continue;

        RemoteEntry entry;
        entry.name = entry_name;
        entry.path = remote_join(path, entry_name);

        bool have_perms = attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS;
        if (have_perms && LIBSSH2_SFTP_S_ISLNK(attrs.permissions)) {
            // Follow symlinks the way a download would
            entry.kind = is_directory(entry.path) ? RemoteEntryKind::DIRECTORY : RemoteEntryKind::FILE;
        } else if (have_perms) {
            entry.kind = LIBSSH2_SFTP_S_ISDIR(attrs.permissions)
                ? RemoteEntryKind::DIRECTORY : RemoteEntryKind::FILE;
        } else {
            entry.kind = is_directory(entry.path) ? RemoteEntryKind::DIRECTORY : RemoteEntryKind::FILE;
        }
        entries.push_back(entry);
    }

    libssh2_sftp_closedir(dir);
    return entries;
}

bool SftpStore::is_directory(const std::string& path) {
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    int rc = libssh2_sftp_stat(sftp_, path.c_str(), &attrs);
    if (rc != 0) {
        unsigned long code = libssh2_sftp_last_error(sftp_);
        if (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH) return false;
        throw TransportError(describe_error("Cannot stat " + path));
    }
    return (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) && LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
}

bool SftpStore::get(const std::string& remote_path, const fs::path& local_path) {
    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open(sftp_, remote_path.c_str(), LIBSSH2_FXF_READ, 0);
    if (!fh) {
        throw TransportError(describe_error("Cannot open " + remote_path));
    }

    std::error_code ec;
    if (local_path.has_parent_path()) {
        fs::create_directories(local_path.parent_path(), ec);
    }
    std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
    if (ec || !out) {
        libssh2_sftp_close(fh);
        throw TransportError("Cannot write " + local_path.string());
    }

    std::vector<char> buf(SFTP_TRANSFER_BUF_SIZE);
    for (;;) {
        ssize_t n = libssh2_sftp_read(fh, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            std::string err = describe_error("Read of " + remote_path + " failed");
            libssh2_sftp_close(fh);
            throw TransportError(err);
        }
        out.write(buf.data(), n);
        if (!out) {
            libssh2_sftp_close(fh);
            throw TransportError("Write to " + local_path.string() + " failed");
        }
    }

    libssh2_sftp_close(fh);
    return true;
}

void SftpStore::remove(const std::string& remote_path) {
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        throw DeletionError(remote_path, describe_error("Cannot remove " + remote_path));
    }
}

void SftpStore::remove_directory(const std::string& remote_path) {
    if (libssh2_sftp_rmdir(sftp_, remote_path.c_str()) != 0) {
        throw DeletionError(remote_path, describe_error("Cannot remove directory " + remote_path));
    }
}
