#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <sync/remote_store.hpp>
#include "session.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

class RunLog;

// RemoteStore over the SFTP subsystem of one SSH session.
class SftpStore : public RemoteStore {
public:
    // Connect, authenticate and open the SFTP subsystem. Throws TransportError.
    static std::unique_ptr<RemoteStore> connect(const RemoteConfig& remote, RunLog& log);

    SftpStore(std::unique_ptr<SessionManager> session, LIBSSH2_SFTP* sftp, RunLog& log);
    ~SftpStore() override;

    SftpStore(const SftpStore&) = delete;
    SftpStore& operator=(const SftpStore&) = delete;

    std::vector<RemoteEntry> list(const std::string& path) override;
    bool is_directory(const std::string& path) override;
    bool get(const std::string& remote_path, const fs::path& local_path) override;
    void remove(const std::string& remote_path) override;
    void remove_directory(const std::string& remote_path) override;

private:
    std::unique_ptr<SessionManager> session_;
    LIBSSH2_SFTP* sftp_;
    RunLog& log_;

    // "<what>: <sftp status or session error>"
    std::string describe_error(const std::string& what) const;
};
