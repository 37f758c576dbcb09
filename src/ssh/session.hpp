#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "key_file.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// One authenticated SSH transport session (TCP socket + libssh2 session),
// in blocking mode. Closed on destruction.
class SessionManager {
public:
    explicit SessionManager(const RemoteConfig& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    Result<void> establish(StatusCallback callback = nullptr);
    void close();

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    const std::string& get_target() const { return target_str_; }

    // Last libssh2 error message for this session ("" if none)
    std::string last_error() const;

private:
    RemoteConfig target_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    std::string target_str_;
    std::unique_ptr<ScopedKeyFile> key_file_;

    Result<void> ssh_userauth(StatusCallback callback);
    Result<void> auth_password(const std::string& methods, StatusCallback callback);
    Result<void> auth_private_key(StatusCallback callback);
};
