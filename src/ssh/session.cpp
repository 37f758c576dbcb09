#include "session.hpp"
#include <core/constants.hpp>
#include <libssh2.h>
#include <cstring>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback. SFTP-only servers often disable the
// "password" method and ask for the same secret through a single prompt.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

SessionManager::SessionManager(const RemoteConfig& target)
    : target_(target), session_(nullptr), sock_(SFTPFETCH_INVALID_SOCKET) {
}

SessionManager::~SessionManager() {
    close();
}

std::string SessionManager::last_error() const {
    if (!session_) return "";
    char* msg = nullptr;
    libssh2_session_last_error(session_, &msg, nullptr, 0);
    return msg ? msg : "";
}

Result<void> SessionManager::establish(StatusCallback callback) {
    if (callback) {
        callback("Connecting to " + target_.host + ":" + std::to_string(target_.port) + "...");
    }

    // Initialize libssh2
    int rc = libssh2_init(0);
    if (rc != 0) {
        return Result<void>::Err("Failed to initialize libssh2");
    }

    auto sock = platform::connect_tcp(target_.host, target_.port, target_.timeout);
    if (sock.is_err()) {
        return Result<void>::Err(sock.error);
    }
    sock_ = sock.value;

    if (callback) callback("TCP connected, starting SSH handshake...");

    // Create SSH session
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return Result<void>::Err("Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 1);

    // SSH handshake (key exchange)
    if (libssh2_session_handshake(session_, sock_) != 0) {
        std::string err = "SSH handshake failed: " + last_error();
        close();
        return Result<void>::Err(err);
    }

    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.is_err()) {
        close();
        return auth_result;
    }

    target_str_ = target_.user + "@" + target_.host;

    if (callback) {
        callback("Connected to " + target_str_);
    }

    return Result<void>::Ok();
}

Result<void> SessionManager::ssh_userauth(StatusCallback callback) {
    // Check what auth methods the server supports
    char* auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                            static_cast<unsigned int>(target_.user.length()));
    if (!auth_list && libssh2_userauth_authenticated(session_)) {
        return Result<void>::Ok();  // "none" auth accepted
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    // Password wins when both credentials are configured
    if (target_.password) {
        return auth_password(methods, callback);
    }
    if (target_.private_key) {
        return auth_private_key(callback);
    }
    return Result<void>::Err("No credentials configured");
}

Result<void> SessionManager::auth_password(const std::string& methods, StatusCallback callback) {
    const std::string& password = *target_.password;

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");
        int ret = libssh2_userauth_password(session_, target_.user.c_str(), password.c_str());
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return Result<void>::Ok();
        }
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = password;
        kbd_data.prompt_round = 0;
        *libssh2_session_abstract(session_) = &kbd_data;

        int ret = libssh2_userauth_keyboard_interactive(session_, target_.user.c_str(), kbd_callback);
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return Result<void>::Ok();
        }
    }

    return Result<void>::Err("Authentication failed (check username/password)");
}

Result<void> SessionManager::auth_private_key(StatusCallback callback) {
    if (callback) callback("Using public key auth...");

    // The key file lives exactly as long as the session
    key_file_ = std::make_unique<ScopedKeyFile>(*target_.private_key);
    const char* passphrase = target_.private_key_passphrase
        ? target_.private_key_passphrase->c_str() : nullptr;

    int ret = libssh2_userauth_publickey_fromfile_ex(
        session_, target_.user.c_str(), static_cast<unsigned int>(target_.user.length()),
        nullptr, key_file_->path().c_str(), passphrase);
    if (ret != 0) {
        return Result<void>::Err("Public key authentication failed: " + last_error());
    }

    if (callback) callback("Authentication successful");
    return Result<void>::Ok();
}

void SessionManager::close() {
    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != SFTPFETCH_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SFTPFETCH_INVALID_SOCKET;
    }

    key_file_.reset();
}
