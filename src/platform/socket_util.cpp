#include "socket_util.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace platform {

void set_nonblocking(socket_t sock, bool nonblocking) {
    int flags = fcntl(sock, F_GETFL, 0);
    if (nonblocking) {
        fcntl(sock, F_SETFL, flags | O_NONBLOCK);
    } else {
        fcntl(sock, F_SETFL, flags & ~O_NONBLOCK);
    }
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

// Non-blocking connect so the timeout applies; restores blocking mode on success.
static Result<socket_t> connect_addr(const struct addrinfo* ai, int timeout_secs) {
    socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock < 0) {
        return Result<socket_t>::Err("Failed to create socket: " + std::string(strerror(errno)));
    }

    set_nonblocking(sock, true);
    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
        int err = errno;
        close_socket(sock);
        return Result<socket_t>::Err("Failed to connect: " + std::string(strerror(err)));
    }

    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_secs * 1000);
        if (revents == 0) {
            close_socket(sock);
            return Result<socket_t>::Err(fmt::format("Connection timed out after {}s", timeout_secs));
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            return Result<socket_t>::Err("Connection failed: " + std::string(strerror(sock_err)));
        }
    }

    set_nonblocking(sock, false);

    int keepalive = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    int nodelay = 1;
    setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    return Result<socket_t>::Ok(sock);
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_secs) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        return Result<socket_t>::Err(fmt::format("Failed to resolve host {}: {}", host, gai_strerror(rc)));
    }

    // Try each resolved address, keep the last error for the message
    Result<socket_t> result = Result<socket_t>::Err("No usable address for " + host);
    for (auto* ai = res; ai != nullptr; ai = ai->ai_next) {
        result = connect_addr(ai, timeout_secs);
        if (result.is_ok()) break;
    }
    freeaddrinfo(res);
    return result;
}

void close_socket(socket_t sock) {
    close(sock);
}

} // namespace platform
