#pragma once

// Socket helpers for the SSH transport.

#include <string>
#include <poll.h>
#include <core/types.hpp>

using socket_t = int;
#define SFTPFETCH_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to blocking or non-blocking mode.
void set_nonblocking(socket_t sock, bool nonblocking = true);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host and open a TCP connection, giving up after timeout_secs.
// The returned socket is left in blocking mode.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_secs);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
