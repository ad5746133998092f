#pragma once

// POSIX socket helpers used by the SSH session.

#include <poll.h>
#include <string>

using socket_t = int;
#define VMIG_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Enable TCP keepalive with the given idle/interval/count settings.
void enable_keepalive(socket_t sock, int idle_secs, int interval_secs, int count);

// Resolve host:port and connect, trying every resolved address until one
// succeeds within timeout_ms. Returns a connected non-blocking socket, or
// VMIG_INVALID_SOCKET with `err` describing the last failure.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& err);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
