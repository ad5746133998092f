#include "socket_util.hpp"
#include <chrono>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void enable_keepalive(socket_t sock, int idle_secs, int interval_secs, int count) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &idle_secs, sizeof(idle_secs));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &interval_secs, sizeof(interval_secs));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &count, sizeof(count));
#endif
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& err) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string port_str = std::to_string(port);
    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        err = "Failed to resolve host " + host + ": " + gai_strerror(gai);
        return VMIG_INVALID_SOCKET;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    err = "No usable address for " + host;

    for (auto* rp = res; rp != nullptr; rp = rp->ai_next) {
        socket_t s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s < 0) {
            err = "Failed to create socket: " + std::string(strerror(errno));
            continue;
        }
        set_nonblocking(s);

        int ret = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (ret == 0) {
            freeaddrinfo(res);
            return s;
        }
        if (errno != EINPROGRESS) {
            err = "Failed to connect: " + std::string(strerror(errno));
            close_socket(s);
            continue;
        }

        // Wait for non-blocking connect to complete
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            close_socket(s);
            err = "Connection timed out: " + host + ":" + port_str;
            break;
        }
        int revents = poll_socket(s, POLLOUT, static_cast<int>(remaining));
        if (revents == 0) {
            close_socket(s);
            err = "Connection timed out: " + host + ":" + port_str;
            break;
        }

        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(s, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            err = "Connection failed: " + std::string(strerror(sock_err));
            close_socket(s);
            continue;
        }

        freeaddrinfo(res);
        return s;
    }

    freeaddrinfo(res);
    return VMIG_INVALID_SOCKET;
}

void close_socket(socket_t sock) {
    if (sock >= 0) {
        close(sock);
    }
}

} // namespace platform
