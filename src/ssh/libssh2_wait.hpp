#pragma once

// Retry helpers for libssh2 in non-blocking mode. Internal to src/ssh.

#include <chrono>
#include <string>
#include <libssh2.h>
#include <platform/socket_util.hpp>

using SshClock = std::chrono::steady_clock;

inline SshClock::time_point deadline_after(int seconds) {
    return SshClock::now() + std::chrono::seconds(seconds);
}

// Block until the socket is ready in whatever direction libssh2 is waiting on,
// or timeout_ms elapses.
inline void wait_socket(LIBSSH2_SESSION* session, socket_t sock, int timeout_ms) {
    int dir = libssh2_session_block_directions(session);
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;
    platform::poll_socket(sock, events, timeout_ms);
}

// Repeat an int-returning libssh2 call while it reports EAGAIN.
// Returns LIBSSH2_ERROR_TIMEOUT once the deadline passes.
template <typename Fn>
int retry_eagain(LIBSSH2_SESSION* session, socket_t sock,
                 SshClock::time_point deadline, Fn fn) {
    int rc;
    while ((rc = static_cast<int>(fn())) == LIBSSH2_ERROR_EAGAIN) {
        if (SshClock::now() >= deadline) return LIBSSH2_ERROR_TIMEOUT;
        wait_socket(session, sock, 100);
    }
    return rc;
}

// Same for calls returning a handle: nullptr + EAGAIN means "try again".
template <typename T, typename Fn>
T* retry_eagain_ptr(LIBSSH2_SESSION* session, socket_t sock,
                    SshClock::time_point deadline, Fn fn) {
    T* p;
    while ((p = fn()) == nullptr) {
        if (libssh2_session_last_errno(session) != LIBSSH2_ERROR_EAGAIN) return nullptr;
        if (SshClock::now() >= deadline) return nullptr;
        wait_socket(session, sock, 100);
    }
    return p;
}

// Last libssh2 error message for the session.
inline std::string ssh_error_message(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "unknown error";
}
