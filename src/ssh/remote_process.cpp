#include "remote_process.hpp"
#include "libssh2_wait.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <managers/job_log.hpp>
#include <libssh2.h>
#include <fmt/format.h>

SshProcess::SshProcess(LIBSSH2_SESSION* session, LIBSSH2_CHANNEL* channel, socket_t sock)
    : session_(session), channel_(channel), sock_(sock) {}

SshProcess::~SshProcess() {
    if (!channel_) return;
    auto deadline = deadline_after(CHANNEL_OPEN_TIMEOUT_SECS);
    int rc = retry_eagain(session_, sock_, deadline,
                          [&] { return libssh2_channel_free(channel_); });
    if (rc != 0) {
        // Freed with the session when SshSession closes
        vmig_log(fmt::format("channel free failed ({}): {}", rc, ssh_error_message(session_)));
    }
}

LineRead SshProcess::next_line(OutputStream stream, std::string& line) {
    StreamState& st = state(stream);
    if (st.splitter.next(line)) return LineRead::kLine;

    if (!st.eof) {
        int stream_id = stream == OutputStream::kStdout ? 0 : SSH_EXTENDED_DATA_STDERR;
        char buf[SSH_READ_BUF_SIZE];
        ssize_t n = libssh2_channel_read_ex(channel_, stream_id, buf, sizeof(buf));
        if (n > 0) {
            st.splitter.feed(buf, static_cast<size_t>(n));
            if (st.splitter.next(line)) return LineRead::kLine;
            return LineRead::kPending;
        }
        if (n == LIBSSH2_ERROR_EAGAIN) {
            // Keepalives go out while the payload is quiet
            int next_secs = 0;
            libssh2_keepalive_send(session_, &next_secs);
            return LineRead::kPending;
        }
        if (n < 0) {
            throw ExecutionError(fmt::format("Remote output channel failed: {}",
                                             ssh_error_message(session_)));
        }
        // n == 0: no data now; the stream is done only once the peer sent EOF
        if (!libssh2_channel_eof(channel_)) return LineRead::kPending;
        st.eof = true;
    }

    if (st.splitter.flush(line)) return LineRead::kLine;
    return LineRead::kEnd;
}

void SshProcess::send_input(const std::string& data) {
    size_t sent = 0;
    auto deadline = deadline_after(CHANNEL_OPEN_TIMEOUT_SECS);
    while (sent < data.size()) {
        int rc = retry_eagain(session_, sock_, deadline, [&] {
            return libssh2_channel_write(channel_, data.data() + sent, data.size() - sent);
        });
        if (rc < 0) {
            throw ExecutionError("Failed to write to remote process: " +
                                 ssh_error_message(session_));
        }
        sent += static_cast<size_t>(rc);
    }
}

void SshProcess::close_input() {
    if (input_closed_) return;
    auto deadline = deadline_after(CHANNEL_OPEN_TIMEOUT_SECS);
    int rc = retry_eagain(session_, sock_, deadline,
                          [&] { return libssh2_channel_send_eof(channel_); });
    if (rc != 0) {
        throw ExecutionError("Failed to close remote input: " + ssh_error_message(session_));
    }
    input_closed_ = true;
}

int SshProcess::exit_status() {
    // exit-status arrives before the peer's CLOSE; until the close handshake
    // completes, libssh2 reports 0 for a status it never received.
    auto deadline = deadline_after(CHANNEL_OPEN_TIMEOUT_SECS);
    int rc = retry_eagain(session_, sock_, deadline,
                          [&] { return libssh2_channel_close(channel_); });
    if (rc != 0) {
        throw ExecutionError(fmt::format("Connection lost before exit status: {}",
                                         ssh_error_message(session_)));
    }
    deadline = deadline_after(CHANNEL_OPEN_TIMEOUT_SECS);
    rc = retry_eagain(session_, sock_, deadline,
                      [&] { return libssh2_channel_wait_closed(channel_); });
    if (rc != 0) {
        throw ExecutionError(fmt::format("Connection lost before exit status: {}",
                                         ssh_error_message(session_)));
    }

    char* signal = nullptr;
    size_t signal_len = 0;
    libssh2_channel_get_exit_signal(channel_, &signal, &signal_len,
                                    nullptr, nullptr, nullptr, nullptr);
    if (signal) {
        std::string name(signal, signal_len);
        libssh2_free(session_, signal);
        throw ExecutionError("Remote script terminated by signal SIG" + name);
    }

    return libssh2_channel_get_exit_status(channel_);
}
