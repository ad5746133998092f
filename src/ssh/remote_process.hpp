#pragma once

#include <string>
#include <platform/socket_util.hpp>
#include "line_splitter.hpp"
#include "transport.hpp"

typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// RemoteProcess over a libssh2 exec channel. Owns the channel; the session
// and socket belong to the SshSession that created it.
class SshProcess : public RemoteProcess {
public:
    SshProcess(LIBSSH2_SESSION* session, LIBSSH2_CHANNEL* channel, socket_t sock);
    ~SshProcess() override;

    SshProcess(const SshProcess&) = delete;
    SshProcess& operator=(const SshProcess&) = delete;

    LineRead next_line(OutputStream stream, std::string& line) override;
    void send_input(const std::string& data) override;
    void close_input() override;
    int exit_status() override;

private:
    struct StreamState {
        LineSplitter splitter;
        bool eof = false;
    };

    LIBSSH2_SESSION* session_;
    LIBSSH2_CHANNEL* channel_;
    socket_t sock_;
    StreamState out_;
    StreamState err_;
    bool input_closed_ = false;

    StreamState& state(OutputStream stream) {
        return stream == OutputStream::kStdout ? out_ : err_;
    }
};
