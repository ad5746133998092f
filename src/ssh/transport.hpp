#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Transport seam between the job runner and the SSH implementation.
//
// The runner only talks to these interfaces; SshSession implements them on
// top of libssh2 and the tests substitute a scripted fake. All failures are
// reported by throwing the classes in core/errors.hpp.

enum class OutputStream {
    kStdout,
    kStderr,
};

// Outcome of one next_line() call.
enum class LineRead {
    kLine,      // `line` holds the next complete line (without '\n')
    kPending,   // nothing complete yet; try again later
    kEnd,       // stream closed and fully drained
};

// A command running on the remote host.
class RemoteProcess {
public:
    virtual ~RemoteProcess() = default;

    // Non-blocking: hand out the next complete line of `stream` if one is
    // buffered or can be read right now. A trailing line without '\n' is
    // delivered once the stream ends.
    virtual LineRead next_line(OutputStream stream, std::string& line) = 0;

    // Write to the process's input channel.
    virtual void send_input(const std::string& data) = 0;

    // Send EOF on the input channel. Safe to call more than once.
    virtual void close_input() = 0;

    // Block until the remote process exits and return its exit code.
    // Call after both streams returned kEnd. ExecutionError when no exit
    // code can be obtained: killed by a signal, or the channel failed
    // before the process reported one.
    virtual int exit_status() = 0;
};

// An authenticated remote-shell connection. One per job.
class Transport {
public:
    virtual ~Transport() = default;

    // ConnectionError on network/handshake failure or timeout,
    // AuthenticationError when the credential is rejected.
    virtual void connect(const Endpoint& endpoint, const Credential& credential,
                         std::chrono::seconds timeout) = 0;

    // Copy a local file to `remote`. Mode 0755 when `executable`, 0644 otherwise.
    // TransferError if the local file is unreadable or the remote write fails.
    virtual void upload(const fs::path& local, const std::string& remote, bool executable) = 0;

    // Start `command` in a remote shell. ExecutionError if it cannot be started.
    virtual std::unique_ptr<RemoteProcess> execute(const std::string& command) = 0;

    // Delete a remote file. A file that does not exist counts as removed.
    // TransferError on failure.
    virtual void remove(const std::string& remote) = 0;

    // Release the connection. Idempotent, also after a failed connect().
    virtual void close() = 0;
};

// Creates a fresh, unconnected transport for each job.
using TransportFactory = std::function<std::unique_ptr<Transport>()>;
