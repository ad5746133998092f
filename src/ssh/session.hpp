#pragma once

#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// One-time libssh2_init() for the process. Err when the library cannot be
// initialised; callers treat that as a missing prerequisite.
Result<void> ssh_library_init();

// Factory handing out a fresh SshSession per job.
TransportFactory ssh_transport_factory();

// libssh2-backed Transport: TCP socket, SSH session, SFTP for file transfer
// and exec channels for commands.
//
// A session is used by exactly one job thread, so it carries no locking.
// RemoteProcess objects returned by execute() must be destroyed before
// close() (or the destructor) runs.
class SshSession : public Transport {
public:
    SshSession();
    ~SshSession() override;

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    void connect(const Endpoint& endpoint, const Credential& credential,
                 std::chrono::seconds timeout) override;
    void upload(const fs::path& local, const std::string& remote, bool executable) override;
    std::unique_ptr<RemoteProcess> execute(const std::string& command) override;
    void remove(const std::string& remote) override;
    void close() override;

private:
    LIBSSH2_SESSION* session_ = nullptr;
    LIBSSH2_SFTP* sftp_ = nullptr;
    socket_t sock_ = VMIG_INVALID_SOCKET;
    bool connected_ = false;
    std::string target_str_;
    std::string fingerprint_;

    void handshake(int timeout_secs);
    void authenticate(const Credential& credential, int timeout_secs);
    void require_connected(const char* op) const;

    // Lazily open the SFTP subsystem
    LIBSSH2_SFTP* sftp();
    std::string sftp_error(const std::string& what, const std::string& path);
};
