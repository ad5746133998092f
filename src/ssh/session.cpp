#include "session.hpp"
#include "libssh2_wait.hpp"
#include "remote_process.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <managers/job_log.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <cstring>
#include <fstream>
#include <mutex>
#include <vector>

// ── Library init ─────────────────────────────────────────────

Result<void> ssh_library_init() {
    static std::once_flag once;
    static int init_rc = 0;
    std::call_once(once, [] { init_rc = libssh2_init(0); });
    if (init_rc != 0) {
        return Result<void>::Err(fmt::format("libssh2_init failed ({})", init_rc));
    }
    return Result<void>::Ok();
}

TransportFactory ssh_transport_factory() {
    return [] { return std::make_unique<SshSession>(); };
}

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// Answer every keyboard-interactive prompt with the password. Servers that
// disable the plain "password" method still ask for it this way.
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

static std::string sftp_code_text(unsigned long code) {
    switch (code) {
        case LIBSSH2_FX_NO_SUCH_FILE:       return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED:  return "permission denied";
        case LIBSSH2_FX_NO_SUCH_PATH:       return "no such path";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space left";
        case LIBSSH2_FX_QUOTA_EXCEEDED:     return "quota exceeded";
        case LIBSSH2_FX_WRITE_PROTECT:      return "write protected";
        case LIBSSH2_FX_FAILURE:            return "failure";
        default:                            return fmt::format("sftp error {}", code);
    }
}

// ── SshSession ───────────────────────────────────────────────

SshSession::SshSession() = default;

SshSession::~SshSession() {
    close();
}

void SshSession::connect(const Endpoint& endpoint, const Credential& credential,
                         std::chrono::seconds timeout) {
    auto init = ssh_library_init();
    if (init.is_err()) {
        throw ConnectionError(init.error);
    }

    // Reconnecting replaces any previous session
    close();

    int timeout_secs = static_cast<int>(timeout.count());
    target_str_ = fmt::format("{}@{}:{}", credential.user, endpoint.host, endpoint.port);
    vmig_log(fmt::format("SSH connect {}", target_str_));

    std::string err;
    sock_ = platform::connect_tcp(endpoint.host, endpoint.port, timeout_secs * 1000, err);
    if (sock_ == VMIG_INVALID_SOCKET) {
        throw ConnectionError(err);
    }
    platform::enable_keepalive(sock_, TCP_KEEPIDLE_SECS, TCP_KEEPINTVL_SECS, TCP_KEEPCNT);

    try {
        handshake(timeout_secs);
        authenticate(credential, timeout_secs);
    } catch (const MigrationError&) {
        close();
        throw;
    }

    connected_ = true;
    vmig_log(fmt::format("SSH connected {} hostkey sha256={}", target_str_, fingerprint_));
}

void SshSession::handshake(int timeout_secs) {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        throw ConnectionError("Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    auto deadline = deadline_after(timeout_secs);
    int rc = retry_eagain(session_, sock_, deadline,
                          [&] { return libssh2_session_handshake(session_, sock_); });
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        throw ConnectionError(fmt::format("SSH handshake timed out after {}s", timeout_secs));
    }
    if (rc != 0) {
        throw ConnectionError("SSH handshake failed: " + ssh_error_message(session_));
    }

    // Host keys are not pinned; the fingerprint goes to the debug log
    const char* hash = libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (hash) {
        fingerprint_.clear();
        for (int i = 0; i < 32; i++) {
            fingerprint_ += fmt::format("{:02x}", static_cast<unsigned char>(hash[i]));
        }
    }

    // Send SSH keepalive every 30s so idle long-running payloads keep the session
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);
}

void SshSession::authenticate(const Credential& credential, int timeout_secs) {
    auto deadline = deadline_after(timeout_secs);

    char* auth_list = retry_eagain_ptr<char>(session_, sock_, deadline, [&] {
        return libssh2_userauth_list(session_, credential.user.c_str(),
                                     static_cast<unsigned int>(credential.user.length()));
    });
    if (!auth_list) {
        if (libssh2_userauth_authenticated(session_)) {
            return;  // server accepted "none"
        }
        throw ConnectionError("Failed to query authentication methods: " +
                              ssh_error_message(session_));
    }

    std::string methods = auth_list;
    vmig_log(fmt::format("SSH auth methods for {}: {}", target_str_, methods));

    if (methods.find("password") == std::string::npos &&
        methods.find("keyboard-interactive") == std::string::npos) {
        throw AuthenticationError("Server does not accept password authentication (offers: " +
                                  methods + ")");
    }

    int rc = LIBSSH2_ERROR_AUTHENTICATION_FAILED;
    if (methods.find("password") != std::string::npos) {
        rc = retry_eagain(session_, sock_, deadline, [&] {
            return libssh2_userauth_password(session_, credential.user.c_str(),
                                             credential.password.c_str());
        });
    }

    if (rc != 0 && methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data{credential.password, 0};
        *libssh2_session_abstract(session_) = &kbd_data;
        rc = retry_eagain(session_, sock_, deadline, [&] {
            return libssh2_userauth_keyboard_interactive(session_, credential.user.c_str(),
                                                         kbd_callback);
        });
        *libssh2_session_abstract(session_) = nullptr;
    }

    if (rc == 0) {
        return;
    }
    if (rc == LIBSSH2_ERROR_AUTHENTICATION_FAILED || rc == LIBSSH2_ERROR_PASSWORD_EXPIRED) {
        throw AuthenticationError(fmt::format("Authentication failed for {} (check username/password)",
                                              credential.user));
    }
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        throw ConnectionError(fmt::format("Authentication timed out after {}s", timeout_secs));
    }
    throw ConnectionError("Authentication aborted: " + ssh_error_message(session_));
}

void SshSession::require_connected(const char* op) const {
    if (!connected_ || !session_) {
        throw ConnectionError(std::string("Cannot ") + op + ": not connected");
    }
}

LIBSSH2_SFTP* SshSession::sftp() {
    if (sftp_) return sftp_;

    auto deadline = deadline_after(CHANNEL_OPEN_TIMEOUT_SECS);
    sftp_ = retry_eagain_ptr<LIBSSH2_SFTP>(session_, sock_, deadline,
                                           [&] { return libssh2_sftp_init(session_); });
    if (!sftp_) {
        throw TransferError("Failed to start SFTP subsystem: " + ssh_error_message(session_));
    }
    return sftp_;
}

std::string SshSession::sftp_error(const std::string& what, const std::string& path) {
    int err = libssh2_session_last_errno(session_);
    if (err == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        return fmt::format("{} {}: {}", what, path, sftp_code_text(libssh2_sftp_last_error(sftp_)));
    }
    return fmt::format("{} {}: {}", what, path, ssh_error_message(session_));
}

void SshSession::upload(const fs::path& local, const std::string& remote, bool executable) {
    require_connected("upload");

    std::ifstream file(local, std::ios::binary);
    if (!file) {
        throw TransferError("Cannot read local file: " + local.string());
    }

    LIBSSH2_SFTP* sftp_session = sftp();
    long mode = executable ? 0755 : 0644;
    auto deadline = deadline_after(SFTP_OP_TIMEOUT_SECS);

    LIBSSH2_SFTP_HANDLE* handle = retry_eagain_ptr<LIBSSH2_SFTP_HANDLE>(
        session_, sock_, deadline, [&] {
            return libssh2_sftp_open_ex(sftp_session, remote.c_str(),
                                        static_cast<unsigned int>(remote.size()),
                                        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                        mode, LIBSSH2_SFTP_OPENFILE);
        });
    if (!handle) {
        throw TransferError(sftp_error("Cannot write remote file", remote));
    }

    std::vector<char> buf(SFTP_WRITE_BUF_SIZE);
    std::string failure;
    size_t total = 0;
    while (failure.empty()) {
        file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = file.gcount();
        if (got <= 0) {
            if (file.bad()) failure = "Failed reading local file: " + local.string();
            break;
        }

        size_t sent = 0;
        while (sent < static_cast<size_t>(got)) {
            deadline = deadline_after(SFTP_OP_TIMEOUT_SECS);
            int w = retry_eagain(session_, sock_, deadline, [&] {
                return libssh2_sftp_write(handle, buf.data() + sent,
                                          static_cast<size_t>(got) - sent);
            });
            if (w < 0) {
                failure = sftp_error("Write failed for", remote);
                break;
            }
            sent += static_cast<size_t>(w);
        }
        total += sent;
    }

    deadline = deadline_after(SFTP_OP_TIMEOUT_SECS);
    int rc = retry_eagain(session_, sock_, deadline,
                          [&] { return libssh2_sftp_close_handle(handle); });
    if (failure.empty() && rc != 0) {
        failure = sftp_error("Failed to finish", remote);
    }
    if (!failure.empty()) {
        throw TransferError(failure);
    }

    // The open mode only applies to new files; set it explicitly for overwrites
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    attrs.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
    attrs.permissions = static_cast<unsigned long>(mode);
    deadline = deadline_after(SFTP_OP_TIMEOUT_SECS);
    rc = retry_eagain(session_, sock_, deadline, [&] {
        return libssh2_sftp_stat_ex(sftp_session, remote.c_str(),
                                    static_cast<unsigned int>(remote.size()),
                                    LIBSSH2_SFTP_SETSTAT, &attrs);
    });
    if (rc != 0) {
        throw TransferError(sftp_error("Cannot set permissions on", remote));
    }

    vmig_log(fmt::format("SFTP put {} -> {} ({} bytes, mode {:o})",
                         local.string(), remote, total, mode));
}

std::unique_ptr<RemoteProcess> SshSession::execute(const std::string& command) {
    require_connected("execute");

    auto deadline = deadline_after(CHANNEL_OPEN_TIMEOUT_SECS);
    LIBSSH2_CHANNEL* channel = retry_eagain_ptr<LIBSSH2_CHANNEL>(
        session_, sock_, deadline, [&] { return libssh2_channel_open_session(session_); });
    if (!channel) {
        throw ExecutionError("Failed to open exec channel: " + ssh_error_message(session_));
    }

    deadline = deadline_after(CHANNEL_OPEN_TIMEOUT_SECS);
    int rc = retry_eagain(session_, sock_, deadline,
                          [&] { return libssh2_channel_exec(channel, command.c_str()); });
    if (rc != 0) {
        std::string msg = ssh_error_message(session_);
        libssh2_channel_free(channel);
        throw ExecutionError("Failed to start remote command: " + msg);
    }

    vmig_log(fmt::format("SSH exec on {}: {}", target_str_, command));
    return std::make_unique<SshProcess>(session_, channel, sock_);
}

void SshSession::remove(const std::string& remote) {
    require_connected("remove");

    LIBSSH2_SFTP* sftp_session = sftp();
    auto deadline = deadline_after(SFTP_OP_TIMEOUT_SECS);
    int rc = retry_eagain(session_, sock_, deadline, [&] {
        return libssh2_sftp_unlink_ex(sftp_session, remote.c_str(),
                                      static_cast<unsigned int>(remote.size()));
    });
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL &&
        libssh2_sftp_last_error(sftp_session) == LIBSSH2_FX_NO_SUCH_FILE) {
        // An upload that failed before creating the file
        vmig_log(fmt::format("SFTP rm {}: already absent", remote));
        return;
    }
    if (rc != 0) {
        throw TransferError(sftp_error("Cannot remove remote file", remote));
    }
    vmig_log(fmt::format("SFTP rm {}", remote));
}

void SshSession::close() {
    connected_ = false;

    if (sftp_) {
        auto deadline = deadline_after(2);
        retry_eagain(session_, sock_, deadline, [&] { return libssh2_sftp_shutdown(sftp_); });
        sftp_ = nullptr;
    }

    if (session_) {
        auto deadline = deadline_after(2);
        retry_eagain(session_, sock_, deadline, [&] {
            return libssh2_session_disconnect(session_, "Normal disconnection");
        });
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != VMIG_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = VMIG_INVALID_SOCKET;
    }
}
