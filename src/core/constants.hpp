#pragma once

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS       = 15;    // TCP connect + SSH handshake
constexpr int CHANNEL_OPEN_TIMEOUT_SECS  = 30;    // exec channel / SFTP subsystem open
constexpr int SFTP_OP_TIMEOUT_SECS       = 120;   // single SFTP open/write/close/unlink
constexpr int POLL_INTERVAL_MS           = 1000;  // CLI job status polling
constexpr int OUTPUT_IDLE_SLEEP_MS       = 20;    // runner sleep when no output is pending

// ── Keepalive ───────────────────────────────────────────────
constexpr int SSH_KEEPALIVE_SECS         = 30;
constexpr int TCP_KEEPIDLE_SECS          = 60;
constexpr int TCP_KEEPINTVL_SECS         = 15;
constexpr int TCP_KEEPCNT                = 4;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int SFTP_WRITE_BUF_SIZE        = 32768;
constexpr int MAX_LINE_BYTES             = 2048;  // longer lines are split

// ── Log line prefixes ───────────────────────────────────────
constexpr const char* STDERR_PREFIX      = "[STDERR] ";

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_REMOTE_CONFIG_NAME = "config.json";
constexpr const char* VMIG_VERSION       = "0.4.0";
