#pragma once

#include <cstdint>

// ── Network ─────────────────────────────────────────────────
constexpr int SSH_DEFAULT_PORT             = 22;

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS         = 30;    // Default wait for the Connected event
constexpr int REQUEST_TIMEOUT_SECS         = 0;     // Default one-shot waiter expiry (0 = none)
constexpr int SHELL_INITIAL_OUTPUT_MS      = 500;   // Quiet period that ends the initial shell output
constexpr int KEEPALIVE_INTERVAL_SECS      = 30;    // SSH keepalive period once authenticated
constexpr int EAGAIN_SLEEP_MS              = 10;    // Back-off between libssh2 EAGAIN retries
constexpr int READER_IDLE_SLEEP_MS         = 5;     // Shell reader idle poll interval

// ── Retry counts ────────────────────────────────────────────
constexpr int SSH_WRITE_MAX_RETRIES        = 100;   // EAGAIN retries before a write is declared stalled

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE            = 4096;
constexpr int SFTP_TRANSFER_BUF_SIZE       = 32768;
constexpr int SFTP_NAME_BUF_SIZE           = 512;
constexpr int SFTP_LONGENTRY_BUF_SIZE      = 1024;

// ── Terminal ────────────────────────────────────────────────
constexpr int PTY_DEFAULT_COLS             = 80;
constexpr int PTY_DEFAULT_ROWS             = 24;

// ── SFTP defaults ───────────────────────────────────────────
constexpr long SFTP_DEFAULT_DIR_MODE       = 0755;
constexpr long SFTP_DEFAULT_FILE_MODE      = 0644;

// ── Files ───────────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME      = ".sshlink";
constexpr const char* CONFIG_FILE_NAME     = "config.yaml";
constexpr const char* LOG_FILE_NAME        = "sshlink_debug.log";
