#pragma once

// ── Connection defaults ─────────────────────────────────────
constexpr int DEFAULT_SSH_PORT          = 22;
constexpr int DIAL_MAX_ATTEMPTS         = 15;     // Dial attempts per connect()
constexpr int DIAL_TIMEOUT_SECS         = 15;     // Cap on one dial (and on the handshake)
constexpr int DIAL_BACKOFF_SECS         = 5;      // Sleep between failed dials
constexpr int RECONNECT_MAX_CYCLES      = 10;     // connect() calls per reconnect()

// ── SSH transport ───────────────────────────────────────────
constexpr int SSH_KEEPALIVE_SECS        = 30;
constexpr int SSH_SESSION_OPEN_SECS     = 30;     // Max time to open one session
constexpr int SSH_READ_BUF_SIZE         = 4096;

// ── Paths ───────────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME   = ".ktest";
constexpr const char* CONFIG_FILE_NAME  = "config.yaml";
constexpr const char* LOG_FILE_NAME     = "ktest_debug.log";
