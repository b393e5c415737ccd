#pragma once

#include <cstddef>

// Tunables that are not worth a config key. Configurable defaults live on the
// structs in core/types.hpp.

constexpr const char* SHELLPOOL_VERSION = "0.4.0";

// ── Polling ─────────────────────────────────────────────────
constexpr int REACTOR_POLL_MS        = 20;     // Reactor poll timeout (remote probe period)
constexpr int SSH_IO_WAIT_MS         = 10;     // Socket wait between EAGAIN retries
constexpr int ACCEPT_POLL_MS         = 200;    // Accept loop stop-flag check period
constexpr int EVENT_WAIT_MS          = 100;    // Event router wait per iteration

// ── SSH ─────────────────────────────────────────────────────
constexpr int SSH_REQUEST_TIMEOUT_MS = 10000;  // Channel open / pty / shell requests
constexpr int SSH_KEEPALIVE_SECS     = 30;

// ── Limits ──────────────────────────────────────────────────
constexpr size_t CLOSED_ID_MEMORY    = 4096;   // Closed session ids remembered
constexpr int PROCESS_TERM_GRACE_MS  = 500;    // SIGHUP → SIGKILL grace on teardown

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE      = 16384;
constexpr int PTY_READ_BUF_SIZE      = 16384;
constexpr int CHANNEL_READ_BUF_SIZE  = 65536;

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_LISTEN = "unix:/tmp/shellpool.sock";
constexpr int DEFAULT_SSH_PORT       = 22;
