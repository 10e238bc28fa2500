#pragma once

// ── Markers ─────────────────────────────────────────────────
// Start/end sentinels are "<MARKER_PREFIX>_START_<id>__" / "<MARKER_PREFIX>_END_<id>__".
constexpr const char* MARKER_PREFIX      = "__TMUX_BRIDGE";
constexpr int MARKER_ID_BYTES            = 16;    // 128-bit id, 32 hex digits

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_EXEC_TIMEOUT_MS    = 30000; // execute_and_wait deadline
constexpr int DEFAULT_POLL_INTERVAL_MS   = 250;   // Sleep between pane captures
constexpr int TMUX_CMD_TIMEOUT_MS        = 10000; // Max time for a single tmux invocation

// ── Process I/O ─────────────────────────────────────────────
constexpr int PROCESS_READ_BUF_SIZE      = 4096;
constexpr int PROCESS_POLL_SLICE_MS      = 50;

// ── Logging ─────────────────────────────────────────────────
constexpr int LOG_OUTPUT_PREVIEW         = 500;   // Chars of stdout/stderr kept per log line

// ── CLI exit codes ──────────────────────────────────────────
constexpr int EXIT_USAGE                 = 1;
constexpr int EXIT_SESSION_NOT_FOUND     = 2;
constexpr int EXIT_COMMAND_TIMEOUT       = 3;
