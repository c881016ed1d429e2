#pragma once

#include <cstddef>
#include <cstdint>

// ── Exit codes ──────────────────────────────────────────────
// Picked above the range shells reserve for themselves (126+, 128+n).
constexpr int CODE_SUCCESS               = 0;
constexpr int CODE_ERROR                 = 100;   // Lock, I/O or connection failure
constexpr int CODE_CMD_ERROR             = 101;   // Command handler threw

// ── Lock file layout ────────────────────────────────────────
constexpr int64_t LOCK_DATA_OFFSET       = 0;     // Port number, big-endian int32
constexpr int64_t LOCK_DATA_LENGTH       = 4;
constexpr int64_t LOCK_INSTANCE_OFFSET   = 4;     // Sentinel byte, never read
constexpr int64_t LOCK_INSTANCE_LENGTH   = 1;
constexpr int LOCK_STALE_RETRIES         = 5;     // Re-opens when the file vanished under us

// ── Wire protocol ───────────────────────────────────────────
constexpr std::size_t INT_SIZE           = 4;
constexpr int32_t MAX_ARGC               = 65536;
constexpr std::size_t DEFAULT_MAX_STRING_BYTES = 16 * 1024 * 1024;

// ── Listener / forwarding ───────────────────────────────────
constexpr int DEFAULT_SERVER_BACKLOG     = 10;
constexpr int DEFAULT_DRAIN_TIMEOUT_MS   = 5000;  // Follower wait for the stdin pump
constexpr std::size_t DEFAULT_PUMP_BUFFER_SIZE = 8192;
constexpr int ACCEPT_POLL_MS             = 500;   // Acceptor wakes this often to check for stop
constexpr int ACCEPT_RETRY_DELAY_MS      = 50;    // Back-off after a failed accept()

// ── Messages ────────────────────────────────────────────────
constexpr const char* MSG_STOPPING       = "Program is stopping";
