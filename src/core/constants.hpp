#pragma once

#include <cstddef>

// ── SSH transport ───────────────────────────────────────────
constexpr int SSH_DEFAULT_PORT           = 22;
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP dial bound
constexpr int SSH_CHANNEL_OPEN_SECS      = 30;    // Max wait for a channel open / exec
constexpr int SSH_EAGAIN_SLEEP_MS        = 10;    // Back-off between EAGAIN retries
constexpr int SSH_HANDSHAKE_SLEEP_MS     = 50;
constexpr int SSH_WRITE_STALL_MS         = 60000; // Write with no window progress
constexpr const char* SSH_AUTH_SOCK_ENV  = "SSH_AUTH_SOCK";

// ── Buffer sizes ────────────────────────────────────────────
constexpr std::size_t SSH_READ_BUF_SIZE  = 16384;
constexpr std::size_t SCP_COPY_BUF_SIZE  = 32768;
constexpr std::size_t SCP_MAX_LINE       = 4096;   // Longest control/status line accepted

// ── Remote copy commands ────────────────────────────────────
// fmt::format(SCP_SINK_COMMAND, dest, dest)
constexpr const char* SCP_SINK_COMMAND   = "rm -f {} ; scp -t {}";
// fmt::format(SCP_SOURCE_COMMAND, src)
constexpr const char* SCP_SOURCE_COMMAND = "scp -qrf {}";

// ── Cluster commands ────────────────────────────────────────
constexpr const char* NODE_START_ENV     = "GOGC=200 COCKROACH_ENABLE_RPC_COMPRESSION=false";
constexpr const char* NODE_STORE_DIR     = "/mnt/data1/cockroach";
constexpr const char* NODE_LOG_DIR       = "/home/cockroach/logs";
constexpr const char* NODE_STOP_COMMAND  = R"(sudo pkill -9 "cockroach|java|mongo|kv" || true)";
constexpr const char* LOAD_STOP_COMMAND  = "sudo pkill -9 kv || true";
constexpr const char* NODE_WIPE_COMMAND  = R"(
sudo pkill -9 "cockroach|java|mongo|kv" || true ;
sudo find /mnt/data* -maxdepth 1 -type f -exec rm -f {} \; ;
sudo rm -fr /mnt/data*/{auxiliary,local,tmp,cassandra,cockroach,mongo-data} \; ;
sudo find /home/cockroach/logs -type f -not -name supervisor.log -exec rm -f {} \; ;
)";
constexpr const char* NODE_PROCESS       = "cockroach";
constexpr const char* LOAD_PROCESS       = "kv";

// ── CLI ─────────────────────────────────────────────────────
constexpr const char* FLEET_VERSION      = "0.1.0";
constexpr int INTERRUPT_POLL_MS          = 100;
