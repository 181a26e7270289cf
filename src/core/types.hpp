#pragma once

#include <string>
#include <optional>
#include <functional>
#include <cstdint>

// What went wrong, coarse enough for callers to branch on.
enum class ErrorKind {
    None,
    Connect,           // agent, dial, handshake, host identity
    Session,           // channel open / exec on a cached connection
    RemoteCommand,     // non-zero exit or termination signal
    TransferProtocol,  // scp framing, short read/write, remote status byte
    FanOut,            // one or more units of a batch failed
    IO,                // local file errors
    Config,            // configuration or trust store
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:             return "ok";
    case ErrorKind::Connect:          return "connect";
    case ErrorKind::Session:          return "session";
    case ErrorKind::RemoteCommand:    return "remote command";
    case ErrorKind::TransferProtocol: return "transfer protocol";
    case ErrorKind::FanOut:           return "fan-out";
    case ErrorKind::IO:               return "io";
    case ErrorKind::Config:           return "config";
    }
    return "unknown";
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    ErrorKind kind;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ErrorKind::None, ""};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, kind, err};
    }

    // Forward the error of another result unchanged
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.kind, other.error};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    ErrorKind kind;
    std::string error;

    static Result<void> Ok() {
        return {true, ErrorKind::None, ""};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, kind, err};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.kind, other.error};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;
    std::string exit_signal;   // e.g. "KILL" when terminated by a signal

    bool success() const { return exit_code == 0 && exit_signal.empty(); }
};

// Remote endpoint; the connection pool is keyed on user@host.
struct Target {
    std::string user;
    std::string host;

    std::string key() const { return user + "@" + host; }
};

// Configuration structures
struct ClusterConfig {
    std::string name = "denim";
    int count = 6;
    std::string user = "cockroach";
    std::string host_pattern = "cockroach-{cluster}-{index:04d}.crdb.io";
    std::optional<int> load_node;   // defaults to count + 1
};

struct SshConfig {
    int port = 22;
    int connect_timeout = 30;
    bool strict_host_key_checking = true;
    std::string known_hosts;        // empty -> ~/.ssh/known_hosts
    std::string agent_socket_env = "SSH_AUTH_SOCK";
};

struct LoadConfig {
    std::string command = "./kv --duration=1m --read-percent=95 --concurrency=10 --splits=10";
    std::string url = "'postgres://root@localhost:27183/test?sslmode=disable'";
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Transfer progress in [0, 1]
using ProgressCallback = std::function<void(double)>;
