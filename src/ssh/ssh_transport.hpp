#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "host_verifier.hpp"
#include "session.hpp"
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// A live libssh2 session and its socket.
//
// Shared by the transport and every channel opened on it, so sessions
// handed out before the pool shuts down keep the connection alive until
// they are dropped. libssh2 is not thread-safe per session: every call
// goes through io_mutex, and the session runs non-blocking so the lock is
// never held across a network wait.
struct SshLink {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = FLEET_INVALID_SOCKET;
    std::mutex io_mutex;
    std::string target;

    SshLink() = default;
    ~SshLink();

    SshLink(const SshLink&) = delete;
    SshLink& operator=(const SshLink&) = delete;

    // Last libssh2 error message. Caller holds io_mutex.
    std::string last_error() const;
};

class SshSession : public Session {
public:
    SshSession(std::shared_ptr<SshLink> link, LIBSSH2_CHANNEL* channel);
    ~SshSession() override;

    Result<void> start(const std::string& command) override;
    Result<void> write_stdin(const char* data, size_t len) override;
    Result<void> close_stdin() override;
    Result<size_t> read_stdout(char* buf, size_t len) override;
    void attach_stdout() override { stdout_attached_ = true; }
    void detach_stdout() override { stdout_attached_ = false; }
    SSHResult wait() override;

private:
    std::shared_ptr<SshLink> link_;
    LIBSSH2_CHANNEL* channel_;
    std::atomic<bool> stdout_attached_{false};
    std::atomic<bool> stdin_closed_{false};
    std::string command_;
};

class SshTransport : public Transport {
public:
    explicit SshTransport(std::shared_ptr<SshLink> link);

    Result<std::unique_ptr<Session>> open_session() override;

private:
    std::shared_ptr<SshLink> link_;
};

// Dials user@host:port and authenticates through the local ssh-agent,
// checking the server key with the HostVerifier it was built with.
class SshConnector : public Connector {
public:
    struct Options {
        int port = 22;
        int connect_timeout_secs = 30;
        std::string agent_socket_env = "SSH_AUTH_SOCK";
    };

    SshConnector(const HostVerifier& verifier, Options options);

    Result<std::unique_ptr<Transport>> connect(const Target& target) override;

private:
    const HostVerifier& verifier_;
    Options options_;
};
