#pragma once

#include <chrono>
#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_AGENT LIBSSH2_AGENT;

// Public-key authentication through the local ssh-agent.
//
// The agent holds the private keys; libssh2 forwards the server's
// challenge to it for signing. Usage:
//
//   AgentAuth agent(session);
//   agent.connect(socket_path);          // dial agent, list identities
//   ... TCP dial + handshake ...
//   agent.authenticate(user, deadline);  // try identities in order
//
class AgentAuth {
public:
    using Deadline = std::chrono::steady_clock::time_point;

    explicit AgentAuth(LIBSSH2_SESSION* session);
    ~AgentAuth();

    AgentAuth(const AgentAuth&) = delete;
    AgentAuth& operator=(const AgentAuth&) = delete;

    // Dial the agent at socket_path and fetch its identities.
    // ErrorKind::Connect if the agent is unreachable or holds no keys.
    Result<void> connect(const std::string& socket_path);

    // Offer each identity until the server accepts one.
    Result<void> authenticate(const std::string& user, Deadline deadline);

    int identity_count() const { return identities_; }

private:
    LIBSSH2_SESSION* session_;
    LIBSSH2_AGENT* agent_ = nullptr;
    bool connected_ = false;
    int identities_ = 0;
};
