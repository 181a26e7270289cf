#include "auth.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>

AgentAuth::AgentAuth(LIBSSH2_SESSION* session)
    : session_(session) {}

AgentAuth::~AgentAuth() {
    if (agent_) {
        if (connected_) libssh2_agent_disconnect(agent_);
        libssh2_agent_free(agent_);
    }
}

Result<void> AgentAuth::connect(const std::string& socket_path) {
    agent_ = libssh2_agent_init(session_);
    if (!agent_) {
        return Result<void>::Err(ErrorKind::Connect, "failed to initialize ssh-agent support");
    }

    libssh2_agent_set_identity_path(agent_, socket_path.c_str());

    int rc;
    while ((rc = libssh2_agent_connect(agent_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::Connect,
            fmt::format("failed to connect to ssh-agent at {}", socket_path));
    }
    connected_ = true;

    while ((rc = libssh2_agent_list_identities(agent_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::Connect, "failed to list ssh-agent identities");
    }

    struct libssh2_agent_publickey* identity = nullptr;
    struct libssh2_agent_publickey* prev = nullptr;
    identities_ = 0;
    while (libssh2_agent_get_identity(agent_, &identity, prev) == 0) {
        ++identities_;
        prev = identity;
    }

    if (identities_ == 0) {
        return Result<void>::Err(ErrorKind::Connect, "ssh-agent holds no identities");
    }
    return Result<void>::Ok();
}

Result<void> AgentAuth::authenticate(const std::string& user, Deadline deadline) {
    if (!agent_ || !connected_) {
        return Result<void>::Err(ErrorKind::Connect, "ssh-agent not connected");
    }

    struct libssh2_agent_publickey* identity = nullptr;
    struct libssh2_agent_publickey* prev = nullptr;
    while (libssh2_agent_get_identity(agent_, &identity, prev) == 0) {
        int rc;
        while ((rc = libssh2_agent_userauth(agent_, user.c_str(), identity)) == LIBSSH2_ERROR_EAGAIN) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return Result<void>::Err(ErrorKind::Connect, "authentication timed out");
            }
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        }
        if (rc == 0) {
            fleet_log(fmt::format("auth: {} accepted key {}", user,
                                  identity->comment ? identity->comment : "(no comment)"));
            return Result<void>::Ok();
        }
        prev = identity;
    }

    return Result<void>::Err(ErrorKind::Connect,
        fmt::format("ssh: handshake failed: ssh: unable to authenticate {} "
                    "(no agent key accepted)", user));
}
