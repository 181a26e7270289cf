#pragma once

#include <memory>
#include <core/types.hpp>
#include "session.hpp"

// An authenticated connection to one Target. Hands out sessions; each
// session is a new channel multiplexed over the same connection.
class Transport {
public:
    virtual ~Transport() = default;

    // Open a channel. ErrorKind::Session on failure; a dead connection
    // is reported here, not repaired.
    virtual Result<std::unique_ptr<Session>> open_session() = 0;
};

// Establishes transports. The production connector speaks SSH via libssh2;
// tests provide in-process fakes.
class Connector {
public:
    virtual ~Connector() = default;

    // ErrorKind::Connect on any failure (agent, dial, handshake, host key, auth).
    virtual Result<std::unique_ptr<Transport>> connect(const Target& target) = 0;
};
