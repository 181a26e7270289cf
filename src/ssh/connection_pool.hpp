#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "session.hpp"
#include "transport.hpp"

// ConnectionPool: one authenticated transport per user@host, shared by
// every session opened against that target.
//
// The first get_session() for a target dials and authenticates through the
// connector; later calls reuse the cached transport and only open a new
// channel. A failed connect leaves the entry empty so the next call starts
// over. Cached transports are never health-checked: a connection that died
// underneath surfaces as ErrorKind::Session on the next open, and is not
// replaced.
//
// Locking: the map lock covers lookup/insert only. Each entry has its own
// lock held for the whole get_session() call, so calls for one target run
// one at a time while different targets proceed in parallel.
class ConnectionPool {
public:
    explicit ConnectionPool(Connector& connector);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Result<std::unique_ptr<Session>> get_session(const std::string& user,
                                                 const std::string& host);
    Result<std::unique_ptr<Session>> get_session(const Target& target);

    // Drop every cached transport. Sessions already handed out stay usable
    // until their owners release them.
    void close_all();

    // Number of targets with an entry (connected or not).
    size_t size() const;

    // True if a transport is cached for target.
    bool is_connected(const Target& target) const;

private:
    struct PooledConnection {
        std::mutex mutex;
        std::unique_ptr<Transport> transport;
    };

    Connector& connector_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<PooledConnection>> connections_;

    std::shared_ptr<PooledConnection> entry_for(const Target& target);
};
