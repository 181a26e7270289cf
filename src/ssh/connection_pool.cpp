#include "connection_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ConnectionPool::ConnectionPool(Connector& connector)
    : connector_(connector) {}

ConnectionPool::~ConnectionPool() {
    close_all();
}

std::shared_ptr<ConnectionPool::PooledConnection>
ConnectionPool::entry_for(const Target& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = connections_[target.key()];
    if (!entry) {
        entry = std::make_shared<PooledConnection>();
    }
    return entry;
}

Result<std::unique_ptr<Session>> ConnectionPool::get_session(const std::string& user,
                                                             const std::string& host) {
    return get_session(Target{user, host});
}

Result<std::unique_ptr<Session>> ConnectionPool::get_session(const Target& target) {
    auto entry = entry_for(target);

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!entry->transport) {
        fleet_log(fmt::format("pool: connecting to {}", target.key()));
        auto connected = connector_.connect(target);
        if (connected.is_err()) {
            fleet_log(fmt::format("pool: connect to {} failed: {}", target.key(), connected.error));
            return Result<std::unique_ptr<Session>>::Err(connected);
        }
        entry->transport = std::move(connected.value);
    }

    return entry->transport->open_session();
}

void ConnectionPool::close_all() {
    std::map<std::string, std::shared_ptr<PooledConnection>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.swap(connections_);
    }

    // Wait out any in-flight get_session on each entry before dropping it
    for (auto& kv : entries) {
        std::lock_guard<std::mutex> lock(kv.second->mutex);
        kv.second->transport.reset();
    }
    if (!entries.empty()) {
        fleet_log(fmt::format("pool: closed {} connection(s)", entries.size()));
    }
}

size_t ConnectionPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

bool ConnectionPool::is_connected(const Target& target) const {
    std::shared_ptr<PooledConnection> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(target.key());
        if (it == connections_.end()) return false;
        entry = it->second;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->transport != nullptr;
}
