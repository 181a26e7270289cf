#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/connection_pool.hpp>
#include "parallel_executor.hpp"

// Cluster operations built on the pool, the fan-out executor and the
// transfer engine.
//
// Nodes are indexed 1..count. Fan-outs that cover the load generator use
// slot count + 1, which resolves to the configured load node.
//
// Progress text ("denim: starting 1 3 2 ...") goes to the output callback,
// one fragment per call with no implied newline.
class ClusterManager {
public:
    ClusterManager(const Config& config, ConnectionPool& pool, StatusCallback out);

    // Host name for a node index.
    std::string host(int index) const;

    // Host name for a fan-out slot; slot count + 1 is the load node.
    std::string slot_host(int slot) const;

    const std::string& name() const { return config_.cluster().name; }
    int count() const { return config_.cluster().count; }

    // ── Node lifecycle ──────────────────────────────────────
    Result<void> start();
    Result<void> stop();
    Result<void> wipe();

    // One line per node plus the load node, in index order.
    std::vector<std::string> status();

    // ── Load generator ──────────────────────────────────────
    // Streams the load command's output to the output callback.
    // A SIGKILL termination (from stop_load) is a clean stop.
    Result<void> run_load();
    Result<void> stop_load();

    // wipe, start, run_load, stop
    Result<void> run_all();

    // ── Files & commands ────────────────────────────────────
    // Upload local to every node and the load node. remote defaults to
    // the file's base name in the remote user's home directory.
    Result<void> push(const std::filesystem::path& local, const std::string& remote = "");

    // Download remote from the node at index.
    Result<void> get(int index, const std::string& remote, const std::filesystem::path& local,
                     ProgressCallback progress = nullptr);

    // Run command on every node and the load node; output in index order.
    Result<void> exec(const std::string& command);

    // Remote command line that starts one node joined to join_host.
    std::string start_command(const std::string& host, const std::string& join_host) const;

private:
    const Config& config_;
    ConnectionPool& pool_;
    StatusCallback out_;
    ParallelExecutor executor_;

    Target target(const std::string& host) const;
    void print(const std::string& s) const;

    // Run cmd on host; Ok(stdout) when it exits 0
    Result<std::string> run_on(const std::string& host, const std::string& cmd);

    // Announce "<name>: <verb>", fan out over [from, to], acknowledge
    // each success with its index.
    Result<void> fan_out(const std::string& verb, int from, int to,
                         const ParallelExecutor::HostOperation& op,
                         FanOutReport* report = nullptr);
};
