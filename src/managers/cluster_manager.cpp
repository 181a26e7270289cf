#include "cluster_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/scp_transfer.hpp>
#include <fmt/format.h>
#include <algorithm>

ClusterManager::ClusterManager(const Config& config, ConnectionPool& pool, StatusCallback out)
    : config_(config), pool_(pool), out_(std::move(out)),
      executor_([this](int slot) { return slot_host(slot); }) {}

// ── Naming ──────────────────────────────────────────────────

std::string ClusterManager::host(int index) const {
    const auto& c = config_.cluster();
    return format_host_name(c.host_pattern, c.name, index);
}

std::string ClusterManager::slot_host(int slot) const {
    if (slot > count()) return host(config_.load_node());
    return host(slot);
}

Target ClusterManager::target(const std::string& host) const {
    return Target{config_.cluster().user, host};
}

void ClusterManager::print(const std::string& s) const {
    if (out_) out_(s);
}

// ── Helpers ─────────────────────────────────────────────────

Result<std::string> ClusterManager::run_on(const std::string& host, const std::string& cmd) {
    auto session = pool_.get_session(target(host));
    if (session.is_err()) return Result<std::string>::Err(session);
    return command_output(*session.value, cmd);
}

Result<void> ClusterManager::fan_out(const std::string& verb, int from, int to,
                                     const ParallelExecutor::HostOperation& op,
                                     FanOutReport* report) {
    print(fmt::format("{}: {}", name(), verb));

    ParallelExecutor::Observer observer;
    observer.on_success = [this](int index) { print(fmt::format(" {}", index)); };
    observer.on_failure = [this](const std::string& host, const std::string& error) {
        print(fmt::format("\n{}: {}\n", host, error));
    };

    auto r = executor_.execute(from, to, op, observer);
    print("\n");

    if (report) *report = r;
    return r.to_result();
}

// ── Node lifecycle ──────────────────────────────────────────

std::string ClusterManager::start_command(const std::string& host,
                                          const std::string& join_host) const {
    std::string args = fmt::format("--insecure --store=path={} --log-dir={} --background",
                                   NODE_STORE_DIR, NODE_LOG_DIR);
    if (host != join_host) {
        args += " --join=" + join_host;
    }
    return fmt::format("{} ./{} start {}> logs/{}.stdout 2> logs/{}.stderr",
                       NODE_START_ENV, NODE_PROCESS, args, NODE_PROCESS, NODE_PROCESS);
}

Result<void> ClusterManager::start() {
    std::string join_host = host(1);
    return fan_out("starting", 1, count(), [this, join_host](const std::string& h) {
        return run_on(h, start_command(h, join_host));
    });
}

Result<void> ClusterManager::stop() {
    return fan_out("stopping", 1, count() + 1, [this](const std::string& h) {
        return run_on(h, NODE_STOP_COMMAND);
    });
}

Result<void> ClusterManager::wipe() {
    auto r = stop_load();
    if (r.is_err()) return r;

    return fan_out("wiping", 1, count() + 1, [this](const std::string& h) {
        return run_on(h, NODE_WIPE_COMMAND);
    });
}

std::vector<std::string> ClusterManager::status() {
    std::string load_host = host(config_.load_node());

    // Every unit succeeds; its output is the status text
    auto report = executor_.execute(1, count() + 1, [this, load_host](const std::string& h) {
        std::string proc = (h == load_host) ? LOAD_PROCESS : NODE_PROCESS;

        auto session = pool_.get_session(target(h));
        if (session.is_err()) return Result<std::string>::Ok(session.error);

        auto r = session.value->output(fmt::format("pidof {}", proc));
        if (r.is_err()) return Result<std::string>::Ok(r.error);
        if (r.value.success()) {
            std::string pids = r.value.stdout_data;
            trim(pids);
            return Result<std::string>::Ok(fmt::format("{} running {}", proc, pids));
        }
        if (r.value.exit_signal.empty()) {
            return Result<std::string>::Ok(proc + " not running");
        }
        return Result<std::string>::Ok(check_command(r.value).error);
    });

    std::sort(report.results.begin(), report.results.end(),
              [](const ExecutionResult& a, const ExecutionResult& b) { return a.index < b.index; });

    std::vector<std::string> lines;
    for (const auto& r : report.results) {
        std::string text = r.ok() ? r.output : r.error;
        lines.push_back(fmt::format("{} {}: {}", name(), r.index, text));
    }
    return lines;
}

// ── Load generator ──────────────────────────────────────────

Result<void> ClusterManager::run_load() {
    std::string load_host = host(config_.load_node());
    auto session = pool_.get_session(target(load_host));
    if (session.is_err()) return Result<void>::Err(session);

    const auto& load = config_.load_settings();
    print(load.command + "\n");

    auto r = session.value->stream(load.command + " " + load.url,
                                   [this](const char* data, size_t len) {
        print(std::string(data, len));
    });
    if (r.is_err()) return Result<void>::Err(r);

    if (!r.value.stderr_data.empty()) print(r.value.stderr_data);

    if (is_sigkill(r.value)) {
        fleet_log(fmt::format("load on {} killed", load_host));
        return Result<void>::Ok();
    }
    return check_command(r.value);
}

Result<void> ClusterManager::stop_load() {
    std::string load_host = host(config_.load_node());
    print(fmt::format("{}: stopping load\n", name()));

    auto r = run_on(load_host, LOAD_STOP_COMMAND);
    if (r.is_err()) return Result<void>::Err(r);
    return Result<void>::Ok();
}

Result<void> ClusterManager::run_all() {
    auto r = wipe();
    if (r.is_err()) return r;
    r = start();
    if (r.is_err()) return r;
    r = run_load();
    if (r.is_err()) return r;
    return stop();
}

// ── Files & commands ────────────────────────────────────────

Result<void> ClusterManager::push(const std::filesystem::path& local, const std::string& remote) {
    std::string dest = remote.empty() ? base_name(local) : remote;
    return fan_out(fmt::format("pushing {}", base_name(local)), 1, count() + 1,
                   [this, &local, &dest](const std::string& h) {
        auto r = scp_put(pool_, target(h), local, dest);
        if (r.is_err()) return Result<std::string>::Err(r);
        return Result<std::string>::Ok("");
    });
}

Result<void> ClusterManager::get(int index, const std::string& remote,
                                 const std::filesystem::path& local,
                                 ProgressCallback progress) {
    if (index < 1 || index > count() + 1) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("node index {} out of range 1..{}", index, count() + 1));
    }
    return scp_get(pool_, target(slot_host(index)), remote, local, std::move(progress));
}

Result<void> ClusterManager::exec(const std::string& command) {
    FanOutReport report;
    auto r = fan_out("running", 1, count() + 1, [this, &command](const std::string& h) {
        return run_on(h, command);
    }, &report);

    std::sort(report.results.begin(), report.results.end(),
              [](const ExecutionResult& a, const ExecutionResult& b) { return a.index < b.index; });
    for (const auto& res : report.results) {
        if (!res.ok() || res.output.empty()) continue;
        std::string out = res.output;
        if (out.back() != '\n') out += '\n';
        print(fmt::format("{} {}:\n{}", name(), res.index, out));
    }
    return r;
}
