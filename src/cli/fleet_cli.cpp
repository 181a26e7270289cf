#include "fleet_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/interrupt.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <atomic>
#include <iostream>
#include <thread>

FleetCLI::FleetCLI() {
    register_all_commands();
}

FleetCLI::~FleetCLI() {
    if (pool_) pool_->close_all();
}

void FleetCLI::add_command(const std::string& name, CommandHandler handler,
                           const std::string& args, const std::string& help) {
    commands_[name] = {std::move(handler), args, help};
    order_.push_back(name);
}

void FleetCLI::register_all_commands() {
    add_command("run", &FleetCLI::cmd_run, "", "Wipe, start, run load, stop (default)");
    add_command("start", &FleetCLI::cmd_start, "", "Start every node");
    add_command("stop", &FleetCLI::cmd_stop, "", "Kill node and load processes");
    add_command("wipe", &FleetCLI::cmd_wipe, "", "Stop load, kill and wipe every node");
    add_command("status", &FleetCLI::cmd_status, "", "Show process status per node");
    add_command("stop-load", &FleetCLI::cmd_stop_load, "", "Kill the load generator");
    add_command("push", &FleetCLI::cmd_push, "<local> [remote]", "Upload a file to every node");
    add_command("get", &FleetCLI::cmd_get, "<index> <remote> <local>", "Download a file from one node");
    add_command("exec", &FleetCLI::cmd_exec, "<command>", "Run a command on every node");
}

void FleetCLI::print_usage() const {
    std::cout << theme::section("Usage");
    for (const auto& name : order_) {
        const auto& cmd = commands_.at(name);
        std::cout << theme::usage_row(name, cmd.args, cmd.help);
    }
    std::cout << "\n" << theme::color::DIM
              << "    --insecure      Accept any host key\n"
              << "    --version       Show version\n"
              << "    --help          Show this help"
              << theme::color::RESET << "\n\n";
}

void FleetCLI::write(const std::string& s) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    std::cout << s << std::flush;
}

// ── Setup ───────────────────────────────────────────────────

Result<void> FleetCLI::init(bool insecure) {
    auto loaded = Config::load();
    if (loaded.is_err()) return Result<void>::Err(loaded);
    config_ = loaded.value;

    if (!config_->log_path().empty()) {
        set_fleet_log_path(expand_home(config_->log_path()).string());
    }
    if (insecure) {
        config_->set_strict_host_key_checking(false);
    }

    if (config_->ssh().strict_host_key_checking) {
        auto v = HostVerifier::strict(config_->known_hosts_path());
        if (v.is_err()) return Result<void>::Err(v);
        verifier_ = v.value;
    } else {
        verifier_ = HostVerifier::permissive();
    }

    SshConnector::Options options;
    options.port = config_->ssh().port;
    options.connect_timeout_secs = config_->ssh().connect_timeout;
    options.agent_socket_env = config_->ssh().agent_socket_env;

    connector_ = std::make_unique<SshConnector>(verifier_, options);
    pool_ = std::make_unique<ConnectionPool>(*connector_);
    cluster_ = std::make_unique<ClusterManager>(*config_, *pool_,
        [this](const std::string& s) { write(s); });

    fleet_log(fmt::format("fleet: cluster {} ({} nodes), host keys {}",
                          config_->cluster().name, config_->cluster().count,
                          verifier_.is_strict() ? "checked" : "not checked"));
    return Result<void>::Ok();
}

// ── Dispatch ────────────────────────────────────────────────

int FleetCLI::run(int argc, char** argv) {
    bool insecure = false;
    Args args;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--insecure") {
            insecure = true;
        } else if (a == "--help" || a == "-h") {
            print_usage();
            return 0;
        } else if (a == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "fleet"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << FLEET_VERSION << theme::color::RESET << "\n";
            return 0;
        } else {
            args.push_back(a);
        }
    }

    std::string name = args.empty() ? "run" : args.front();
    if (!args.empty()) args.erase(args.begin());

    auto it = commands_.find(name);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + name);
        print_usage();
        return 1;
    }

    auto r = init(insecure);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }

    fleet_log(fmt::format("fleet: {}", name));
    r = it->second.handler(*this, args);
    pool_->close_all();

    if (r.is_err()) {
        fleet_log(fmt::format("fleet: {} failed ({}): {}", name, error_kind_name(r.kind), r.error));
        // Fan-out failures were already reported host by host
        if (r.kind == ErrorKind::FanOut) {
            std::cout << theme::fail("failed");
        } else {
            std::cout << theme::fail(r.error);
        }
        return 1;
    }
    return 0;
}

// ── Commands ────────────────────────────────────────────────

Result<void> FleetCLI::cmd_start(const Args&) {
    return cluster_->start();
}

Result<void> FleetCLI::cmd_stop(const Args&) {
    return cluster_->stop();
}

Result<void> FleetCLI::cmd_wipe(const Args&) {
    return cluster_->wipe();
}

Result<void> FleetCLI::cmd_status(const Args&) {
    for (const auto& line : cluster_->status()) {
        write(line + "\n");
    }
    return Result<void>::Ok();
}

Result<void> FleetCLI::run_load_interruptible() {
    platform::InterruptGuard guard;
    std::atomic<bool> done{false};

    std::thread watcher([this, &guard, &done] {
        while (!done) {
            if (guard.triggered()) {
                guard.reset();
                auto r = cluster_->stop_load();
                if (r.is_err()) write(theme::fail(r.error));
            }
            platform::sleep_ms(INTERRUPT_POLL_MS);
        }
    });

    auto r = cluster_->run_load();
    done = true;
    watcher.join();
    return r;
}

Result<void> FleetCLI::cmd_run(const Args&) {
    auto r = cluster_->wipe();
    if (r.is_err()) return r;
    r = cluster_->start();
    if (r.is_err()) return r;
    r = run_load_interruptible();
    if (r.is_err()) return r;
    return cluster_->stop();
}

Result<void> FleetCLI::cmd_stop_load(const Args&) {
    return cluster_->stop_load();
}

Result<void> FleetCLI::cmd_push(const Args& args) {
    if (args.empty() || args.size() > 2) {
        return Result<void>::Err(ErrorKind::Config, "usage: fleet push <local> [remote]");
    }
    return cluster_->push(args[0], args.size() == 2 ? args[1] : "");
}

Result<void> FleetCLI::cmd_get(const Args& args) {
    if (args.size() != 3) {
        return Result<void>::Err(ErrorKind::Config, "usage: fleet get <index> <remote> <local>");
    }
    int index = safe_stoi(args[0], -1);
    std::string label = base_name(args[1]);

    auto r = cluster_->get(index, args[1], args[2], [this, &label](double fraction) {
        write(theme::progress(label, fraction));
    });
    write("\n");
    if (r.is_ok()) write(theme::ok(fmt::format("{} -> {}", args[1], args[2])));
    return r;
}

Result<void> FleetCLI::cmd_exec(const Args& args) {
    if (args.empty()) {
        return Result<void>::Err(ErrorKind::Config, "usage: fleet exec <command>");
    }
    std::string command;
    for (const auto& a : args) {
        if (!command.empty()) command += ' ';
        command += a;
    }
    return cluster_->exec(command);
}
