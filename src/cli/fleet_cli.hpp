#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <ssh/connection_pool.hpp>
#include <ssh/host_verifier.hpp>
#include <ssh/ssh_transport.hpp>
#include <managers/cluster_manager.hpp>

// Command-line front end: parses argv, builds the verifier, connector,
// pool and cluster manager, and dispatches one command.
class FleetCLI {
public:
    FleetCLI();
    ~FleetCLI();

    using Args = std::vector<std::string>;
    using CommandHandler = std::function<Result<void>(FleetCLI&, const Args&)>;

    // Returns the process exit code.
    int run(int argc, char** argv);

    void print_usage() const;

private:
    struct Command {
        CommandHandler handler;
        std::string args;
        std::string help;
    };

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& args, const std::string& help);
    void register_all_commands();

    // Load config and build the connection stack.
    Result<void> init(bool insecure);

    // run_load with SIGINT/SIGTERM/SIGQUIT stopping the remote load
    Result<void> run_load_interruptible();

    // Thread-safe write to stdout
    void write(const std::string& s);

    Result<void> cmd_start(const Args& args);
    Result<void> cmd_stop(const Args& args);
    Result<void> cmd_wipe(const Args& args);
    Result<void> cmd_status(const Args& args);
    Result<void> cmd_run(const Args& args);
    Result<void> cmd_stop_load(const Args& args);
    Result<void> cmd_push(const Args& args);
    Result<void> cmd_get(const Args& args);
    Result<void> cmd_exec(const Args& args);

    std::map<std::string, Command> commands_;
    std::vector<std::string> order_;   // registration order for usage
    std::mutex out_mutex_;

    std::optional<Config> config_;
    HostVerifier verifier_;
    std::unique_ptr<SshConnector> connector_;
    std::unique_ptr<ConnectionPool> pool_;
    std::unique_ptr<ClusterManager> cluster_;
};
