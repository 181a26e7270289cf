#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.fleet/config.yaml, then overlay ./fleet.yaml key by key.
    // Missing files are skipped; malformed files are an error.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Overlay the given files in order on top of the defaults.
    static Result<Config> load_files(const std::vector<fs::path>& files);

    // Accessors
    const ClusterConfig& cluster() const { return cluster_; }
    const SshConfig& ssh() const { return ssh_; }
    const LoadConfig& load_settings() const { return load_; }
    const std::string& log_path() const { return log_path_; }

    // Index of the load-generator node (cluster.load_node, else count + 1)
    int load_node() const;

    // Resolved trust-store path
    fs::path known_hosts_path() const;

    // --insecure on the command line
    void set_strict_host_key_checking(bool strict) { ssh_.strict_host_key_checking = strict; }

public:
    Config() = default;

private:
    Result<void> overlay_file(const fs::path& path);

    ClusterConfig cluster_;
    SshConfig ssh_;
    LoadConfig load_;
    std::string log_path_;
};

// Expand a host_pattern ("cockroach-{cluster}-{index:04d}.crdb.io").
// Throws fmt::format_error for a malformed pattern; Config validates
// patterns on load.
std::string format_host_name(const std::string& pattern, const std::string& cluster, int index);

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());
