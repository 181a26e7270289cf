#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".fleet";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "fleet.yaml";
}

std::string format_host_name(const std::string& pattern, const std::string& cluster, int index) {
    return fmt::format(fmt::runtime(pattern), fmt::arg("cluster", cluster), fmt::arg("index", index));
}

// Present keys must convert; absent keys keep the current value.
template <typename T>
static T get_or(const YAML::Node& node, const char* key, const T& current) {
    const YAML::Node value = node[key];
    return value ? value.as<T>() : current;
}

// Each parser starts from the current values so later files only
// override the keys they mention.
static ClusterConfig parse_cluster_config(const YAML::Node& node, ClusterConfig cluster) {
    cluster.name = get_or<std::string>(node, "name", cluster.name);
    cluster.count = get_or<int>(node, "count", cluster.count);
    cluster.user = get_or<std::string>(node, "user", cluster.user);
    cluster.host_pattern = get_or<std::string>(node, "host_pattern", cluster.host_pattern);

    if (node["load_node"]) {
        cluster.load_node = node["load_node"].as<int>();
    }

    return cluster;
}

static SshConfig parse_ssh_config(const YAML::Node& node, SshConfig ssh) {
    ssh.port = get_or<int>(node, "port", ssh.port);
    ssh.connect_timeout = get_or<int>(node, "connect_timeout", ssh.connect_timeout);
    ssh.strict_host_key_checking =
        get_or<bool>(node, "strict_host_key_checking", ssh.strict_host_key_checking);
    ssh.known_hosts = get_or<std::string>(node, "known_hosts", ssh.known_hosts);
    ssh.agent_socket_env = get_or<std::string>(node, "agent_socket_env", ssh.agent_socket_env);
    return ssh;
}

static LoadConfig parse_load_config(const YAML::Node& node, LoadConfig load) {
    load.command = get_or<std::string>(node, "command", load.command);
    load.url = get_or<std::string>(node, "url", load.url);
    return load;
}

Result<void> Config::overlay_file(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) {
            return Result<void>::Ok();   // empty file
        }
        if (!root.IsMap()) {
            return Result<void>::Err(ErrorKind::Config,
                fmt::format("{}: top level must be a mapping", path.string()));
        }

        if (root["cluster"]) cluster_ = parse_cluster_config(root["cluster"], cluster_);
        if (root["ssh"]) ssh_ = parse_ssh_config(root["ssh"], ssh_);
        if (root["load"]) load_ = parse_load_config(root["load"], load_);
        if (root["log"]) log_path_ = get_or<std::string>(root["log"], "path", log_path_);
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }

    if (cluster_.count < 1) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("{}: cluster.count must be at least 1", path.string()));
    }
    if (cluster_.load_node && *cluster_.load_node < 1) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("{}: cluster.load_node must be at least 1", path.string()));
    }
    try {
        (void)format_host_name(cluster_.host_pattern, cluster_.name, 1);
    } catch (const fmt::format_error& e) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("{}: bad cluster.host_pattern \"{}\": {}",
                        path.string(), cluster_.host_pattern, e.what()));
    }
    if (ssh_.connect_timeout < 1) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("{}: ssh.connect_timeout must be positive", path.string()));
    }
    return Result<void>::Ok();
}

Result<Config> Config::load_files(const std::vector<fs::path>& files) {
    Config config;
    for (const auto& path : files) {
        std::error_code ec;
        if (!fs::exists(path, ec)) continue;

        auto r = config.overlay_file(path);
        if (r.is_err()) return Result<Config>::Err(r);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& project_dir) {
    return load_files({get_global_config_path(), get_project_config_path(project_dir)});
}

int Config::load_node() const {
    return cluster_.load_node.value_or(cluster_.count + 1);
}

fs::path Config::known_hosts_path() const {
    if (ssh_.known_hosts.empty()) {
        return platform::home_dir() / ".ssh" / "known_hosts";
    }
    return expand_home(ssh_.known_hosts);
}
