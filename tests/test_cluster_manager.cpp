#include <gtest/gtest.h>
#include <managers/cluster_manager.hpp>
#include <core/constants.hpp>
#include "fakes.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

using fake::Pipe;

// Records every remote command and answers from a per-test script.
class ClusterManagerTest : public ::testing::Test {
protected:
    struct Call {
        std::string host;
        std::string command;
    };

    using Script = std::function<SSHResult(const std::string& host, const std::string& cmd,
                                           Pipe& in, Pipe& out)>;

    Config config;
    fake::FakeRemoteFs remote;
    Script script;
    std::mutex calls_mutex;
    std::vector<Call> calls;
    std::mutex out_mutex;
    std::string output;

    std::unique_ptr<fake::FakeConnector> connector;
    std::unique_ptr<ConnectionPool> pool;
    std::unique_ptr<ClusterManager> cluster;

    void SetUp() override {
        connector = std::make_unique<fake::FakeConnector>(
            [this](const std::string& tagged, Pipe& in, Pipe& out) {
                auto bar = tagged.find('|');
                std::string host = tagged.substr(0, bar);
                std::string cmd = tagged.substr(bar + 1);
                {
                    std::lock_guard<std::mutex> lock(calls_mutex);
                    calls.push_back({host, cmd});
                }
                if (cmd.find("scp -") != std::string::npos) {
                    return fake::scp_handler(remote)(cmd, in, out);
                }
                return script ? script(host, cmd, in, out) : fake::exit_with(0);
            });
        pool = std::make_unique<ConnectionPool>(*connector);
        cluster = std::make_unique<ClusterManager>(config, *pool, [this](const std::string& s) {
            std::lock_guard<std::mutex> lock(out_mutex);
            output += s;
        });
    }

    std::vector<Call> calls_matching(const std::string& needle) {
        std::lock_guard<std::mutex> lock(calls_mutex);
        std::vector<Call> out;
        for (const auto& c : calls) {
            if (c.command.find(needle) != std::string::npos) out.push_back(c);
        }
        return out;
    }

    std::vector<std::string> hosts_of(const std::vector<Call>& cs) {
        std::vector<std::string> hosts;
        for (const auto& c : cs) hosts.push_back(c.host);
        std::sort(hosts.begin(), hosts.end());
        return hosts;
    }

    std::vector<std::string> hosts_range(int from, int to) {
        std::vector<std::string> hosts;
        for (int i = from; i <= to; i++) hosts.push_back(cluster->host(i));
        return hosts;
    }
};

TEST_F(ClusterManagerTest, HostNames) {
    EXPECT_EQ(cluster->host(1), "cockroach-denim-0001.crdb.io");
    EXPECT_EQ(cluster->host(7), "cockroach-denim-0007.crdb.io");
    EXPECT_EQ(cluster->slot_host(7), cluster->host(config.load_node()));
}

TEST_F(ClusterManagerTest, StartCommand) {
    std::string first = cluster->start_command(cluster->host(1), cluster->host(1));
    EXPECT_EQ(first,
        "GOGC=200 COCKROACH_ENABLE_RPC_COMPRESSION=false ./cockroach start --insecure "
        "--store=path=/mnt/data1/cockroach --log-dir=/home/cockroach/logs --background"
        "> logs/cockroach.stdout 2> logs/cockroach.stderr");

    std::string other = cluster->start_command(cluster->host(2), cluster->host(1));
    EXPECT_NE(other.find("--background --join=cockroach-denim-0001.crdb.io>"), std::string::npos);
}

TEST_F(ClusterManagerTest, StartRunsOnEveryNode) {
    auto r = cluster->start();
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto started = calls_matching("./cockroach start");
    EXPECT_EQ(hosts_of(started), hosts_range(1, 6));
    for (const auto& c : started) {
        bool joins = c.command.find("--join=") != std::string::npos;
        EXPECT_EQ(joins, c.host != cluster->host(1)) << c.host;
    }

    EXPECT_EQ(output.rfind("denim: starting", 0), 0u);
    for (int i = 1; i <= 6; i++) {
        EXPECT_NE(output.find(" " + std::to_string(i)), std::string::npos);
    }
    EXPECT_EQ(output.back(), '\n');
    EXPECT_EQ(connector->total_connects(), 6);
}

TEST_F(ClusterManagerTest, StopIncludesLoadNode) {
    ASSERT_TRUE(cluster->stop().is_ok());
    EXPECT_EQ(hosts_of(calls_matching(NODE_STOP_COMMAND)), hosts_range(1, 7));
}

TEST_F(ClusterManagerTest, WipeStopsLoadFirst) {
    ASSERT_TRUE(cluster->wipe().is_ok());

    std::lock_guard<std::mutex> lock(calls_mutex);
    ASSERT_EQ(calls.size(), 8u);
    EXPECT_EQ(calls[0].command, LOAD_STOP_COMMAND);
    EXPECT_EQ(calls[0].host, cluster->host(7));
    for (size_t i = 1; i < calls.size(); i++) {
        EXPECT_EQ(calls[i].command, NODE_WIPE_COMMAND);
    }
    EXPECT_NE(output.find("denim: stopping load\n"), std::string::npos);
    EXPECT_NE(output.find("denim: wiping"), std::string::npos);
}

TEST_F(ClusterManagerTest, FailingNodeFailsBatchAfterAllFinish) {
    std::string bad = cluster->host(3);
    script = [bad](const std::string& host, const std::string&, Pipe&, Pipe&) {
        return host == bad ? fake::exit_with(1) : fake::exit_with(0);
    };

    auto r = cluster->stop();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::FanOut);
    EXPECT_EQ(calls_matching(NODE_STOP_COMMAND).size(), 7u);
    EXPECT_NE(output.find("\n" + bad + ": Process exited with status 1\n"), std::string::npos);
    EXPECT_EQ(output.find(" 3"), std::string::npos);
}

TEST_F(ClusterManagerTest, UnreachableNodeFailsBatch) {
    connector->unreachable = {cluster->host(5)};
    auto r = cluster->start();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::FanOut);
    EXPECT_NE(output.find("no route to host"), std::string::npos);
    EXPECT_EQ(calls_matching("./cockroach start").size(), 5u);
}

TEST_F(ClusterManagerTest, StatusInIndexOrder) {
    std::string down = cluster->host(6);
    std::string killed = cluster->host(2);
    script = [=](const std::string& host, const std::string& cmd, Pipe&, Pipe& out) {
        if (cmd == "pidof kv") return fake::exit_with(1);
        if (host == down) return fake::exit_with(1);
        if (host == killed) return fake::exit_with(-1, "", "KILL");
        out.write("4242\n");
        return fake::exit_with(0);
    };
    connector->unreachable = {cluster->host(4)};

    auto lines = cluster->status();
    ASSERT_EQ(lines.size(), 7u);
    EXPECT_EQ(lines[0], "denim 1: cockroach running 4242");
    EXPECT_EQ(lines[1], "denim 2: Process exited with signal KILL");
    EXPECT_EQ(lines[2], "denim 3: cockroach running 4242");
    EXPECT_NE(lines[3].find("denim 4: dial cockroach-denim-0004.crdb.io:22: no route to host"),
              std::string::npos);
    EXPECT_EQ(lines[5], "denim 6: cockroach not running");
    EXPECT_EQ(lines[6], "denim 7: kv not running");
}

TEST_F(ClusterManagerTest, RunLoadToleratesKill) {
    script = [](const std::string&, const std::string&, Pipe&, Pipe& out) {
        out.write("_elapsed___errors__ops/sec(inst)\n");
        return fake::exit_with(-1, "", "KILL");
    };

    auto r = cluster->run_load();
    ASSERT_TRUE(r.is_ok()) << r.error;

    const auto& load = config.load_settings();
    auto runs = calls_matching(load.command);
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].host, cluster->host(7));
    EXPECT_EQ(runs[0].command, load.command + " " + load.url);
    EXPECT_EQ(output.rfind(load.command + "\n", 0), 0u);
    EXPECT_NE(output.find("ops/sec"), std::string::npos);
}

TEST_F(ClusterManagerTest, RunLoadFailure) {
    script = [](const std::string&, const std::string&, Pipe&, Pipe&) {
        return fake::exit_with(1, "connection refused");
    };
    auto r = cluster->run_load();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::RemoteCommand);
}

TEST_F(ClusterManagerTest, RunAllSequence) {
    ASSERT_TRUE(cluster->run_all().is_ok());

    std::lock_guard<std::mutex> lock(calls_mutex);
    ASSERT_FALSE(calls.empty());
    EXPECT_EQ(calls.front().command, LOAD_STOP_COMMAND);
    EXPECT_EQ(calls.back().command, NODE_STOP_COMMAND);
    // 1 stop-load + 7 wipe + 6 start + 1 load + 7 stop
    EXPECT_EQ(calls.size(), 22u);
}

TEST_F(ClusterManagerTest, PushUploadsToEveryNode) {
    auto local = fs::temp_directory_path() / "fleet_push_test.bin";
    std::ofstream(local, std::ios::binary) << "binary";

    auto r = cluster->push(local);
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto sinks = calls_matching("scp -t fleet_push_test.bin");
    EXPECT_EQ(hosts_of(sinks), hosts_range(1, 7));
    fake::RemoteFile f;
    ASSERT_TRUE(remote.get("fleet_push_test.bin", f));
    EXPECT_EQ(f.data, "binary");
    EXPECT_NE(output.find("denim: pushing fleet_push_test.bin"), std::string::npos);

    fs::remove(local);
}

TEST_F(ClusterManagerTest, GetFromOneNode) {
    remote.put("logs/cockroach.log", "I180101 started\n", 0640);
    auto local = fs::temp_directory_path() / "fleet_get_test.log";

    std::vector<double> progress;
    auto r = cluster->get(2, "logs/cockroach.log", local, [&](double p) { progress.push_back(p); });
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto sources = calls_matching("scp -qrf logs/cockroach.log");
    ASSERT_EQ(sources.size(), 1u);
    EXPECT_EQ(sources[0].host, cluster->host(2));
    ASSERT_FALSE(progress.empty());
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);

    fs::remove(local);
}

TEST_F(ClusterManagerTest, GetRejectsBadIndex) {
    auto r = cluster->get(0, "x", fs::temp_directory_path() / "x");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
    EXPECT_TRUE(calls.empty());
}

TEST_F(ClusterManagerTest, ExecPrintsOutputInIndexOrder) {
    script = [](const std::string& host, const std::string&, Pipe&, Pipe& out) {
        out.write("up " + host);
        return fake::exit_with(0);
    };

    ASSERT_TRUE(cluster->exec("uptime").is_ok());
    EXPECT_EQ(calls_matching("uptime").size(), 7u);

    size_t prev = 0;
    for (int i = 1; i <= 7; i++) {
        auto pos = output.find(fmt::format("denim {}:\nup {}\n", i, cluster->host(i)));
        ASSERT_NE(pos, std::string::npos) << i;
        EXPECT_GE(pos, prev);
        prev = pos;
    }
}
