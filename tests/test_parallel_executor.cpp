#include <gtest/gtest.h>
#include <managers/parallel_executor.hpp>
#include <atomic>
#include <chrono>
#include <set>
#include <thread>

static std::string host_name(int i) {
    return "node-" + std::to_string(i);
}

TEST(ParallelExecutor, AllSucceed) {
    ParallelExecutor exec(host_name);
    std::set<int> acked;

    ParallelExecutor::Observer obs;
    obs.on_success = [&](int index) { acked.insert(index); };
    obs.on_failure = [&](const std::string&, const std::string&) { FAIL(); };

    auto report = exec.execute(1, 6, [](const std::string& host) {
        // Reverse completion order
        int n = host.back() - '0';
        std::this_thread::sleep_for(std::chrono::milliseconds((7 - n) * 5));
        return Result<std::string>::Ok("ok " + host);
    }, obs);

    EXPECT_FALSE(report.failed());
    EXPECT_EQ(report.results.size(), 6u);
    EXPECT_EQ(acked, (std::set<int>{1, 2, 3, 4, 5, 6}));
    EXPECT_TRUE(report.to_result().is_ok());
}

TEST(ParallelExecutor, OneFailureWaitsForAll) {
    ParallelExecutor exec(host_name);
    std::vector<int> acked;
    std::vector<std::pair<std::string, std::string>> failures;
    std::atomic<int> finished{0};

    ParallelExecutor::Observer obs;
    obs.on_success = [&](int index) { acked.push_back(index); };
    obs.on_failure = [&](const std::string& host, const std::string& err) {
        failures.emplace_back(host, err);
    };

    auto report = exec.execute(1, 6, [&](const std::string& host) {
        if (host == "node-3") {
            finished++;
            return Result<std::string>::Err(ErrorKind::RemoteCommand, "Process exited with status 1");
        }
        // Everyone else finishes well after the failure
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        finished++;
        return Result<std::string>::Ok("");
    }, obs);

    EXPECT_EQ(finished.load(), 6);
    EXPECT_EQ(acked.size(), 5u);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].first, "node-3");
    EXPECT_EQ(failures[0].second, "Process exited with status 1");

    EXPECT_TRUE(report.failed());
    EXPECT_EQ(report.failures, 1);
    EXPECT_EQ(report.results.size(), 6u);

    auto r = report.to_result();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::FanOut);
    EXPECT_NE(r.error.find("node-3"), std::string::npos);
}

TEST(ParallelExecutor, UnitsRunConcurrently) {
    ParallelExecutor exec(host_name);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    exec.execute(1, 4, [&](const std::string&) {
        int now = ++running;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        running--;
        return Result<std::string>::Ok("");
    });

    EXPECT_GT(peak.load(), 1);
}

TEST(ParallelExecutor, EmptyRangeSucceeds) {
    ParallelExecutor exec(host_name);
    bool called = false;
    auto report = exec.execute(3, 2, [&](const std::string&) {
        called = true;
        return Result<std::string>::Ok("");
    });
    EXPECT_FALSE(called);
    EXPECT_TRUE(report.results.empty());
    EXPECT_TRUE(report.to_result().is_ok());
}

TEST(ParallelExecutor, ThrowingOperationIsAFailedUnit) {
    ParallelExecutor exec(host_name);
    auto report = exec.execute(1, 2, [](const std::string& host) -> Result<std::string> {
        if (host == "node-2") throw std::runtime_error("boom");
        return Result<std::string>::Ok("");
    });
    EXPECT_EQ(report.failures, 1);
    for (const auto& r : report.results) {
        if (r.index == 2) EXPECT_EQ(r.error, "boom");
    }
}

TEST(ParallelExecutor, ResolverMapsIndexToHost) {
    ParallelExecutor exec([](int i) { return "h" + std::to_string(i * 10); });
    auto report = exec.execute(1, 3, [](const std::string& host) {
        return Result<std::string>::Ok(host);
    });
    std::set<std::string> hosts;
    for (const auto& r : report.results) {
        EXPECT_EQ(r.host, r.output);
        EXPECT_EQ(r.host, "h" + std::to_string(r.index * 10));
        hosts.insert(r.host);
    }
    EXPECT_EQ(hosts.size(), 3u);
}
