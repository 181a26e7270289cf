#pragma once

#include <functional>
#include <string>
#include <vector>
#include <core/types.hpp>

// Outcome of one fan-out unit.
struct ExecutionResult {
    int index = 0;
    std::string host;
    std::string output;
    std::string error;   // empty on success

    bool ok() const { return error.empty(); }
};

struct FanOutReport {
    std::vector<ExecutionResult> results;   // arrival order
    int failures = 0;

    bool failed() const { return failures > 0; }

    // Ok, or a FanOut error summarizing the failed units.
    Result<void> to_result() const;
};

// ParallelExecutor: run one operation per host index concurrently.
//
// Every index in [from, to] gets its own thread. Results are drained from a
// completion queue in arrival order; failures are reported as they arrive,
// but the batch is only decided once every unit has finished. Units are
// never cancelled.
class ParallelExecutor {
public:
    using HostResolver = std::function<std::string(int index)>;
    using HostOperation = std::function<Result<std::string>(const std::string& host)>;

    // Called on the draining thread only.
    struct Observer {
        std::function<void(int index)> on_success;
        std::function<void(const std::string& host, const std::string& error)> on_failure;
    };

    explicit ParallelExecutor(HostResolver resolver);

    FanOutReport execute(int from, int to, const HostOperation& op,
                         const Observer& observer = {}) const;

private:
    HostResolver resolver_;
};
