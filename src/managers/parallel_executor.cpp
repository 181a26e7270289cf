#include "parallel_executor.hpp"
#include "completion_queue.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <thread>

Result<void> FanOutReport::to_result() const {
    if (!failed()) return Result<void>::Ok();

    std::string msg = fmt::format("{} of {} hosts failed", failures, results.size());
    for (const auto& r : results) {
        if (!r.ok()) msg += fmt::format("\n{}: {}", r.host, r.error);
    }
    return Result<void>::Err(ErrorKind::FanOut, msg);
}

ParallelExecutor::ParallelExecutor(HostResolver resolver)
    : resolver_(std::move(resolver)) {}

FanOutReport ParallelExecutor::execute(int from, int to, const HostOperation& op,
                                       const Observer& observer) const {
    FanOutReport report;
    if (from > to) return report;

    CompletionQueue<ExecutionResult> queue;
    std::vector<std::thread> units;
    units.reserve(static_cast<size_t>(to - from + 1));

    for (int i = from; i <= to; i++) {
        units.emplace_back([this, i, &op, &queue] {
            ExecutionResult r;
            r.index = i;
            try {
                r.host = resolver_(i);
                auto out = op(r.host);
                if (out.is_ok()) {
                    r.output = std::move(out.value);
                } else {
                    r.error = out.error.empty() ? error_kind_name(out.kind) : out.error;
                }
            } catch (const std::exception& e) {
                r.error = e.what();
            }
            queue.push(std::move(r));
        });
    }

    // Closes the queue once every unit has reported
    std::thread closer([&units, &queue] {
        for (auto& t : units) t.join();
        queue.close();
    });

    while (auto r = queue.pop()) {
        if (r->ok()) {
            if (observer.on_success) observer.on_success(r->index);
        } else {
            report.failures++;
            fleet_log(fmt::format("fan-out: {} (index {}) failed: {}", r->host, r->index, r->error));
            if (observer.on_failure) observer.on_failure(r->host, r->error);
        }
        report.results.push_back(std::move(*r));
    }
    closer.join();

    fleet_log(fmt::format("fan-out: [{}, {}] done, {} failed", from, to, report.failures));
    return report;
}
