#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <vector>

#include "load_report.hpp"

namespace throttle {

// One unit of synthetic work. Returns the positive outcome flag (cache hit,
// request admitted). Throwing marks the call as failed; throwing
// WorkerFatalError aborts the whole worker.
using Operation = std::function<bool()>;

// Runs an operation sequentially and times every call.
class Worker {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    explicit Worker(TimeSource now = &Clock::now);

    /**
     * Executes operation up to iterations times; the next call starts only after the previous returned.
     * A failing call is recorded and the loop continues.
     * @param deadline Stop issuing new calls once reached; collected results are kept.
     * @throws WorkerFatalError propagated from the operation.
     */
    std::vector<OperationResult> run(const Operation& operation, long long iterations,
                                     std::optional<Clock::time_point> deadline = std::nullopt) const;

private:
    TimeSource now_;
};

}
