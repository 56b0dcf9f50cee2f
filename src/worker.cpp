#include "worker.hpp"
#include "errors.hpp"
#include "metrics.hpp"

namespace throttle {

Worker::Worker(TimeSource now) : now_(std::move(now)) {
}

std::vector<OperationResult> Worker::run(const Operation& operation, long long iterations,
                                         std::optional<Clock::time_point> deadline) const {
    std::vector<OperationResult> results;
    if (iterations <= 0) return results;
    results.reserve(static_cast<size_t>(iterations));

    for (long long i = 0; i < iterations; ++i) {
        if (deadline && now_() >= *deadline) {
            MetricsRegistry::instance().increment_counter("harness_calls_cancelled_total",
                                                          static_cast<double>(iterations - i));
            break;
        }

        OperationResult result;
        auto start = now_();
        try {
            result.positive = operation();
            result.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(now_() - start);
            result.succeeded = true;
        } catch (const WorkerFatalError&) {
            throw;
        } catch (const std::exception&) {
            // Per-call failure: no latency sample, the worker keeps going.
            result.succeeded = false;
            result.positive = false;
        }
        results.push_back(result);
    }
    return results;
}

}
