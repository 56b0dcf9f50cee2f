#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "load_report.hpp"
#include "worker.hpp"

namespace throttle {

// Builds the operation for one worker. Called on the worker's own thread,
// concurrently for different indexes. Throwing marks that worker as lost.
using OperationFactory = std::function<Operation(int worker_index)>;

// Fans a phase out over concurrent workers and joins them before aggregating.
class LoadHarness {
public:
    explicit LoadHarness(std::optional<std::chrono::milliseconds> phase_timeout = std::nullopt,
                         Worker::TimeSource now = &Worker::Clock::now);

    /**
     * Runs total_ops / concurrency operations on each of concurrency workers.
     * The remainder of an uneven split is intentionally dropped, so the phase
     * never runs more than total_ops calls.
     * @param tracks_positives Whether operation results carry a hit/admit outcome
     *        worth grading; copied onto the report.
     * @throws ConfigurationError if concurrency <= 0 or total_ops < 0.
     */
    LoadTestReport run_phase(const std::string& phase, long long total_ops, int concurrency,
                             const OperationFactory& factory, bool tracks_positives = false) const;

    // Operations each worker is assigned for a given split.
    static long long ops_per_worker(long long total_ops, int concurrency) {
        return total_ops / concurrency;
    }

private:
    std::optional<std::chrono::milliseconds> phase_timeout_;
    Worker::TimeSource now_;
};

}
