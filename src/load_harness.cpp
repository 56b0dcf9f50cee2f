#include "load_harness.hpp"
#include "errors.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <vector>

namespace throttle {

namespace {

// Private to one worker; written by that worker only, read after join.
struct WorkerSlot {
    std::vector<OperationResult> results;
    bool lost = false;
    std::string error;
};

}

LoadHarness::LoadHarness(std::optional<std::chrono::milliseconds> phase_timeout, Worker::TimeSource now)
    : phase_timeout_(phase_timeout), now_(std::move(now)) {
}

LoadTestReport LoadHarness::run_phase(const std::string& phase, long long total_ops, int concurrency,
                                      const OperationFactory& factory, bool tracks_positives) const {
    if (concurrency <= 0) {
        throw ConfigurationError("concurrency must be > 0, got " + std::to_string(concurrency));
    }
    if (total_ops < 0) {
        throw ConfigurationError("total_ops must be >= 0, got " + std::to_string(total_ops));
    }

    const long long per_worker = ops_per_worker(total_ops, concurrency);
    std::vector<WorkerSlot> slots(static_cast<size_t>(concurrency));
    Worker worker(now_);

    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::PHASE_STARTED, "<harness>",
                     phase + " workers=" + std::to_string(concurrency) + " ops_per_worker=" + std::to_string(per_worker));

    auto& metrics = MetricsRegistry::instance();
    boost::asio::thread_pool pool(static_cast<std::size_t>(concurrency));

    const auto start = now_();
    std::optional<Worker::Clock::time_point> deadline;
    if (phase_timeout_) {
        deadline = start + *phase_timeout_;
    }

    for (int i = 0; i < concurrency; ++i) {
        boost::asio::post(pool, [&, i]() {
            WorkerSlot& slot = slots[static_cast<size_t>(i)];
            metrics.increment_gauge("harness_active_workers");
            try {
                Operation operation = factory(i);
                slot.results = worker.run(operation, per_worker, deadline);
            } catch (const std::exception& e) {
                slot.results.clear();
                slot.lost = true;
                slot.error = e.what();
            } catch (...) {
                slot.results.clear();
                slot.lost = true;
                slot.error = "non-standard exception";
            }
            metrics.decrement_gauge("harness_active_workers");
        });
    }

    // Join barrier: nothing is aggregated until every worker has finished or failed.
    pool.join();
    const auto end = now_();

    std::vector<OperationResult> all;
    all.reserve(static_cast<size_t>(per_worker) * slots.size());
    size_t lost = 0;
    for (size_t i = 0; i < slots.size(); ++i) {
        auto& slot = slots[i];
        if (slot.lost) {
            ++lost;
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::WORKER_LOST, "<harness>",
                             phase + " worker " + std::to_string(i) + ": " + slot.error);
            continue;
        }
        all.insert(all.end(), slot.results.begin(), slot.results.end());
    }
    metrics.increment_counter("harness_workers_lost_total", static_cast<double>(lost));

    LoadTestReport report = MetricsAggregator::reduce(
        phase, all, std::chrono::duration_cast<std::chrono::nanoseconds>(end - start));
    report.requested_ops = total_ops;
    report.lost_workers = lost;
    report.tracks_positives = tracks_positives;

    metrics.increment_counter("harness_operations_total", static_cast<double>(report.total_ops));
    metrics.increment_counter("harness_operation_errors_total", static_cast<double>(report.error_count));

    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::PHASE_COMPLETED, "<harness>",
                     phase + " ops=" + std::to_string(report.total_ops) +
                     " errors=" + std::to_string(report.error_count) +
                     " lost_workers=" + std::to_string(lost));
    return report;
}

}
