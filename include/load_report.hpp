#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace throttle {

// Outcome of one timed call made by a worker.
struct OperationResult {
    bool succeeded = false;
    std::optional<std::chrono::nanoseconds> elapsed;  // Empty for failed calls
    bool positive = false;                            // Cache hit / admitted request; successes only
};

// Aggregate of one load phase. Latency fields are empty when there is not
// enough successful data, which is distinct from a measured zero.
struct LoadTestReport {
    std::string phase;
    long long requested_ops = 0;
    size_t total_ops = 0;
    std::chrono::nanoseconds total_time{0};
    double ops_per_sec = 0.0;
    std::optional<std::chrono::nanoseconds> avg_latency;
    std::optional<std::chrono::nanoseconds> p95_latency;
    std::optional<std::chrono::nanoseconds> p99_latency;
    size_t error_count = 0;
    size_t lost_workers = 0;
    size_t positive_count = 0;
    double positive_ratio = 0.0;
    bool tracks_positives = false;  // Set for phases whose positives mean something (hits, admits)
};

// Outcome of opening and pinging a full pool of connections at once.
struct ConnectionCheck {
    int max_connections = 0;
    std::chrono::nanoseconds acquisition_time{0};
    size_t failed = 0;  // Pings that errored plus workers that never got a connection
    bool succeeded() const { return failed == 0; }
};

// Minimum successful samples before a percentile is reported.
constexpr size_t kMinSamplesP95 = 20;
constexpr size_t kMinSamplesP99 = 100;

// Reduces raw worker results into a report.
class MetricsAggregator {
public:
    static LoadTestReport reduce(const std::string& phase,
                                 const std::vector<OperationResult>& results,
                                 std::chrono::nanoseconds total_time);

    /**
     * Nearest-rank percentile over an ascending sample.
     * Selects index ceil(p * n) - 1, clamped to [0, n - 1].
     * @return Empty if the sample holds fewer than min_samples values.
     */
    static std::optional<std::chrono::nanoseconds> nearest_rank(
        const std::vector<std::chrono::nanoseconds>& sorted, double p, size_t min_samples = 1);

    // Reads a one-ping-per-connection phase as a pool check.
    static ConnectionCheck connection_check(const LoadTestReport& report, int max_connections);
};

}
