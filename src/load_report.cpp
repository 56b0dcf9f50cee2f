#include "load_report.hpp"
#include <algorithm>
#include <cmath>

namespace throttle {

std::optional<std::chrono::nanoseconds> MetricsAggregator::nearest_rank(
    const std::vector<std::chrono::nanoseconds>& sorted, double p, size_t min_samples) {
    if (sorted.empty() || sorted.size() < min_samples) return std::nullopt;

    const long long n = static_cast<long long>(sorted.size());
    long long index = static_cast<long long>(std::ceil(p * static_cast<double>(n))) - 1;
    index = std::clamp(index, 0LL, n - 1);
    return sorted[static_cast<size_t>(index)];
}

LoadTestReport MetricsAggregator::reduce(const std::string& phase,
                                         const std::vector<OperationResult>& results,
                                         std::chrono::nanoseconds total_time) {
    LoadTestReport report;
    report.phase = phase;
    report.total_ops = results.size();
    report.total_time = total_time;

    std::vector<std::chrono::nanoseconds> latencies;
    latencies.reserve(results.size());
    for (const auto& r : results) {
        if (!r.succeeded) {
            report.error_count++;
            continue;
        }
        if (r.positive) report.positive_count++;
        if (r.elapsed) latencies.push_back(*r.elapsed);
    }

    // Throughput counts attempted work, failures included.
    double seconds = std::chrono::duration<double>(total_time).count();
    if (seconds > 0.0) {
        report.ops_per_sec = static_cast<double>(results.size()) / seconds;
    }

    size_t successes = results.size() - report.error_count;
    if (successes > 0) {
        report.positive_ratio = static_cast<double>(report.positive_count) / static_cast<double>(successes);
    }

    if (!latencies.empty()) {
        std::sort(latencies.begin(), latencies.end());

        std::chrono::nanoseconds sum{0};
        for (const auto& l : latencies) sum += l;
        report.avg_latency = sum / static_cast<long long>(latencies.size());

        report.p95_latency = nearest_rank(latencies, 0.95, kMinSamplesP95);
        report.p99_latency = nearest_rank(latencies, 0.99, kMinSamplesP99);
    }

    return report;
}

ConnectionCheck MetricsAggregator::connection_check(const LoadTestReport& report, int max_connections) {
    ConnectionCheck check;
    check.max_connections = max_connections;
    check.acquisition_time = report.total_time;
    check.failed = report.error_count + report.lost_workers;
    // A timed-out phase leaves connections that were never pinged.
    size_t expected = max_connections > 0 ? static_cast<size_t>(max_connections) : 0;
    size_t accounted = report.total_ops + report.lost_workers;
    if (accounted < expected) {
        check.failed += expected - accounted;
    }
    return check;
}

}
