#include "assessment.hpp"
#include <algorithm>

namespace throttle {

Band assess_throughput(double ops_per_sec, const AssessmentThresholds& thresholds) {
    if (ops_per_sec >= thresholds.throughput_excellent) return Band::Excellent;
    if (ops_per_sec >= thresholds.throughput_good) return Band::Good;
    return Band::NeedsImprovement;
}

Band assess_ratio(double ratio, const AssessmentThresholds& thresholds) {
    if (ratio >= thresholds.hit_ratio_excellent) return Band::Excellent;
    if (ratio >= thresholds.hit_ratio_good) return Band::Good;
    return Band::NeedsImprovement;
}

std::optional<Band> assess_latency(const std::optional<std::chrono::nanoseconds>& p95,
                                   const AssessmentThresholds& thresholds) {
    if (!p95) return std::nullopt;
    if (*p95 < thresholds.p95_excellent) return Band::Excellent;
    if (*p95 < thresholds.p95_good) return Band::Good;
    return Band::NeedsImprovement;
}

Assessment assess(const LoadTestReport& report, const AssessmentThresholds& thresholds) {
    Assessment result;
    result.throughput = assess_throughput(report.ops_per_sec, thresholds);
    if (report.tracks_positives && report.total_ops > report.error_count) {
        result.hit_ratio = assess_ratio(report.positive_ratio, thresholds);
    }
    result.p95_latency = assess_latency(report.p95_latency, thresholds);
    return result;
}

std::optional<double> mean_throughput(const std::vector<LoadTestReport>& reports,
                                      const std::vector<std::string>& phases) {
    double sum = 0.0;
    size_t counted = 0;
    for (const auto& report : reports) {
        if (std::find(phases.begin(), phases.end(), report.phase) == phases.end()) continue;
        sum += report.ops_per_sec;
        ++counted;
    }
    if (counted == 0) return std::nullopt;
    return sum / static_cast<double>(counted);
}

std::string band_to_string(Band band) {
    switch (band) {
        case Band::Excellent: return "excellent";
        case Band::Good: return "good";
        case Band::NeedsImprovement: return "needs_improvement";
        default: return "unknown";
    }
}

}
