#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "load_report.hpp"

namespace throttle {

// Qualitative bands, ordered best to worst.
enum class Band {
    Excellent,
    Good,
    NeedsImprovement
};

// Band boundaries. Throughput and ratios are higher-is-better,
// latency is lower-is-better (strictly below the bound).
struct AssessmentThresholds {
    double throughput_excellent = 100000.0;  // ops/sec
    double throughput_good = 50000.0;
    double hit_ratio_excellent = 0.90;
    double hit_ratio_good = 0.70;
    std::chrono::milliseconds p95_excellent{100};
    std::chrono::milliseconds p95_good{200};
};

struct Assessment {
    Band throughput = Band::NeedsImprovement;
    std::optional<Band> hit_ratio;    // Empty unless the phase tracks positives and had successes
    std::optional<Band> p95_latency;  // Empty when p95 has insufficient data
};

Band assess_throughput(double ops_per_sec, const AssessmentThresholds& thresholds);
Band assess_ratio(double ratio, const AssessmentThresholds& thresholds);
std::optional<Band> assess_latency(const std::optional<std::chrono::nanoseconds>& p95,
                                   const AssessmentThresholds& thresholds);

Assessment assess(const LoadTestReport& report, const AssessmentThresholds& thresholds);

// Mean ops/sec over the reports whose phase is listed; empty if none of them ran.
std::optional<double> mean_throughput(const std::vector<LoadTestReport>& reports,
                                      const std::vector<std::string>& phases);

std::string band_to_string(Band band);

}
