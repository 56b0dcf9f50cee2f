#include <gtest/gtest.h>
#include "assessment.hpp"

using namespace throttle;
using namespace std::chrono_literals;

TEST(AssessmentTest, ThroughputBands) {
    AssessmentThresholds t;
    EXPECT_EQ(assess_throughput(150000, t), Band::Excellent);
    EXPECT_EQ(assess_throughput(100000, t), Band::Excellent);
    EXPECT_EQ(assess_throughput(99999, t), Band::Good);
    EXPECT_EQ(assess_throughput(50000, t), Band::Good);
    EXPECT_EQ(assess_throughput(49999, t), Band::NeedsImprovement);
}

TEST(AssessmentTest, RatioBands) {
    AssessmentThresholds t;
    EXPECT_EQ(assess_ratio(0.95, t), Band::Excellent);
    EXPECT_EQ(assess_ratio(0.90, t), Band::Excellent);
    EXPECT_EQ(assess_ratio(0.70, t), Band::Good);
    EXPECT_EQ(assess_ratio(0.69, t), Band::NeedsImprovement);
}

TEST(AssessmentTest, LatencyIsLowerIsBetter) {
    AssessmentThresholds t;
    EXPECT_EQ(assess_latency(std::chrono::nanoseconds(99ms), t), Band::Excellent);
    EXPECT_EQ(assess_latency(std::chrono::nanoseconds(100ms), t), Band::Good);
    EXPECT_EQ(assess_latency(std::chrono::nanoseconds(199ms), t), Band::Good);
    EXPECT_EQ(assess_latency(std::chrono::nanoseconds(200ms), t), Band::NeedsImprovement);
    EXPECT_FALSE(assess_latency(std::nullopt, t).has_value());
}

TEST(AssessmentTest, ThresholdsAreParameters) {
    AssessmentThresholds strict;
    strict.throughput_excellent = 10;
    strict.throughput_good = 5;
    strict.p95_excellent = 1ms;
    strict.p95_good = 2ms;

    EXPECT_EQ(assess_throughput(7, strict), Band::Good);
    EXPECT_EQ(assess_latency(std::chrono::nanoseconds(1500us), strict), Band::Good);
}

TEST(AssessmentTest, BandsAreOrdered) {
    EXPECT_LT(Band::Excellent, Band::Good);
    EXPECT_LT(Band::Good, Band::NeedsImprovement);
}

TEST(AssessmentTest, AssessReport) {
    LoadTestReport report;
    report.total_ops = 1000;
    report.error_count = 0;
    report.ops_per_sec = 60000;
    report.positive_ratio = 0.92;
    report.tracks_positives = true;
    report.p95_latency = 150ms;

    auto a = assess(report, AssessmentThresholds{});
    EXPECT_EQ(a.throughput, Band::Good);
    ASSERT_TRUE(a.hit_ratio.has_value());
    EXPECT_EQ(*a.hit_ratio, Band::Excellent);
    ASSERT_TRUE(a.p95_latency.has_value());
    EXPECT_EQ(*a.p95_latency, Band::Good);
}

TEST(AssessmentTest, AllFailedPhaseHasNoRatioBand) {
    LoadTestReport report;
    report.total_ops = 10;
    report.error_count = 10;
    report.tracks_positives = true;
    auto a = assess(report, AssessmentThresholds{});
    EXPECT_EQ(a.throughput, Band::NeedsImprovement);
    EXPECT_FALSE(a.hit_ratio.has_value());
    EXPECT_FALSE(a.p95_latency.has_value());
}

TEST(AssessmentTest, WriteOnlyPhaseHasNoRatioBand) {
    // SET-style phases report every success as positive; that is not a hit ratio.
    LoadTestReport report;
    report.total_ops = 500;
    report.positive_count = 500;
    report.positive_ratio = 1.0;
    report.ops_per_sec = 120000;

    auto a = assess(report, AssessmentThresholds{});
    EXPECT_EQ(a.throughput, Band::Excellent);
    EXPECT_FALSE(a.hit_ratio.has_value());
}

TEST(AssessmentTest, MeanThroughputCoversListedPhasesOnly) {
    auto phase = [](const std::string& name, double ops) {
        LoadTestReport r;
        r.phase = name;
        r.ops_per_sec = ops;
        return r;
    };
    std::vector<LoadTestReport> reports = {
        phase("RATE_LIMIT", 900000), phase("SET", 30000), phase("GET", 60000),
        phase("MIXED", 30000), phase("CONNECTIONS", 500)
    };

    auto mean = mean_throughput(reports, {"SET", "GET", "MIXED"});
    ASSERT_TRUE(mean.has_value());
    EXPECT_DOUBLE_EQ(*mean, 40000.0);
    EXPECT_EQ(assess_throughput(*mean, AssessmentThresholds{}), Band::NeedsImprovement);

    EXPECT_FALSE(mean_throughput({phase("RATE_LIMIT", 5)}, {"SET", "GET", "MIXED"}).has_value());
}

TEST(AssessmentTest, BandNames) {
    EXPECT_EQ(band_to_string(Band::Excellent), "excellent");
    EXPECT_EQ(band_to_string(Band::Good), "good");
    EXPECT_EQ(band_to_string(Band::NeedsImprovement), "needs_improvement");
}
