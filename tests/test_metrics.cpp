#include <gtest/gtest.h>
#include "metrics.hpp"

using namespace throttle;

TEST(MetricsTest, Counter) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    
    reg.increment_counter("test_counter", 1.0);
    reg.increment_counter("test_counter", 2.5);
    EXPECT_EQ(reg.get_counter("test_counter"), 3.5);
    
    std::string prometheus = reg.collect_prometheus();
    EXPECT_TRUE(prometheus.find("test_counter 3.5") != std::string::npos);
    EXPECT_TRUE(prometheus.find("# TYPE test_counter counter") != std::string::npos);
}

TEST(MetricsTest, Gauge) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    reg.set_gauge("test_gauge", 42.0);
    EXPECT_EQ(reg.get_gauge("test_gauge"), 42.0);
    
    reg.increment_gauge("test_gauge", 8.0);
    EXPECT_EQ(reg.get_gauge("test_gauge"), 50.0);
    
    reg.decrement_gauge("test_gauge", 10.0);
    EXPECT_EQ(reg.get_gauge("test_gauge"), 40.0);
    
    std::string prometheus = reg.collect_prometheus();
    EXPECT_TRUE(prometheus.find("test_gauge 40") != std::string::npos);
    EXPECT_TRUE(prometheus.find("# TYPE test_gauge gauge") != std::string::npos);
}

TEST(MetricsTest, ResetClearsEverything) {
    auto& reg = MetricsRegistry::instance();
    reg.increment_counter("stale_counter");
    reg.reset();
    EXPECT_EQ(reg.get_counter("stale_counter"), 0.0);
    EXPECT_TRUE(reg.collect_prometheus().empty());
}

TEST(MetricsTest, LabelledSeriesShareOneTypeLine) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    reg.set_gauge(MetricsRegistry::series("load_phase_ops_per_sec", "phase", "GET"), 1200.0);
    reg.set_gauge(MetricsRegistry::series("load_phase_ops_per_sec", "phase", "SET"), 900.0);
    reg.set_gauge("load_phase_ops_per_sec_total", 5.0);

    std::string prometheus = reg.collect_prometheus();
    EXPECT_NE(prometheus.find("load_phase_ops_per_sec{phase=\"GET\"} 1200"), std::string::npos);
    EXPECT_NE(prometheus.find("load_phase_ops_per_sec{phase=\"SET\"} 900"), std::string::npos);

    size_t first = prometheus.find("# TYPE load_phase_ops_per_sec gauge");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(prometheus.find("# TYPE load_phase_ops_per_sec gauge", first + 1), std::string::npos);
    EXPECT_NE(prometheus.find("# TYPE load_phase_ops_per_sec_total gauge"), std::string::npos);
}

TEST(MetricsTest, SnapshotCopiesCurrentValues) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    reg.increment_counter("rate_limiter_allowed_total", 3.0);
    reg.set_gauge("redis_pool_size", 20.0);

    MetricsSnapshot snap = reg.snapshot();
    reg.increment_counter("rate_limiter_allowed_total");

    EXPECT_EQ(snap.counters.at("rate_limiter_allowed_total"), 3.0);
    EXPECT_EQ(snap.gauges.at("redis_pool_size"), 20.0);
    EXPECT_EQ(reg.get_counter("rate_limiter_allowed_total"), 4.0);
}
