#include <gtest/gtest.h>
#include "config.hpp"
#include "errors.hpp"
#include <cstdlib>

using namespace throttle;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"THROTTLE_LIMIT", "THROTTLE_WINDOW_MS", "THROTTLE_CONCURRENCY",
                                 "THROTTLE_REDIS_URL", "THROTTLE_PHASE_TIMEOUT_MS", "THROTTLE_P95_GOOD_MS",
                                 "THROTTLE_HIT_RATIO_GOOD"}) {
            unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, DefaultValues) {
    ThrottleConfig config;
    EXPECT_EQ(config.redis_url, "tcp://127.0.0.1:6379");
    EXPECT_EQ(config.key_prefix, "ratelimit:");
    EXPECT_EQ(config.pool_size, 20);
    EXPECT_EQ(config.limit, 100);
    EXPECT_EQ(config.window, 60s);
    EXPECT_EQ(config.concurrency, 100);
    EXPECT_EQ(config.total_ops, 100000);
    EXPECT_EQ(config.key_space_size, 10000);
    EXPECT_FALSE(config.phase_timeout.has_value());
    EXPECT_NO_THROW(validate(config));
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("THROTTLE_LIMIT", "3", 1);
    setenv("THROTTLE_WINDOW_MS", "1500", 1);
    setenv("THROTTLE_CONCURRENCY", "8", 1);
    setenv("THROTTLE_REDIS_URL", "tcp://redis:6380", 1);
    setenv("THROTTLE_PHASE_TIMEOUT_MS", "30000", 1);
    setenv("THROTTLE_P95_GOOD_MS", "250", 1);
    setenv("THROTTLE_HIT_RATIO_GOOD", "0.5", 1);

    ThrottleConfig config;
    apply_env_overrides(config);
    EXPECT_EQ(config.limit, 3);
    EXPECT_EQ(config.window, 1500ms);
    EXPECT_EQ(config.concurrency, 8);
    EXPECT_EQ(config.redis_url, "tcp://redis:6380");
    ASSERT_TRUE(config.phase_timeout.has_value());
    EXPECT_EQ(*config.phase_timeout, 30s);
    EXPECT_EQ(config.thresholds.p95_good, 250ms);
    EXPECT_DOUBLE_EQ(config.thresholds.hit_ratio_good, 0.5);
}

TEST_F(ConfigTest, MalformedEnvironmentValue) {
    setenv("THROTTLE_LIMIT", "ten", 1);
    ThrottleConfig config;
    EXPECT_THROW(apply_env_overrides(config), ConfigurationError);

    setenv("THROTTLE_LIMIT", "10x", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigurationError);
}

TEST_F(ConfigTest, ValidationRejectsInvalidValues) {
    auto rejects = [](auto mutate) {
        ThrottleConfig config;
        mutate(config);
        EXPECT_THROW(validate(config), ConfigurationError);
    };
    rejects([](ThrottleConfig& c) { c.limit = 0; });
    rejects([](ThrottleConfig& c) { c.window = 0ms; });
    rejects([](ThrottleConfig& c) { c.concurrency = 0; });
    rejects([](ThrottleConfig& c) { c.total_ops = -1; });
    rejects([](ThrottleConfig& c) { c.key_space_size = 0; });
    rejects([](ThrottleConfig& c) { c.pool_size = 0; });
    rejects([](ThrottleConfig& c) { c.phase_timeout = 0ms; });
    rejects([](ThrottleConfig& c) { c.thresholds.throughput_good = 200000; });
    rejects([](ThrottleConfig& c) { c.thresholds.p95_excellent = 500ms; });
}

TEST_F(ConfigTest, ZeroTotalOpsIsValid) {
    ThrottleConfig config;
    config.total_ops = 0;
    EXPECT_NO_THROW(validate(config));
}
