#pragma once

#include <string>
#include <chrono>
#include <optional>

#include "assessment.hpp"

namespace throttle {


// Limiter, store and load-harness configuration.
struct ThrottleConfig {
    // --- Backing Store (Redis) ---
    std::string redis_url = "tcp://127.0.0.1:6379";
    int pool_size = 20;                  // Upper bound on pooled connections, independent of worker count
    int pool_wait_timeout_ms = 1000;     // How long a caller waits for a free connection
    std::string key_prefix = "ratelimit:";

    // --- Sliding Window Limit ---
    int limit = 100;
    std::chrono::milliseconds window{60000};

    // --- Load Harness ---
    int concurrency = 100;
    long long total_ops = 100000;
    int key_space_size = 10000;
    std::optional<std::chrono::milliseconds> phase_timeout;

    // --- Assessment Bands ---
    AssessmentThresholds thresholds;
};

// Overrides fields from THROTTLE_* environment variables.
// Throws ConfigurationError when a variable is present but not a valid number.
void apply_env_overrides(ThrottleConfig& config);

// Throws ConfigurationError naming the first invalid field.
void validate(const ThrottleConfig& config);

}
