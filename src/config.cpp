#include "config.hpp"
#include "errors.hpp"
#include <cstdint>
#include <cstdlib>
#include <string>

namespace throttle {

namespace {

long long env_integer(const char* name, const char* value) {
    try {
        size_t pos = 0;
        long long parsed = std::stoll(value, &pos);
        if (pos != std::string(value).size()) {
            throw ConfigurationError(std::string(name) + " has trailing characters: " + value);
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw ConfigurationError(std::string(name) + " is not an integer: " + value);
    } catch (const std::out_of_range&) {
        throw ConfigurationError(std::string(name) + " is out of range: " + value);
    }
}

double env_number(const char* name, const char* value) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw ConfigurationError(std::string(name) + " is not a number: " + value);
    }
}

int env_int(const char* name, const char* value) {
    long long parsed = env_integer(name, value);
    if (parsed < INT32_MIN || parsed > INT32_MAX) {
        throw ConfigurationError(std::string(name) + " is out of range: " + value);
    }
    return static_cast<int>(parsed);
}

}

void apply_env_overrides(ThrottleConfig& config) {
    if (const char* e = std::getenv("THROTTLE_REDIS_URL")) config.redis_url = e;
    if (const char* e = std::getenv("THROTTLE_KEY_PREFIX")) config.key_prefix = e;
    if (const char* e = std::getenv("THROTTLE_POOL_SIZE")) config.pool_size = env_int("THROTTLE_POOL_SIZE", e);
    if (const char* e = std::getenv("THROTTLE_POOL_WAIT_MS")) config.pool_wait_timeout_ms = env_int("THROTTLE_POOL_WAIT_MS", e);

    // Window limit
    if (const char* e = std::getenv("THROTTLE_LIMIT")) config.limit = env_int("THROTTLE_LIMIT", e);
    if (const char* e = std::getenv("THROTTLE_WINDOW_MS")) {
        config.window = std::chrono::milliseconds(env_integer("THROTTLE_WINDOW_MS", e));
    }

    // Harness
    if (const char* e = std::getenv("THROTTLE_CONCURRENCY")) config.concurrency = env_int("THROTTLE_CONCURRENCY", e);
    if (const char* e = std::getenv("THROTTLE_TOTAL_OPS")) config.total_ops = env_integer("THROTTLE_TOTAL_OPS", e);
    if (const char* e = std::getenv("THROTTLE_KEY_SPACE")) config.key_space_size = env_int("THROTTLE_KEY_SPACE", e);
    if (const char* e = std::getenv("THROTTLE_PHASE_TIMEOUT_MS")) {
        config.phase_timeout = std::chrono::milliseconds(env_integer("THROTTLE_PHASE_TIMEOUT_MS", e));
    }

    // Assessment bands
    auto& t = config.thresholds;
    if (const char* e = std::getenv("THROTTLE_THROUGHPUT_EXCELLENT")) t.throughput_excellent = env_number("THROTTLE_THROUGHPUT_EXCELLENT", e);
    if (const char* e = std::getenv("THROTTLE_THROUGHPUT_GOOD")) t.throughput_good = env_number("THROTTLE_THROUGHPUT_GOOD", e);
    if (const char* e = std::getenv("THROTTLE_HIT_RATIO_EXCELLENT")) t.hit_ratio_excellent = env_number("THROTTLE_HIT_RATIO_EXCELLENT", e);
    if (const char* e = std::getenv("THROTTLE_HIT_RATIO_GOOD")) t.hit_ratio_good = env_number("THROTTLE_HIT_RATIO_GOOD", e);
    if (const char* e = std::getenv("THROTTLE_P95_EXCELLENT_MS")) {
        t.p95_excellent = std::chrono::milliseconds(env_integer("THROTTLE_P95_EXCELLENT_MS", e));
    }
    if (const char* e = std::getenv("THROTTLE_P95_GOOD_MS")) {
        t.p95_good = std::chrono::milliseconds(env_integer("THROTTLE_P95_GOOD_MS", e));
    }
}

void validate(const ThrottleConfig& config) {
    if (config.limit <= 0) {
        throw ConfigurationError("limit must be > 0, got " + std::to_string(config.limit));
    }
    if (config.window.count() <= 0) {
        throw ConfigurationError("window must be > 0ms, got " + std::to_string(config.window.count()));
    }
    if (config.concurrency <= 0) {
        throw ConfigurationError("concurrency must be > 0, got " + std::to_string(config.concurrency));
    }
    if (config.total_ops < 0) {
        throw ConfigurationError("total_ops must be >= 0, got " + std::to_string(config.total_ops));
    }
    if (config.key_space_size <= 0) {
        throw ConfigurationError("key_space_size must be > 0, got " + std::to_string(config.key_space_size));
    }
    if (config.pool_size <= 0) {
        throw ConfigurationError("pool_size must be > 0, got " + std::to_string(config.pool_size));
    }
    if (config.pool_wait_timeout_ms < 0) {
        throw ConfigurationError("pool_wait_timeout_ms must be >= 0");
    }
    if (config.phase_timeout && config.phase_timeout->count() <= 0) {
        throw ConfigurationError("phase_timeout must be > 0ms when set");
    }

    const auto& t = config.thresholds;
    if (t.throughput_good > t.throughput_excellent) {
        throw ConfigurationError("throughput_good must not exceed throughput_excellent");
    }
    if (t.hit_ratio_good > t.hit_ratio_excellent) {
        throw ConfigurationError("hit_ratio_good must not exceed hit_ratio_excellent");
    }
    if (t.p95_excellent > t.p95_good) {
        throw ConfigurationError("p95_excellent must not exceed p95_good");
    }
}

}
