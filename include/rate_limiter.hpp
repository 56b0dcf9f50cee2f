#pragma once

#include <string>
#include <chrono>
#include <functional>

#include "window_store.hpp"

namespace throttle {

struct RateLimitDecision {
    bool allowed;
    long long remaining;      // 0 on denial, limit on fail-open
    bool failed_open = false; // Diagnostic only; never an error state
};

// Emitted on every check that failed open because the store was unreachable.
struct FailOpenEvent {
    std::string key;
    std::string cause;
    std::chrono::system_clock::time_point at;
};

 
// Sliding-window admission control.
// Owns no window state: entries live in the WindowStore under key_prefix + key
// and expire by TTL once a key goes quiet.
class RateLimiter {
public:
    using Clock = std::chrono::system_clock;
    using FailOpenSink = std::function<void(const FailOpenEvent&)>;

    // The default sink logs a FAIL_OPEN event and bumps rate_limiter_fail_open_total.
    explicit RateLimiter(WindowStore& store, std::string key_prefix = "ratelimit:",
                         FailOpenSink sink = default_fail_open_sink);
    ~RateLimiter() = default;

    /**
     * Decides whether one more unit of work for key is admitted.
     * @param key Entity being throttled (user, client id).
     * @param limit Maximum admitted units per window; <= 0 always denies.
     * @param window Sliding window length; must be positive.
     * @param now Decision timestamp.
     * @return Decision; store failures fail open with remaining = limit.
     * @throws ConfigurationError if window <= 0.
     */
    RateLimitDecision check(const std::string& key, int limit, std::chrono::milliseconds window,
                            Clock::time_point now);

    RateLimitDecision check(const std::string& key, int limit, std::chrono::milliseconds window) {
        return check(key, limit, window, Clock::now());
    }

    static void default_fail_open_sink(const FailOpenEvent& event);

private:
    RateLimitDecision fail_open(const std::string& key, int limit, Clock::time_point now, const std::string& cause);

    WindowStore& store_;
    std::string key_prefix_;
    FailOpenSink sink_;
};

} 
