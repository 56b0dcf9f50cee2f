#include "rate_limiter.hpp"
#include "errors.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"
#include "nonce.hpp"
#include <iostream>

namespace throttle {

RateLimiter::RateLimiter(WindowStore& store, std::string key_prefix, FailOpenSink sink)
    : store_(store), key_prefix_(std::move(key_prefix)), sink_(std::move(sink))
{}

// Evaluates a request against the sliding window stored for key.
// Expired entries are removed before counting; a denied request records nothing.
RateLimitDecision RateLimiter::check(const std::string& key, int limit, std::chrono::milliseconds window,
                                     Clock::time_point now) {
    if (window.count() <= 0) {
        throw ConfigurationError("rate limit window must be positive, got " + std::to_string(window.count()) + "ms");
    }
    if (limit <= 0) {
        MetricsRegistry::instance().increment_counter("rate_limiter_denied_total");
        return {false, 0};
    }

    const std::string store_key = key_prefix_ + key;
    const long long now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    const double cutoff = static_cast<double>(now_ms - window.count());

    try {
        std::string member = std::to_string(now_ms) + ":" + NonceGenerator::generate();
        WindowAdmission admission = store_.record_if_below(store_key, cutoff, static_cast<double>(now_ms),
                                                           member, limit, window);
        if (!admission.recorded) {
            MetricsRegistry::instance().increment_counter("rate_limiter_denied_total");
            return {false, 0};
        }

        MetricsRegistry::instance().increment_counter("rate_limiter_allowed_total");
        return {true, limit - admission.count - 1};
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        return fail_open(key, limit, now, e.what());
    }
}

// Availability of the protected service takes priority over strict quota
// enforcement: the caller is admitted with a full quota and the failure is
// reported only through the sink.
RateLimitDecision RateLimiter::fail_open(const std::string& key, int limit, Clock::time_point now,
                                         const std::string& cause) {
    if (sink_) {
        try {
            sink_(FailOpenEvent{key, cause, now});
        } catch (const std::exception& e) {
            std::cerr << "[!] Fail-open sink error: " << e.what() << "\n";
        }
    }
    return {true, limit, true};
}

void RateLimiter::default_fail_open_sink(const FailOpenEvent& event) {
    MetricsRegistry::instance().increment_counter("rate_limiter_fail_open_total");
    EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::FAIL_OPEN, event.key,
                     "store error, request admitted: " + event.cause);
}

}
