#pragma once

#include <string>
#include <boost/json.hpp>

#include "assessment.hpp"
#include "load_report.hpp"
#include "metrics.hpp"
#include "rate_limiter.hpp"

namespace throttle {

// Structured encodings handed to the report sink. Durations are emitted in
// fractional milliseconds; insufficient-data latencies are emitted as null.
class ReportJson {
public:
    static boost::json::object encode(const LoadTestReport& report);
    static boost::json::object encode(const Assessment& assessment);
    static boost::json::object encode(const LoadTestReport& report, const Assessment& assessment);
    static boost::json::object encode(const RateLimitDecision& decision);
    static boost::json::object encode(const ConnectionCheck& check);
    static boost::json::object encode(const MetricsSnapshot& snapshot);

    static std::string serialize(const boost::json::object& obj) {
        return boost::json::serialize(obj);
    }
};

}
