#include "report_json.hpp"

namespace json = boost::json;

namespace throttle {

namespace {

json::value millis(const std::optional<std::chrono::nanoseconds>& value) {
    if (!value) return nullptr;
    return std::chrono::duration<double, std::milli>(*value).count();
}

json::value band(const std::optional<Band>& value) {
    if (!value) return nullptr;
    return json::string(band_to_string(*value));
}

}

json::object ReportJson::encode(const LoadTestReport& report) {
    json::object obj;
    obj["phase"] = report.phase;
    obj["requested_ops"] = static_cast<int64_t>(report.requested_ops);
    obj["total_ops"] = static_cast<uint64_t>(report.total_ops);
    obj["total_time_ms"] = std::chrono::duration<double, std::milli>(report.total_time).count();
    obj["ops_per_sec"] = report.ops_per_sec;
    obj["avg_latency_ms"] = millis(report.avg_latency);
    obj["p95_latency_ms"] = millis(report.p95_latency);
    obj["p99_latency_ms"] = millis(report.p99_latency);
    obj["error_count"] = static_cast<uint64_t>(report.error_count);
    obj["lost_workers"] = static_cast<uint64_t>(report.lost_workers);
    obj["positive_count"] = static_cast<uint64_t>(report.positive_count);
    if (report.tracks_positives) {
        obj["positive_ratio"] = report.positive_ratio;
    } else {
        obj["positive_ratio"] = nullptr;
    }
    return obj;
}

json::object ReportJson::encode(const Assessment& assessment) {
    json::object obj;
    obj["throughput"] = band_to_string(assessment.throughput);
    obj["hit_ratio"] = band(assessment.hit_ratio);
    obj["p95_latency"] = band(assessment.p95_latency);
    return obj;
}

json::object ReportJson::encode(const LoadTestReport& report, const Assessment& assessment) {
    json::object obj;
    obj["report"] = encode(report);
    obj["assessment"] = encode(assessment);
    return obj;
}

json::object ReportJson::encode(const RateLimitDecision& decision) {
    json::object obj;
    obj["allowed"] = decision.allowed;
    obj["remaining"] = static_cast<int64_t>(decision.remaining);
    obj["failed_open"] = decision.failed_open;
    return obj;
}

json::object ReportJson::encode(const ConnectionCheck& check) {
    json::object obj;
    obj["max_connections"] = check.max_connections;
    obj["acquisition_time_ms"] = std::chrono::duration<double, std::milli>(check.acquisition_time).count();
    obj["failed"] = static_cast<uint64_t>(check.failed);
    obj["status"] = check.succeeded() ? "success" : "failed";
    return obj;
}

json::object ReportJson::encode(const MetricsSnapshot& snapshot) {
    json::object counters;
    for (const auto& [name, value] : snapshot.counters) {
        counters[name] = value;
    }
    json::object gauges;
    for (const auto& [name, value] : snapshot.gauges) {
        gauges[name] = value;
    }

    json::object obj;
    obj["counters"] = std::move(counters);
    obj["gauges"] = std::move(gauges);
    return obj;
}

}
