#pragma once

#include <string>
#include <map>
#include <set>
#include <mutex>
#include <sstream>

namespace throttle {

// Point-in-time copy of every series in the registry.
struct MetricsSnapshot {
    std::map<std::string, double> counters;
    std::map<std::string, double> gauges;
};

// Process-wide registry for limiter, harness and driver series.
// Series names may carry one Prometheus label, built with series().
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // family{label="value"}
    static std::string series(const std::string& family, const std::string& label, const std::string& value) {
        return family + "{" + label + "=\"" + value + "\"}";
    }

    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second : 0.0;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] -= value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return (it != gauges_.end()) ? it->second : 0.0;
    }

    MetricsSnapshot snapshot() {
        std::lock_guard<std::mutex> lock(mutex_);
        return MetricsSnapshot{counters_, gauges_};
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

    /**
     * Prometheus text exposition (format 0.0.4). One TYPE line per family,
     * followed by its series.
     */
    std::string collect_prometheus() {
        MetricsSnapshot snap = snapshot();
        std::stringstream ss;
        write_family(ss, snap.counters, "counter");
        write_family(ss, snap.gauges, "gauge");
        return ss.str();
    }

private:
    MetricsRegistry() = default;

    static std::string family_of(const std::string& name) {
        return name.substr(0, name.find('{'));
    }

    static void write_family(std::stringstream& ss, const std::map<std::string, double>& values,
                             const std::string& type) {
        std::set<std::string> families;
        for (const auto& [name, val] : values) {
            families.insert(family_of(name));
        }
        for (const auto& family : families) {
            ss << "# TYPE " << family << " " << type << "\n";
            for (const auto& [name, val] : values) {
                if (family_of(name) == family) {
                    ss << name << " " << val << "\n";
                }
            }
        }
    }

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::mutex mutex_;
};

}
