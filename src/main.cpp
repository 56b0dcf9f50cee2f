#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <random>
#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "config.hpp"
#include "errors.hpp"
#include "assessment.hpp"
#include "backend_client.hpp"
#include "event_logger.hpp"
#include "load_harness.hpp"
#include "metrics.hpp"
#include "rate_limiter.hpp"
#include "redis_window_store.hpp"
#include "report_json.hpp"

namespace throttle {

namespace {

const std::vector<std::string> kAllPhases = {"RATE_LIMIT", "SET", "GET", "MIXED", "CONNECTIONS"};

// Phases averaged into the overall throughput band.
const std::vector<std::string> kBackendPhases = {"SET", "GET", "MIXED"};

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

// Fails the worker outright when no pooled connection can be obtained.
void ensure_connection(sw::redis::Redis& redis, int worker_index) {
    try {
        redis.ping();
    } catch (const sw::redis::Error& e) {
        throw WorkerFatalError("worker " + std::to_string(worker_index) + " has no connection: " + e.what());
    }
}

std::mt19937 worker_rng(int worker_index) {
    std::random_device rd;
    std::seed_seq seq{rd(), static_cast<unsigned>(worker_index)};
    return std::mt19937(seq);
}

class PhaseRunner {
public:
    PhaseRunner(const ThrottleConfig& config, std::shared_ptr<sw::redis::Redis> redis)
        : config_(config),
          redis_(redis),
          store_(redis),
          limiter_(store_, config.key_prefix),
          backend_(redis, config.key_space_size),
          harness_(config.phase_timeout) {}

    bool connected() { return store_.ping(); }

    LoadTestReport run(const std::string& phase) {
        if (phase == "RATE_LIMIT") {
            return harness_.run_phase(phase, config_.total_ops, config_.concurrency, [this](int i) -> Operation {
                ensure_connection(*redis_, i);
                auto rng = worker_rng(i);
                return [this, rng]() mutable {
                    std::uniform_int_distribution<int> ids(0, config_.key_space_size - 1);
                    auto decision = limiter_.check("user:" + std::to_string(ids(rng)), config_.limit, config_.window);
                    return decision.allowed;
                };
            }, true);
        }
        if (phase == "SET") {
            return harness_.run_phase(phase, config_.total_ops, config_.concurrency, [this](int i) -> Operation {
                ensure_connection(*redis_, i);
                auto rng = worker_rng(i);
                long long sequence = 0;
                return [this, rng, sequence]() mutable {
                    backend_.set_random(rng, sequence++);
                    return true;
                };
            });
        }
        if (phase == "GET") {
            std::cout << "[*] Pre-populating " << config_.key_space_size << " cache keys...\n";
            backend_.populate();
            return harness_.run_phase(phase, config_.total_ops, config_.concurrency, [this](int i) -> Operation {
                ensure_connection(*redis_, i);
                auto rng = worker_rng(i);
                return [this, rng]() mutable {
                    return backend_.get_random(rng);
                };
            }, true);
        }
        if (phase == "MIXED") {
            return harness_.run_phase(phase, config_.total_ops, config_.concurrency, [this](int i) -> Operation {
                ensure_connection(*redis_, i);
                auto rng = worker_rng(i);
                long long sequence = 0;
                return [this, rng, sequence]() mutable {
                    backend_.mixed_random(rng, sequence++);
                    return true;
                };
            });
        }
        if (phase == "CONNECTIONS") {
            // One worker and one PING per pooled connection, all at once.
            return harness_.run_phase(phase, config_.pool_size, config_.pool_size, [this](int) -> Operation {
                return [this]() {
                    backend_.ping();
                    return true;
                };
            });
        }
        throw ConfigurationError("unknown phase: " + phase);
    }

    void cleanup() {
        try {
            backend_.cleanup();
        } catch (const OperationError& e) {
            std::cerr << "[!] " << e.what() << "\n";
        }
    }

private:
    const ThrottleConfig& config_;
    std::shared_ptr<sw::redis::Redis> redis_;
    RedisWindowStore store_;
    RateLimiter limiter_;
    BackendClient backend_;
    LoadHarness harness_;
};

}

}

int main(int argc, char* argv[]) {
    using throttle::EventLogger;
    using throttle::MetricsRegistry;
    try {
        throttle::ThrottleConfig config;
        std::vector<std::string> phases;
        std::string metrics_file;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [options]\n"
                          << "Options:\n"
                          << "  --phase, -p NAME      Run only this phase (RATE_LIMIT, SET, GET, MIXED, CONNECTIONS); repeatable\n"
                          << "  --metrics-file PATH   Write Prometheus text metrics to PATH on completion\n"
                          << "  --help, -h            Show this help\n"
                          << "Configuration is read from THROTTLE_* environment variables.\n";
                return 0;
            } else if ((arg == "--phase" || arg == "-p") && i + 1 < argc) {
                std::string phase = argv[++i];
                if (!throttle::contains(throttle::kAllPhases, phase)) {
                    std::cerr << "[!] Unknown phase: " << phase << "\n";
                    return 1;
                }
                phases.push_back(phase);
            } else if (arg == "--metrics-file" && i + 1 < argc) {
                metrics_file = argv[++i];
            } else {
                std::cerr << "[!] Unknown argument: " << arg << "\n";
                return 1;
            }
        }
        if (phases.empty()) {
            phases = throttle::kAllPhases;
        }

        // --- Environment Variable Overrides ---
        throttle::apply_env_overrides(config);
        throttle::validate(config);

        auto& metrics = MetricsRegistry::instance();
        metrics.set_gauge("redis_pool_size", config.pool_size);

        std::cout << "[*] Connecting to " << config.redis_url << " (pool_size=" << config.pool_size << ")...\n";
        auto redis = throttle::make_redis_client(config);
        throttle::PhaseRunner runner(config, redis);
        if (!runner.connected()) {
            EventLogger::log(EventLogger::Level::CRITICAL, EventLogger::EventType::STORE_UNAVAILABLE,
                             "<driver>", "Redis unreachable at " + config.redis_url);
            return 1;
        }
        std::cout << "[+] Connected to Redis\n";

        std::vector<throttle::LoadTestReport> reports;
        for (const auto& phase : phases) {
            throttle::LoadTestReport report;
            try {
                report = runner.run(phase);
            } catch (const throttle::OperationError& e) {
                std::cerr << "[!] Phase " << phase << " setup failed: " << e.what() << "\n";
                continue;
            }
            metrics.set_gauge(MetricsRegistry::series("load_phase_ops_per_sec", "phase", phase), report.ops_per_sec);
            metrics.set_gauge(MetricsRegistry::series("load_phase_errors", "phase", phase),
                              static_cast<double>(report.error_count));

            if (phase == "CONNECTIONS") {
                auto check = throttle::MetricsAggregator::connection_check(report, config.pool_size);
                boost::json::object doc;
                doc["report"] = throttle::ReportJson::encode(report);
                doc["connections"] = throttle::ReportJson::encode(check);
                std::cout << throttle::ReportJson::serialize(doc) << std::endl;
                continue;
            }

            reports.push_back(report);
            auto assessment = throttle::assess(report, config.thresholds);
            std::cout << throttle::ReportJson::serialize(throttle::ReportJson::encode(report, assessment)) << std::endl;
        }

        boost::json::object summary;
        if (auto avg_ops = throttle::mean_throughput(reports, throttle::kBackendPhases)) {
            boost::json::object overall;
            overall["avg_ops_per_sec"] = *avg_ops;
            overall["throughput"] = throttle::band_to_string(throttle::assess_throughput(*avg_ops, config.thresholds));
            summary["overall"] = overall;
        } else {
            summary["overall"] = nullptr;
        }
        summary["metrics"] = throttle::ReportJson::encode(metrics.snapshot());
        std::cout << throttle::ReportJson::serialize(summary) << std::endl;

        std::cout << "[*] Cleaning up test data...\n";
        runner.cleanup();

        if (!metrics_file.empty()) {
            std::ofstream out(metrics_file, std::ios::trunc);
            out << metrics.collect_prometheus();
            if (!out) {
                std::cerr << "[!] Could not write metrics to " << metrics_file << "\n";
                return 1;
            }
            std::cout << "[*] Metrics written to " << metrics_file << "\n";
        }

        std::cout << "[+] Load test completed\n";
        return 0;

    } catch (const throttle::ConfigurationError& e) {
        EventLogger::log(EventLogger::Level::CRITICAL, EventLogger::EventType::CONFIG_INVALID, "<driver>", e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
