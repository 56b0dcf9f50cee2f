#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

#include "window_store.hpp"

namespace throttle {

// In-process WindowStore. Members are kept ordered by (score, member);
// key expiry is applied lazily on access against the injected clock.
class MemoryWindowStore : public WindowStore {
public:
    using Clock = std::chrono::system_clock;
    using TimeSource = std::function<Clock::time_point()>;

    explicit MemoryWindowStore(TimeSource now = &Clock::now);
    ~MemoryWindowStore() override = default;

    MemoryWindowStore(const MemoryWindowStore&) = delete;
    MemoryWindowStore& operator=(const MemoryWindowStore&) = delete;

    void add_timed_member(const std::string& key, double score, const std::string& member) override;
    void remove_members_below(const std::string& key, double score) override;
    long long count_members(const std::string& key) override;
    void set_ttl(const std::string& key, std::chrono::milliseconds ttl) override;
    WindowAdmission record_if_below(const std::string& key, double cutoff, double score,
                                    const std::string& member, long long limit,
                                    std::chrono::milliseconds ttl) override;

    // Remaining time-to-live, or empty if the key is missing or has none.
    std::optional<std::chrono::milliseconds> ttl(const std::string& key);

    // Number of live keys.
    size_t key_count();

private:
    struct Bucket {
        std::set<std::pair<double, std::string>> members;
        std::optional<Clock::time_point> expires_at;
    };

    // The helpers below expect mutex_ to be held.
    bool purge_if_expired(const std::string& key, Clock::time_point now);
    void add_locked(const std::string& key, double score, const std::string& member, Clock::time_point now);
    void remove_below_locked(const std::string& key, double score, Clock::time_point now);
    long long count_locked(const std::string& key, Clock::time_point now);
    void set_ttl_locked(const std::string& key, std::chrono::milliseconds ttl, Clock::time_point now);

    std::unordered_map<std::string, Bucket> buckets_;
    std::mutex mutex_;
    TimeSource now_;
};

}
