#pragma once

#include <string>
#include <chrono>
#include <memory>
#include <sw/redis++/redis++.h>

#include "window_store.hpp"

namespace throttle {

struct ThrottleConfig;

// Builds a Redis client over a bounded connection pool. Every command borrows one
// pooled connection and returns it immediately; callers beyond pool_size wait up to
// pool_wait_timeout_ms for a free connection.
std::shared_ptr<sw::redis::Redis> make_redis_client(const ThrottleConfig& config);

// Redis sorted-set backed WindowStore. Scores are epoch milliseconds.
class RedisWindowStore : public WindowStore {
public:
    explicit RedisWindowStore(std::shared_ptr<sw::redis::Redis> redis);
    ~RedisWindowStore() override = default;

    void add_timed_member(const std::string& key, double score, const std::string& member) override;
    void remove_members_below(const std::string& key, double score) override;
    long long count_members(const std::string& key) override;
    void set_ttl(const std::string& key, std::chrono::milliseconds ttl) override;

    // ZREMRANGEBYSCORE, ZCARD, ZADD and PEXPIRE in a single Lua script.
    WindowAdmission record_if_below(const std::string& key, double cutoff, double score,
                                    const std::string& member, long long limit,
                                    std::chrono::milliseconds ttl) override;

    // Connection health check.
    bool ping();

    // Deletes a key outright (test cleanup).
    bool delete_key(const std::string& key);

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};

}
