#include "redis_window_store.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <vector>

namespace throttle {

namespace {

// Runs atomically on the server, so no other client observes the window
// between the count and the add.
const std::string kRecordScript = R"(
    local key = KEYS[1]
    local cutoff = ARGV[1]
    local score = ARGV[2]
    local member = ARGV[3]
    local limit = tonumber(ARGV[4])
    local ttl_ms = ARGV[5]

    redis.call('ZREMRANGEBYSCORE', key, '-inf', '(' .. cutoff)
    local count = redis.call('ZCARD', key)
    if count >= limit then
        return {count, 0}
    end

    redis.call('ZADD', key, score, member)
    redis.call('PEXPIRE', key, ttl_ms)
    return {count, 1}
)";

// Epoch-millisecond scores are integral; print them without exponent or padding.
std::string format_score(double score) {
    std::ostringstream out;
    out << std::setprecision(17) << score;
    return out.str();
}

}

std::shared_ptr<sw::redis::Redis> make_redis_client(const ThrottleConfig& config) {
    try {
        sw::redis::ConnectionOptions connection_options(config.redis_url);

        sw::redis::ConnectionPoolOptions pool_options;
        pool_options.size = static_cast<std::size_t>(config.pool_size);
        pool_options.wait_timeout = std::chrono::milliseconds(config.pool_wait_timeout_ms);

        return std::make_shared<sw::redis::Redis>(connection_options, pool_options);
    } catch (const sw::redis::Error& e) {
        throw ConfigurationError("invalid redis_url '" + config.redis_url + "': " + e.what());
    }
}

RedisWindowStore::RedisWindowStore(std::shared_ptr<sw::redis::Redis> redis)
    : redis_(std::move(redis)) {
}

void RedisWindowStore::add_timed_member(const std::string& key, double score, const std::string& member) {
    try {
        redis_->zadd(key, member, score);
    } catch (const sw::redis::Error& e) {
        throw BackingStoreError(std::string("ZADD failed: ") + e.what());
    }
}

void RedisWindowStore::remove_members_below(const std::string& key, double score) {
    try {
        // ZREMRANGEBYSCORE key -inf (score
        redis_->zremrangebyscore(key, sw::redis::RightBoundedInterval<double>(score, sw::redis::BoundType::RIGHT_OPEN));
    } catch (const sw::redis::Error& e) {
        throw BackingStoreError(std::string("ZREMRANGEBYSCORE failed: ") + e.what());
    }
}

long long RedisWindowStore::count_members(const std::string& key) {
    try {
        return redis_->zcard(key);
    } catch (const sw::redis::Error& e) {
        throw BackingStoreError(std::string("ZCARD failed: ") + e.what());
    }
}

void RedisWindowStore::set_ttl(const std::string& key, std::chrono::milliseconds ttl) {
    try {
        redis_->pexpire(key, ttl);
    } catch (const sw::redis::Error& e) {
        throw BackingStoreError(std::string("PEXPIRE failed: ") + e.what());
    }
}

WindowAdmission RedisWindowStore::record_if_below(const std::string& key, double cutoff, double score,
                                                  const std::string& member, long long limit,
                                                  std::chrono::milliseconds ttl) {
    std::vector<std::string> keys = {key};
    std::vector<std::string> args = {
        format_score(cutoff),
        format_score(score),
        member,
        std::to_string(limit),
        std::to_string(ttl.count())
    };

    std::vector<long long> res;
    try {
        redis_->eval(kRecordScript, keys.begin(), keys.end(), args.begin(), args.end(), std::back_inserter(res));
    } catch (const sw::redis::Error& e) {
        throw BackingStoreError(std::string("window script failed: ") + e.what());
    }
    if (res.size() < 2) {
        throw BackingStoreError("window script returned " + std::to_string(res.size()) + " values, expected 2");
    }

    WindowAdmission admission;
    admission.count = res[0];
    admission.recorded = res[1] == 1;
    return admission;
}

bool RedisWindowStore::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        std::cerr << "[!] Redis ping failed: " << e.what() << "\n";
        return false;
    }
}

bool RedisWindowStore::delete_key(const std::string& key) {
    try {
        return redis_->del(key) > 0;
    } catch (const sw::redis::Error& e) {
        throw BackingStoreError(std::string("DEL failed: ") + e.what());
    }
}

}
