#include "memory_window_store.hpp"

namespace throttle {

MemoryWindowStore::MemoryWindowStore(TimeSource now)
    : now_(std::move(now)) {
}

bool MemoryWindowStore::purge_if_expired(const std::string& key, Clock::time_point now) {
    auto it = buckets_.find(key);
    if (it == buckets_.end()) return false;
    if (it->second.expires_at && *it->second.expires_at <= now) {
        buckets_.erase(it);
        return true;
    }
    return false;
}

void MemoryWindowStore::add_locked(const std::string& key, double score, const std::string& member,
                                   Clock::time_point now) {
    purge_if_expired(key, now);

    auto& members = buckets_[key].members;
    // ZADD semantics: an existing member is re-scored, not duplicated.
    for (auto it = members.begin(); it != members.end(); ++it) {
        if (it->second == member) {
            members.erase(it);
            break;
        }
    }
    members.emplace(score, member);
}

void MemoryWindowStore::remove_below_locked(const std::string& key, double score, Clock::time_point now) {
    if (purge_if_expired(key, now)) return;

    auto it = buckets_.find(key);
    if (it == buckets_.end()) return;

    auto& members = it->second.members;
    members.erase(members.begin(), members.lower_bound({score, std::string()}));
    if (members.empty()) {
        buckets_.erase(it);
    }
}

long long MemoryWindowStore::count_locked(const std::string& key, Clock::time_point now) {
    if (purge_if_expired(key, now)) return 0;

    auto it = buckets_.find(key);
    if (it == buckets_.end()) return 0;
    return static_cast<long long>(it->second.members.size());
}

void MemoryWindowStore::set_ttl_locked(const std::string& key, std::chrono::milliseconds ttl,
                                       Clock::time_point now) {
    if (purge_if_expired(key, now)) return;

    auto it = buckets_.find(key);
    if (it == buckets_.end()) return;
    if (ttl.count() <= 0) {
        buckets_.erase(it);
        return;
    }
    it->second.expires_at = now + ttl;
}

void MemoryWindowStore::add_timed_member(const std::string& key, double score, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    add_locked(key, score, member, now_());
}

void MemoryWindowStore::remove_members_below(const std::string& key, double score) {
    std::lock_guard<std::mutex> lock(mutex_);
    remove_below_locked(key, score, now_());
}

long long MemoryWindowStore::count_members(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_locked(key, now_());
}

void MemoryWindowStore::set_ttl(const std::string& key, std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    set_ttl_locked(key, ttl, now_());
}

WindowAdmission MemoryWindowStore::record_if_below(const std::string& key, double cutoff, double score,
                                                   const std::string& member, long long limit,
                                                   std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = now_();

    remove_below_locked(key, cutoff, now);

    WindowAdmission admission;
    admission.count = count_locked(key, now);
    if (admission.count >= limit) {
        return admission;
    }

    add_locked(key, score, member, now);
    set_ttl_locked(key, ttl, now);
    admission.recorded = true;
    return admission;
}

std::optional<std::chrono::milliseconds> MemoryWindowStore::ttl(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = now_();
    if (purge_if_expired(key, now)) return std::nullopt;

    auto it = buckets_.find(key);
    if (it == buckets_.end() || !it->second.expires_at) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::milliseconds>(*it->second.expires_at - now);
}

size_t MemoryWindowStore::key_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = now_();
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if (it->second.expires_at && *it->second.expires_at <= now) {
            it = buckets_.erase(it);
        } else {
            ++it;
        }
    }
    return buckets_.size();
}

}
