#pragma once

#include <string>
#include <chrono>

namespace throttle {

// Result of one trim-count-record step.
struct WindowAdmission {
    long long count = 0;    // Members inside the window before this request
    bool recorded = false;  // True if the new member was added
};


// Abstract interface for the time-indexed set the rate limiter counts against.
// Primary implementation uses Redis sorted sets for distributed access; an
// in-memory implementation serves single-process deployments and tests.
// All operations report failures by throwing BackingStoreError.
class WindowStore {
public:
    virtual ~WindowStore() = default;

    /**
     * Records a member in the set stored at key.
     * @param key Store key (already prefixed by the caller).
     * @param score Ordering score, milliseconds since the Unix epoch.
     * @param member Member identity; must be unique within the key.
     */
    virtual void add_timed_member(const std::string& key, double score, const std::string& member) = 0;

    // Removes every member whose score is strictly below the given score.
    virtual void remove_members_below(const std::string& key, double score) = 0;

    virtual long long count_members(const std::string& key) = 0;

    // (Re)sets the time-to-live of the whole key.
    virtual void set_ttl(const std::string& key, std::chrono::milliseconds ttl) = 0;

    /**
     * Removes members scored below cutoff, counts the rest and, if the count is
     * below limit, adds member at score and resets the key TTL.
     * Executes as one step: concurrent callers on the same key are serialized
     * by the store and never wait on a timeout.
     */
    virtual WindowAdmission record_if_below(const std::string& key, double cutoff, double score,
                                            const std::string& member, long long limit,
                                            std::chrono::milliseconds ttl) = 0;
};

}
