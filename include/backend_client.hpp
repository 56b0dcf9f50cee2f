#pragma once

#include <memory>
#include <random>
#include <string>
#include <sw/redis++/redis++.h>

namespace throttle {

// Synthetic read/write traffic against the backing service the limiter protects.
// Keys are drawn uniformly from [0, key_space_size). Redis failures surface as OperationError.
class BackendClient {
public:
    BackendClient(std::shared_ptr<sw::redis::Redis> redis, int key_space_size);

    // SET load_test:key:<n> with a 300s TTL.
    void set_random(std::mt19937& rng, long long sequence);

    // GET load_test:key:<n>. Returns true on a cache hit.
    bool get_random(std::mt19937& rng);

    // One of SET / GET / INCR / LPUSH / HSET chosen uniformly.
    void mixed_random(std::mt19937& rng, long long sequence);

    // PING over one pooled connection.
    void ping();

    // Writes every key in the key space with a 600s TTL so the GET phase can hit.
    void populate();

    // Deletes the key-space keys written by the phases.
    void cleanup();

    std::string cache_key(int n) const { return "load_test:key:" + std::to_string(n); }

private:
    // Uniform in [0, count).
    int random_key(std::mt19937& rng, int count);

    std::shared_ptr<sw::redis::Redis> redis_;
    int key_space_size_;
};

}
