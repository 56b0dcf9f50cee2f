#include "backend_client.hpp"
#include "errors.hpp"
#include <chrono>

namespace throttle {

BackendClient::BackendClient(std::shared_ptr<sw::redis::Redis> redis, int key_space_size)
    : redis_(std::move(redis)), key_space_size_(key_space_size) {
}

int BackendClient::random_key(std::mt19937& rng, int count) {
    std::uniform_int_distribution<int> dist(0, count - 1);
    return dist(rng);
}

void BackendClient::set_random(std::mt19937& rng, long long sequence) {
    try {
        std::uniform_int_distribution<int> salt(0, 1000000);
        std::string value = "value_" + std::to_string(sequence) + "_" + std::to_string(salt(rng));
        redis_->set(cache_key(random_key(rng, key_space_size_)), value, std::chrono::seconds(300));
    } catch (const sw::redis::Error& e) {
        throw OperationError(std::string("SET failed: ") + e.what());
    }
}

bool BackendClient::get_random(std::mt19937& rng) {
    try {
        auto val = redis_->get(cache_key(random_key(rng, key_space_size_)));
        return static_cast<bool>(val);
    } catch (const sw::redis::Error& e) {
        throw OperationError(std::string("GET failed: ") + e.what());
    }
}

void BackendClient::mixed_random(std::mt19937& rng, long long sequence) {
    std::string seq = std::to_string(sequence);
    try {
        switch (random_key(rng, 5)) {
            case 0:
                redis_->set("load_test:mixed:" + std::to_string(random_key(rng, key_space_size_)),
                            "value_" + seq, std::chrono::seconds(300));
                break;
            case 1:
                redis_->get("load_test:mixed:" + std::to_string(random_key(rng, key_space_size_)));
                break;
            case 2:
                redis_->incr("load_test:counter:" + std::to_string(random_key(rng, 100)));
                break;
            case 3:
                redis_->lpush("load_test:list:" + std::to_string(random_key(rng, 100)), "item_" + seq);
                break;
            default:
                redis_->hset("load_test:hash:" + std::to_string(random_key(rng, 100)), "field_" + seq, "value_" + seq);
                break;
        }
    } catch (const sw::redis::Error& e) {
        throw OperationError(std::string("MIXED operation failed: ") + e.what());
    }
}

void BackendClient::ping() {
    try {
        redis_->ping();
    } catch (const sw::redis::Error& e) {
        throw OperationError(std::string("PING failed: ") + e.what());
    }
}

void BackendClient::populate() {
    try {
        for (int i = 0; i < key_space_size_; ++i) {
            redis_->set(cache_key(i), "value_" + std::to_string(i), std::chrono::seconds(600));
        }
    } catch (const sw::redis::Error& e) {
        throw OperationError(std::string("cache pre-population failed: ") + e.what());
    }
}

void BackendClient::cleanup() {
    try {
        for (int i = 0; i < key_space_size_; ++i) {
            redis_->del(cache_key(i));
        }
    } catch (const sw::redis::Error& e) {
        throw OperationError(std::string("cleanup failed: ") + e.what());
    }
}

}
