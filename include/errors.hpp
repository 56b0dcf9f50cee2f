#pragma once

#include <stdexcept>
#include <string>

namespace throttle {

// Invalid limit/window/concurrency or other settings. Fatal, never retried.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Any failure reaching the backing window store.
class BackingStoreError : public std::runtime_error {
public:
    explicit BackingStoreError(const std::string& what) : std::runtime_error(what) {}
};

// A single worker iteration failed.
class OperationError : public std::runtime_error {
public:
    explicit OperationError(const std::string& what) : std::runtime_error(what) {}
};

// A worker could not run at all (e.g. no connection could be obtained).
class WorkerFatalError : public std::runtime_error {
public:
    explicit WorkerFatalError(const std::string& what) : std::runtime_error(what) {}
};

}
