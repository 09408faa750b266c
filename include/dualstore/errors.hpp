#pragma once

#include <stdexcept>
#include <string>

namespace dualstore {

// Local SQLite store failure. Fatal during initialization.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// Failure reported by a remote database implementation
class RemoteError : public std::runtime_error {
public:
    explicit RemoteError(const std::string& what) : std::runtime_error(what) {}
};

// A deadline race was lost. The raced operation may still complete.
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace dualstore
