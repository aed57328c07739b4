#pragma once
#include <stdexcept>
#include <string>

// Remote embedding backend failed: transport, status or response shape.
struct EmbeddingError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// SQLite statement, transaction or connection failure.
struct StoreError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Configuration file missing, unreadable or malformed.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
