#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    Validation,   // caller input malformed; never retried
    Unavailable,  // backend unreachable after the retry budget
    Unauthorized, // credential/config problem; needs operator action
    Unexpected,   // contract violation from a backend or store
    Conflict,     // storage key already holds different bytes
    Transient,    // retryable class; only seen inside clients
    Cancelled     // run cancelled or past its deadline
};

const char* to_string(ErrorKind kind);

struct Failure {
    ErrorKind kind{ErrorKind::Unexpected};
    std::string message;
    bool retryable{false};
};

enum class TransportFailure { ConnectFailed, Timeout, Cancelled, Other };

// Thrown by HttpTransport when no HTTP response was received.
class TransportError : public std::runtime_error {
public:
    TransportError(TransportFailure failure, const std::string& msg)
        : std::runtime_error(msg), failure_(failure) {}
    TransportFailure failure() const { return failure_; }

private:
    TransportFailure failure_;
};

// Thrown by ObjectStore implementations.
class StorageError : public std::runtime_error {
public:
    StorageError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}
    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};
