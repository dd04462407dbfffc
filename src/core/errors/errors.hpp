#pragma once
#include <stdexcept>
#include <string>

namespace Trawl {
namespace Core {

enum class ErrorKind {
    None,
    TransientNetwork,  // timeout, reset, 5xx
    RateLimit,         // 429
    Client,            // other 4xx
    Validation,        // malformed entity payload
    Configuration,     // bad proxy entry, invalid budget
    StoreUnavailable   // key-value or durable store unreachable
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {
    }
};

class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {
    }
};

class StoreUnavailableError : public std::runtime_error {
public:
    explicit StoreUnavailableError(const std::string& message) : std::runtime_error(message) {
    }
};

class ApiError : public std::runtime_error {
public:
    ApiError(ErrorKind kind, long status, const std::string& message)
        : std::runtime_error(message), kind_(kind), status_(status) {
    }

    ErrorKind kind() const {
        return kind_;
    }
    long status() const {
        return status_;
    }

private:
    ErrorKind kind_;
    long      status_;
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::TransientNetwork:
            return "transient_network";
        case ErrorKind::RateLimit:
            return "rate_limit";
        case ErrorKind::Client:
            return "client";
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::Configuration:
            return "configuration";
        case ErrorKind::StoreUnavailable:
            return "store_unavailable";
    }
    return "unknown";
}

}  // namespace Core
}  // namespace Trawl
