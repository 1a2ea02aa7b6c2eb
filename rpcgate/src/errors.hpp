#pragma once

#include "protocol.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace rpcgate {

enum class ErrorKind {
    failed,       // server answered with success=false
    timeout,      // no answer within the request timeout
    throttled,    // rejected locally by the throttle
    disconnected, // session torn down while pending
    local,        // rejected by a client-side pipeline step
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::failed: return "failed";
        case ErrorKind::timeout: return "timeout";
        case ErrorKind::throttled: return "throttled";
        case ErrorKind::disconnected: return "disconnected";
        case ErrorKind::local: return "local";
    }
    return "unknown";
}

struct RequestError {
    ErrorKind kind = ErrorKind::failed;
    std::string message;
    std::optional<Response> response; // set when the server answered

    bool is_timeout() const { return kind == ErrorKind::timeout; }
};

// Client-safe messages; never carry internal detail.
namespace messages {
inline constexpr const char* kInvalidFormat = "Invalid data format";
inline constexpr const char* kSecurityViolation = "Security check failed";
inline constexpr const char* kDuplicateRequest = "Duplicate request";
inline constexpr const char* kRateLimited = "Rate limit exceeded";
inline constexpr const char* kUnauthorized = "Unauthorized";
inline constexpr const char* kUnknownAction = "Unknown action";
inline constexpr const char* kOperationFailed = "Operation failed";
inline constexpr const char* kRequestRejected = "Request rejected";
inline constexpr const char* kRequestCancelled = "Request cancelled";
inline constexpr const char* kTimeout = "Request timed out";
inline constexpr const char* kThrottled = "Request throttled";
inline constexpr const char* kDisconnected = "Session closed";
} // namespace messages

class ConfigError : public std::runtime_error {
public:
    ConfigError(const std::string& key, const std::string& what)
        : std::runtime_error(key + ": " + what), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

} // namespace rpcgate
