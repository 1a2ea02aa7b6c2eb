#pragma once

#include <string>

namespace rpcgate {

// Category names emitted by the core.
namespace diag {
inline constexpr const char* kSecurity = "security";
inline constexpr const char* kRateLimit = "rate_limit";
inline constexpr const char* kHandlerError = "handler_error";
inline constexpr const char* kDefect = "defect";
inline constexpr const char* kRequest = "request";
inline constexpr const char* kSubscriber = "subscriber";
} // namespace diag

class DiagnosticsSink {
public:
    virtual ~DiagnosticsSink() = default;
    virtual void emit(const std::string& category, const std::string& message) = 0;
};

/// Forwards each category to the "rpcgate.<category>" log4cplus logger.
class LogDiagnostics final : public DiagnosticsSink {
public:
    void emit(const std::string& category, const std::string& message) override;
};

DiagnosticsSink& default_diagnostics();

} // namespace rpcgate
