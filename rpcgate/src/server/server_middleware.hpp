#pragma once

#include "server_context.hpp"

#include "../diagnostics.hpp"
#include "../event_loop.hpp"
#include "../middleware/middleware.hpp"
#include "../rate_limiter.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace rpcgate::server {

using ServerMiddleware = middleware::Middleware<ServerContext>;
using ServerMiddlewarePtr = middleware::MiddlewarePtr<ServerContext>;
using ServerPipeline = middleware::Pipeline<ServerContext>;

using AdminPredicate = std::function<bool(const std::string& sender_id)>;
/// Asynchronous lookup; the callback may run later on the loop thread.
using AsyncAdminPredicate = std::function<void(const std::string& sender_id, std::function<void(bool)> done)>;

/// Structure-only re-check of the decoded request.
class ValidationMiddleware final : public ServerMiddleware {
public:
    explicit ValidationMiddleware(DiagnosticsSink& diagnostics) : diagnostics_(diagnostics) {}

    const char* name() const override { return "validation"; }
    void process(ServerContext& ctx, const Next& next) override;

private:
    DiagnosticsSink& diagnostics_;
};

/// Timestamp window and sender identity consistency.
class SecurityMiddleware final : public ServerMiddleware {
public:
    SecurityMiddleware(double max_request_age, double max_clock_skew, TimeSource now, DiagnosticsSink& diagnostics)
        : max_request_age_(max_request_age), max_clock_skew_(max_clock_skew), now_(std::move(now)),
          diagnostics_(diagnostics) {}

    const char* name() const override { return "security"; }
    void process(ServerContext& ctx, const Next& next) override;

private:
    double max_request_age_;
    double max_clock_skew_;
    TimeSource now_;
    DiagnosticsSink& diagnostics_;
};

class AdminMiddleware final : public ServerMiddleware {
public:
    AdminMiddleware(AdminPredicate is_admin, DiagnosticsSink& diagnostics)
        : is_admin_(std::move(is_admin)), diagnostics_(diagnostics) {}
    AdminMiddleware(AsyncAdminPredicate is_admin, DiagnosticsSink& diagnostics)
        : async_is_admin_(std::move(is_admin)), diagnostics_(diagnostics) {}

    const char* name() const override { return "admin"; }
    void process(ServerContext& ctx, const Next& next) override;

private:
    void decide(ServerContext& ctx, bool allowed, const Next& next);

    AdminPredicate is_admin_;
    AsyncAdminPredicate async_is_admin_;
    DiagnosticsSink& diagnostics_;
};

/// Records action, sender and outcome. Never touches the request or response.
class RequestLoggingMiddleware final : public ServerMiddleware {
public:
    explicit RequestLoggingMiddleware(TimeSource now) : now_(std::move(now)) {}

    const char* name() const override { return "logging"; }
    void process(ServerContext& ctx, const Next& next) override;

private:
    TimeSource now_;
};

class RateLimitMiddleware final : public ServerMiddleware {
public:
    RateLimitMiddleware(RateLimiter& limiter, DiagnosticsSink& diagnostics)
        : limiter_(limiter), diagnostics_(diagnostics) {}

    const char* name() const override { return "rate_limit"; }
    void process(ServerContext& ctx, const Next& next) override;

    std::size_t rejected() const { return rejected_.load(); }

private:
    RateLimiter& limiter_;
    DiagnosticsSink& diagnostics_;
    std::atomic<std::size_t> rejected_{0};
};

ServerMiddlewarePtr validation_middleware(DiagnosticsSink& diagnostics = default_diagnostics());
ServerMiddlewarePtr security_middleware(double max_request_age, double max_clock_skew,
                                        TimeSource now = wall_clock_seconds,
                                        DiagnosticsSink& diagnostics = default_diagnostics());
ServerMiddlewarePtr admin_middleware(AdminPredicate is_admin, DiagnosticsSink& diagnostics = default_diagnostics());
ServerMiddlewarePtr admin_middleware(AsyncAdminPredicate is_admin, DiagnosticsSink& diagnostics = default_diagnostics());
ServerMiddlewarePtr logging_middleware(TimeSource now = steady_seconds);

} // namespace rpcgate::server
