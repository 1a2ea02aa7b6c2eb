#include "server_middleware.hpp"

#include "../errors.hpp"
#include "../logger.hpp"

#include <cmath>
#include <sstream>

#include <log4cplus/loggingmacros.h>

namespace rpcgate::server {

void ValidationMiddleware::process(ServerContext& ctx, const Next& next) {
    ShapeError error = validate_request_shape(ctx.request);
    if (error != ShapeError::ok) {
        std::ostringstream oss;
        oss << "Invalid request from " << ctx.sender_id << ": " << to_string(error);
        diagnostics_.emit(diag::kSecurity, oss.str());
        ctx.reject(messages::kInvalidFormat);
        return;
    }
    next();
}

void SecurityMiddleware::process(ServerContext& ctx, const Next& next) {
    double age = now_() - ctx.request.timestamp;

    std::ostringstream oss;
    if (!std::isfinite(age) || age > max_request_age_) {
        oss << "Stale request from " << ctx.sender_id << " action=" << ctx.request.action << " age=" << age << "s";
    } else if (-age > max_clock_skew_) {
        oss << "Future-dated request from " << ctx.sender_id << " action=" << ctx.request.action
            << " skew=" << -age << "s";
    } else if (!ctx.request.sender_id.empty() && ctx.request.sender_id != ctx.sender_id) {
        oss << "Sender mismatch: session " << ctx.sender_id << " claimed " << ctx.request.sender_id;
    } else {
        next();
        return;
    }

    diagnostics_.emit(diag::kSecurity, oss.str());
    ctx.reject(messages::kSecurityViolation);
}

void AdminMiddleware::process(ServerContext& ctx, const Next& next) {
    if (is_admin_) {
        decide(ctx, is_admin_(ctx.sender_id), next);
        return;
    }

    if (!async_is_admin_) {
        decide(ctx, false, next);
        return;
    }

    ctx.suspend();
    auto* ctx_ptr = &ctx;
    async_is_admin_(ctx.sender_id, [this, ctx_ptr, next](bool allowed) { decide(*ctx_ptr, allowed, next); });
}

void AdminMiddleware::decide(ServerContext& ctx, bool allowed, const Next& next) {
    if (allowed) {
        next();
        return;
    }
    diagnostics_.emit(diag::kSecurity,
                      "Admin action " + ctx.request.action + " denied for " + ctx.sender_id);
    ctx.reject(messages::kUnauthorized);
}

void RequestLoggingMiddleware::process(ServerContext& ctx, const Next& next) {
    LOG4CPLUS_DEBUG(server_logger(), "Request " << ctx.request.action << " id=" << ctx.request.id
                                                << " from " << ctx.sender_id);

    double started = now_();
    std::string action = ctx.request.action;
    std::string sender = ctx.sender_id;
    TimeSource now = now_;
    ctx.observe([action, sender, started, now](const Response& response) {
        double elapsed_ms = (now() - started) * 1000.0;
        if (response.success) {
            LOG4CPLUS_INFO(server_logger(), action << " from " << sender << " ok (" << elapsed_ms << " ms)");
        } else {
            LOG4CPLUS_INFO(server_logger(), action << " from " << sender << " failed: " << response.error
                                                   << " (" << elapsed_ms << " ms)");
        }
    });

    next();
}

void RateLimitMiddleware::process(ServerContext& ctx, const Next& next) {
    if (limiter_.allow(ctx.sender_id)) {
        next();
        return;
    }
    ++rejected_;
    diagnostics_.emit(diag::kRateLimit, "Rate limit exceeded by " + ctx.sender_id + " action=" + ctx.request.action);
    ctx.reject(messages::kRateLimited);
}

ServerMiddlewarePtr validation_middleware(DiagnosticsSink& diagnostics) {
    return std::make_shared<ValidationMiddleware>(diagnostics);
}

ServerMiddlewarePtr security_middleware(double max_request_age, double max_clock_skew, TimeSource now,
                                        DiagnosticsSink& diagnostics) {
    return std::make_shared<SecurityMiddleware>(max_request_age, max_clock_skew, std::move(now), diagnostics);
}

ServerMiddlewarePtr admin_middleware(AdminPredicate is_admin, DiagnosticsSink& diagnostics) {
    return std::make_shared<AdminMiddleware>(std::move(is_admin), diagnostics);
}

ServerMiddlewarePtr admin_middleware(AsyncAdminPredicate is_admin, DiagnosticsSink& diagnostics) {
    return std::make_shared<AdminMiddleware>(std::move(is_admin), diagnostics);
}

ServerMiddlewarePtr logging_middleware(TimeSource now) {
    return std::make_shared<RequestLoggingMiddleware>(std::move(now));
}

} // namespace rpcgate::server
