#pragma once

#include "client_context.hpp"

#include "../event_loop.hpp"
#include "../middleware/middleware.hpp"
#include "../options.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace rpcgate::client {

using ClientMiddleware = middleware::Middleware<ClientContext>;
using ClientMiddlewarePtr = middleware::MiddlewarePtr<ClientContext>;
using ClientPipeline = middleware::Pipeline<ClientContext>;

/// Minimum spacing between requests for the same action.
class ThrottleMiddleware final : public ClientMiddleware {
public:
    ThrottleMiddleware(EventLoop& loop, double interval, ThrottleMode mode)
        : loop_(loop), interval_(interval), mode_(mode) {}

    const char* name() const override { return "throttle"; }
    void process(ClientContext& ctx, const Next& next) override;

private:
    EventLoop& loop_;
    double interval_;
    ThrottleMode mode_;
    std::mutex mutex_;
    std::unordered_map<std::string, double> last_sent_;
};

/// Re-issues failed attempts with exponential backoff; the caller sees only the final outcome.
class RetryMiddleware final : public ClientMiddleware {
public:
    explicit RetryMiddleware(RetryPolicy policy) : policy_(policy) {}

    const char* name() const override { return "retry"; }
    void process(ClientContext& ctx, const Next& next) override;

private:
    RetryPolicy policy_;
};

class ClientLoggingMiddleware final : public ClientMiddleware {
public:
    const char* name() const override { return "logging"; }
    void process(ClientContext& ctx, const Next& next) override;
};

ClientMiddlewarePtr throttle_middleware(EventLoop& loop, double interval, ThrottleMode mode = ThrottleMode::reject);
ClientMiddlewarePtr retry_middleware(RetryPolicy policy);
ClientMiddlewarePtr client_logging_middleware();

} // namespace rpcgate::client
