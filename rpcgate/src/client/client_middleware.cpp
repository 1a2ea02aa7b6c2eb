#include "client_middleware.hpp"

#include "../logger.hpp"

#include <memory>

#include <log4cplus/loggingmacros.h>

namespace rpcgate::client {

void ThrottleMiddleware::process(ClientContext& ctx, const Next& next) {
    double now = loop_.now();
    double wait = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_sent_.find(ctx.request.action);
        if (it == last_sent_.end() || now - it->second >= interval_) {
            last_sent_[ctx.request.action] = now;
        } else if (mode_ == ThrottleMode::reject) {
            wait = -1.0;
        } else {
            double slot = it->second + interval_;
            it->second = slot;
            wait = slot - now;
        }
    }

    if (wait < 0.0) {
        LOG4CPLUS_DEBUG(client_logger(), "Throttled " << ctx.request.action);
        ctx.reject(ErrorKind::throttled, messages::kThrottled);
        return;
    }
    if (wait > 0.0) {
        LOG4CPLUS_DEBUG(client_logger(), "Delaying " << ctx.request.action << " by " << wait << "s");
        ctx.suspend();
        loop_.schedule_after(wait, next);
        return;
    }
    next();
}

void RetryMiddleware::process(ClientContext& ctx, const Next& next) {
    ctx.retry = policy_;
    next();
}

void ClientLoggingMiddleware::process(ClientContext& ctx, const Next& next) {
    std::string action = ctx.request.action;
    std::string id = ctx.request.id;
    LOG4CPLUS_DEBUG(client_logger(), "Request " << action << " id=" << id);

    ctx.completion.then(
        [action](const Response&) { LOG4CPLUS_INFO(client_logger(), action << " ok"); },
        [action](const RequestError& error) {
            LOG4CPLUS_INFO(client_logger(), action << " " << to_string(error.kind) << ": " << error.message);
        });
    next();
}

ClientMiddlewarePtr throttle_middleware(EventLoop& loop, double interval, ThrottleMode mode) {
    return std::make_shared<ThrottleMiddleware>(loop, interval, mode);
}

ClientMiddlewarePtr retry_middleware(RetryPolicy policy) {
    return std::make_shared<RetryMiddleware>(policy);
}

ClientMiddlewarePtr client_logging_middleware() {
    return std::make_shared<ClientLoggingMiddleware>();
}

} // namespace rpcgate::client
