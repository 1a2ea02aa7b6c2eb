#pragma once

#include "action_registry.hpp"
#include "server_context.hpp"
#include "server_middleware.hpp"

#include "../channel.hpp"
#include "../diagnostics.hpp"
#include "../event_loop.hpp"
#include "../options.hpp"
#include "../rate_limiter.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rpcgate::server {

struct RouterStats {
    std::size_t received = 0;
    std::size_t invalid = 0;
    std::size_t replays = 0;
    std::size_t unknown_actions = 0;
    std::size_t handler_failures = 0;
    std::size_t handler_exceptions = 0;
    std::size_t defects = 0;
    std::size_t responses = 0;
    std::size_t events = 0;
};

/**
 * Authoritative request dispatcher.
 *
 * Lifecycle: construct, init(), register handlers and middleware, then serve.
 * All dispatch happens on the event loop thread; the router must outlive
 * any request still in flight.
 */
class Router {
public:
    Router(EventLoop& loop, ServerChannel& channel, Options options,
           DiagnosticsSink& diagnostics = default_diagnostics(), TimeSource now = wall_clock_seconds);

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    /// Idempotent. Installs built-in middleware and subscribes to the channel.
    void init();
    bool initialized() const { return initialized_; }

    // Last registration for an action wins.
    void handle(const std::string& action, HandlerFn handler);
    void handle(const std::string& action, std::shared_ptr<ActionHandler> handler);
    void handle_async(const std::string& action, AsyncHandlerFn handler);
    void handle_async(const std::string& action, std::shared_ptr<AsyncActionHandler> handler);

    void use(ServerMiddlewarePtr step);
    void use_for_action(const std::string& action, ServerMiddlewarePtr step);

    /// Runs the full pipeline for one raw inbound frame. Always answers.
    void dispatch(const std::string& sender_id, const std::string& bytes);

    bool broadcast(const std::string& event_name, codec::Payload payload = codec::Payload());
    bool send_to_client(const std::string& session_id, const std::string& event_name,
                        codec::Payload payload = codec::Payload());

    /// Drops per-session state (rate window, replay cache).
    void purge_session(const std::string& sender_id);

    std::vector<std::string> registered_actions() const { return registry_.actions(); }
    RouterStats stats() const;
    RateLimiter& rate_limiter() { return limiter_; }
    const Options& options() const { return options_; }

private:
    using ContextPtr = std::shared_ptr<ServerContext>;

    void reject_early(const std::string& sender_id, const std::string& request_id, const char* error);
    bool check_replay(const std::string& sender_id, const Request& request);
    ServerPipeline::Steps chain_for(const std::string& action) const;
    void invoke_handler(const ContextPtr& ctx);
    void step_failed(ServerContext& ctx, const std::string& where, const std::string& what);
    void apply_result(ServerContext& ctx, const HandlerResult& result);
    void finish(const ContextPtr& ctx);
    void send_response(const std::string& sender_id, const Response& response);

    void count(std::size_t RouterStats::*field) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++(stats_.*field);
    }

    struct ReplayCache {
        std::unordered_set<std::string> ids;
        std::deque<std::pair<double, std::string>> expiry;
    };

    EventLoop& loop_;
    ServerChannel& channel_;
    Options options_;
    DiagnosticsSink& diagnostics_;
    TimeSource now_;
    bool initialized_ = false;

    ActionRegistry registry_;
    RateLimiter limiter_;

    mutable std::mutex middleware_mutex_;
    ServerPipeline builtin_;
    ServerPipeline global_;
    std::unordered_map<std::string, ServerPipeline> per_action_;

    std::mutex replay_mutex_;
    std::unordered_map<std::string, ReplayCache> replay_;

    mutable std::mutex stats_mutex_;
    RouterStats stats_;
};

} // namespace rpcgate::server
