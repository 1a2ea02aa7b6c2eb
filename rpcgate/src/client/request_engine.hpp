#pragma once

#include "client_context.hpp"
#include "client_middleware.hpp"

#include "../channel.hpp"
#include "../diagnostics.hpp"
#include "../event_loop.hpp"
#include "../options.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rpcgate::client {

struct PendingRequest {
    std::string id;
    double created_at = 0.0;
    double deadline = 0.0;
    ResponseCompletion completion;
    EventLoop::TimerId timer = 0;
};

/**
 * Client side of the request/response layer.
 *
 * Correlates responses to pending requests by id, enforces the request
 * timeout and fans server events out to subscribers. Runs on the loop thread.
 */
class RequestEngine {
public:
    using EventCallback = std::function<void(const codec::Payload& payload)>;

    RequestEngine(EventLoop& loop, ClientChannel& channel, Options options,
                  DiagnosticsSink& diagnostics = default_diagnostics(), TimeSource wall_now = wall_clock_seconds);
    ~RequestEngine();

    RequestEngine(const RequestEngine&) = delete;
    RequestEngine& operator=(const RequestEngine&) = delete;

    /// Idempotent. Installs the configured built-in middleware and subscribes to the channel.
    void init();
    bool initialized() const { return initialized_; }

    void use(ClientMiddlewarePtr step);

    /// Resolves with the response on success; rejects with a RequestError otherwise.
    ResponseCompletion request(const std::string& action, codec::Payload payload = codec::Payload());

    void on_server_message(const std::string& event_name, EventCallback callback);

    /// Entry point for every inbound frame.
    void handle_message(const std::string& bytes);

    /// Rejects every pending request; returns how many were dropped.
    std::size_t cancel_all(ErrorKind kind, const std::string& message);
    void shutdown();

    std::size_t pending_count() const;

private:
    using ContextPtr = std::shared_ptr<ClientContext>;

    static void settle_locally(const ContextPtr& ctx);
    void transmit(const ContextPtr& ctx, int attempt);
    bool should_retry(const ClientContext& ctx, const RequestError& error, int attempt) const;
    ResponseCompletion send_attempt(const Request& request);
    void resolve_pending(const Response& response);
    void expire(const std::string& request_id);
    void drop(const std::string& request_id);
    void dispatch_event(const Event& event);

    EventLoop& loop_;
    ClientChannel& channel_;
    Options options_;
    DiagnosticsSink& diagnostics_;
    TimeSource wall_now_;
    bool initialized_ = false;

    // Callbacks that can outlive the engine check this token first.
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);

    mutable std::mutex middleware_mutex_;
    ClientPipeline pipeline_;

    mutable std::mutex pending_mutex_;
    std::unordered_map<std::string, PendingRequest> pending_;

    std::mutex subscribers_mutex_;
    std::unordered_map<std::string, std::vector<EventCallback>> subscribers_;
};

} // namespace rpcgate::client
