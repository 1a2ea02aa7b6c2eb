#pragma once

#include "../protocol.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rpcgate::server {

/**
 * Per-dispatch state shared by the middleware chain and the handler.
 * The first outcome wins: once cancelled or answered, later outcomes are ignored.
 */
struct ServerContext {
    std::string sender_id;
    Request request;
    bool cancelled = false;
    std::optional<Response> response;

    bool suspended = false;
    bool handler_reached = false;

    bool halted() const { return cancelled || response.has_value(); }

    void respond(bool success, codec::Payload data, const std::string& error) {
        if (halted()) {
            return;
        }
        response = build_response(success, std::move(data), error, request.id);
        settled();
    }

    void reject(const std::string& error) { respond(false, codec::Payload(), error); }

    void cancel() {
        if (halted()) {
            return;
        }
        cancelled = true;
        settled();
    }

    /// Marks that a step will resume (or settle) the context later.
    void suspend() { suspended = true; }

    /// Write-only observers called with the response actually sent.
    void observe(std::function<void(const Response&)> observer) { observers.push_back(std::move(observer)); }

    // Owned by the router.
    std::vector<std::function<void(const Response&)>> observers;
    std::function<void()> settle_hook;
    bool detached = false;
    bool delivered = false;

private:
    void settled() {
        if (detached && settle_hook) {
            settle_hook();
        }
    }
};

} // namespace rpcgate::server
