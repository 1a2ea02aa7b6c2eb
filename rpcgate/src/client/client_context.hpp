#pragma once

#include "../completion.hpp"
#include "../errors.hpp"
#include "../protocol.hpp"

#include <functional>
#include <optional>
#include <string>

namespace rpcgate::client {

using ResponseCompletion = Completion<Response, RequestError>;

struct RetryPolicy {
    int max_attempts = 3;
    double base_delay = 0.5; // doubled after every failed attempt
    bool retry_on_timeout = true;
};

/**
 * Per-request state on the client. `completion` is the caller's handle;
 * steps may attach observers to it but must not settle it directly.
 */
struct ClientContext {
    Request request;
    ResponseCompletion completion;
    bool cancelled = false;
    std::optional<RequestError> rejection;
    std::optional<RetryPolicy> retry;

    bool suspended = false;
    bool transmitted = false;

    bool halted() const { return cancelled || rejection.has_value(); }

    void reject(ErrorKind kind, const std::string& message) {
        if (halted()) {
            return;
        }
        rejection = RequestError{kind, message, std::nullopt};
        settled();
    }

    void cancel() {
        if (halted()) {
            return;
        }
        cancelled = true;
        settled();
    }

    void suspend() { suspended = true; }

    // Owned by the engine.
    std::function<void()> settle_hook;
    bool detached = false;

private:
    void settled() {
        if (detached && settle_hook) {
            settle_hook();
        }
    }
};

} // namespace rpcgate::client
