#pragma once

#include "../msgpack_codec.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace rpcgate::server {

struct HandlerResult {
    bool success = true;
    codec::Payload data;
    std::string error;

    static HandlerResult ok(codec::Payload data = codec::Payload()) { return {true, std::move(data), ""}; }
    static HandlerResult fail(std::string error) { return {false, codec::Payload(), std::move(error)}; }
};

/// Delivers an asynchronous handler's result; only the first call counts.
using Responder = std::function<void(HandlerResult)>;

class ActionHandler {
public:
    virtual ~ActionHandler() = default;
    virtual HandlerResult handle(const std::string& sender_id, const codec::Payload& payload) = 0;
};

class AsyncActionHandler {
public:
    virtual ~AsyncActionHandler() = default;
    virtual void handle(const std::string& sender_id, const codec::Payload& payload, Responder respond) = 0;
};

using HandlerFn = std::function<HandlerResult(const std::string& sender_id, const codec::Payload& payload)>;
using AsyncHandlerFn = std::function<void(const std::string& sender_id, const codec::Payload& payload, Responder respond)>;

class FunctionHandler final : public ActionHandler {
public:
    explicit FunctionHandler(HandlerFn fn) : fn_(std::move(fn)) {}
    HandlerResult handle(const std::string& sender_id, const codec::Payload& payload) override {
        return fn_(sender_id, payload);
    }

private:
    HandlerFn fn_;
};

class FunctionAsyncHandler final : public AsyncActionHandler {
public:
    explicit FunctionAsyncHandler(AsyncHandlerFn fn) : fn_(std::move(fn)) {}
    void handle(const std::string& sender_id, const codec::Payload& payload, Responder respond) override {
        fn_(sender_id, payload, std::move(respond));
    }

private:
    AsyncHandlerFn fn_;
};

} // namespace rpcgate::server
