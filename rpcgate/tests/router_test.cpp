#include <gtest/gtest.h>

#include "errors.hpp"
#include "event_loop.hpp"
#include "memory_channel.hpp"
#include "protocol.hpp"
#include "server/router.hpp"
#include "server/server_middleware.hpp"
#include "test_helpers.hpp"

#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using rpcgate::Response;
using rpcgate::codec::Payload;
using rpcgate::server::HandlerResult;
using rpcgate::server::ServerContext;
using rpcgate::server::ServerMiddleware;

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override { ensure_test_logging(); }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

rpcgate::server::ServerMiddlewarePtr step(const std::string& name,
                                          std::function<void(ServerContext&, const ServerMiddleware::Next&)> fn) {
    return rpcgate::middleware::make_middleware<ServerContext>(name, std::move(fn));
}

class RouterTest : public ::testing::Test {
protected:
    RouterTest() : loop(clock.source()), hub(loop) {
        options.throttle_interval = 0.0;
        options.retry_max_attempts = 1;
    }

    void start() {
        router = std::make_unique<rpcgate::server::Router>(loop, hub.server(), options, diagnostics, clock.source());
        router->init();
        router->handle("ping", [](const std::string&, const Payload&) {
            return HandlerResult::ok(Payload::from(std::string("pong")));
        });
    }

    std::shared_ptr<rpcgate::ClientChannel> connect(const std::string& session) {
        auto channel = hub.connect(session);
        channel->on_receive([this, session](const std::string& bytes) { inbox[session].push_back(bytes); });
        return channel;
    }

    void send_frame(const std::string& session, const std::string& bytes) {
        hub.connect(session)->send(bytes);
        loop.drain();
    }

    rpcgate::Request send_request(const std::string& session, const std::string& action,
                                  Payload payload = Payload()) {
        auto request = rpcgate::build_request(action, std::move(payload), "", clock.now());
        send_frame(session, rpcgate::wire::encode(request));
        return request;
    }

    Response last_response(const std::string& session) {
        const auto& frames = inbox[session];
        if (frames.empty()) {
            throw std::runtime_error("no frame received by " + session);
        }
        return decode_response(frames.back());
    }

    std::size_t received(const std::string& session) { return inbox[session].size(); }

    rpcgate::ManualClock clock;
    rpcgate::EventLoop loop;
    rpcgate::MemoryHub hub;
    RecordingDiagnostics diagnostics;
    rpcgate::Options options;
    std::unique_ptr<rpcgate::server::Router> router;
    std::map<std::string, std::vector<std::string>> inbox;
};

} // namespace

TEST_F(RouterTest, PingReturnsData) {
    start();
    connect("alice");

    auto request = send_request("alice", "ping");
    auto response = last_response("alice");
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.id, request.id);
    EXPECT_EQ(response.data.as<std::string>(), "pong");
}

TEST_F(RouterTest, UndecodableFrameReturnsInvalidFormat) {
    start();
    connect("alice");

    send_frame("alice", std::string("\xc1\xc1", 2));
    auto response = last_response("alice");
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, rpcgate::messages::kInvalidFormat);
    EXPECT_EQ(diagnostics.count(rpcgate::diag::kSecurity), 1u);
    EXPECT_EQ(router->stats().invalid, 1u);
}

TEST_F(RouterTest, MalformedRequestEchoesIdWhenPresent) {
    start();
    connect("alice");

    send_frame("alice", make_request_frame("req-7", "", clock.now()));
    auto response = last_response("alice");
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.id, "req-7");
    EXPECT_EQ(response.error, rpcgate::messages::kInvalidFormat);
}

TEST_F(RouterTest, StaleRequestRejectedBeforeHandler) {
    start();
    connect("alice");
    int calls = 0;
    router->handle("count", [&](const std::string&, const Payload&) {
        ++calls;
        return HandlerResult::ok();
    });

    send_frame("alice", make_request_frame("old-1", "count", clock.now() - 31.0));
    auto response = last_response("alice");
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, rpcgate::messages::kSecurityViolation);
    EXPECT_EQ(calls, 0);
    EXPECT_TRUE(diagnostics.contains(rpcgate::diag::kSecurity, "Stale request"));
}

TEST_F(RouterTest, DuplicateIdRejected) {
    start();
    connect("alice");
    int calls = 0;
    router->handle("count", [&](const std::string&, const Payload&) {
        ++calls;
        return HandlerResult::ok();
    });

    std::string frame = make_request_frame("dup-1", "count", clock.now());
    send_frame("alice", frame);
    EXPECT_TRUE(last_response("alice").success);

    send_frame("alice", frame);
    auto response = last_response("alice");
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, rpcgate::messages::kDuplicateRequest);
    EXPECT_EQ(calls, 1);
}

TEST_F(RouterTest, SameIdFromAnotherSessionIsNotAReplay) {
    start();
    connect("alice");
    connect("bob");

    std::string frame = make_request_frame("shared-1", "ping", clock.now());
    send_frame("alice", frame);
    send_frame("bob", frame);
    EXPECT_TRUE(last_response("alice").success);
    EXPECT_TRUE(last_response("bob").success);
}

TEST_F(RouterTest, RateLimitRejectsBeyondCapacity) {
    options.max_request_rate = 3.0;
    start();
    connect("alice");
    connect("bob");

    for (int i = 0; i < 3; ++i) {
        send_request("alice", "ping");
        EXPECT_TRUE(last_response("alice").success) << "request " << i;
    }
    send_request("alice", "ping");
    EXPECT_EQ(last_response("alice").error, rpcgate::messages::kRateLimited);
    EXPECT_EQ(diagnostics.count(rpcgate::diag::kRateLimit), 1u);

    send_request("bob", "ping");
    EXPECT_TRUE(last_response("bob").success);

    clock.advance(1.0);
    send_request("alice", "ping");
    EXPECT_TRUE(last_response("alice").success);
}

TEST_F(RouterTest, RateLimitingCanBeDisabled) {
    options.max_request_rate = 1.0;
    options.enable_rate_limiting = false;
    start();
    connect("alice");

    for (int i = 0; i < 5; ++i) {
        send_request("alice", "ping");
        EXPECT_TRUE(last_response("alice").success);
    }
}

TEST_F(RouterTest, UnknownActionRejected) {
    start();
    connect("alice");

    send_request("alice", "does.not.exist");
    auto response = last_response("alice");
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, rpcgate::messages::kUnknownAction);
    EXPECT_EQ(router->stats().unknown_actions, 1u);
}

TEST_F(RouterTest, HandlerExceptionHidesDetail) {
    start();
    connect("alice");
    router->handle("transfer", [](const std::string&, const Payload&) -> HandlerResult {
        throw std::runtime_error("connection to ledger db refused");
    });

    send_request("alice", "transfer");
    auto response = last_response("alice");
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, rpcgate::messages::kOperationFailed);
    EXPECT_TRUE(diagnostics.contains(rpcgate::diag::kHandlerError, "connection to ledger db refused"));
    EXPECT_EQ(router->stats().handler_exceptions, 1u);
}

TEST_F(RouterTest, HandlerFailureMessageIsForwarded) {
    start();
    connect("alice");
    router->handle("withdraw", [](const std::string&, const Payload&) {
        return HandlerResult::fail("Insufficient funds");
    });

    send_request("alice", "withdraw");
    EXPECT_EQ(last_response("alice").error, "Insufficient funds");
}

TEST_F(RouterTest, HandlerReceivesSessionAndPayload) {
    start();
    connect("alice");
    std::string seen_sender;
    int seen_amount = 0;
    router->handle("deposit", [&](const std::string& sender, const Payload& payload) {
        seen_sender = sender;
        auto amount = rpcgate::codec::find_key(payload.get(), "amount");
        seen_amount = amount ? static_cast<int>(rpcgate::codec::as_int64(*amount)) : -1;
        return HandlerResult::ok();
    });

    send_request("alice", "deposit", Payload::build([](rpcgate::codec::Packer& pk) {
                     pk.pack_map(1);
                     pk.pack("amount");
                     pk.pack(25);
                 }));
    EXPECT_TRUE(last_response("alice").success);
    EXPECT_EQ(seen_sender, "alice");
    EXPECT_EQ(seen_amount, 25);
}

TEST_F(RouterTest, LastRegistrationWins) {
    start();
    connect("alice");
    router->handle("ping", [](const std::string&, const Payload&) {
        return HandlerResult::ok(Payload::from(std::string("pong v2")));
    });

    send_request("alice", "ping");
    EXPECT_EQ(last_response("alice").data.as<std::string>(), "pong v2");
    EXPECT_EQ(router->registered_actions(), (std::vector<std::string>{"ping"}));
}

TEST_F(RouterTest, AsyncHandlerAnswersLater) {
    start();
    connect("alice");
    rpcgate::server::Responder pending;
    router->handle_async("slow", [&](const std::string&, const Payload&, rpcgate::server::Responder respond) {
        pending = respond;
    });

    send_request("alice", "slow");
    EXPECT_EQ(received("alice"), 0u);
    ASSERT_TRUE(pending);

    pending(HandlerResult::ok(Payload::from(5)));
    pending(HandlerResult::fail("ignored"));
    loop.drain();

    ASSERT_EQ(received("alice"), 1u);
    auto response = last_response("alice");
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.data.as<int>(), 5);
}

TEST_F(RouterTest, GlobalMiddlewareRunsBeforeActionMiddleware) {
    start();
    connect("alice");
    std::vector<std::string> order;
    router->use_for_action("ping", step("action", [&](ServerContext&, const ServerMiddleware::Next& next) {
        order.push_back("action");
        next();
    }));
    router->use(step("global", [&](ServerContext&, const ServerMiddleware::Next& next) {
        order.push_back("global");
        next();
    }));

    send_request("alice", "ping");
    EXPECT_TRUE(last_response("alice").success);
    EXPECT_EQ(order, (std::vector<std::string>{"global", "action"}));

    order.clear();
    router->handle("other", [](const std::string&, const Payload&) { return HandlerResult::ok(); });
    send_request("alice", "other");
    EXPECT_EQ(order, (std::vector<std::string>{"global"}));
}

TEST_F(RouterTest, ShortCircuitSkipsHandler) {
    start();
    connect("alice");
    int calls = 0;
    router->handle("guarded", [&](const std::string&, const Payload&) {
        ++calls;
        return HandlerResult::ok();
    });
    router->use_for_action("guarded", step("deny", [](ServerContext& ctx, const ServerMiddleware::Next&) {
        ctx.reject("Maintenance window");
    }));

    send_request("alice", "guarded");
    EXPECT_EQ(last_response("alice").error, "Maintenance window");
    EXPECT_EQ(calls, 0);
}

TEST_F(RouterTest, ChainWithoutOutcomeIsRejected) {
    start();
    connect("alice");
    router->use(step("forgetful", [](ServerContext&, const ServerMiddleware::Next&) {}));

    send_request("alice", "ping");
    EXPECT_EQ(last_response("alice").error, rpcgate::messages::kRequestRejected);
    EXPECT_EQ(diagnostics.count(rpcgate::diag::kDefect), 1u);
    EXPECT_EQ(router->stats().defects, 1u);
}

TEST_F(RouterTest, CancelledRequestIsAnswered) {
    start();
    connect("alice");
    router->use(step("cancel", [](ServerContext& ctx, const ServerMiddleware::Next&) { ctx.cancel(); }));

    send_request("alice", "ping");
    EXPECT_EQ(last_response("alice").error, rpcgate::messages::kRequestCancelled);
}

TEST_F(RouterTest, ObserverSeesFinalResponse) {
    start();
    connect("alice");
    std::vector<bool> outcomes;
    router->use(step("observe", [&](ServerContext& ctx, const ServerMiddleware::Next& next) {
        ctx.observe([&](const Response& response) { outcomes.push_back(response.success); });
        next();
    }));

    send_request("alice", "ping");
    send_request("alice", "nope");
    EXPECT_EQ(outcomes, (std::vector<bool>{true, false}));
}

TEST_F(RouterTest, AdminMiddlewareAllowsAndDenies) {
    start();
    connect("root");
    connect("guest");
    router->handle("admin.reset", [](const std::string&, const Payload&) { return HandlerResult::ok(); });
    router->use_for_action("admin.reset", rpcgate::server::admin_middleware(
                                              [](const std::string& sender) { return sender == "root"; }, diagnostics));

    send_request("root", "admin.reset");
    EXPECT_TRUE(last_response("root").success);

    send_request("guest", "admin.reset");
    EXPECT_EQ(last_response("guest").error, rpcgate::messages::kUnauthorized);
    EXPECT_TRUE(diagnostics.contains(rpcgate::diag::kSecurity, "guest"));
}

TEST_F(RouterTest, AsyncAdminCheckSuspendsChain) {
    start();
    connect("root");
    std::function<void(bool)> decide;
    rpcgate::server::AsyncAdminPredicate lookup = [&](const std::string&, std::function<void(bool)> done) {
        decide = std::move(done);
    };
    int calls = 0;
    router->handle("admin.reset", [&](const std::string&, const Payload&) {
        ++calls;
        return HandlerResult::ok();
    });
    router->use_for_action("admin.reset", rpcgate::server::admin_middleware(lookup, diagnostics));

    send_request("root", "admin.reset");
    EXPECT_EQ(received("root"), 0u);
    EXPECT_EQ(router->stats().defects, 0u);
    ASSERT_TRUE(decide);

    decide(true);
    loop.drain();
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(last_response("root").success);
}

TEST_F(RouterTest, AsyncAdminDenialAnswersUnauthorized) {
    start();
    connect("guest");
    std::function<void(bool)> decide;
    rpcgate::server::AsyncAdminPredicate lookup = [&](const std::string&, std::function<void(bool)> done) {
        decide = std::move(done);
    };
    router->handle("admin.reset", [](const std::string&, const Payload&) { return HandlerResult::ok(); });
    router->use_for_action("admin.reset", rpcgate::server::admin_middleware(lookup, diagnostics));

    send_request("guest", "admin.reset");
    ASSERT_TRUE(decide);
    decide(false);
    loop.drain();

    ASSERT_EQ(received("guest"), 1u);
    EXPECT_EQ(last_response("guest").error, rpcgate::messages::kUnauthorized);
}

TEST_F(RouterTest, SecurityMiddlewareRejectsSpoofedSender) {
    start();
    connect("alice");
    router->use(rpcgate::server::security_middleware(options.max_request_age, options.max_clock_skew,
                                                     clock.source(), diagnostics));

    auto spoofed = rpcgate::build_request("ping", Payload(), "mallory", clock.now());
    send_frame("alice", rpcgate::wire::encode(spoofed));
    EXPECT_EQ(last_response("alice").error, rpcgate::messages::kSecurityViolation);
    EXPECT_TRUE(diagnostics.contains(rpcgate::diag::kSecurity, "mallory"));

    send_request("alice", "ping");
    EXPECT_TRUE(last_response("alice").success);
}

TEST_F(RouterTest, SecurityMiddlewareRejectsFutureTimestamp) {
    start();
    connect("alice");
    router->use(rpcgate::server::security_middleware(options.max_request_age, 5.0, clock.source(), diagnostics));

    send_frame("alice", make_request_frame("future-1", "ping", clock.now() + 60.0));
    EXPECT_EQ(last_response("alice").error, rpcgate::messages::kSecurityViolation);
}

TEST_F(RouterTest, NonFiniteTimestampRejectedAsInvalid) {
    start();
    connect("alice");
    int calls = 0;
    router->handle("count", [&](const std::string&, const Payload&) {
        ++calls;
        return HandlerResult::ok();
    });

    send_frame("alice", make_request_frame("nan-1", "count", std::numeric_limits<double>::quiet_NaN()));
    EXPECT_EQ(last_response("alice").error, rpcgate::messages::kInvalidFormat);
    EXPECT_EQ(last_response("alice").id, "nan-1");

    send_frame("alice", make_request_frame("inf-1", "count", std::numeric_limits<double>::infinity()));
    EXPECT_EQ(last_response("alice").error, rpcgate::messages::kInvalidFormat);

    send_frame("alice", make_request_frame("inf-2", "count", -std::numeric_limits<double>::infinity()));
    EXPECT_EQ(last_response("alice").error, rpcgate::messages::kInvalidFormat);

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(router->stats().invalid, 3u);
    EXPECT_TRUE(diagnostics.contains(rpcgate::diag::kSecurity, "invalid_timestamp"));
}

TEST_F(RouterTest, ValidationMiddlewareRejectsMutatedRequest) {
    start();
    connect("alice");
    int calls = 0;
    router->handle("count", [&](const std::string&, const Payload&) {
        ++calls;
        return HandlerResult::ok();
    });
    router->use(step("blank-action", [](ServerContext& ctx, const ServerMiddleware::Next& next) {
        ctx.request.action.clear();
        next();
    }));
    router->use(rpcgate::server::validation_middleware(diagnostics));

    send_request("alice", "count");
    auto response = last_response("alice");
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, rpcgate::messages::kInvalidFormat);
    EXPECT_EQ(calls, 0);
    EXPECT_TRUE(diagnostics.contains(rpcgate::diag::kSecurity, "empty_action"));
}

TEST_F(RouterTest, ValidationMiddlewarePassesWellFormedRequest) {
    start();
    connect("alice");
    router->use(rpcgate::server::validation_middleware(diagnostics));

    send_request("alice", "ping");
    EXPECT_TRUE(last_response("alice").success);
    EXPECT_EQ(diagnostics.count(rpcgate::diag::kSecurity), 0u);
}

TEST_F(RouterTest, LoggingMiddlewareLeavesResponseUntouched) {
    start();
    connect("alice");
    std::vector<rpcgate::Request> seen;
    std::vector<bool> answered_early;
    router->use(rpcgate::server::logging_middleware(clock.source()));
    router->use(step("inspect", [&](ServerContext& ctx, const ServerMiddleware::Next& next) {
        seen.push_back(ctx.request);
        answered_early.push_back(ctx.response.has_value() || ctx.cancelled);
        next();
    }));

    auto request = send_request("alice", "ping", Payload::from(std::string("body")));
    auto response = last_response("alice");
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.id, request.id);
    EXPECT_EQ(response.data.as<std::string>(), "pong");
    EXPECT_TRUE(response.error.empty());

    send_request("alice", "nope");
    EXPECT_EQ(last_response("alice").error, rpcgate::messages::kUnknownAction);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].id, request.id);
    EXPECT_EQ(seen[0].action, "ping");
    EXPECT_EQ(seen[0].sender_id, "alice");
    EXPECT_EQ(seen[0].payload.as<std::string>(), "body");
    EXPECT_EQ(answered_early, (std::vector<bool>{false, false}));
}

TEST_F(RouterTest, ThrowingMiddlewareAnswersOperationFailed) {
    start();
    connect("alice");
    int calls = 0;
    router->handle("count", [&](const std::string&, const Payload&) {
        ++calls;
        return HandlerResult::ok();
    });
    router->use(step("broken", [](ServerContext&, const ServerMiddleware::Next&) {
        throw std::runtime_error("lookup table missing");
    }));

    send_request("alice", "count");
    auto response = last_response("alice");
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, rpcgate::messages::kOperationFailed);
    EXPECT_EQ(calls, 0);
    EXPECT_TRUE(diagnostics.contains(rpcgate::diag::kHandlerError, "lookup table missing"));
    EXPECT_TRUE(diagnostics.contains(rpcgate::diag::kHandlerError, "broken"));
    EXPECT_EQ(router->stats().defects, 0u);
}

TEST_F(RouterTest, NonStandardThrowFromMiddlewareStillAnswers) {
    start();
    connect("alice");
    router->use_for_action("ping", step("odd", [](ServerContext&, const ServerMiddleware::Next&) { throw 42; }));

    send_request("alice", "ping");
    ASSERT_EQ(received("alice"), 1u);
    EXPECT_EQ(last_response("alice").error, rpcgate::messages::kOperationFailed);

    // The loop keeps serving afterwards.
    send_request("alice", "nope");
    EXPECT_EQ(received("alice"), 2u);
}

TEST_F(RouterTest, ThrowingAdminPredicateAnswersOperationFailed) {
    start();
    connect("root");
    int calls = 0;
    router->handle("admin.reset", [&](const std::string&, const Payload&) {
        ++calls;
        return HandlerResult::ok();
    });
    router->use_for_action("admin.reset", rpcgate::server::admin_middleware(
                                              [](const std::string&) -> bool {
                                                  throw std::runtime_error("directory unreachable");
                                              },
                                              diagnostics));

    send_request("root", "admin.reset");
    ASSERT_EQ(received("root"), 1u);
    EXPECT_EQ(last_response("root").error, rpcgate::messages::kOperationFailed);
    EXPECT_EQ(calls, 0);
    EXPECT_TRUE(diagnostics.contains(rpcgate::diag::kHandlerError, "directory unreachable"));
}

TEST_F(RouterTest, StepThrowingAfterResumeStillAnswers) {
    start();
    connect("root");
    std::function<void(bool)> decide;
    rpcgate::server::AsyncAdminPredicate lookup = [&](const std::string&, std::function<void(bool)> done) {
        decide = std::move(done);
    };
    router->handle("admin.reset", [](const std::string&, const Payload&) { return HandlerResult::ok(); });
    router->use_for_action("admin.reset", rpcgate::server::admin_middleware(lookup, diagnostics));
    router->use_for_action("admin.reset", step("audit", [](ServerContext&, const ServerMiddleware::Next&) {
        throw std::runtime_error("audit log full");
    }));

    send_request("root", "admin.reset");
    EXPECT_EQ(received("root"), 0u);
    ASSERT_TRUE(decide);

    decide(true);
    loop.drain();
    ASSERT_EQ(received("root"), 1u);
    EXPECT_EQ(last_response("root").error, rpcgate::messages::kOperationFailed);
    EXPECT_TRUE(diagnostics.contains(rpcgate::diag::kHandlerError, "audit log full"));
}

TEST_F(RouterTest, BroadcastReachesEverySession) {
    start();
    connect("alice");
    connect("bob");

    EXPECT_TRUE(router->broadcast("server.notice", Payload::from(std::string("maintenance"))));
    loop.drain();

    for (const std::string session : {"alice", "bob"}) {
        ASSERT_EQ(received(session), 1u);
        auto event = decode_event(inbox[session].back());
        EXPECT_EQ(event.name, "server.notice");
        EXPECT_EQ(event.payload.as<std::string>(), "maintenance");
    }
    EXPECT_FALSE(router->broadcast(""));
}

TEST_F(RouterTest, SendToClientTargetsOneSession) {
    start();
    connect("alice");
    connect("bob");

    EXPECT_TRUE(router->send_to_client("bob", "private", Payload::from(1)));
    EXPECT_FALSE(router->send_to_client("carol", "private", Payload::from(1)));
    loop.drain();

    EXPECT_EQ(received("alice"), 0u);
    ASSERT_EQ(received("bob"), 1u);
    EXPECT_EQ(decode_event(inbox["bob"].back()).name, "private");
}

TEST_F(RouterTest, EventsBeforeInitAreIgnored) {
    router = std::make_unique<rpcgate::server::Router>(loop, hub.server(), options, diagnostics, clock.source());
    EXPECT_FALSE(router->broadcast("early"));
    EXPECT_FALSE(router->initialized());
    router->init();
    router->init();
    EXPECT_TRUE(router->initialized());
}

TEST_F(RouterTest, DisconnectPurgesSessionState) {
    options.max_request_rate = 1.0;
    start();
    connect("alice");

    send_request("alice", "ping");
    send_request("alice", "ping");
    EXPECT_EQ(last_response("alice").error, rpcgate::messages::kRateLimited);
    EXPECT_EQ(router->rate_limiter().tracked_senders(), 1u);

    hub.disconnect("alice");
    loop.drain();
    EXPECT_EQ(router->rate_limiter().tracked_senders(), 0u);

    inbox.clear();
    connect("alice");
    send_request("alice", "ping");
    EXPECT_TRUE(last_response("alice").success);
}

TEST_F(RouterTest, DisconnectReleasesSessionChannel) {
    start();
    std::weak_ptr<rpcgate::ClientChannel> released = connect("alice");
    auto held = connect("bob");

    hub.disconnect("alice");
    hub.disconnect("bob");
    loop.drain();

    EXPECT_TRUE(released.expired());
    EXPECT_FALSE(held->send("after close"));
    EXPECT_EQ(hub.session_count(), 0u);

    auto reopened = connect("bob");
    EXPECT_NE(reopened, held);
    EXPECT_TRUE(reopened->send(rpcgate::wire::encode(rpcgate::build_request("ping", Payload(), "", clock.now()))));
}

TEST_F(RouterTest, AnswerForDepartedSessionIsDropped) {
    start();
    connect("alice");
    rpcgate::server::Responder pending;
    router->handle_async("slow", [&](const std::string&, const Payload&, rpcgate::server::Responder respond) {
        pending = respond;
    });

    send_request("alice", "slow");
    hub.disconnect("alice");
    loop.drain();

    std::size_t before = router->stats().responses;
    pending(HandlerResult::ok());
    loop.drain();
    EXPECT_EQ(router->stats().responses, before);
}
