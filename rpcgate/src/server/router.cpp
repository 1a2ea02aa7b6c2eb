#include "router.hpp"

#include "../errors.hpp"
#include "../logger.hpp"

#include <atomic>
#include <cmath>
#include <sstream>

#include <log4cplus/loggingmacros.h>

namespace rpcgate::server {

namespace {

std::size_t window_capacity(const Options& options) {
    auto capacity = static_cast<long long>(std::llround(options.max_request_rate * options.rate_window));
    return capacity > 0 ? static_cast<std::size_t>(capacity) : 1;
}

} // namespace

Router::Router(EventLoop& loop, ServerChannel& channel, Options options, DiagnosticsSink& diagnostics,
               TimeSource now)
    : loop_(loop),
      channel_(channel),
      options_(std::move(options)),
      diagnostics_(diagnostics),
      now_(std::move(now)),
      limiter_(window_capacity(options_), options_.rate_window, now_) {}

void Router::init() {
    if (initialized_) {
        return;
    }
    initialized_ = true;

    {
        std::lock_guard<std::mutex> lock(middleware_mutex_);
        if (options_.enable_rate_limiting) {
            builtin_.use(std::make_shared<RateLimitMiddleware>(limiter_, diagnostics_));
        }
        if (options_.enable_request_logging) {
            builtin_.use(logging_middleware([this] { return loop_.now(); }));
        }
    }

    channel_.on_receive([this](const std::string& sender_id, const std::string& bytes) { dispatch(sender_id, bytes); });
    channel_.on_disconnect([this](const std::string& sender_id) { purge_session(sender_id); });

    LOG4CPLUS_INFO(server_logger(), "Router initialized (rate limiting "
                                        << (options_.enable_rate_limiting ? "on" : "off") << ", "
                                        << limiter_.capacity() << " per " << options_.rate_window
                                        << "s, max request age " << options_.max_request_age << "s)");
}

void Router::handle(const std::string& action, HandlerFn handler) {
    handle(action, std::make_shared<FunctionHandler>(std::move(handler)));
}

void Router::handle(const std::string& action, std::shared_ptr<ActionHandler> handler) {
    if (!initialized_) {
        LOG4CPLUS_WARN(server_logger(), "Handler for " << action << " registered before init()");
    }
    if (registry_.add(action, std::move(handler))) {
        LOG4CPLUS_WARN(server_logger(), "Handler for " << action << " replaced");
    }
}

void Router::handle_async(const std::string& action, AsyncHandlerFn handler) {
    handle_async(action, std::make_shared<FunctionAsyncHandler>(std::move(handler)));
}

void Router::handle_async(const std::string& action, std::shared_ptr<AsyncActionHandler> handler) {
    if (!initialized_) {
        LOG4CPLUS_WARN(server_logger(), "Handler for " << action << " registered before init()");
    }
    if (registry_.add(action, std::move(handler))) {
        LOG4CPLUS_WARN(server_logger(), "Handler for " << action << " replaced");
    }
}

void Router::use(ServerMiddlewarePtr step) {
    if (!step) {
        return;
    }
    std::lock_guard<std::mutex> lock(middleware_mutex_);
    LOG4CPLUS_DEBUG(server_logger(), "Global middleware: " << step->name());
    global_.use(std::move(step));
}

void Router::use_for_action(const std::string& action, ServerMiddlewarePtr step) {
    if (!step) {
        return;
    }
    std::lock_guard<std::mutex> lock(middleware_mutex_);
    LOG4CPLUS_DEBUG(server_logger(), "Middleware for " << action << ": " << step->name());
    per_action_[action].use(std::move(step));
}

ServerPipeline::Steps Router::chain_for(const std::string& action) const {
    std::lock_guard<std::mutex> lock(middleware_mutex_);
    ServerPipeline::Steps steps = builtin_.steps();
    steps.insert(steps.end(), global_.steps().begin(), global_.steps().end());
    auto it = per_action_.find(action);
    if (it != per_action_.end()) {
        steps.insert(steps.end(), it->second.steps().begin(), it->second.steps().end());
    }
    return steps;
}

void Router::dispatch(const std::string& sender_id, const std::string& bytes) {
    count(&RouterStats::received);

    codec::Payload root;
    try {
        root = wire::decode_frame(bytes);
    } catch (const std::exception& exc) {
        count(&RouterStats::invalid);
        diagnostics_.emit(diag::kSecurity, "Undecodable frame from " + sender_id + ": " + exc.what());
        reject_early(sender_id, "", messages::kInvalidFormat);
        return;
    }

    ShapeError shape = validate_request_shape(root.get());
    if (shape != ShapeError::ok) {
        std::string request_id;
        if (auto id_obj = codec::find_key(root.get(), "id")) {
            request_id = codec::as_string(*id_obj);
            if (!is_well_formed_id(request_id)) {
                request_id.clear();
            }
        }
        count(&RouterStats::invalid);
        diagnostics_.emit(diag::kSecurity,
                          std::string("Invalid request from ") + sender_id + ": " + to_string(shape));
        reject_early(sender_id, request_id, messages::kInvalidFormat);
        return;
    }

    Request request = wire::read_request(root);

    double age = now_() - request.timestamp;
    if (age > options_.max_request_age) {
        count(&RouterStats::replays);
        std::ostringstream oss;
        oss << "Stale request from " << sender_id << " action=" << request.action << " age=" << age << "s";
        diagnostics_.emit(diag::kSecurity, oss.str());
        reject_early(sender_id, request.id, messages::kSecurityViolation);
        return;
    }

    if (options_.reject_duplicate_ids && !check_replay(sender_id, request)) {
        count(&RouterStats::replays);
        diagnostics_.emit(diag::kSecurity, "Replayed request id " + request.id + " from " + sender_id);
        reject_early(sender_id, request.id, messages::kDuplicateRequest);
        return;
    }

    if (request.sender_id.empty()) {
        request.sender_id = sender_id;
    }

    auto ctx = std::make_shared<ServerContext>();
    ctx->sender_id = sender_id;
    ctx->request = std::move(request);
    std::weak_ptr<ServerContext> weak = ctx;
    ctx->settle_hook = [this, weak] {
        if (auto locked = weak.lock()) {
            finish(locked);
        }
    };

    ServerPipeline::run(
        chain_for(ctx->request.action), ctx, [this, ctx](ServerContext&) { invoke_handler(ctx); },
        [this](ServerContext& failed, const std::string& where, const std::string& what) {
            step_failed(failed, where, what);
        });

    ctx->detached = true;
    if (ctx->halted()) {
        finish(ctx);
        return;
    }
    if (!ctx->suspended && !ctx->handler_reached) {
        count(&RouterStats::defects);
        diagnostics_.emit(diag::kDefect, "Middleware chain for " + ctx->request.action +
                                             " ended without an outcome");
        ctx->reject(messages::kRequestRejected);
    }
}

bool Router::check_replay(const std::string& sender_id, const Request& request) {
    double now = now_();

    std::lock_guard<std::mutex> lock(replay_mutex_);
    ReplayCache& cache = replay_[sender_id];
    while (!cache.expiry.empty() && cache.expiry.front().first <= now) {
        cache.ids.erase(cache.expiry.front().second);
        cache.expiry.pop_front();
    }

    if (!cache.ids.insert(request.id).second) {
        return false;
    }
    cache.expiry.emplace_back(now + options_.max_request_age, request.id);
    return true;
}

void Router::invoke_handler(const ContextPtr& ctx) {
    ctx->handler_reached = true;

    Registration registration = registry_.find(ctx->request.action);
    if (!registration) {
        count(&RouterStats::unknown_actions);
        LOG4CPLUS_WARN(server_logger(), "Unknown action: " << ctx->request.action << " from " << ctx->sender_id);
        ctx->reject(messages::kUnknownAction);
        return;
    }

    try {
        if (registration.handler) {
            HandlerResult result = registration.handler->handle(ctx->sender_id, ctx->request.payload);
            apply_result(*ctx, result);
            return;
        }

        auto responded = std::make_shared<std::atomic<bool>>(false);
        Responder responder = [this, ctx, responded](HandlerResult result) {
            if (responded->exchange(true)) {
                LOG4CPLUS_WARN(server_logger(), "Duplicate result for " << ctx->request.action << " ignored");
                return;
            }
            loop_.post([this, ctx, result = std::move(result)] { apply_result(*ctx, result); });
        };
        registration.async_handler->handle(ctx->sender_id, ctx->request.payload, responder);
    } catch (const std::exception& exc) {
        count(&RouterStats::handler_exceptions);
        diagnostics_.emit(diag::kHandlerError, "Handler " + ctx->request.action + " failed for " +
                                                   ctx->sender_id + ": " + exc.what());
        ctx->reject(messages::kOperationFailed);
    } catch (...) {
        count(&RouterStats::handler_exceptions);
        diagnostics_.emit(diag::kHandlerError, "Handler " + ctx->request.action + " failed for " +
                                                   ctx->sender_id + ": non-standard exception");
        ctx->reject(messages::kOperationFailed);
    }
}

void Router::step_failed(ServerContext& ctx, const std::string& where, const std::string& what) {
    count(&RouterStats::handler_exceptions);
    diagnostics_.emit(diag::kHandlerError, "Middleware " + where + " failed for " + ctx.request.action + " from " +
                                               ctx.sender_id + ": " + what);
    ctx.reject(messages::kOperationFailed);
}

void Router::apply_result(ServerContext& ctx, const HandlerResult& result) {
    if (result.success) {
        ctx.respond(true, result.data, "");
        return;
    }
    count(&RouterStats::handler_failures);
    ctx.reject(result.error.empty() ? messages::kOperationFailed : result.error);
}

void Router::finish(const ContextPtr& ctx) {
    if (ctx->delivered) {
        return;
    }
    ctx->delivered = true;
    ctx->settle_hook = nullptr;

    Response response = ctx->response
                            ? *ctx->response
                            : build_response(false, codec::Payload(), messages::kRequestCancelled, ctx->request.id);

    for (const auto& observer : ctx->observers) {
        try {
            observer(response);
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(server_logger(), "Response observer failed: " << exc.what());
        } catch (...) {
            LOG4CPLUS_ERROR(server_logger(), "Response observer failed with a non-standard exception");
        }
    }

    send_response(ctx->sender_id, response);
}

void Router::reject_early(const std::string& sender_id, const std::string& request_id, const char* error) {
    send_response(sender_id, build_response(false, codec::Payload(), error, request_id));
}

void Router::send_response(const std::string& sender_id, const Response& response) {
    if (!channel_.send(sender_id, wire::encode(response))) {
        LOG4CPLUS_WARN(server_logger(), "Response " << response.id << " not delivered, session " << sender_id
                                                    << " is gone");
        return;
    }
    count(&RouterStats::responses);
}

bool Router::broadcast(const std::string& event_name, codec::Payload payload) {
    if (!initialized_) {
        LOG4CPLUS_WARN(server_logger(), "broadcast(" << event_name << ") before init() ignored");
        return false;
    }
    if (event_name.empty()) {
        return false;
    }

    std::size_t reached = channel_.broadcast(wire::encode(Event{event_name, std::move(payload)}));
    count(&RouterStats::events);
    LOG4CPLUS_DEBUG(server_logger(), "Broadcast " << event_name << " to " << reached << " sessions");
    return true;
}

bool Router::send_to_client(const std::string& session_id, const std::string& event_name, codec::Payload payload) {
    if (!initialized_) {
        LOG4CPLUS_WARN(server_logger(), "send_to_client(" << event_name << ") before init() ignored");
        return false;
    }
    if (event_name.empty()) {
        return false;
    }

    if (!channel_.send(session_id, wire::encode(Event{event_name, std::move(payload)}))) {
        LOG4CPLUS_WARN(server_logger(), "Event " << event_name << " not delivered to " << session_id);
        return false;
    }
    count(&RouterStats::events);
    return true;
}

void Router::purge_session(const std::string& sender_id) {
    limiter_.forget(sender_id);
    {
        std::lock_guard<std::mutex> lock(replay_mutex_);
        replay_.erase(sender_id);
    }
    LOG4CPLUS_DEBUG(server_logger(), "Session " << sender_id << " purged");
}

RouterStats Router::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace rpcgate::server
