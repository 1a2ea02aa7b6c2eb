#include "request_engine.hpp"

#include "../logger.hpp"

#include <cmath>

#include <log4cplus/loggingmacros.h>

namespace rpcgate::client {

RequestEngine::RequestEngine(EventLoop& loop, ClientChannel& channel, Options options,
                             DiagnosticsSink& diagnostics, TimeSource wall_now)
    : loop_(loop),
      channel_(channel),
      options_(std::move(options)),
      diagnostics_(diagnostics),
      wall_now_(std::move(wall_now)) {}

RequestEngine::~RequestEngine() {
    // Callbacks still queued on the loop settle their requests without touching the engine.
    lifetime_.reset();
    if (initialized_) {
        channel_.on_receive(nullptr);
        channel_.on_close(nullptr);
    }
    std::size_t dropped = cancel_all(ErrorKind::disconnected, messages::kDisconnected);
    if (dropped > 0) {
        LOG4CPLUS_DEBUG(client_logger(), "Engine destroyed with " << dropped << " pending requests");
    }
}

void RequestEngine::init() {
    if (initialized_) {
        return;
    }
    initialized_ = true;

    {
        std::lock_guard<std::mutex> lock(middleware_mutex_);
        if (options_.enable_request_logging) {
            pipeline_.use(client_logging_middleware());
        }
        if (options_.throttle_interval > 0.0) {
            pipeline_.use(throttle_middleware(loop_, options_.throttle_interval, options_.throttle_mode));
        }
        if (options_.retry_max_attempts > 1) {
            RetryPolicy policy;
            policy.max_attempts = options_.retry_max_attempts;
            policy.base_delay = options_.retry_base_delay;
            policy.retry_on_timeout = options_.retry_on_timeout;
            pipeline_.use(retry_middleware(policy));
        }
    }

    channel_.on_receive([this](const std::string& bytes) { handle_message(bytes); });
    channel_.on_close([this] { shutdown(); });

    LOG4CPLUS_INFO(client_logger(), "Request engine initialized (timeout " << options_.request_timeout
                                        << "s, throttle " << options_.throttle_interval << "s "
                                        << to_string(options_.throttle_mode) << ", attempts "
                                        << options_.retry_max_attempts << ")");
}

void RequestEngine::use(ClientMiddlewarePtr step) {
    std::lock_guard<std::mutex> lock(middleware_mutex_);
    pipeline_.use(std::move(step));
}

ResponseCompletion RequestEngine::request(const std::string& action, codec::Payload payload) {
    if (!initialized_) {
        LOG4CPLUS_WARN(client_logger(), "request(" << action << ") before init()");
    }

    auto ctx = std::make_shared<ClientContext>();
    ctx->request = build_request(action, std::move(payload), channel_.session_id(), wall_now_());
    ResponseCompletion completion = ctx->completion;

    std::weak_ptr<ClientContext> weak = ctx;
    std::weak_ptr<int> alive = lifetime_;
    ctx->settle_hook = [weak] {
        if (auto locked = weak.lock()) {
            settle_locally(locked);
        }
    };

    ClientPipeline::Steps steps;
    {
        std::lock_guard<std::mutex> lock(middleware_mutex_);
        steps = pipeline_.steps();
    }

    ClientPipeline::run(
        std::move(steps), ctx,
        [this, ctx, alive](ClientContext&) {
            if (!alive.lock()) {
                ctx->completion.reject(RequestError{ErrorKind::disconnected, messages::kDisconnected, std::nullopt});
                return;
            }
            ctx->transmitted = true;
            transmit(ctx, 1);
        },
        [this, alive](ClientContext& failed, const std::string& where, const std::string& what) {
            if (alive.lock()) {
                diagnostics_.emit(diag::kDefect, "Client middleware " + where + " failed for " +
                                                     failed.request.action + ": " + what);
            }
            failed.reject(ErrorKind::local, messages::kRequestRejected);
        });

    ctx->detached = true;
    if (ctx->halted()) {
        settle_locally(ctx);
    } else if (!ctx->suspended && !ctx->transmitted) {
        diagnostics_.emit(diag::kDefect, "Client middleware for " + action + " ended without an outcome");
        ctx->reject(ErrorKind::local, messages::kRequestRejected);
    }
    return completion;
}

void RequestEngine::settle_locally(const ContextPtr& ctx) {
    if (ctx->cancelled) {
        ctx->completion.cancel();
    } else if (ctx->rejection) {
        ctx->completion.reject(*ctx->rejection);
    }
}

void RequestEngine::transmit(const ContextPtr& ctx, int attempt) {
    ResponseCompletion outer = ctx->completion;
    if (!outer.pending()) {
        return;
    }

    Request request = ctx->request;
    if (attempt > 1) {
        request.id = generate_request_id();
        request.timestamp = wall_now_();
    }

    ResponseCompletion inner = send_attempt(request);
    outer.on_cancel([inner]() mutable { inner.cancel(); });

    std::weak_ptr<int> alive = lifetime_;
    inner.then(
        [outer](const Response& response) mutable { outer.resolve(response); },
        [this, ctx, attempt, alive](const RequestError& error) {
            ResponseCompletion outer = ctx->completion;
            if (!alive.lock() || !should_retry(*ctx, error, attempt)) {
                outer.reject(error);
                return;
            }

            double delay = ctx->retry->base_delay * std::pow(2.0, attempt - 1);
            LOG4CPLUS_DEBUG(client_logger(), ctx->request.action << " attempt " << attempt << " failed ("
                                                                 << error.message << "), retrying in " << delay
                                                                 << "s");
            auto timer = loop_.schedule_after(delay, [this, ctx, attempt, alive] {
                if (alive.lock()) {
                    transmit(ctx, attempt + 1);
                } else {
                    ctx->completion.reject(RequestError{ErrorKind::disconnected, messages::kDisconnected, std::nullopt});
                }
            });
            outer.on_cancel([this, timer, alive] {
                if (alive.lock()) {
                    loop_.cancel(timer);
                }
            });
        });
}

bool RequestEngine::should_retry(const ClientContext& ctx, const RequestError& error, int attempt) const {
    if (!ctx.retry || attempt >= ctx.retry->max_attempts) {
        return false;
    }
    if (error.kind == ErrorKind::failed) {
        return true;
    }
    return error.kind == ErrorKind::timeout && ctx.retry->retry_on_timeout;
}

ResponseCompletion RequestEngine::send_attempt(const Request& request) {
    ResponseCompletion completion;
    double now = loop_.now();
    std::weak_ptr<int> alive = lifetime_;
    std::string id = request.id;

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (pending_.count(id)) {
            completion.reject(RequestError{ErrorKind::local, "Duplicate request id", std::nullopt});
            return completion;
        }

        PendingRequest entry;
        entry.id = id;
        entry.created_at = now;
        entry.deadline = now + options_.request_timeout;
        entry.completion = completion;
        entry.timer = loop_.schedule_after(options_.request_timeout, [this, id, alive] {
            if (alive.lock()) {
                expire(id);
            }
        });
        pending_.emplace(id, std::move(entry));
    }

    completion.on_cancel([this, id, alive] {
        if (alive.lock()) {
            drop(id);
        }
    });

    if (!channel_.send(wire::encode(request))) {
        drop(id);
        completion.reject(RequestError{ErrorKind::disconnected, messages::kDisconnected, std::nullopt});
    }
    return completion;
}

void RequestEngine::handle_message(const std::string& bytes) {
    codec::Payload root;
    try {
        root = wire::decode_frame(bytes);
    } catch (const std::exception& exc) {
        LOG4CPLUS_WARN(client_logger(), "Discarding undecodable frame: " << exc.what());
        return;
    }

    auto type = wire::message_type(root.get());
    if (!type) {
        LOG4CPLUS_WARN(client_logger(), "Discarding frame without a known type");
        return;
    }

    switch (*type) {
        case MessageType::response:
            if (auto response = wire::read_response(root)) {
                resolve_pending(*response);
            } else {
                LOG4CPLUS_WARN(client_logger(), "Discarding malformed response");
            }
            break;
        case MessageType::event:
            if (auto event = wire::read_event(root)) {
                dispatch_event(*event);
            } else {
                LOG4CPLUS_WARN(client_logger(), "Discarding malformed event");
            }
            break;
        case MessageType::request:
            LOG4CPLUS_WARN(client_logger(), "Discarding request frame sent to a client");
            break;
    }
}

void RequestEngine::resolve_pending(const Response& response) {
    PendingRequest entry;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(response.id);
        if (it == pending_.end()) {
            LOG4CPLUS_DEBUG(client_logger(), "Discarding response for unknown request " << response.id);
            return;
        }
        entry = std::move(it->second);
        pending_.erase(it);
    }

    loop_.cancel(entry.timer);
    if (response.success) {
        entry.completion.resolve(response);
    } else {
        entry.completion.reject(RequestError{ErrorKind::failed, response.error, response});
    }
}

void RequestEngine::expire(const std::string& request_id) {
    PendingRequest entry;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(request_id);
        if (it == pending_.end()) {
            return;
        }
        entry = std::move(it->second);
        pending_.erase(it);
    }

    LOG4CPLUS_DEBUG(client_logger(), "Request " << request_id << " timed out");
    entry.completion.reject(RequestError{ErrorKind::timeout, messages::kTimeout, std::nullopt});
}

void RequestEngine::drop(const std::string& request_id) {
    EventLoop::TimerId timer = 0;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(request_id);
        if (it == pending_.end()) {
            return;
        }
        timer = it->second.timer;
        pending_.erase(it);
    }
    loop_.cancel(timer);
}

std::size_t RequestEngine::cancel_all(ErrorKind kind, const std::string& message) {
    std::unordered_map<std::string, PendingRequest> dropped;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        dropped.swap(pending_);
    }

    for (auto& entry : dropped) {
        loop_.cancel(entry.second.timer);
        entry.second.completion.reject(RequestError{kind, message, std::nullopt});
    }
    return dropped.size();
}

void RequestEngine::shutdown() {
    std::size_t dropped = cancel_all(ErrorKind::disconnected, messages::kDisconnected);
    if (dropped > 0) {
        LOG4CPLUS_INFO(client_logger(), "Session closed with " << dropped << " pending requests");
    }
}

std::size_t RequestEngine::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

void RequestEngine::on_server_message(const std::string& event_name, EventCallback callback) {
    if (!callback) {
        return;
    }
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_[event_name].push_back(std::move(callback));
}

void RequestEngine::dispatch_event(const Event& event) {
    std::vector<EventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        auto it = subscribers_.find(event.name);
        if (it == subscribers_.end()) {
            LOG4CPLUS_DEBUG(client_logger(), "No subscriber for event " << event.name);
            return;
        }
        callbacks = it->second;
    }

    for (const auto& callback : callbacks) {
        try {
            callback(event.payload);
        } catch (const std::exception& exc) {
            diagnostics_.emit(diag::kSubscriber, "Subscriber for " + event.name + " failed: " + exc.what());
        } catch (...) {
            diagnostics_.emit(diag::kSubscriber, "Subscriber for " + event.name + " failed: non-standard exception");
        }
    }
}

} // namespace rpcgate::client
