#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace rpcgate {

enum class CompletionState { pending, resolved, rejected, cancelled };

/**
 * One-shot asynchronous result.
 *
 * Settles exactly once: resolved with a T, rejected with an E, or cancelled
 * by its owner. Continuations registered after settlement run immediately.
 * Cancellation runs the cancel hooks only, never the resolve/reject callbacks.
 * Copies share the same state.
 */
template <typename T, typename E>
class Completion {
public:
    using ResolveFn = std::function<void(const T&)>;
    using RejectFn = std::function<void(const E&)>;
    using CancelFn = std::function<void()>;

    Completion() : state_(std::make_shared<State>()) {}

    bool resolve(T value) {
        std::vector<Callbacks> callbacks;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->status != CompletionState::pending) {
                return false;
            }
            state_->status = CompletionState::resolved;
            state_->value = std::move(value);
            callbacks.swap(state_->callbacks);
            state_->cancel_hooks.clear();
        }
        for (auto& cb : callbacks) {
            if (cb.on_resolve) {
                cb.on_resolve(*state_->value);
            }
        }
        return true;
    }

    bool reject(E error) {
        std::vector<Callbacks> callbacks;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->status != CompletionState::pending) {
                return false;
            }
            state_->status = CompletionState::rejected;
            state_->error = std::move(error);
            callbacks.swap(state_->callbacks);
            state_->cancel_hooks.clear();
        }
        for (auto& cb : callbacks) {
            if (cb.on_reject) {
                cb.on_reject(*state_->error);
            }
        }
        return true;
    }

    bool cancel() {
        std::vector<CancelFn> hooks;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->status != CompletionState::pending) {
                return false;
            }
            state_->status = CompletionState::cancelled;
            state_->callbacks.clear();
            hooks.swap(state_->cancel_hooks);
        }
        for (auto& hook : hooks) {
            hook();
        }
        return true;
    }

    const Completion& then(ResolveFn on_resolve, RejectFn on_reject = nullptr) const {
        CompletionState status;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            status = state_->status;
            if (status == CompletionState::pending) {
                state_->callbacks.push_back({std::move(on_resolve), std::move(on_reject)});
                return *this;
            }
        }
        if (status == CompletionState::resolved && on_resolve) {
            on_resolve(*state_->value);
        } else if (status == CompletionState::rejected && on_reject) {
            on_reject(*state_->error);
        }
        return *this;
    }

    /// Registers a hook fired only if the completion is cancelled while pending.
    const Completion& on_cancel(CancelFn hook) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->status == CompletionState::pending) {
            state_->cancel_hooks.push_back(std::move(hook));
        }
        return *this;
    }

    /// Forwards this completion's outcome into another one.
    void forward_to(Completion other) const {
        then([other](const T& value) mutable { other.resolve(value); },
             [other](const E& error) mutable { other.reject(error); });
    }

    CompletionState state() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->status;
    }

    bool pending() const { return state() == CompletionState::pending; }

    std::optional<T> value() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->value;
    }

    std::optional<E> error() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->error;
    }

private:
    struct Callbacks {
        ResolveFn on_resolve;
        RejectFn on_reject;
    };

    struct State {
        std::mutex mutex;
        CompletionState status = CompletionState::pending;
        std::optional<T> value;
        std::optional<E> error;
        std::vector<Callbacks> callbacks;
        std::vector<CancelFn> cancel_hooks;
    };

    std::shared_ptr<State> state_;
};

} // namespace rpcgate
