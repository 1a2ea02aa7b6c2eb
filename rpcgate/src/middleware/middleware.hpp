#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rpcgate::middleware {

/**
 * One processing step around a terminal action.
 *
 * A step may call next() to proceed, return without calling it to
 * short-circuit (usually after settling the context), or mutate the context
 * around the call. A step that resumes later must mark the context suspended
 * before returning.
 *
 * Context must provide `bool halted() const`.
 */
template <typename Context>
class Middleware {
public:
    using Next = std::function<void()>;

    virtual ~Middleware() = default;
    virtual const char* name() const = 0;
    virtual void process(Context& ctx, const Next& next) = 0;
};

template <typename Context>
using MiddlewarePtr = std::shared_ptr<Middleware<Context>>;

template <typename Context>
class FunctionMiddleware final : public Middleware<Context> {
public:
    using Fn = std::function<void(Context&, const typename Middleware<Context>::Next&)>;

    FunctionMiddleware(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

    const char* name() const override { return name_.c_str(); }
    void process(Context& ctx, const typename Middleware<Context>::Next& next) override { fn_(ctx, next); }

private:
    std::string name_;
    Fn fn_;
};

template <typename Context>
MiddlewarePtr<Context> make_middleware(std::string name, typename FunctionMiddleware<Context>::Fn fn) {
    return std::make_shared<FunctionMiddleware<Context>>(std::move(name), std::move(fn));
}

/**
 * Ordered chain of steps. run() works on a snapshot of the steps so that
 * registrations made while a run is suspended do not affect it.
 */
template <typename Context>
class Pipeline {
public:
    using Step = MiddlewarePtr<Context>;
    using Steps = std::vector<Step>;
    using Terminal = std::function<void(Context&)>;
    /// Receives the name of the step (or "terminal") that threw and the exception text.
    using Fault = std::function<void(Context&, const std::string& where, const std::string& what)>;

    void use(Step step) {
        if (step) {
            steps_.push_back(std::move(step));
        }
    }

    const Steps& steps() const { return steps_; }
    std::size_t size() const { return steps_.size(); }
    bool empty() const { return steps_.empty(); }

    /**
     * Runs the steps then the terminal action, at most once, unless a step halts the context.
     * An exception thrown by a step or the terminal, including one resumed later through a
     * deferred next(), goes to `fault` and ends that branch of the run. Without a fault
     * handler it propagates to the caller.
     */
    static void run(Steps steps, std::shared_ptr<Context> ctx, Terminal terminal, Fault fault = nullptr) {
        auto state = std::make_shared<Run>();
        state->steps = std::move(steps);
        state->ctx = std::move(ctx);
        state->terminal = std::move(terminal);
        state->fault = std::move(fault);
        advance(state, 0);
    }

    void run(std::shared_ptr<Context> ctx, Terminal terminal, Fault fault = nullptr) const {
        run(steps_, std::move(ctx), std::move(terminal), std::move(fault));
    }

private:
    struct Run {
        Steps steps;
        std::shared_ptr<Context> ctx;
        Terminal terminal;
        Fault fault;
        bool terminal_reached = false;
    };

    template <typename Fn>
    static void guarded(const std::shared_ptr<Run>& state, const char* where, Fn&& fn) {
        if (!state->fault) {
            fn();
            return;
        }
        try {
            fn();
        } catch (const std::exception& exc) {
            state->fault(*state->ctx, where, exc.what());
        } catch (...) {
            state->fault(*state->ctx, where, "non-standard exception");
        }
    }

    static void advance(const std::shared_ptr<Run>& state, std::size_t index) {
        Context& ctx = *state->ctx;
        if (ctx.halted()) {
            return;
        }

        if (index == state->steps.size()) {
            if (state->terminal_reached) {
                return;
            }
            state->terminal_reached = true;
            if (state->terminal) {
                guarded(state, "terminal", [&] { state->terminal(ctx); });
            }
            return;
        }

        auto called = std::make_shared<bool>(false);
        typename Middleware<Context>::Next next = [state, index, called]() {
            if (*called) {
                return;
            }
            *called = true;
            advance(state, index + 1);
        };
        const auto& current = state->steps[index];
        guarded(state, current->name(), [&] { current->process(ctx, next); });
    }

    Steps steps_;
};

} // namespace rpcgate::middleware
