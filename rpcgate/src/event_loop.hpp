#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rpcgate {

/// Seconds on some clock; steady for the loop, wall clock for request timestamps.
using TimeSource = std::function<double()>;

double steady_seconds();

/// Virtual time for tests and simulations.
class ManualClock {
public:
    explicit ManualClock(double start = 1000.0) : now_(start) {}

    double now() const { return now_.load(); }
    void advance(double seconds) { now_.store(now_.load() + seconds); }
    void set(double seconds) { now_.store(seconds); }
    TimeSource source() const {
        return [this] { return now(); };
    }

private:
    std::atomic<double> now_;
};

/**
 * Single-threaded cooperative scheduler.
 *
 * Tasks and timers run on whichever thread calls poll() or run().
 * post() and schedule_after() may be called from any thread.
 */
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    explicit EventLoop(TimeSource now = steady_seconds);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task);
    TimerId schedule_after(double delay_seconds, Task task);
    bool cancel(TimerId id);

    /// Runs the tasks that are ready and the timers that are due. Returns how many ran.
    std::size_t poll();

    /// Polls until nothing is ready or due.
    std::size_t drain();

    /// Blocks until stop() is called.
    void run();
    void stop();

    double now() const { return now_(); }
    std::size_t pending_timers() const;
    bool is_running() const { return running_.load(); }

private:
    void run_task(Task& task);

    TimeSource now_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> ready_;
    std::map<std::pair<double, TimerId>, Task> timers_;
    std::unordered_map<TimerId, double> timer_deadlines_;
    TimerId next_timer_id_ = 1;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

/**
 * Fixed pool of worker threads for handler work that must not block the loop.
 * Results are delivered back on the loop thread.
 */
class WorkerPool {
public:
    WorkerPool(EventLoop& loop, std::size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename R>
    void offload(std::function<R()> work,
                 std::function<void(R)> on_result,
                 std::function<void(const std::string&)> on_error) {
        EventLoop* loop = &loop_;
        submit([loop, work = std::move(work), on_result = std::move(on_result),
                on_error = std::move(on_error)]() {
            try {
                R result = work();
                loop->post([on_result, result = std::move(result)]() { on_result(result); });
            } catch (const std::exception& exc) {
                std::string what = exc.what();
                loop->post([on_error, what]() { on_error(what); });
            } catch (...) {
                loop->post([on_error]() { on_error("non-standard exception"); });
            }
        });
    }

    void submit(std::function<void()> job);
    void shutdown();
    std::size_t size() const { return threads_.size(); }

private:
    void worker_thread_func();

    EventLoop& loop_;
    std::vector<std::thread> threads_;
    std::deque<std::function<void()>> jobs_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool pool_running_ = true;
};

} // namespace rpcgate
