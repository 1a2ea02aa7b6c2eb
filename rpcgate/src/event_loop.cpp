#include "event_loop.hpp"

#include "logger.hpp"

#include <chrono>

#include <log4cplus/loggingmacros.h>

namespace rpcgate {

double steady_seconds() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

EventLoop::EventLoop(TimeSource now) : now_(std::move(now)) {}

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(std::move(task));
    }
    cv_.notify_one();
}

EventLoop::TimerId EventLoop::schedule_after(double delay_seconds, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        double deadline = now_() + (delay_seconds > 0.0 ? delay_seconds : 0.0);
        timers_.emplace(std::make_pair(deadline, id), std::move(task));
        timer_deadlines_.emplace(id, deadline);
    }
    cv_.notify_one();
    return id;
}

bool EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timer_deadlines_.find(id);
    if (it == timer_deadlines_.end()) {
        return false;
    }
    timers_.erase(std::make_pair(it->second, id));
    timer_deadlines_.erase(it);
    return true;
}

void EventLoop::run_task(Task& task) {
    try {
        task();
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(core_logger(), "Event loop task failed: " << exc.what());
    } catch (...) {
        LOG4CPLUS_ERROR(core_logger(), "Event loop task failed with a non-standard exception");
    }
}

std::size_t EventLoop::poll() {
    std::deque<Task> ready;
    std::vector<Task> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready.swap(ready_);

        double now = now_();
        while (!timers_.empty() && timers_.begin()->first.first <= now) {
            auto node = timers_.begin();
            timer_deadlines_.erase(node->first.second);
            due.push_back(std::move(node->second));
            timers_.erase(node);
        }
    }

    for (auto& task : ready) {
        run_task(task);
    }
    for (auto& task : due) {
        run_task(task);
    }
    return ready.size() + due.size();
}

std::size_t EventLoop::drain() {
    std::size_t total = 0;
    for (std::size_t ran = poll(); ran > 0; ran = poll()) {
        total += ran;
    }
    return total;
}

void EventLoop::run() {
    running_ = true;
    stop_requested_ = false;

    while (!stop_requested_) {
        poll();

        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_requested_ || !ready_.empty()) {
            continue;
        }
        if (timers_.empty()) {
            cv_.wait(lock, [this] { return stop_requested_ || !ready_.empty() || !timers_.empty(); });
        } else {
            double wait = timers_.begin()->first.first - now_();
            if (wait > 0.0) {
                cv_.wait_for(lock, std::chrono::duration<double>(wait));
            }
        }
    }

    running_ = false;
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

std::size_t EventLoop::pending_timers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

WorkerPool::WorkerPool(EventLoop& loop, std::size_t thread_count) : loop_(loop) {
    if (thread_count == 0) {
        thread_count = 1;
    }
    for (std::size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back(&WorkerPool::worker_thread_func, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!pool_running_) {
            LOG4CPLUS_WARN(core_logger(), "Worker pool is shut down, job dropped");
            return;
        }
        jobs_.push_back(std::move(job));
    }
    queue_cv_.notify_one();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!pool_running_) {
            return;
        }
        pool_running_ = false;
    }
    queue_cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void WorkerPool::worker_thread_func() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !jobs_.empty() || !pool_running_; });

            if (!pool_running_ && jobs_.empty()) {
                return;
            }

            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        try {
            job();
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(core_logger(), "Worker job failed: " << exc.what());
        } catch (...) {
            LOG4CPLUS_ERROR(core_logger(), "Worker job failed with a non-standard exception");
        }
    }
}

} // namespace rpcgate
