#include "rate_limiter.hpp"

namespace rpcgate {

RateLimiter::RateLimiter(std::size_t capacity, double window_seconds, TimeSource now)
    : capacity_(capacity), window_(window_seconds), now_(std::move(now)) {}

bool RateLimiter::allow(const std::string& sender_id) {
    double now = now_();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(sender_id);
    if (it == states_.end()) {
        states_.emplace(sender_id, WindowState{1, now});
        return true;
    }

    WindowState& state = it->second;
    if (now - state.window_start >= window_) {
        state.count = 1;
        state.window_start = now;
        return true;
    }

    ++state.count;
    return state.count <= capacity_;
}

void RateLimiter::forget(const std::string& sender_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.erase(sender_id);
}

std::size_t RateLimiter::tracked_senders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

} // namespace rpcgate
