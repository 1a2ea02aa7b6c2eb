#pragma once

#include "event_loop.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rpcgate {

/**
 * Fixed-window request counter per sender.
 * Tolerates bursts at window boundaries in exchange for O(1) state per sender.
 */
class RateLimiter {
public:
    RateLimiter(std::size_t capacity, double window_seconds, TimeSource now);

    /// Counts the call and reports whether it is within the current window's capacity.
    bool allow(const std::string& sender_id);

    /// Drops the sender's state; called on session teardown.
    void forget(const std::string& sender_id);

    std::size_t tracked_senders() const;
    std::size_t capacity() const { return capacity_; }
    double window() const { return window_; }

private:
    struct WindowState {
        std::size_t count = 0;
        double window_start = 0.0;
    };

    std::size_t capacity_;
    double window_;
    TimeSource now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, WindowState> states_;
};

} // namespace rpcgate
