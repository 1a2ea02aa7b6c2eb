#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace rpcgate {

enum class ThrottleMode { reject, delay };

/**
 * Named options consumed by the router and the request engine.
 * Durations are in seconds.
 */
struct Options {
    double max_request_rate = 30.0;     // requests per rate window before rejection
    double rate_window = 1.0;
    double request_timeout = 10.0;
    double max_request_age = 30.0;      // older requests are treated as replays
    double max_clock_skew = 30.0;       // tolerated future timestamps
    double throttle_interval = 0.1;
    ThrottleMode throttle_mode = ThrottleMode::reject;
    bool enable_rate_limiting = true;
    bool enable_request_logging = true;
    bool reject_duplicate_ids = true;

    int retry_max_attempts = 3;
    double retry_base_delay = 0.5;
    bool retry_on_timeout = true;

    std::size_t max_frame_bytes = 1024 * 1024;
    std::size_t worker_threads = 4;
    std::string socket_path = "/tmp/rpcgate.sock";
};

/// Throws ConfigError on a wrongly typed or out of range value.
Options options_from_json(const nlohmann::json& doc);

/// Missing file yields defaults; unreadable or invalid JSON throws ConfigError.
Options load_options(const std::string& path);

const char* to_string(ThrottleMode mode);

} // namespace rpcgate
