#include "options.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <filesystem>
#include <fstream>
#include <set>

#include <log4cplus/loggingmacros.h>

namespace rpcgate {

namespace {

const std::set<std::string>& known_keys() {
    static const std::set<std::string> keys = {
        "maxRequestRate", "rateWindow", "requestTimeout", "maxRequestAge", "maxClockSkew",
        "throttleInterval", "throttleMode", "enableRateLimiting", "enableRequestLogging",
        "rejectDuplicateIds", "retryMaxAttempts", "retryBaseDelay", "retryOnTimeout",
        "maxFrameBytes", "workerThreads", "socketPath",
    };
    return keys;
}

void read_seconds(const nlohmann::json& doc, const char* key, double& out, bool allow_zero = false) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return;
    }
    if (!it->is_number()) {
        throw ConfigError(key, "expected a number");
    }
    double value = it->get<double>();
    if (value < 0.0 || (!allow_zero && value == 0.0)) {
        throw ConfigError(key, "must be positive");
    }
    out = value;
}

void read_bool(const nlohmann::json& doc, const char* key, bool& out) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return;
    }
    if (!it->is_boolean()) {
        throw ConfigError(key, "expected a boolean");
    }
    out = it->get<bool>();
}

template <typename Int>
void read_count(const nlohmann::json& doc, const char* key, Int& out) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return;
    }
    if (!it->is_number_integer() || it->get<long long>() <= 0) {
        throw ConfigError(key, "expected a positive integer");
    }
    out = static_cast<Int>(it->get<long long>());
}

} // namespace

const char* to_string(ThrottleMode mode) {
    return mode == ThrottleMode::delay ? "delay" : "reject";
}

Options options_from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("<root>", "expected a JSON object");
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (!known_keys().count(it.key())) {
            LOG4CPLUS_WARN(core_logger(), "Ignoring unknown option: " << it.key());
        }
    }

    Options options;
    read_seconds(doc, "maxRequestRate", options.max_request_rate);
    read_seconds(doc, "rateWindow", options.rate_window);
    read_seconds(doc, "requestTimeout", options.request_timeout);
    read_seconds(doc, "maxRequestAge", options.max_request_age);
    read_seconds(doc, "maxClockSkew", options.max_clock_skew, true);
    read_seconds(doc, "throttleInterval", options.throttle_interval, true);
    read_seconds(doc, "retryBaseDelay", options.retry_base_delay, true);
    read_bool(doc, "enableRateLimiting", options.enable_rate_limiting);
    read_bool(doc, "enableRequestLogging", options.enable_request_logging);
    read_bool(doc, "rejectDuplicateIds", options.reject_duplicate_ids);
    read_bool(doc, "retryOnTimeout", options.retry_on_timeout);
    read_count(doc, "retryMaxAttempts", options.retry_max_attempts);
    read_count(doc, "maxFrameBytes", options.max_frame_bytes);
    read_count(doc, "workerThreads", options.worker_threads);

    if (auto it = doc.find("throttleMode"); it != doc.end()) {
        std::string mode = it->is_string() ? it->get<std::string>() : "";
        if (mode == "reject") {
            options.throttle_mode = ThrottleMode::reject;
        } else if (mode == "delay") {
            options.throttle_mode = ThrottleMode::delay;
        } else {
            throw ConfigError("throttleMode", "expected \"reject\" or \"delay\"");
        }
    }

    if (auto it = doc.find("socketPath"); it != doc.end()) {
        if (!it->is_string() || it->get<std::string>().empty()) {
            throw ConfigError("socketPath", "expected a non-empty string");
        }
        options.socket_path = it->get<std::string>();
    }

    return options;
}

Options load_options(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        LOG4CPLUS_INFO(core_logger(), "Config " << path << " not found, using defaults");
        return Options{};
    }

    std::ifstream in(path);
    if (!in) {
        throw ConfigError(path, "cannot open file");
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& exc) {
        throw ConfigError(path, exc.what());
    }
    return options_from_json(doc);
}

} // namespace rpcgate
