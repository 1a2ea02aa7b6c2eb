#include "action_registry.hpp"

#include <algorithm>

namespace rpcgate::server {

Registration ActionRegistry::add(const std::string& action, std::shared_ptr<ActionHandler> handler) {
    Registration registration;
    registration.action = action;
    registration.handler = std::move(handler);
    return store(std::move(registration));
}

Registration ActionRegistry::add(const std::string& action, std::shared_ptr<AsyncActionHandler> handler) {
    Registration registration;
    registration.action = action;
    registration.async_handler = std::move(handler);
    return store(std::move(registration));
}

Registration ActionRegistry::store(Registration registration) {
    if (registration.action.empty() || !registration) {
        return Registration{};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Registration previous;
    auto it = handlers_.find(registration.action);
    if (it != handlers_.end()) {
        previous = std::move(it->second);
        it->second = std::move(registration);
    } else {
        std::string key = registration.action;
        handlers_.emplace(std::move(key), std::move(registration));
    }
    return previous;
}

Registration ActionRegistry::find(const std::string& action) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(action);
    if (it == handlers_.end()) {
        return Registration{};
    }
    return it->second;
}

std::vector<std::string> ActionRegistry::actions() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names.reserve(handlers_.size());
        for (const auto& entry : handlers_) {
            names.push_back(entry.first);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::size_t ActionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

} // namespace rpcgate::server
