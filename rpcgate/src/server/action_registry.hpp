#pragma once

#include "action_handler.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rpcgate::server {

struct Registration {
    std::string action;
    std::shared_ptr<ActionHandler> handler;
    std::shared_ptr<AsyncActionHandler> async_handler;

    explicit operator bool() const { return handler || async_handler; }
};

class ActionRegistry {
public:
    /// Registers or replaces; the previous registration for the action is returned (empty if none).
    Registration add(const std::string& action, std::shared_ptr<ActionHandler> handler);
    Registration add(const std::string& action, std::shared_ptr<AsyncActionHandler> handler);
    Registration find(const std::string& action) const;
    std::vector<std::string> actions() const;
    std::size_t size() const;

private:
    Registration store(Registration registration);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Registration> handlers_;
};

} // namespace rpcgate::server
