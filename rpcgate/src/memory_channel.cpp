#include "memory_channel.hpp"

#include "logger.hpp"

#include <vector>

#include <log4cplus/loggingmacros.h>

namespace rpcgate {

class MemoryHub::ServerEnd final : public ServerChannel {
public:
    explicit ServerEnd(MemoryHub& hub) : hub_(hub) {}

    bool send(const std::string& session_id, const std::string& bytes) override {
        {
            std::lock_guard<std::mutex> lock(hub_.mutex_);
            if (!hub_.sessions_.count(session_id)) {
                return false;
            }
        }
        hub_.deliver_to_client(session_id, bytes);
        return true;
    }

    std::size_t broadcast(const std::string& bytes) override {
        std::vector<std::string> targets;
        {
            std::lock_guard<std::mutex> lock(hub_.mutex_);
            for (const auto& entry : hub_.sessions_) {
                targets.push_back(entry.first);
            }
        }
        for (const auto& session_id : targets) {
            hub_.deliver_to_client(session_id, bytes);
        }
        return targets.size();
    }

    void on_receive(ReceiveFn fn) override { receive_ = std::move(fn); }
    void on_disconnect(DisconnectFn fn) override { disconnect_ = std::move(fn); }

    ReceiveFn receive_;
    DisconnectFn disconnect_;

private:
    MemoryHub& hub_;
};

class MemoryHub::ClientEnd final : public ClientChannel {
public:
    ClientEnd(MemoryHub& hub, std::string session_id) : hub_(hub), session_id_(std::move(session_id)) {}

    bool send(const std::string& bytes) override {
        if (closed_) {
            return false;
        }
        hub_.deliver_to_server(session_id_, bytes);
        return true;
    }

    void on_receive(ReceiveFn fn) override { receive_ = std::move(fn); }
    void on_close(CloseFn fn) override { close_ = std::move(fn); }
    std::string session_id() const override { return session_id_; }

    ReceiveFn receive_;
    CloseFn close_;
    bool closed_ = false;

private:
    MemoryHub& hub_;
    std::string session_id_;
};

MemoryHub::MemoryHub(EventLoop& loop) : loop_(loop), server_(std::make_unique<ServerEnd>(*this)) {}

MemoryHub::~MemoryHub() = default;

ServerChannel& MemoryHub::server() {
    return *server_;
}

std::shared_ptr<ClientChannel> MemoryHub::connect(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = sessions_[session_id];
    if (!slot) {
        slot = std::make_shared<ClientEnd>(*this, session_id);
        LOG4CPLUS_DEBUG(core_logger(), "Memory session " << session_id << " connected");
    }
    return slot;
}

void MemoryHub::disconnect(const std::string& session_id) {
    std::shared_ptr<ClientEnd> end;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return;
        }
        end = it->second;
        end->closed_ = true;
        sessions_.erase(it);
    }

    std::weak_ptr<int> alive = lifetime_;
    loop_.post([this, alive, end, session_id] {
        if (!alive.lock()) {
            return;
        }
        if (end->close_) {
            end->close_();
        }
        if (server_->disconnect_) {
            server_->disconnect_(session_id);
        }
    });
}

void MemoryHub::deliver_to_client(const std::string& session_id, const std::string& bytes) {
    std::weak_ptr<int> alive = lifetime_;
    loop_.post([this, alive, session_id, bytes] {
        if (!alive.lock()) {
            return;
        }
        std::shared_ptr<ClientEnd> end;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(session_id);
            if (it == sessions_.end()) {
                return;
            }
            end = it->second;
            ++delivered_;
        }
        if (end->receive_) {
            end->receive_(bytes);
        }
    });
}

void MemoryHub::deliver_to_server(const std::string& session_id, const std::string& bytes) {
    std::weak_ptr<int> alive = lifetime_;
    loop_.post([this, alive, session_id, bytes] {
        if (!alive.lock()) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!sessions_.count(session_id)) {
                return;
            }
            ++delivered_;
        }
        if (server_->receive_) {
            server_->receive_(session_id, bytes);
        }
    });
}

std::size_t MemoryHub::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::size_t MemoryHub::frames_delivered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
}

} // namespace rpcgate
