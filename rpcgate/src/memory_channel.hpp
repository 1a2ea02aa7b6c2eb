#pragma once

#include "channel.hpp"
#include "event_loop.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rpcgate {

/**
 * In-process transport: one server endpoint, any number of client sessions.
 * Every delivery goes through the event loop, so nothing is re-entrant.
 */
class MemoryHub {
public:
    explicit MemoryHub(EventLoop& loop);
    ~MemoryHub();

    MemoryHub(const MemoryHub&) = delete;
    MemoryHub& operator=(const MemoryHub&) = delete;

    ServerChannel& server();

    /// Opens a session, or returns the open one with that id. After disconnect() the
    /// hub drops its reference; holders keep a closed channel whose send() fails.
    std::shared_ptr<ClientChannel> connect(const std::string& session_id);
    void disconnect(const std::string& session_id);

    std::size_t session_count() const;
    std::size_t frames_delivered() const;

private:
    class ServerEnd;
    class ClientEnd;

    void deliver_to_client(const std::string& session_id, const std::string& bytes);
    void deliver_to_server(const std::string& session_id, const std::string& bytes);

    EventLoop& loop_;
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
    std::unique_ptr<ServerEnd> server_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ClientEnd>> sessions_;
    std::size_t delivered_ = 0;
};

} // namespace rpcgate
