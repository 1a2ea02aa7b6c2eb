#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace rpcgate {

/**
 * Server end of the transport: one addressable session per connected client.
 * Callbacks are delivered on the event loop thread.
 */
class ServerChannel {
public:
    using ReceiveFn = std::function<void(const std::string& session_id, const std::string& bytes)>;
    using DisconnectFn = std::function<void(const std::string& session_id)>;

    virtual ~ServerChannel() = default;

    virtual bool send(const std::string& session_id, const std::string& bytes) = 0;
    /// Returns the number of sessions the message was handed to.
    virtual std::size_t broadcast(const std::string& bytes) = 0;
    virtual void on_receive(ReceiveFn fn) = 0;
    virtual void on_disconnect(DisconnectFn fn) = 0;
};

/**
 * Client end of the transport. Callbacks are delivered on the event loop thread.
 */
class ClientChannel {
public:
    using ReceiveFn = std::function<void(const std::string& bytes)>;
    using CloseFn = std::function<void()>;

    virtual ~ClientChannel() = default;

    virtual bool send(const std::string& bytes) = 0;
    virtual void on_receive(ReceiveFn fn) = 0;
    virtual void on_close(CloseFn fn) = 0;
    /// Session identity as known locally; empty when the server assigns it.
    virtual std::string session_id() const = 0;
};

} // namespace rpcgate
