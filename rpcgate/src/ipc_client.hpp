#pragma once

#include "channel.hpp"
#include "event_loop.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace rpcgate {

/// Client endpoint for SocketServerChannel. A reader thread posts frames to the loop.
class SocketClientChannel final : public ClientChannel {
public:
    SocketClientChannel(EventLoop& loop, std::string socket_path, std::size_t max_frame_bytes);
    ~SocketClientChannel() override;

    /// Throws std::system_error when the server is unreachable.
    void connect();
    void close();
    bool is_connected() const { return connected_.load(); }

    bool send(const std::string& bytes) override;
    void on_receive(ReceiveFn fn) override { receive_ = std::move(fn); }
    void on_close(CloseFn fn) override { close_ = std::move(fn); }
    std::string session_id() const override { return ""; }

private:
    void reader_loop();

    EventLoop& loop_;
    std::string socket_path_;
    std::size_t max_frame_bytes_;
    int fd_ = -1;
    std::atomic<bool> connected_{false};
    std::thread reader_thread_;
    std::mutex write_mutex_;
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);

    ReceiveFn receive_;
    CloseFn close_;
};

} // namespace rpcgate
