#pragma once

#include "channel.hpp"
#include "event_loop.hpp"
#include "framing.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rpcgate {

/**
 * Unix domain socket server endpoint.
 *
 * An epoll thread accepts connections and reads length-prefixed frames;
 * frames and disconnects are posted to the event loop. Each connection is a
 * session named "session-<n>".
 *
 * Client sockets are non-blocking. Partial frames are buffered per
 * connection, and output a peer does not drain is queued up to
 * max_pending_bytes; past that bound the session is dropped.
 */
class SocketServerChannel final : public ServerChannel {
public:
    SocketServerChannel(EventLoop& loop, std::string socket_path, std::size_t max_frame_bytes,
                        std::size_t max_pending_bytes = 0);
    ~SocketServerChannel() override;

    /// Throws std::system_error when the socket cannot be set up.
    void start();
    void stop();
    bool is_running() const { return running_.load(); }
    const std::string& socket_path() const { return socket_path_; }

    bool send(const std::string& session_id, const std::string& bytes) override;
    std::size_t broadcast(const std::string& bytes) override;
    void on_receive(ReceiveFn fn) override { receive_ = std::move(fn); }
    void on_disconnect(DisconnectFn fn) override { disconnect_ = std::move(fn); }

    std::size_t session_count() const;
    std::size_t max_pending_bytes() const { return max_pending_bytes_; }

private:
    struct Connection {
        explicit Connection(std::size_t max_frame_bytes) : reader(max_frame_bytes) {}

        std::string session_id;
        framing::FrameReader reader;
        std::string outbox;
        bool want_write = false;
        bool closing = false;
    };

    void accept_loop();
    void accept_client();
    void read_ready(int fd);
    void write_ready(int fd);
    void close_session(int fd);

    // Callers hold sessions_mutex_.
    bool queue_frame(int fd, Connection& conn, const std::string& bytes);
    bool flush(int fd, Connection& conn);
    void abort_connection(int fd, Connection& conn);

    EventLoop& loop_;
    std::string socket_path_;
    std::size_t max_frame_bytes_;
    std::size_t max_pending_bytes_;
    int server_fd_ = -1;
    int epoll_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);

    ReceiveFn receive_;
    DisconnectFn disconnect_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, int> fds_by_session_;
    std::unordered_map<int, Connection> connections_;
    std::vector<char> read_buffer_;
    std::size_t next_session_ = 1;
};

} // namespace rpcgate
