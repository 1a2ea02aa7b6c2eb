#include "ipc_client.hpp"

#include "framing.hpp"
#include "logger.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <system_error>

#include <log4cplus/loggingmacros.h>

namespace rpcgate {

SocketClientChannel::SocketClientChannel(EventLoop& loop, std::string socket_path, std::size_t max_frame_bytes)
    : loop_(loop), socket_path_(std::move(socket_path)), max_frame_bytes_(max_frame_bytes) {}

SocketClientChannel::~SocketClientChannel() {
    close();
}

void SocketClientChannel::connect() {
    if (connected_) {
        return;
    }

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path_.c_str());

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw std::system_error(err, std::generic_category(), "connect " + socket_path_);
    }

    connected_ = true;
    reader_thread_ = std::thread(&SocketClientChannel::reader_loop, this);
    LOG4CPLUS_INFO(client_logger(), "Connected to " << socket_path_);
}

void SocketClientChannel::close() {
    if (fd_ >= 0) {
        connected_ = false;
        ::shutdown(fd_, SHUT_RDWR);
    }
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool SocketClientChannel::send(const std::string& bytes) {
    if (!connected_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    return framing::write_frame(fd_, bytes);
}

void SocketClientChannel::reader_loop() {
    std::weak_ptr<int> alive = lifetime_;
    std::string frame;
    while (framing::read_frame(fd_, frame, max_frame_bytes_)) {
        loop_.post([this, alive, frame] {
            if (alive.lock() && receive_) {
                receive_(frame);
            }
        });
    }

    bool was_connected = connected_.exchange(false);
    if (was_connected) {
        LOG4CPLUS_WARN(client_logger(), "Connection to " << socket_path_ << " lost");
    }
    loop_.post([this, alive] {
        if (alive.lock() && close_) {
            close_();
        }
    });
}

} // namespace rpcgate
