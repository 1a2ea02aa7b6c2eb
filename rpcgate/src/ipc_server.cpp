#include "ipc_server.hpp"

#include "logger.hpp"

#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <system_error>
#include <vector>

#include <log4cplus/loggingmacros.h>

namespace rpcgate {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

uint32_t interest(bool want_write) {
    uint32_t events = EPOLLIN | EPOLLRDHUP;
    if (want_write) {
        events |= EPOLLOUT;
    }
    return events;
}

} // namespace

SocketServerChannel::SocketServerChannel(EventLoop& loop, std::string socket_path, std::size_t max_frame_bytes,
                                         std::size_t max_pending_bytes)
    : loop_(loop),
      socket_path_(std::move(socket_path)),
      max_frame_bytes_(max_frame_bytes),
      max_pending_bytes_(max_pending_bytes > 0 ? max_pending_bytes
                                               : 4 * (max_frame_bytes + framing::kHeaderBytes)),
      read_buffer_(kReadChunk) {}

SocketServerChannel::~SocketServerChannel() {
    stop();
}

void SocketServerChannel::start() {
    if (running_) {
        return;
    }

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
    if (server_fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }

    ::unlink(socket_path_.c_str());

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path_.c_str());

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(server_fd_, 16) < 0) {
        int err = errno;
        ::close(server_fd_);
        server_fd_ = -1;
        throw std::system_error(err, std::generic_category(), "bind/listen " + socket_path_);
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        int err = errno;
        ::close(server_fd_);
        server_fd_ = -1;
        throw std::system_error(err, std::generic_category(), "epoll_create1");
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = server_fd_;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &ev) < 0) {
        int err = errno;
        ::close(epoll_fd_);
        epoll_fd_ = -1;
        ::close(server_fd_);
        server_fd_ = -1;
        throw std::system_error(err, std::generic_category(), "epoll_ctl ADD server_fd");
    }

    running_ = true;
    accept_thread_ = std::thread(&SocketServerChannel::accept_loop, this);
    LOG4CPLUS_INFO(server_logger(), "Listening on " << socket_path_);
}

void SocketServerChannel::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& entry : connections_) {
            ::close(entry.first);
        }
        connections_.clear();
        fds_by_session_.clear();
    }

    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    ::unlink(socket_path_.c_str());
}

bool SocketServerChannel::send(const std::string& session_id, const std::string& bytes) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = fds_by_session_.find(session_id);
    if (it == fds_by_session_.end()) {
        return false;
    }
    auto conn = connections_.find(it->second);
    return conn != connections_.end() && queue_frame(it->second, conn->second, bytes);
}

std::size_t SocketServerChannel::broadcast(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::size_t reached = 0;
    for (auto& entry : connections_) {
        if (queue_frame(entry.first, entry.second, bytes)) {
            ++reached;
        }
    }
    return reached;
}

bool SocketServerChannel::queue_frame(int fd, Connection& conn, const std::string& bytes) {
    if (conn.closing) {
        return false;
    }
    if (conn.outbox.size() + framing::kHeaderBytes + bytes.size() > max_pending_bytes_) {
        LOG4CPLUS_WARN(server_logger(), "Session " << conn.session_id << " is not reading ("
                                                   << conn.outbox.size() << " bytes queued), dropping it");
        abort_connection(fd, conn);
        return false;
    }

    conn.outbox += framing::encode_frame(bytes);
    if (!flush(fd, conn)) {
        abort_connection(fd, conn);
        return false;
    }
    return true;
}

bool SocketServerChannel::flush(int fd, Connection& conn) {
    std::size_t sent = 0;
    while (sent < conn.outbox.size()) {
        ssize_t chunk = ::send(fd, conn.outbox.data() + sent, conn.outbox.size() - sent, MSG_NOSIGNAL);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        if (chunk <= 0) {
            return false;
        }
        sent += static_cast<std::size_t>(chunk);
    }
    conn.outbox.erase(0, sent);

    bool want_write = !conn.outbox.empty();
    if (want_write != conn.want_write) {
        epoll_event ev{};
        ev.events = interest(want_write);
        ev.data.fd = fd;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
            LOG4CPLUS_WARN(server_logger(), "epoll_ctl MOD client failed: errno " << errno);
            return false;
        }
        conn.want_write = want_write;
    }
    return true;
}

void SocketServerChannel::abort_connection(int fd, Connection& conn) {
    // The epoll thread sees the hangup and closes the session.
    conn.closing = true;
    conn.outbox.clear();
    ::shutdown(fd, SHUT_RDWR);
}

std::size_t SocketServerChannel::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return fds_by_session_.size();
}

void SocketServerChannel::accept_client() {
    int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK);
    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            LOG4CPLUS_WARN(server_logger(), "accept failed: errno " << errno);
        }
        return;
    }

    epoll_event cli_ev{};
    cli_ev.events = interest(false);
    cli_ev.data.fd = client_fd;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &cli_ev) < 0) {
        LOG4CPLUS_WARN(server_logger(), "epoll_ctl ADD client failed: errno " << errno);
        ::close(client_fd);
        return;
    }

    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        session_id = "session-" + std::to_string(next_session_++);
        fds_by_session_[session_id] = client_fd;
        auto& conn = connections_.emplace(client_fd, Connection(max_frame_bytes_)).first->second;
        conn.session_id = session_id;
    }
    LOG4CPLUS_INFO(server_logger(), "Session " << session_id << " connected");
}

void SocketServerChannel::close_session(int fd) {
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);

    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = connections_.find(fd);
        if (it == connections_.end()) {
            return;
        }
        session_id = it->second.session_id;
        connections_.erase(it);
        fds_by_session_.erase(session_id);
        ::close(fd);
    }

    LOG4CPLUS_INFO(server_logger(), "Session " << session_id << " disconnected");
    std::weak_ptr<int> alive = lifetime_;
    loop_.post([this, alive, session_id] {
        if (alive.lock() && disconnect_) {
            disconnect_(session_id);
        }
    });
}

void SocketServerChannel::read_ready(int fd) {
    ssize_t got = ::read(fd, read_buffer_.data(), read_buffer_.size());
    if (got < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
        return;
    }
    if (got <= 0) {
        close_session(fd);
        return;
    }

    std::string session_id;
    std::vector<std::string> frames;
    bool oversized = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = connections_.find(fd);
        if (it == connections_.end()) {
            return;
        }
        Connection& conn = it->second;
        session_id = conn.session_id;
        conn.reader.feed(read_buffer_.data(), static_cast<std::size_t>(got));

        std::string frame;
        for (;;) {
            auto status = conn.reader.next(frame);
            if (status == framing::FrameReader::Status::frame) {
                frames.push_back(std::move(frame));
                continue;
            }
            oversized = status == framing::FrameReader::Status::oversized;
            break;
        }
    }

    std::weak_ptr<int> alive = lifetime_;
    for (auto& frame : frames) {
        loop_.post([this, alive, session_id, frame = std::move(frame)] {
            if (alive.lock() && receive_) {
                receive_(session_id, frame);
            }
        });
    }

    if (oversized) {
        LOG4CPLUS_WARN(server_logger(), "Session " << session_id << " sent a frame over " << max_frame_bytes_
                                                   << " bytes, dropping it");
        close_session(fd);
    }
}

void SocketServerChannel::write_ready(int fd) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = connections_.find(fd);
    if (it == connections_.end() || it->second.closing) {
        return;
    }
    if (!flush(fd, it->second)) {
        abort_connection(fd, it->second);
    }
}

void SocketServerChannel::accept_loop() {
    const int kMaxEvents = 32;
    epoll_event events[kMaxEvents];

    while (running_) {
        int nfds = ::epoll_wait(epoll_fd_, events, kMaxEvents, 200);
        if (nfds < 0) {
            if (errno != EINTR && running_) {
                LOG4CPLUS_ERROR(server_logger(), "epoll_wait failed: errno " << errno);
            }
            continue;
        }

        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;

            if (fd == server_fd_) {
                accept_client();
                continue;
            }

            if (events[i].events & EPOLLOUT) {
                write_ready(fd);
            }

            if (events[i].events & EPOLLIN) {
                read_ready(fd);
                continue;
            }

            if (events[i].events & (EPOLLRDHUP | EPOLLERR | EPOLLHUP)) {
                close_session(fd);
            }
        }
    }
}

} // namespace rpcgate
