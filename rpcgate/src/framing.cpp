#include "framing.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <vector>

namespace rpcgate::framing {

namespace {

bool read_exact(int fd, char* data, std::size_t size) {
    std::size_t offset = 0;
    while (offset < size) {
        ssize_t chunk = ::read(fd, data + offset, size - offset);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<std::size_t>(chunk);
    }
    return true;
}

bool write_all(int fd, const char* data, std::size_t size) {
    std::size_t offset = 0;
    while (offset < size) {
        ssize_t chunk = ::send(fd, data + offset, size - offset, MSG_NOSIGNAL);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<std::size_t>(chunk);
    }
    return true;
}

} // namespace

bool read_frame(int fd, std::string& out, std::size_t max_bytes) {
    uint32_t length_be = 0;
    if (!read_exact(fd, reinterpret_cast<char*>(&length_be), sizeof(length_be))) {
        return false;
    }

    uint32_t length = __builtin_bswap32(length_be);
    if (length > max_bytes) {
        return false;
    }

    std::vector<char> buffer(length);
    if (length > 0 && !read_exact(fd, buffer.data(), length)) {
        return false;
    }
    out.assign(buffer.data(), buffer.size());
    return true;
}

bool write_frame(int fd, const std::string& bytes) {
    std::string frame = encode_frame(bytes);
    return write_all(fd, frame.data(), frame.size());
}

std::string encode_frame(const std::string& bytes) {
    uint32_t length_be = __builtin_bswap32(static_cast<uint32_t>(bytes.size()));
    std::string frame;
    frame.reserve(kHeaderBytes + bytes.size());
    frame.append(reinterpret_cast<const char*>(&length_be), sizeof(length_be));
    frame.append(bytes);
    return frame;
}

void FrameReader::feed(const char* data, std::size_t size) {
    if (offset_ > 0 && offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    }
    buffer_.append(data, size);
}

FrameReader::Status FrameReader::next(std::string& out) {
    if (buffered() < kHeaderBytes) {
        return Status::incomplete;
    }

    uint32_t length_be = 0;
    std::memcpy(&length_be, buffer_.data() + offset_, sizeof(length_be));
    uint32_t length = __builtin_bswap32(length_be);
    if (length > max_bytes_) {
        return Status::oversized;
    }
    if (buffered() < kHeaderBytes + length) {
        return Status::incomplete;
    }

    out.assign(buffer_, offset_ + kHeaderBytes, length);
    offset_ += kHeaderBytes + length;

    // Consumed bytes are dropped once they dominate the buffer.
    if (offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    } else if (offset_ > buffer_.size() / 2) {
        buffer_.erase(0, offset_);
        offset_ = 0;
    }
    return Status::frame;
}

} // namespace rpcgate::framing
