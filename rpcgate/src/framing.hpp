#pragma once

#include <cstddef>
#include <string>

namespace rpcgate::framing {

// 4-byte big-endian length prefix followed by the payload.

constexpr std::size_t kHeaderBytes = 4;

/// Returns false on EOF, I/O error or a frame larger than max_bytes.
bool read_frame(int fd, std::string& out, std::size_t max_bytes);
bool write_frame(int fd, const std::string& bytes);

/// Header and payload in one buffer, ready for a single send.
std::string encode_frame(const std::string& bytes);

/**
 * Reassembles frames from a non-blocking stream. Bytes are fed as they
 * arrive; next() hands out each complete frame in order.
 */
class FrameReader {
public:
    enum class Status { incomplete, frame, oversized };

    explicit FrameReader(std::size_t max_bytes) : max_bytes_(max_bytes) {}

    void feed(const char* data, std::size_t size);
    Status next(std::string& out);

    std::size_t buffered() const { return buffer_.size() - offset_; }

private:
    std::size_t max_bytes_;
    std::string buffer_;
    std::size_t offset_ = 0;
};

} // namespace rpcgate::framing
