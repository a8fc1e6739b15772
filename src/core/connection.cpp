#include "minikv/connection.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace minikv {


std::optional<Frame> Connection::read_frame() {
    while (true) {
        // Pipelined requests may already be sitting in the buffer
        if (auto frame = parse_frame())
            return frame;

        if (!read_to_buffer()) {
            // Clean shutdown only if the peer stopped between frames
            if (buffer_.empty())
                return std::nullopt;
            throw ConnectionResetError{"connection reset by peer"};
        }
    }
}

std::optional<Frame> Connection::parse_frame() {
    DecodeResult result = decoder_.decode(buffer_);

    switch (result.status) {
    case DecodeStatus::Ready:
        buffer_.erase(0, result.consumed);
        return std::move(result.frame);
    case DecodeStatus::Incomplete:
        return std::nullopt;
    case DecodeStatus::Malformed:
        break;
    }
    throw FrameError{"malformed frame: " + result.error};
}

bool Connection::read_to_buffer() {
    // Only reached with an undecodable prefix buffered, so a full buffer is an oversized frame
    if (buffer_.size() >= max_buffer_) {
        buffer_.clear();
        throw BufferOverflowError{"frame larger than " + std::to_string(max_buffer_) + " bytes"};
    }

    char chunk[READ_CHUNK];
    size_t want = std::min(sizeof(chunk), max_buffer_ - buffer_.size());
    ssize_t n;
    do {
        n = ::read(socket_.fd(), chunk, want);
    } while (n < 0 && errno == EINTR);

    if (n == 0)
        return false;
    if (n < 0)
        throw IOError{std::string{"read failed: "} + std::strerror(errno)};

    buffer_.append(chunk, static_cast<size_t>(n));
    return true;
}

void Connection::write_frame(const Frame& frame) {
    write_all(frame.encode());
}

void Connection::write_all(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        // MSG_NOSIGNAL: don't SIGPIPE us if the socket is dead
        ssize_t n = ::send(socket_.fd(), data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            throw IOError{std::string{"write failed: "} + std::strerror(errno)};
        }
        sent += static_cast<size_t>(n);
    }
}

void Connection::shutdown() const noexcept {
    socket_.shutdown();
}

} // namespace minikv
