#pragma once

#include "minikv/frame.hpp"
#include "minikv/socket.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace minikv {

class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

// The peer closed the stream in the middle of a frame
class ConnectionResetError : public IOError {
    using IOError::IOError;
};

class BufferOverflowError : public IOError {
    using IOError::IOError;
};

/*
 * One stream socket plus its read buffer.
 *
 * Reads and writes block, so each Connection is driven by a single
 * thread. shutdown() is the only member safe to call from elsewhere.
 */
class Connection {
public:
    static constexpr size_t DEFAULT_MAX_BUFFER = 2 * 1024 * 1024 + 1024; // 2MB value plus framing

    explicit Connection(Socket socket, size_t max_buffer = DEFAULT_MAX_BUFFER)
        : socket_(std::move(socket)), max_buffer_(max_buffer) {
        buffer_.reserve(READ_CHUNK);
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Next frame from the stream.
    // Returns std::nullopt when the peer closed cleanly between frames.
    // Throws FrameError on malformed input, ConnectionResetError when the
    // peer closed mid-frame, IOError / BufferOverflowError otherwise.
    std::optional<Frame> read_frame();

    // Writes the whole encoded frame before returning. Throws IOError.
    void write_frame(const Frame& frame);

    // Unblocks a pending read_frame() in another thread
    void shutdown() const noexcept;

    int fd() const noexcept { return socket_.fd(); }

    // Bytes received but not yet returned as a frame
    size_t buffered() const noexcept { return buffer_.size(); }

private:
    static constexpr size_t READ_CHUNK = 4096;

    // Decodes one frame from the buffer without touching the socket
    std::optional<Frame> parse_frame();

    // One read() into the buffer; returns false at end of stream
    bool read_to_buffer();

    void write_all(const std::string& data);

    Socket socket_;
    size_t max_buffer_;
    std::string buffer_;
    FrameDecoder decoder_;
};

} // namespace minikv
