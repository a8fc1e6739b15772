# pragma once


namespace minikv {

/*
 * RAII wrapper for a POSIX stream socket
 *
 * Owns the descriptor and closes it on destruction
 * Move-only
 */
class Socket {
public:
    // Constructs an invalid socket
    Socket() noexcept;

    // Takes ownership of an existing file descriptor
    explicit Socket(int fd) noexcept;

    // Closes the socket if valid
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    // Returns true if the socket owns a valid descriptor
    bool valid() const noexcept;

    // Returns the underlying file descriptor
    int fd() const noexcept;

    // Shuts down both directions but keeps the descriptor open,
    // so a read blocked on it in another thread returns 0.
    // Safe to call from any thread.
    void shutdown() const noexcept;

private:
    void close() noexcept;

    int fd_;
};

} // namespace minikv
