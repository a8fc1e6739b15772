
#include "minikv/socket.hpp"

#include <sys/socket.h> // shutdown()
#include <unistd.h>     // close()


namespace minikv {


Socket::Socket() noexcept: fd_(-1) {}

Socket::Socket(int fd) noexcept: fd_(fd) {}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept: fd_(other.fd_) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

bool Socket::valid() const noexcept {
    return fd_ != -1;
}

int Socket::fd() const noexcept {
    return fd_;
}

void Socket::shutdown() const noexcept {
    if (fd_ != -1) {
        // ENOTCONN once the peer is gone is fine, there is nothing left to unblock
        ::shutdown(fd_, SHUT_RDWR);
    }
}

void Socket::close() noexcept {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace minikv
