
#include "waker.hpp"

#include <cerrno>


namespace minikv {

Waker::Waker() {
    if (::pipe2(pipe_fds_, O_NONBLOCK | O_CLOEXEC) == -1)
        throw std::runtime_error("Failed to create self-pipe");
}

Waker::~Waker() {
    ::close(pipe_fds_[0]);
    ::close(pipe_fds_[1]);
}

int Waker::read_fd() const {
    return pipe_fds_[0];
}

void Waker::notify() {
    char c = 'x';
    // A full pipe (EAGAIN) already guarantees a wake-up
    while (::write(pipe_fds_[1], &c, 1) < 0 && errno == EINTR) {}
}

void Waker::clear() {
    char buf[64];
    while (::read(pipe_fds_[0], buf, sizeof(buf)) > 0);
}

} // namespace minikv
