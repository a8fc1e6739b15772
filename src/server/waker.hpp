#pragma once

#include <unistd.h>
#include <fcntl.h>
#include <stdexcept>


namespace minikv {

/*
 * Self-pipe used to wake the accept loop out of poll().
 * notify() only calls write(), so it may run inside a signal handler.
 */
class Waker {
public:
    Waker();
    ~Waker();

    Waker(const Waker&) = delete;
    Waker& operator=(const Waker&) = delete;

    int read_fd() const;

    void notify();

    // Drains pending notifications
    void clear();

private:
    int pipe_fds_[2];
};

} // namespace minikv
