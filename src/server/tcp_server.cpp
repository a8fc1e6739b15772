
#include "tcp_server.hpp"
#include "connection_handler.hpp"

#include "minikv/logger.hpp"

#include <stdexcept>     // std::runtime_error
#include <sys/socket.h>  // socket(), bind(), listen()
#include <netinet/in.h>  // sockaddr_in
#include <netinet/tcp.h> // TCP_NODELAY
#include <arpa/inet.h>   // htons(), inet_pton()
#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <string>

namespace minikv {


TcpServer::~TcpServer() {
    stop();
    close_all();
}

void TcpServer::listen() {
    if (running_)
        throw std::runtime_error("Server is already listening");

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port); // Converts port to network byte order
    if (::inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1)
        throw std::runtime_error("Invalid bind address '" + config_.bind_address + "'");

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd == -1)
        throw std::runtime_error("Failed to create socket");

    listen_socket_ = Socket(fd);

    int opt = 1;
    ::setsockopt(listen_socket_.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (::bind(listen_socket_.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1)
        throw std::runtime_error(std::string{"Bind failed: "} + std::strerror(errno));

    if (::listen(listen_socket_.fd(), SOMAXCONN) == -1)
        throw std::runtime_error(std::string{"Listen failed: "} + std::strerror(errno));

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(listen_socket_.fd(), reinterpret_cast<sockaddr*>(&bound), &bound_len) == -1)
        throw std::runtime_error("getsockname failed");
    port_ = ntohs(bound.sin_port);

    running_ = true;
    MINIKV_LOG_INFO("Listening on " << config_.bind_address << ":" << port_.load());
}

void TcpServer::start() {
    listen();
    run();
}

void TcpServer::run() {
    if (!listen_socket_.valid())
        throw std::runtime_error("Server is not listening");

    std::array<pollfd, 2> poll_fds{{
        {listen_socket_.fd(), POLLIN, 0}, // The server listening socket
        {waker_.read_fd(), POLLIN, 0}     // The read-end of the self-pipe
    }};

    while (running_) {
        int activity = ::poll(poll_fds.data(), poll_fds.size(), -1); // Block until a FD is ready
        if (activity < 0) {
            if (errno == EINTR) // interrupted syscall, eg: SIGINT before stop() ran
                continue;
            MINIKV_LOG_ERROR("poll failed: " << std::strerror(errno));
            break;
        }

        // Waker poke: stop() or a finished connection
        if (poll_fds[1].revents & POLLIN) {
            waker_.clear();
            reap_finished();
        }

        // New clients
        if (running_ && (poll_fds[0].revents & POLLIN))
            handle_new_connection();
    }

    running_ = false;
    listen_socket_ = Socket{}; // stop accepting new clients
    close_all();
    MINIKV_LOG_INFO("Server stopped");
}

void TcpServer::stop() noexcept {
    // Compare and Swap (atomic transaction) to prevent double-shutdown logic
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    waker_.notify();
}

std::optional<Socket> TcpServer::accept() {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);

    // Client sockets stay blocking: each one is driven by its own thread
    int client_fd = ::accept4(
        listen_socket_.fd(),
        reinterpret_cast<sockaddr*>(&client_addr),
        &client_len,
        SOCK_CLOEXEC
    );

    if (client_fd < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNABORTED)
            return std::nullopt;
        throw std::runtime_error(std::string{"Accept failed: "} + std::strerror(errno));
    }

    int opt = 1;
    ::setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
    return Socket{client_fd};
}

void TcpServer::handle_new_connection() {
    // Drain the backlog, the listener is non-blocking
    while (true) {
        std::optional<Socket> client;
        try {
            client = accept();
        } catch (const std::runtime_error& e) {
            // e.g. EMFILE: keep serving the existing connections
            MINIKV_LOG_ERROR(e.what());
            return;
        }
        if (!client)
            return;
        spawn_session(std::move(*client));
    }
}

void TcpServer::spawn_session(Socket client) {
    std::uint64_t id = next_id_++;
    int fd = client.fd();
    auto connection = std::make_shared<Connection>(std::move(client), config_.max_buffer_size);

    MINIKV_LOG_INFO("Client [" << id << "] connected on fd " << fd);

    std::lock_guard lock(sessions_mutex_);
    Session& session = sessions_[id];
    session.connection = connection;
    session.worker = std::jthread([this, id, connection]() {
        try {
            ConnectionHandler handler{id, connection, store_};
            handler.run();
        } catch (const std::exception& e) {
            MINIKV_LOG_ERROR("Client [" << id << "] handler failed: " << e.what());
        }

        {
            std::lock_guard done_lock(sessions_mutex_);
            finished_.push_back(id);
        }
        waker_.notify();
    });
}

void TcpServer::reap_finished() {
    std::vector<std::jthread> done;
    {
        std::lock_guard lock(sessions_mutex_);
        for (auto id : finished_) {
            auto it = sessions_.find(id);
            if (it == sessions_.end())
                continue;
            done.push_back(std::move(it->second.worker));
            sessions_.erase(it);
        }
        finished_.clear();
    }
    // jthread joins on destruction; these threads have already returned
}

void TcpServer::close_all() {
    std::vector<std::jthread> workers;
    {
        std::lock_guard lock(sessions_mutex_);
        for (auto& [id, session] : sessions_) {
            // Unblocks the handler's pending read
            session.connection->shutdown();
            workers.push_back(std::move(session.worker));
        }
        sessions_.clear();
        finished_.clear();
    }
    workers.clear();
}

bool TcpServer::is_running() const noexcept {
    return running_;
}

uint16_t TcpServer::port() const noexcept {
    return port_;
}

size_t TcpServer::active_connections() const {
    std::lock_guard lock(sessions_mutex_);
    return sessions_.size();
}

} // namespace minikv
