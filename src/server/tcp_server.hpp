#pragma once

#include "minikv/config.hpp"
#include "minikv/connection.hpp"
#include "minikv/kv_store.hpp"
#include "minikv/socket.hpp"
#include "waker.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace minikv {

/*
 * Listener loop.
 *
 * poll()s the listening socket and a self-pipe, and gives every accepted
 * connection its own thread running a ConnectionHandler. All handlers
 * share one Store. Finished handlers report back through the waker and
 * are joined by the loop.
 */
class TcpServer {
public:
    explicit TcpServer(ServerConfig config, std::shared_ptr<Store> store = std::make_shared<KvStore>())
        : config_(std::move(config)), store_(std::move(store)) {};

    // Shuts down and joins any remaining connection threads
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    TcpServer(TcpServer&&) = delete;
    TcpServer& operator=(TcpServer&&) = delete;

    // Bind and listen on the configured address.
    // Throws std::runtime_error on failure.
    void listen();

    // Accept connections until stop() is called, then close every
    // connection and join their threads.
    void run();

    // listen() followed by run()
    void start();

    // Only flips a flag and pokes the waker, so it is safe from a
    // signal handler or any thread.
    void stop() noexcept;

    // Returns true between listen() and stop().
    bool is_running() const noexcept;

    // Bound port, resolved after listen() when the configured port is 0
    uint16_t port() const noexcept;

    size_t active_connections() const;

    const std::shared_ptr<Store>& store() const noexcept { return store_; }

private:
    struct Session {
        std::shared_ptr<Connection> connection;
        std::jthread worker;
    };

    // Accept a new client connection, std::nullopt when none is pending
    std::optional<Socket> accept();

    void handle_new_connection();
    void spawn_session(Socket client);
    void reap_finished();
    void close_all();

    ServerConfig config_;
    std::shared_ptr<Store> store_;
    Socket listen_socket_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> port_{0};
    Waker waker_;

    std::uint64_t next_id_{1};
    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::uint64_t, Session> sessions_;
    std::vector<std::uint64_t> finished_;
};

} // namespace minikv
