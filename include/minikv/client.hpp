#pragma once

#include "minikv/connection.hpp"
#include "minikv/frame.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace minikv {

// The server answered with an Error frame
class ServerError : public std::runtime_error {
public:
    explicit ServerError(const std::string& msg) : std::runtime_error(msg) {}
};

// The server answered with a frame of the wrong kind, or not at all
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

/*
 * Blocking client: one request in flight at a time.
 */
class Client {
public:
    explicit Client(Socket socket) : connection_(std::move(socket)) {}

    // Throws IOError if the address cannot be resolved or reached
    static Client connect(const std::string& host, uint16_t port);

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key);

    // Sends any frame and returns the reply as is
    Frame request(const Frame& frame);

private:
    Connection connection_;
};

} // namespace minikv
