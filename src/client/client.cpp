#include "minikv/client.hpp"
#include "minikv/protocol.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <memory>

namespace minikv {


Client Client::connect(const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &raw);
    if (rc != 0)
        throw IOError{"cannot resolve " + host + ": " + ::gai_strerror(rc)};
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addrs{raw, &::freeaddrinfo};

    for (addrinfo* ai = addrs.get(); ai; ai = ai->ai_next) {
        Socket socket{::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol)};
        if (!socket.valid())
            continue;
        if (::connect(socket.fd(), ai->ai_addr, ai->ai_addrlen) == 0) {
            int opt = 1;
            ::setsockopt(socket.fd(), IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
            return Client{std::move(socket)};
        }
    }
    throw IOError{"cannot connect to " + host + ":" + service};
}

Frame Client::request(const Frame& frame) {
    connection_.write_frame(frame);
    auto reply = connection_.read_frame();
    if (!reply)
        throw ProtocolError{"server closed the connection"};
    return std::move(*reply);
}

void Client::set(const std::string& key, const std::string& value) {
    Frame reply = request(Protocol::to_frame(Set{key, value}));

    if (auto* error = reply.get_if<Frame::Error>())
        throw ServerError{error->text};
    auto* simple = reply.get_if<Frame::Simple>();
    if (!simple || simple->text != "OK")
        throw ProtocolError{"unexpected reply to SET: " + reply.to_string()};
}

std::optional<std::string> Client::get(const std::string& key) {
    Frame reply = request(Protocol::to_frame(Get{key}));

    if (auto* error = reply.get_if<Frame::Error>())
        throw ServerError{error->text};
    if (reply.is<Frame::Null>())
        return std::nullopt;
    if (auto* bulk = reply.get_if<Frame::Bulk>())
        return bulk->data;
    throw ProtocolError{"unexpected reply to GET: " + reply.to_string()};
}

} // namespace minikv
