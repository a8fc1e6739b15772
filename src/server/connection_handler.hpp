#pragma once

#include "minikv/command_dispatcher.hpp"
#include "minikv/connection.hpp"
#include "minikv/kv_store.hpp"
#include "minikv/logger.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace minikv {

/*
 * Per-connection request loop.
 *
 *   AwaitFrame -> DecodeCommand -> Apply -> RespondAndLoop -> AwaitFrame
 *        |              |                        |
 *        v              +--(CommandError)--------^
 *      Closed  <----------------(write failed)---+
 *
 * Exactly one reply is written per frame read, in request order.
 * A bad command gets an Error reply and the loop goes on; it ends
 * when read_frame() yields nothing or anything on the stream fails.
 */
class ConnectionHandler {
public:
    enum class State {
        AwaitFrame,
        DecodeCommand,
        Apply,
        RespondAndLoop,
        Closed
    };

    ConnectionHandler(std::uint64_t id, std::shared_ptr<Connection> connection, std::shared_ptr<Store> store)
        : id_(id), connection_(std::move(connection)), store_(std::move(store)) {}

    // Runs until the state machine reaches Closed
    void run();

    State state() const noexcept { return state_; }

    // Frames answered so far
    std::uint64_t replies() const noexcept { return replies_; }

private:
    void await_frame();
    void decode_command();
    void apply();
    void respond();
    void close(std::string_view reason, LogLevel level = LogLevel::Info);

    std::uint64_t id_;
    std::shared_ptr<Connection> connection_;
    std::shared_ptr<Store> store_;

    State state_{State::AwaitFrame};
    std::optional<Frame> request_;
    std::optional<Command> command_;
    Frame response_;
    std::uint64_t replies_{0};
};

} // namespace minikv
