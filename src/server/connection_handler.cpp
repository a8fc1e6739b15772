#include "connection_handler.hpp"

namespace minikv {


void ConnectionHandler::run() {
    while (state_ != State::Closed) {
        switch (state_) {
        case State::AwaitFrame:
            await_frame();
            break;
        case State::DecodeCommand:
            decode_command();
            break;
        case State::Apply:
            apply();
            break;
        case State::RespondAndLoop:
            respond();
            break;
        case State::Closed:
            break;
        }
    }
}

void ConnectionHandler::await_frame() {
    try {
        request_ = connection_->read_frame();
    } catch (const FrameError& e) {
        close(e.what(), LogLevel::Warn);
        return;
    } catch (const IOError& e) {
        close(e.what(), LogLevel::Warn);
        return;
    }

    if (!request_) {
        close("peer closed the connection");
        return;
    }
    state_ = State::DecodeCommand;
}

void ConnectionHandler::decode_command() {
    try {
        command_ = Protocol::parse(*request_);
        state_ = State::Apply;
    } catch (const CommandError& e) {
        MINIKV_LOG_DEBUG("Client [" << id_ << "] bad command " << *request_ << ": " << e.what());
        command_.reset();
        response_ = Protocol::format_error(e.what());
        state_ = State::RespondAndLoop;
    }
    request_.reset();
}

void ConnectionHandler::apply() {
    if (auto* unknown = std::get_if<Unknown>(&*command_))
        MINIKV_LOG_DEBUG("Client [" << id_ << "] unknown command '" << unknown->name << "'");

    // Store access never blocks on I/O
    response_ = CommandDispatcher::execute(*command_, *store_);
    command_.reset();
    state_ = State::RespondAndLoop;
}

void ConnectionHandler::respond() {
    try {
        connection_->write_frame(response_);
    } catch (const IOError& e) {
        close(e.what(), LogLevel::Warn);
        return;
    }
    ++replies_;
    state_ = State::AwaitFrame;
}

void ConnectionHandler::close(std::string_view reason, LogLevel level) {
    MINIKV_LOG(level, "Client [" << id_ << "] disconnected: " << reason);
    // The peer sees end of stream now, even while the listener still holds the connection
    connection_->shutdown();
    connection_.reset();
    state_ = State::Closed;
}

} // namespace minikv
