
#include "tcp_server.hpp"

#include "minikv/config.hpp"
#include "minikv/logger.hpp"

#include <cerrno>
#include <csignal>
#include <iostream>


/*
 * Entry point for the server executable.
 * parse CLI args
 * start server
 * block until SIGINT / SIGTERM
 */

namespace {

minikv::TcpServer* s_server = nullptr; // used by the signal handler

void signal_handler(int) {
    int saved_errno = errno;
    if (s_server)
        s_server->stop();
    errno = saved_errno;
}

} // namespace

int main(int argc, char* argv[]) {
    minikv::ServerConfig config;
    try {
        config = minikv::parse_args(argc, argv);
    } catch (const minikv::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n" << minikv::usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        std::cout << minikv::usage(argv[0]);
        return 0;
    }

    minikv::Logger::set_level(config.log_level);

    try {
        minikv::TcpServer server{config};
        server.listen();

        std::signal(SIGPIPE, SIG_IGN); // ignore SIGPIPE
        s_server = &server;
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        server.run();
        s_server = nullptr;
    } catch (const std::exception& e) {
        s_server = nullptr;
        MINIKV_LOG_ERROR("Fatal: " << e.what());
        return 1;
    }
    return 0;
}
