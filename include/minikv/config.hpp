#pragma once

#include "minikv/logger.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace minikv {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct ServerConfig {
    std::string bind_address{"127.0.0.1"};
    uint16_t port{6379};   // 0 picks an ephemeral port
    LogLevel log_level{LogLevel::Info};
    size_t max_buffer_size{2 * 1024 * 1024 + 1024}; // per-connection read buffer
    bool show_help{false};
};

/*
 * Parses the server command line:
 *   --bind ADDR  --port N  --log-level debug|info|warn|error
 *   --max-buffer BYTES  --help
 * Both "--flag value" and "--flag=value" are accepted.
 * Throws ConfigError on unknown flags, missing or invalid values.
 */
ServerConfig parse_args(int argc, const char* const argv[]);

// Case-insensitive. Throws ConfigError.
LogLevel parse_log_level(std::string_view name);

std::string usage(std::string_view program);

} // namespace minikv
