#include "minikv/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <optional>

namespace minikv {

namespace {

template <typename T>
T parse_number(std::string_view flag, std::string_view text, T min, T max) {
    unsigned long long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
        throw ConfigError{std::string{flag} + ": '" + std::string{text} + "' is not a number"};
    if (value < min || value > max) {
        throw ConfigError{std::string{flag} + ": " + std::string{text} + " is out of range ["
            + std::to_string(min) + ", " + std::to_string(max) + "]"};
    }
    return static_cast<T>(value);
}

} // namespace

LogLevel parse_log_level(std::string_view name) {
    std::string lower{name};
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error")
        return LogLevel::Error;

    throw ConfigError{"unknown log level '" + std::string{name} + "'"};
}

ServerConfig parse_args(int argc, const char* const argv[]) {
    ServerConfig config;

    for (int i = 1; i < argc; i++) {
        std::string_view arg{argv[i]};
        std::string_view flag = arg;
        std::optional<std::string_view> value;

        // --flag=value
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string_view::npos) {
            flag = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }

        if (flag == "--help" || flag == "-h") {
            config.show_help = true;
            continue;
        }

        if (flag != "--bind" && flag != "--port" && flag != "--log-level" && flag != "--max-buffer")
            throw ConfigError{"unknown option '" + std::string{arg} + "'"};

        if (!value) {
            if (i + 1 >= argc)
                throw ConfigError{std::string{flag} + " requires a value"};
            value = std::string_view{argv[++i]};
        }

        if (flag == "--bind") {
            if (value->empty())
                throw ConfigError{"--bind requires a non-empty address"};
            config.bind_address = std::string{*value};
        } else if (flag == "--port") {
            config.port = parse_number<uint16_t>(flag, *value, 0, std::numeric_limits<uint16_t>::max());
        } else if (flag == "--log-level") {
            config.log_level = parse_log_level(*value);
        } else {
            config.max_buffer_size = parse_number<size_t>(flag, *value, 64, std::numeric_limits<size_t>::max());
        }
    }
    return config;
}

std::string usage(std::string_view program) {
    std::string out = "usage: " + std::string{program} + " [options]\n";
    out += "  --bind ADDR         IPv4 address to listen on (default 127.0.0.1)\n";
    out += "  --port N            TCP port, 0 for an ephemeral one (default 6379)\n";
    out += "  --log-level LEVEL   debug, info, warn or error (default info)\n";
    out += "  --max-buffer BYTES  per-connection read buffer limit (default 2098176)\n";
    out += "  --help              show this message\n";
    return out;
}

} // namespace minikv
