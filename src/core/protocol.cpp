#include "minikv/protocol.hpp"

#include <algorithm>
#include <cctype>
#include <type_traits>

namespace minikv {


Command Protocol::parse(const Frame& frame) {
    const auto* array = frame.get_if<Frame::Array>();
    if (!array)
        throw CommandError{CommandError::Kind::NotArray, "command must be an array frame"};

    const auto& parts = array->items;
    if (parts.empty())
        throw CommandError{CommandError::Kind::Arity, "empty command"};

    const std::string* name = parts[0].as_text();
    if (!name)
        throw CommandError{CommandError::Kind::WrongType, "command name must be a string"};

    std::string cmd{*name};
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    if (cmd == "get") {
        if (parts.size() != 2)
            throw CommandError{CommandError::Kind::Arity, "GET requires exactly one argument"};

        return Get{ text_argument(parts[1], "GET", "key") };
    }

    if (cmd == "set") {
        if (parts.size() != 3)
            throw CommandError{CommandError::Kind::Arity, "SET requires exactly two arguments"};

        return Set{
            text_argument(parts[1], "SET", "key"),
            text_argument(parts[2], "SET", "value")
        };
    }

    return Unknown{ *name };
}

const std::string& Protocol::text_argument(const Frame& element, std::string_view command, std::string_view what) {
    const std::string* text = element.as_text();
    if (!text) {
        throw CommandError{CommandError::Kind::WrongType,
            std::string{command} + " " + std::string{what} + " must be a string"};
    }
    return *text;
}

Frame Protocol::to_frame(const Command& command) {
    return std::visit([](const auto& cmd) -> Frame {
        using T = std::decay_t<decltype(cmd)>;

        if constexpr (std::is_same_v<T, Get>) {
            return Frame::array({ Frame::bulk("GET"), Frame::bulk(cmd.key) });

        } else if constexpr (std::is_same_v<T, Set>) {
            return Frame::array({ Frame::bulk("SET"), Frame::bulk(cmd.key), Frame::bulk(cmd.value) });

        } else if constexpr (std::is_same_v<T, Unknown>) {
            return Frame::array({ Frame::bulk(cmd.name) });
        }
    }, command);
}

Frame Protocol::format_ok() {
    return Frame::simple("OK");
}

Frame Protocol::format_error(std::string_view message) {
    // Error lines cannot carry line breaks, whatever the message holds
    std::string text = "ERR " + std::string{message};
    std::replace_if(text.begin(), text.end(), [](char c) {
        return c == '\r' || c == '\n';
    }, ' ');
    return Frame::error(std::move(text));
}

Frame Protocol::format_value(std::string_view value) {
    return Frame::bulk(std::string{value});
}

Frame Protocol::format_null() {
    return Frame::null();
}

} // namespace minikv
