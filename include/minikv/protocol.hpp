#pragma once

#include "minikv/frame.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace minikv {

/*
 * A frame that cannot be read as a command.
 * Recovered into an Error reply; never ends the session.
 */
class CommandError : public std::runtime_error {
public:
    enum class Kind {
        NotArray,  // command frame is not an Array
        Arity,     // wrong number of arguments
        WrongType  // an element is not Bulk/Simple text
    };

    CommandError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

struct Get {
    std::string key;
};

struct Set {
    std::string key;
    std::string value;
};

// Any operation name outside the supported set
struct Unknown {
    std::string name;
};

using Command = std::variant<Get, Set, Unknown>;

/*
 * Maps frames to commands and back, and builds the reply frames.
 */
class Protocol {
public:
    // Throws CommandError
    static Command parse(const Frame& frame);

    // Request frame for a command, as a client sends it
    static Frame to_frame(const Command& command);

    static Frame format_ok();
    static Frame format_error(std::string_view message);
    static Frame format_value(std::string_view value);
    static Frame format_null();

private:
    static const std::string& text_argument(const Frame& element, std::string_view command, std::string_view what);
};

} // namespace minikv
