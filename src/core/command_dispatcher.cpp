#include "minikv/command_dispatcher.hpp"

#include <type_traits>

namespace minikv {

Frame CommandDispatcher::execute(const Command& command, Store& store) {
    return std::visit([&](const auto& cmd) -> Frame {
        using T = std::decay_t<decltype(cmd)>;

        if constexpr (std::is_same_v<T, Get>) {
            auto value = store.get(cmd.key);
            return value ?
                Protocol::format_value(*value) :
                Protocol::format_null();

        } else if constexpr (std::is_same_v<T, Set>) {
            store.set(cmd.key, cmd.value);
            return Protocol::format_ok();

        } else if constexpr (std::is_same_v<T, Unknown>) {
            return Protocol::format_error("unknown command '" + cmd.name + "'");
        }
    }, command);
}

} // namespace minikv
