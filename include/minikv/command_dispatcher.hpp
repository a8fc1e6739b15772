#pragma once

#include "minikv/frame.hpp"
#include "minikv/kv_store.hpp"
#include "minikv/protocol.hpp"

namespace minikv {

class CommandDispatcher {
public:
    // Applies a command to the store and returns the reply frame
    static Frame execute(const Command& command, Store& store);
};

} // namespace minikv
