#include "minikv/kv_store.hpp"

namespace minikv {

void KvStore::set(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    data_[key] = value;
}

std::optional<std::string> KvStore::get(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = data_.find(key);
    return it != data_.end() ? std::make_optional(it->second) : std::nullopt;
}

} // namespace minikv
