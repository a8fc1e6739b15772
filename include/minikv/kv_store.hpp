#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>


namespace minikv {

/*
 * Storage capability shared by every connection.
 * Callers only see get/set, so the locking discipline lives behind it.
 */
class Store {
public:
    virtual ~Store() = default;

    // Inserts or overwrites
    virtual void set(const std::string& key, const std::string& value) = 0;

    // Never mutates
    virtual std::optional<std::string> get(const std::string& key) const = 0;
};

/*
 * Thread-safe in-memory key-value store.
 * One mutex guards the whole map; every operation holds it exclusively.
 */
class KvStore : public Store {
public:
    void set(const std::string& key, const std::string& value) override;
    std::optional<std::string> get(const std::string& key) const override;

private:
    std::unordered_map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

} // namespace minikv
