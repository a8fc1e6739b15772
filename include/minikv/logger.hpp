#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace minikv {

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3
};

constexpr std::string_view log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

/*
 * Process-wide leveled logger writing one line per message to stderr:
 *   [12:04:31] [INFO] Listening on 127.0.0.1:6379
 * Use the MINIKV_LOG_* macros, which skip formatting below the threshold.
 */
class Logger {
public:
    static void set_level(LogLevel level) noexcept {
        level_.store(level, std::memory_order_relaxed);
    }

    static LogLevel level() noexcept {
        return level_.load(std::memory_order_relaxed);
    }

    static bool enabled(LogLevel level) noexcept {
        return level >= Logger::level();
    }

    static void write(LogLevel level, const std::string& message) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);

        char stamp[16];
        std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm);

        static std::mutex mtx;
        std::lock_guard lock(mtx);
        std::cerr << '[' << stamp << "] [" << log_level_name(level) << "] " << message << '\n';
    }

private:
    static inline std::atomic<LogLevel> level_{LogLevel::Info};
};

} // namespace minikv

#define MINIKV_LOG(level, expr)                                  \
    do {                                                         \
        if (::minikv::Logger::enabled(level)) {                  \
            std::ostringstream minikv_log_stream_;               \
            minikv_log_stream_ << expr;                          \
            ::minikv::Logger::write(level, minikv_log_stream_.str()); \
        }                                                        \
    } while (0)

#define MINIKV_LOG_DEBUG(expr) MINIKV_LOG(::minikv::LogLevel::Debug, expr)
#define MINIKV_LOG_INFO(expr)  MINIKV_LOG(::minikv::LogLevel::Info, expr)
#define MINIKV_LOG_WARN(expr)  MINIKV_LOG(::minikv::LogLevel::Warn, expr)
#define MINIKV_LOG_ERROR(expr) MINIKV_LOG(::minikv::LogLevel::Error, expr)
