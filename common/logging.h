#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <utility>

#include "common/macros.h"

namespace Common {

/// Front end of the asynchronous file logger.
///
/// Messages are formatted on the caller's stack and handed to a background
/// writer thread through a bounded lock-free queue. A full queue drops the
/// message and bumps a counter; logging never blocks the caller.
class Logger {
public:
    enum Level : uint16_t {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3,
        FATAL = 4
    };

    static constexpr size_t MAX_MSG_SIZE = 240;

    struct Stats {
        uint64_t messages_written = 0;
        uint64_t messages_dropped = 0;
        uint64_t bytes_written = 0;
    };

    template<typename... Args>
    static void log(Level level, const char* format, Args&&... args) noexcept {
        if (level < minLevel()) return;

        char buffer[MAX_MSG_SIZE];
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
        int len = snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
#pragma GCC diagnostic pop
        if (len <= 0) return;
        // Truncated messages are still worth keeping
        size_t n = static_cast<size_t>(len);
        if (n >= sizeof(buffer)) n = sizeof(buffer) - 1;
        enqueue(level, buffer, n);
    }

    static Level minLevel() noexcept;
    static void setMinLevel(Level level) noexcept;

    /// Map "DEBUG", "INFO", "WARN", "ERROR", "FATAL" to a level; INFO otherwise.
    static Level parseLevel(const char* name) noexcept;

    static Stats getStats() noexcept;

private:
    static void enqueue(Level level, const char* msg, size_t len) noexcept;
};

// Start the background writer. A second call replaces the previous logger.
void initLogging(const char* log_file);

// Drain pending messages and stop the writer thread.
void shutdownLogging();

bool isLoggingActive() noexcept;

} // namespace Common

#define LOG_DEBUG(...) ::Common::Logger::log(::Common::Logger::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  ::Common::Logger::log(::Common::Logger::INFO, __VA_ARGS__)
#define LOG_WARN(...)  ::Common::Logger::log(::Common::Logger::WARN, __VA_ARGS__)
#define LOG_ERROR(...) ::Common::Logger::log(::Common::Logger::ERROR, __VA_ARGS__)
