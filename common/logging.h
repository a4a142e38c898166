#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <utility>

#include "macros.h"

namespace Common {

void logMessageToGlobal(uint16_t level, const char* msg, size_t len) noexcept;

/// Front end of the async logger. Formatting happens on the calling thread
/// into a stack buffer; the record is then queued for the writer thread.
class Logger {
public:
    enum Level : uint16_t {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3,
        FATAL = 4
    };

    struct Stats {
        uint64_t messages_written = 0;
        uint64_t messages_dropped = 0;
        uint64_t bytes_written = 0;
    };

    static constexpr size_t MAX_MSG_SIZE = 240;

    explicit Logger(Level min_level = INFO) noexcept : min_level_(min_level) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    void log(Level level, const char* format, Args&&... args) noexcept {
        if (level < min_level_.load(std::memory_order_relaxed)) {
            return;
        }
        char buffer[MAX_MSG_SIZE];
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
        int len = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
#pragma GCC diagnostic pop
        if (len <= 0) {
            return;
        }
        // Truncated messages are kept, not dropped
        const size_t n = static_cast<size_t>(len) < sizeof(buffer) ? static_cast<size_t>(len)
                                                                   : sizeof(buffer) - 1;
        logMessageToGlobal(level, buffer, n);
    }

    void setMinLevel(Level level) noexcept {
        min_level_.store(level, std::memory_order_relaxed);
    }

    [[nodiscard]] Level minLevel() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] Stats getStats() const noexcept;

    static const char* levelToString(Level level) noexcept;

    /// Accepts DEBUG, INFO, WARN, ERROR, FATAL (any case)
    [[nodiscard]] static bool parseLevel(const char* name, Level* out) noexcept;

private:
    std::atomic<Level> min_level_;
};

// Global logger instance, null until initLogging()
extern Logger* g_logger;

// Opens (truncates) log_file and starts the writer thread.
// Parent directories are created. Re-initializing replaces the previous logger.
void initLogging(const char* log_file, Logger::Level min_level = Logger::INFO);

// Drains pending records, flushes and closes the file
void shutdownLogging();

} // namespace Common

#define LOG_DEBUG(...) do { if (::Common::g_logger) ::Common::g_logger->log(::Common::Logger::DEBUG, __VA_ARGS__); } while (0)
#define LOG_INFO(...)  do { if (::Common::g_logger) ::Common::g_logger->log(::Common::Logger::INFO, __VA_ARGS__); } while (0)
#define LOG_WARN(...)  do { if (::Common::g_logger) ::Common::g_logger->log(::Common::Logger::WARN, __VA_ARGS__); } while (0)
#define LOG_ERROR(...) do { if (::Common::g_logger) ::Common::g_logger->log(::Common::Logger::ERROR, __VA_ARGS__); } while (0)
#define LOG_FATAL(...) do { if (::Common::g_logger) ::Common::g_logger->log(::Common::Logger::FATAL, __VA_ARGS__); } while (0)
