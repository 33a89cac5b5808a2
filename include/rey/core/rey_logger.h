/**
 * @file rey_logger.h
 * @brief Rey Voice Server - Logger
 *
 * Process-wide logger with category tags. Routes to an external callback when
 * one is installed, otherwise prints to stdout/stderr with a timestamp.
 *
 * Usage:
 *   REY_LOG_INFO("Session", "Client connected: %s", id.c_str());
 *   REY_LOG_ERROR("Backend", "Request failed: %s", error.c_str());
 */

#ifndef REY_CORE_LOGGER_H
#define REY_CORE_LOGGER_H

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace rey {

// =============================================================================
// LOG LEVELS
// =============================================================================

enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warning = 3, Error = 4, Fatal = 5 };

/**
 * Parse a level name ("trace", "debug", "info", "warn"/"warning", "error", "fatal").
 * Returns false and leaves @p out untouched for unknown names.
 */
bool parse_log_level(const std::string& name, LogLevel& out);

// =============================================================================
// LOG CALLBACK TYPE
// =============================================================================

/**
 * External log callback type.
 *
 * @param level Log level
 * @param category Log category (e.g., "Session")
 * @param message Formatted message
 * @param user_data Optional user context
 */
using LogCallback = void (*)(LogLevel level, const char* category, const char* message,
                             void* user_data);

// =============================================================================
// LOGGER CLASS
// =============================================================================

class Logger {
   public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    // Set external callback for routing logs
    void setCallback(LogCallback callback, void* user_data = nullptr) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = callback;
        user_data_ = user_data;
    }

    void setMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel minLevel() {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    // Enable/disable stdout/stderr fallback
    void setStderrFallback(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        stderr_fallback_ = enabled;
    }

    // Core log function
    void log(LogLevel level, const char* category, const char* format, ...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }
        }

        char buffer[2048];
        va_list args;
        va_start(args, format);
        vsnprintf(buffer, sizeof(buffer), format, args);
        va_end(args);

        std::lock_guard<std::mutex> lock(mutex_);
        if (callback_) {
            callback_(level, category, buffer, user_data_);
        } else if (stderr_fallback_) {
            logToStderr(level, category, buffer);
        }
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:
                return "TRACE";
            case LogLevel::Debug:
                return "DEBUG";
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Warning:
                return "WARN";
            case LogLevel::Error:
                return "ERROR";
            case LogLevel::Fatal:
                return "FATAL";
            default:
                return "???";
        }
    }

   private:
    Logger() = default;

    void logToStderr(LogLevel level, const char* category, const char* message) {
        char stamp[32];
        std::time_t now = std::time(nullptr);
        std::tm local_tm{};
        localtime_r(&now, &local_tm);
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local_tm);

        FILE* stream = (level >= LogLevel::Error) ? stderr : stdout;
        fprintf(stream, "%s %s [%s] %s\n", stamp, levelToString(level), category, message);
        fflush(stream);
    }

    std::mutex mutex_;
    LogCallback callback_ = nullptr;
    void* user_data_ = nullptr;
    LogLevel min_level_ = LogLevel::Info;
    bool stderr_fallback_ = true;
};

// =============================================================================
// CONVENIENCE MACROS
// =============================================================================

#define REY_LOG_TRACE(category, ...) \
    rey::Logger::instance().log(rey::LogLevel::Trace, category, __VA_ARGS__)

#define REY_LOG_DEBUG(category, ...) \
    rey::Logger::instance().log(rey::LogLevel::Debug, category, __VA_ARGS__)

#define REY_LOG_INFO(category, ...) \
    rey::Logger::instance().log(rey::LogLevel::Info, category, __VA_ARGS__)

#define REY_LOG_WARNING(category, ...) \
    rey::Logger::instance().log(rey::LogLevel::Warning, category, __VA_ARGS__)

#define REY_LOG_ERROR(category, ...) \
    rey::Logger::instance().log(rey::LogLevel::Error, category, __VA_ARGS__)

#define REY_LOG_FATAL(category, ...) \
    rey::Logger::instance().log(rey::LogLevel::Fatal, category, __VA_ARGS__)

}  // namespace rey

#endif  // REY_CORE_LOGGER_H
