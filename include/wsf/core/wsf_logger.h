/**
 * @file wsf_logger.h
 * @brief whisper-safe - Internal Logger
 *
 * Simple logging utilities that can be optionally connected to an external
 * logging system. whisper.cpp's own log output is routed here once
 * install_native_log_hook() has been called.
 *
 * Usage:
 *   WSF_LOG_INFO("STT.Context", "Model loaded: %s", path);
 *   WSF_LOG_WARNING("FFI.Callback", "Skipping segment %d", index);
 */

#ifndef WSF_LOGGER_H
#define WSF_LOGGER_H

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace whispersafe {

// =============================================================================
// LOG LEVELS
// =============================================================================

enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warning = 3, Error = 4, Fatal = 5 };

// =============================================================================
// LOG CALLBACK TYPE
// =============================================================================

/**
 * External log callback type.
 *
 * @param level Log level
 * @param category Log category (e.g., "FFI.Guard")
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

    // Accepts trace|debug|info|warning|error|fatal; returns false and keeps
    // the current level for anything else
    bool setMinLevelFromString(const char* name) {
        if (!name) return false;
        static const struct {
            const char* name;
            LogLevel level;
        } kLevels[] = {{"trace", LogLevel::Trace},     {"debug", LogLevel::Debug},
                       {"info", LogLevel::Info},       {"warning", LogLevel::Warning},
                       {"error", LogLevel::Error},     {"fatal", LogLevel::Fatal}};
        for (const auto& entry : kLevels) {
            if (strcmp(entry.name, name) == 0) {
                setMinLevel(entry.level);
                return true;
            }
        }
        return false;
    }

    // Enable/disable stderr fallback
    void setStderrFallback(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        stderr_fallback_ = enabled;
    }

    // Core log function
    void log(LogLevel level, const char* category, const char* format, ...) {
        va_list args;
        va_start(args, format);
        vlog(level, category, format, args);
        va_end(args);
    }

    void vlog(LogLevel level, const char* category, const char* format, va_list args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(level) < static_cast<int>(min_level_)) {
            return;
        }

        char buffer[2048];
        vsnprintf(buffer, sizeof(buffer), format, args);

        if (callback_) {
            callback_(level, category, buffer, user_data_);
        } else if (stderr_fallback_) {
            logToStderr(level, category, buffer);
        }
    }

   private:
    Logger() = default;

    void logToStderr(LogLevel level, const char* category, const char* message) {
        const char* level_str = levelToString(level);
        FILE* stream = (level >= LogLevel::Error) ? stderr : stdout;
        fprintf(stream, "[%s][%s] %s\n", level_str, category, message);
        fflush(stream);
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

    std::mutex mutex_;
    LogCallback callback_ = nullptr;
    void* user_data_ = nullptr;
    LogLevel min_level_ = LogLevel::Info;
    bool stderr_fallback_ = true;
};

// =============================================================================
// CONVENIENCE MACROS
// =============================================================================

#define WSF_LOG_TRACE(category, ...) \
    whispersafe::Logger::instance().log(whispersafe::LogLevel::Trace, category, __VA_ARGS__)

#define WSF_LOG_DEBUG(category, ...) \
    whispersafe::Logger::instance().log(whispersafe::LogLevel::Debug, category, __VA_ARGS__)

#define WSF_LOG_INFO(category, ...) \
    whispersafe::Logger::instance().log(whispersafe::LogLevel::Info, category, __VA_ARGS__)

#define WSF_LOG_WARNING(category, ...) \
    whispersafe::Logger::instance().log(whispersafe::LogLevel::Warning, category, __VA_ARGS__)

#define WSF_LOG_ERROR(category, ...) \
    whispersafe::Logger::instance().log(whispersafe::LogLevel::Error, category, __VA_ARGS__)

}  // namespace whispersafe

#endif  // WSF_LOGGER_H
