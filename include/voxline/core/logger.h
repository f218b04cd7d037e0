/**
 * @file logger.h
 * @brief voxline - Internal Logger
 *
 * Simple logging utilities that can be optionally connected to an external
 * logging system (e.g., the host application's log sink).
 *
 * Usage:
 *   VOXLINE_LOG_INFO("STT", "Transcribed %zu bytes", size);
 *   VOXLINE_LOG_ERROR("LLM", "Stream failed: %s", cause.c_str());
 */

#ifndef VOXLINE_CORE_LOGGER_H
#define VOXLINE_CORE_LOGGER_H

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace voxline {

// =============================================================================
// LOG LEVELS
// =============================================================================

enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warning = 3, Error = 4, Fatal = 5 };

/**
 * External log callback type.
 *
 * @param level Log level
 * @param category Log category (e.g., "Pipeline", "STT")
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

    LogLevel minLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    // Enable/disable stderr fallback
    void setStderrFallback(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        stderr_fallback_ = enabled;
    }

    void log(LogLevel level, const char* category, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 4, 5)))
#endif
        ;

    static const char* levelToString(LogLevel level);
    static bool parseLevel(const char* name, LogLevel* out_level);

   private:
    Logger() = default;

    void logToStream(LogLevel level, const char* category, const char* message);

    mutable std::mutex mutex_;
    LogCallback callback_ = nullptr;
    void* user_data_ = nullptr;
    LogLevel min_level_ = LogLevel::Info;
    bool stderr_fallback_ = true;
};

// =============================================================================
// CONVENIENCE MACROS
// =============================================================================

#define VOXLINE_LOG_TRACE(category, ...) \
    voxline::Logger::instance().log(voxline::LogLevel::Trace, category, __VA_ARGS__)

#define VOXLINE_LOG_DEBUG(category, ...) \
    voxline::Logger::instance().log(voxline::LogLevel::Debug, category, __VA_ARGS__)

#define VOXLINE_LOG_INFO(category, ...) \
    voxline::Logger::instance().log(voxline::LogLevel::Info, category, __VA_ARGS__)

#define VOXLINE_LOG_WARNING(category, ...) \
    voxline::Logger::instance().log(voxline::LogLevel::Warning, category, __VA_ARGS__)

#define VOXLINE_LOG_ERROR(category, ...) \
    voxline::Logger::instance().log(voxline::LogLevel::Error, category, __VA_ARGS__)

#define VOXLINE_LOG_FATAL(category, ...) \
    voxline::Logger::instance().log(voxline::LogLevel::Fatal, category, __VA_ARGS__)

}  // namespace voxline

#endif  // VOXLINE_CORE_LOGGER_H
