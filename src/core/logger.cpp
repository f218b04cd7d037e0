/**
 * @file logger.cpp
 * @brief voxline - Logger implementation
 */

#include "voxline/core/logger.h"

#include <cstring>
#include <strings.h>

namespace voxline {

void Logger::log(LogLevel level, const char* category, const char* format, ...) {
    LogCallback callback = nullptr;
    void* user_data = nullptr;
    bool fallback = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(level) < static_cast<int>(min_level_)) {
            return;
        }
        callback = callback_;
        user_data = user_data_;
        fallback = stderr_fallback_;
    }

    char buffer[2048];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    const char* cat = category ? category : "voxline";
    if (callback) {
        callback(level, cat, buffer, user_data);
    } else if (fallback) {
        logToStream(level, cat, buffer);
    }
}

void Logger::logToStream(LogLevel level, const char* category, const char* message) {
    // Serialize writes so lines from different session workers do not interleave
    std::lock_guard<std::mutex> lock(mutex_);
    FILE* stream = (level >= LogLevel::Warning) ? stderr : stdout;
    fprintf(stream, "[%s][%s] %s\n", levelToString(level), category, message);
    fflush(stream);
}

const char* Logger::levelToString(LogLevel level) {
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

bool Logger::parseLevel(const char* name, LogLevel* out_level) {
    if (!name || !out_level) {
        return false;
    }
    static const struct {
        const char* name;
        LogLevel level;
    } kLevels[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},   {"info", LogLevel::Info},
        {"warn", LogLevel::Warning}, {"warning", LogLevel::Warning}, {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal},
    };
    for (const auto& entry : kLevels) {
        if (strcasecmp(name, entry.name) == 0) {
            *out_level = entry.level;
            return true;
        }
    }
    return false;
}

}  // namespace voxline
