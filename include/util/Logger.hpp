#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>

// Log levels
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

// Extract filename from full path (for concise logging)
#define FILENAME (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

// Logging macros that automatically capture file and line information
#define LOG_DEBUG(...) Logger::log(LogLevel::DEBUG, FILENAME, __LINE__, __VA_ARGS__)
#define LOG_INFO(...)  Logger::log(LogLevel::INFO,  FILENAME, __LINE__, __VA_ARGS__)
#define LOG_WARN(...)  Logger::log(LogLevel::WARN,  FILENAME, __LINE__, __VA_ARGS__)
#define LOG_ERROR(...) Logger::log(LogLevel::ERROR, FILENAME, __LINE__, __VA_ARGS__)

// Static logger that formats lines and hands them to a pluggable sink.
//
// Usage on the target:
//   util::attachSerialLogging(115200);      // Serial sink + millis() clock
//   Logger::setLogLevel(LogLevel::DEBUG);
//
//   LOG_INFO("INA260 found at 0x%02X", addr);
//   LOG_ERROR("read failed: %s", app::toString(err));
//
// With no sink attached every LOG_* call is a no-op.
class Logger {
public:
    using Sink = std::function<void(LogLevel, const char*)>;
    using Clock = std::function<uint32_t()>;

    // Set the destination for formatted lines (nullptr disables output)
    static void setSink(Sink sink) {
        sink_ = std::move(sink);
    }

    // Set the timestamp source (milliseconds); defaults to 0 when unset
    static void setClock(Clock clock) {
        clock_ = std::move(clock);
    }

    // Set minimum log level (messages below this level are dropped)
    static void setLogLevel(LogLevel level) {
        minLogLevel_ = level;
    }

    static LogLevel getLogLevel() {
        return minLogLevel_;
    }

    // Main logging method with file and line information
    template<typename... Args>
    static void log(LogLevel level, const char* file, int line, const char* format, Args... args) {
        if (level < minLogLevel_ || !sink_) return;

        char message[256];
        snprintf(message, sizeof(message), format, args...);

        // [timestamp][LEVEL][file:line] message
        char formatted[384];
        uint32_t timestamp = clock_ ? clock_() : 0;
        snprintf(formatted, sizeof(formatted), "[%u][%s][%s:%d] %s",
                 static_cast<unsigned>(timestamp), getLevelString(level), file, line, message);

        sink_(level, formatted);
    }

    static const char* getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO";
            case LogLevel::WARN:  return "WARN";
            case LogLevel::ERROR: return "ERROR";
            default:              return "UNKNOWN";
        }
    }

private:
    static inline LogLevel minLogLevel_ = LogLevel::INFO;
    static inline Sink sink_ = nullptr;
    static inline Clock clock_ = nullptr;
};
