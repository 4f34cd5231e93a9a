#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <functional>

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Important events
    WARNING = 2,   // Problems only
    ERROR = 3,     // Errors only
    NONE = 4,      // Disable all logging
};

// Prefix every log line with the local peer id
void setSessionId(const std::string& session_id);
void nativeLog(const std::string& message);

// Set a callback for log messages (the desktop CLI routes them into its own pane).
// Passing nullptr restores stderr output.
void setLogCallback(std::function<void(const std::string&)> callback);

// Default: INFO (skips debug messages)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Accepts debug|info|warn|warning|error|none (case-insensitive); unknown values map to `fallback`.
LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::INFO);
const char* log_level_to_string(LogLevel level);

// Logging macros for conditional compilation
#define LOG_DEBUG(msg) if (get_log_level() <= LogLevel::DEBUG) nativeLog(msg)
#define LOG_INFO(msg)  if (get_log_level() <= LogLevel::INFO) nativeLog(msg)
#define LOG_WARN(msg)  if (get_log_level() <= LogLevel::WARNING) nativeLog(msg)
#define LOG_ERROR(msg) if (get_log_level() <= LogLevel::ERROR) nativeLog(msg)

#endif // LOGGER_H
