#include "logger.h"
#include <mutex>
#include <string>
#include <iostream>
#include <cctype>

/**
 * @brief The session ID for logging.
 */
static std::string g_sessionId = "NO_PEER";

/**
 * @brief Mutex for protecting the logger.
 */
static std::mutex g_logMutex;

/**
 * @brief Global log level (for conditional logging)
 * Default: INFO (skips DEBUG messages)
 */
static LogLevel g_log_level = LogLevel::INFO;

/**
 * @brief Optional sink replacing stderr output.
 */
static std::function<void(const std::string&)> g_log_callback;

/**
 * @brief Sets the session ID for logging.
 * @param session_id The session ID to set.
 */
void setSessionId(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sessionId = session_id;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_callback = std::move(callback);
}

/**
 * @brief Sets the global log level (for conditional logging)
 * @param level The log level to set.
 */
void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_level = level;
}

/**
 * @brief Gets the current global log level
 * @return The current log level.
 */
LogLevel get_log_level() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_log_level;
}

LogLevel parse_log_level(const std::string& value, LogLevel fallback) {
    std::string v = value;
    for (auto& c : v) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "none") return LogLevel::NONE;
    return fallback;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::NONE: return "NONE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Logs a message to the native log.
 * @param message The message to log.
 */
void nativeLog(const std::string& message) {
    std::function<void(const std::string&)> callback;
    std::string log_message;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        log_message = "[" + g_sessionId + "] " + message;
        callback = g_log_callback;
    }

    // Invoke the sink without holding the lock so it may log or query the level itself.
    if (callback) {
        callback(log_message);
        return;
    }

    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cerr << log_message << std::endl;
}
