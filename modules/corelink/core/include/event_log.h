#pragma once

#include "logger.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

// One user-visible log line. Pure output; the link layer never reads it back.
struct LogEntry {
    uint64_t id = 0;
    std::chrono::system_clock::time_point time;
    std::string message;
    LogLevel severity = LogLevel::INFO;
};

// Append-only bounded ring of LogEntry. Past capacity the oldest entry is dropped.
// Every entry is also forwarded to the process log at the matching level.
class EventLog {
public:
    using EntryCallback = std::function<void(const LogEntry&)>;

    explicit EventLog(size_t capacity = 200);

    void set_entry_callback(EntryCallback callback);

    LogEntry append(const std::string& message, LogLevel severity);
    LogEntry info(const std::string& message) { return append(message, LogLevel::INFO); }
    LogEntry warn(const std::string& message) { return append(message, LogLevel::WARNING); }
    LogEntry error(const std::string& message) { return append(message, LogLevel::ERROR); }

    std::vector<LogEntry> entries() const;
    size_t size() const { return m_entries.size(); }
    size_t capacity() const { return m_capacity; }
    size_t count(LogLevel severity) const;

private:
    std::deque<LogEntry> m_entries;
    size_t m_capacity;
    uint64_t m_next_id = 1;
    EntryCallback m_callback;
};
