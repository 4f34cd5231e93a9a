#include "event_log.h"
#include <algorithm>
#include <stdexcept>

EventLog::EventLog(size_t capacity) : m_capacity(capacity) {
    if (m_capacity == 0) {
        throw std::invalid_argument("EventLog capacity must be positive");
    }
}

void EventLog::set_entry_callback(EntryCallback callback) {
    m_callback = std::move(callback);
}

LogEntry EventLog::append(const std::string& message, LogLevel severity) {
    LogEntry entry;
    entry.id = m_next_id++;
    entry.time = std::chrono::system_clock::now();
    entry.message = message;
    entry.severity = severity;

    switch (severity) {
        case LogLevel::DEBUG: LOG_DEBUG(message); break;
        case LogLevel::INFO: LOG_INFO(message); break;
        case LogLevel::WARNING: LOG_WARN(message); break;
        case LogLevel::ERROR: LOG_ERROR(message); break;
        case LogLevel::NONE: break;
    }

    m_entries.push_back(entry);
    while (m_entries.size() > m_capacity) {
        m_entries.pop_front();
    }

    if (m_callback) {
        m_callback(entry);
    }
    return entry;
}

std::vector<LogEntry> EventLog::entries() const {
    return std::vector<LogEntry>(m_entries.begin(), m_entries.end());
}

size_t EventLog::count(LogLevel severity) const {
    return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(),
                                             [severity](const LogEntry& e) { return e.severity == severity; }));
}
