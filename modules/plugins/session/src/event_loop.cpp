#include "event_loop.h"
#include "logger.h"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace {
    // Upper bound on one poll() sleep so stop() is noticed even without a wake-up.
    constexpr int kMaxPollTimeoutMs = 500;
}

EventLoop::EventLoop() {
    // Create wake-up pipe for cross-thread signaling
    if (pipe(m_wakeup_pipe) < 0) {
        LOG_ERROR("EventLoop: Failed to create wake-up pipe");
        m_wakeup_pipe[0] = m_wakeup_pipe[1] = -1;
        return;
    }

    fcntl(m_wakeup_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(m_wakeup_pipe[1], F_SETFL, O_NONBLOCK);

    LOG_DEBUG("EventLoop: Initialized");
}

EventLoop::~EventLoop() {
    stop();

    if (m_wakeup_pipe[0] >= 0) close(m_wakeup_pipe[0]);
    if (m_wakeup_pipe[1] >= 0) close(m_wakeup_pipe[1]);

    LOG_DEBUG("EventLoop: Destroyed");
}

void EventLoop::setHandler(EventHandler handler) {
    m_event_handler = std::move(handler);
}

void EventLoop::run() {
    if (m_running.exchange(true, std::memory_order_acq_rel)) {
        LOG_WARN("EventLoop: Already running");
        return;
    }
    LOG_INFO("EventLoop: Entering main loop");

    while (!m_stopping.load(std::memory_order_acquire)) {
        const int timeout_ms = calculateNextTimeout();

        if (m_wakeup_pipe[0] >= 0) {
            struct pollfd pfd{m_wakeup_pipe[0], POLLIN, 0};
            const int nfds = poll(&pfd, 1, timeout_ms);
            if (nfds < 0 && errno != EINTR) {
                LOG_WARN("EventLoop: poll error " + std::to_string(errno));
            }
            if (nfds > 0) {
                drainWakeupPipe();
            }
        }

        processPendingEvents();
        processTimers();
    }

    m_stopping.store(false, std::memory_order_release);
    m_running.store(false, std::memory_order_release);
    LOG_INFO("EventLoop: Exited main loop");
}

void EventLoop::stop() {
    // Latched even when run() has not started yet, so a stop issued right
    // after spawning the loop thread is not lost.
    m_stopping.store(true, std::memory_order_release);
    if (!m_running.load(std::memory_order_acquire)) {
        return;
    }

    LOG_INFO("EventLoop: Stopping");

    // Wake up the loop to exit
    wakeup();
}

void EventLoop::pushEvent(LinkEvent event) {
    {
        std::lock_guard<std::mutex> lock(m_event_mutex);
        m_event_queue.push(std::move(event));
    }

    wakeup();
}

size_t EventLoop::pendingEventCount() const {
    std::lock_guard<std::mutex> lock(m_event_mutex);
    return m_event_queue.size();
}

void EventLoop::addScheduledEvent(const std::string& id, LinkEvent event, Clock::time_point due_time) {
    {
        std::lock_guard<std::mutex> lock(m_scheduled_mutex);

        // Remove existing event with same ID
        m_scheduled_events.erase(
            std::remove_if(m_scheduled_events.begin(), m_scheduled_events.end(),
                           [&id](const ScheduledEvent& e) { return e.id == id; }),
            m_scheduled_events.end()
        );

        // Keep sorted by due time; equal due times stay in insertion order.
        auto pos = std::upper_bound(m_scheduled_events.begin(), m_scheduled_events.end(), due_time,
                                    [](Clock::time_point t, const ScheduledEvent& e) { return t < e.due_time; });
        m_scheduled_events.insert(pos, ScheduledEvent{id, std::move(event), due_time});
    }

    LOG_DEBUG("EventLoop: Scheduled event added, id=" + id);
    wakeup();
}

void EventLoop::removeScheduledEvent(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    m_scheduled_events.erase(
        std::remove_if(m_scheduled_events.begin(), m_scheduled_events.end(),
                       [&id](const ScheduledEvent& e) { return e.id == id; }),
        m_scheduled_events.end()
    );
}

void EventLoop::clearScheduledEvents() {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    m_scheduled_events.clear();
}

bool EventLoop::hasScheduledEvent(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    return std::any_of(m_scheduled_events.begin(), m_scheduled_events.end(),
                       [&id](const ScheduledEvent& e) { return e.id == id; });
}

size_t EventLoop::scheduledEventCount() const {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    return m_scheduled_events.size();
}

std::optional<EventLoop::Clock::time_point> EventLoop::nextDueTime() const {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    if (m_scheduled_events.empty()) {
        return std::nullopt;
    }
    return m_scheduled_events.front().due_time;
}

size_t EventLoop::processPendingEvents() {
    std::queue<LinkEvent> events_to_process;
    {
        std::lock_guard<std::mutex> lock(m_event_mutex);
        std::swap(events_to_process, m_event_queue);
    }

    size_t handled = 0;
    while (!events_to_process.empty()) {
        if (m_event_handler) {
            m_event_handler(std::move(events_to_process.front()));
            handled++;
        }
        events_to_process.pop();
    }
    return handled;
}

size_t EventLoop::processTimers(Clock::time_point now) {
    size_t handled = 0;

    // Never call the handler while holding m_scheduled_mutex:
    // handlers schedule and cancel timers themselves.
    while (true) {
        std::optional<LinkEvent> due;
        Clock::time_point due_time;
        {
            std::lock_guard<std::mutex> lock(m_scheduled_mutex);
            if (m_scheduled_events.empty() || m_scheduled_events.front().due_time > now) {
                break;
            }
            due.emplace(std::move(m_scheduled_events.front().event));
            due_time = m_scheduled_events.front().due_time;
            m_scheduled_events.erase(m_scheduled_events.begin());
        }
        if (m_event_handler) {
            m_in_timer = true;
            m_timer_time = due_time;
            m_event_handler(std::move(*due));
            m_in_timer = false;
            handled++;
        }
    }
    return handled;
}

EventLoop::Clock::time_point EventLoop::now() const {
    return m_in_timer ? m_timer_time : Clock::now();
}

size_t EventLoop::runUntilIdle(Clock::time_point now) {
    size_t total = 0;
    while (true) {
        const size_t handled = processPendingEvents() + processTimers(now);
        if (handled == 0) {
            break;
        }
        total += handled;
    }
    return total;
}

void EventLoop::wakeup() {
    if (m_wakeup_pipe[1] < 0) {
        return;
    }
    char c = 1;
    ssize_t n = write(m_wakeup_pipe[1], &c, 1);
    (void)n; // Pipe full means a wake-up is already pending
}

void EventLoop::drainWakeupPipe() {
    char buf[256];
    while (read(m_wakeup_pipe[0], buf, sizeof(buf)) > 0) {}
}

int EventLoop::calculateNextTimeout() const {
    if (pendingEventCount() > 0) {
        return 0;
    }

    int timeout = kMaxPollTimeoutMs;
    const auto next_due = nextDueTime();
    if (next_due) {
        const auto ms_until = std::chrono::duration_cast<std::chrono::milliseconds>(
            *next_due - Clock::now()).count();
        if (ms_until <= 0) {
            timeout = 0;  // Process immediately
        } else if (ms_until < timeout) {
            timeout = static_cast<int>(ms_until);
        }
    }
    return timeout;
}
