#ifndef EVENT_LOOP_H
#define EVENT_LOOP_H

#include "link_events.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

/**
 * @brief EventLoop - Single-threaded dispatch loop for one link endpoint
 *
 * Every state change of the session happens inside the handler this loop
 * invokes. Other threads (transports, media devices, the terminal) only push
 * events; the loop drains them in FIFO order.
 *
 * Architecture:
 * - Mutex-protected event queue, drained by processPendingEvents()
 * - Scheduled events keyed by id and sorted by due time (timers)
 * - Wake-up pipe + poll() so run() sleeps until work arrives or a timer is due
 * - processTimers()/runUntilIdle() take an explicit `now` so tests can advance time
 */
class EventLoop {
public:
    using Clock = std::chrono::steady_clock;
    using EventHandler = std::function<void(LinkEvent)>;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void setHandler(EventHandler handler);

    // Lifecycle: run() blocks the calling thread until stop().
    void run();
    void stop();
    bool isRunning() const { return m_running.load(std::memory_order_acquire); }

    // Event queue (thread-safe)
    void pushEvent(LinkEvent event);
    size_t pendingEventCount() const;

    // Timer management (thread-safe). Re-using an id replaces the earlier event.
    void addScheduledEvent(const std::string& id, LinkEvent event, Clock::time_point due_time);
    void removeScheduledEvent(const std::string& id);
    void clearScheduledEvents();
    bool hasScheduledEvent(const std::string& id) const;
    size_t scheduledEventCount() const;
    std::optional<Clock::time_point> nextDueTime() const;

    // Manual pumping (used by run() and by tests). Each returns the number of events handled.
    size_t processPendingEvents();
    size_t processTimers(Clock::time_point now = Clock::now());
    size_t runUntilIdle(Clock::time_point now = Clock::now());

    // Wake up the event loop (e.g., when new events are pushed)
    void wakeup();

    // Due time of the timer being dispatched, otherwise the clock. Handlers
    // schedule follow-up timers relative to this so manual time stays consistent.
    Clock::time_point now() const;

private:
    int calculateNextTimeout() const;
    void drainWakeupPipe();

    struct ScheduledEvent {
        std::string id;
        LinkEvent event;
        Clock::time_point due_time;
    };

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopping{false};

    // Wake-up pipe for cross-thread signaling
    int m_wakeup_pipe[2]{-1, -1};

    std::queue<LinkEvent> m_event_queue;
    mutable std::mutex m_event_mutex;

    // Scheduled events (sorted by due time)
    std::vector<ScheduledEvent> m_scheduled_events;
    mutable std::mutex m_scheduled_mutex;

    EventHandler m_event_handler;

    // Loop thread only
    bool m_in_timer = false;
    Clock::time_point m_timer_time{};
};

#endif // EVENT_LOOP_H
