#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

enum class EventType {
    ConfigChanged,
    RunNow
};

struct Event {
    EventType type;
};

std::string eventTypeToString(EventType type);

// Bounded queue from event producers (UI, signal bridge) to the scheduler.
// Sending never blocks: a full or closed channel drops the event, and a
// ConfigChanged that is already pending absorbs later ones.
class EventChannel {
public:
    enum class ReceiveStatus {
        Received,
        Timeout,
        Closed
    };

    using Clock = std::chrono::steady_clock;

    explicit EventChannel(size_t capacity = 8);

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    // Returns false when the event was dropped
    bool trySend(const Event& event);

    // Waits for the next event until deadline (forever when empty).
    // Once closed, returns Closed immediately, even with events pending.
    ReceiveStatus receive(Event& event, std::optional<Clock::time_point> deadline = std::nullopt);

    void close();
    bool isClosed() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t droppedCount() const;

private:
    const size_t capacity_;
    std::deque<Event> queue_;
    bool closed_{false};
    size_t dropped_{0};
    mutable std::mutex mutex_;
    std::condition_variable condition_;
};
