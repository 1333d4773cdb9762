#include "common/event_channel.hpp"
#include <algorithm>

std::string eventTypeToString(EventType type) {
    switch (type) {
        case EventType::ConfigChanged: return "config-changed";
        case EventType::RunNow:        return "run-now";
        default:                       return "unknown";
    }
}

EventChannel::EventChannel(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

bool EventChannel::trySend(const Event& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            ++dropped_;
            return false;
        }

        if (event.type == EventType::ConfigChanged) {
            bool pending = std::any_of(queue_.begin(), queue_.end(), [](const Event& queued) {
                return queued.type == EventType::ConfigChanged;
            });
            if (pending) {
                return true;
            }
        }

        if (queue_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        queue_.push_back(event);
    }
    condition_.notify_one();
    return true;
}

EventChannel::ReceiveStatus EventChannel::receive(Event& event, std::optional<Clock::time_point> deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this] { return closed_ || !queue_.empty(); };

    if (deadline) {
        if (!condition_.wait_until(lock, *deadline, ready)) {
            return ReceiveStatus::Timeout;
        }
    } else {
        condition_.wait(lock, ready);
    }

    if (closed_) {
        return ReceiveStatus::Closed;
    }

    event = queue_.front();
    queue_.pop_front();
    return ReceiveStatus::Received;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    condition_.notify_all();
}

bool EventChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t EventChannel::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
