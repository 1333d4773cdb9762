#pragma once

#include "common/cancellation_token.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

// Counting limiter: at most `slots` holders at any instant.
class AdmissionGate {
public:
    explicit AdmissionGate(size_t slots);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // Blocks until a slot is free. Returns false without taking a slot
    // if the token is (or becomes) cancelled while waiting.
    bool acquire(const CancellationToken& token);
    void release();

    size_t capacity() const { return capacity_; }
    size_t available() const;

    // Holds one slot for its lifetime
    class Slot {
    public:
        Slot(AdmissionGate& gate, const CancellationToken& token)
            : gate_(gate), held_(gate.acquire(token)) {}
        ~Slot() {
            if (held_) {
                gate_.release();
            }
        }

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        bool held() const { return held_; }

    private:
        AdmissionGate& gate_;
        bool held_;
    };

private:
    // Waiters recheck the token at this period
    static constexpr std::chrono::milliseconds kCancelPollInterval{50};

    const size_t capacity_;
    size_t available_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
};
