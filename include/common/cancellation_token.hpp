#pragma once

#include <atomic>

// Cooperative cancellation flag shared by a run and the tasks it spawns.
// Holders check it at their own checkpoints; nothing is interrupted forcibly.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};
