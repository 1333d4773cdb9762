#pragma once

#include "backup/backup_config.hpp"
#include "common/cancellation_token.hpp"
#include "common/event_channel.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// "A run is in progress". Only the scheduler owns one; it changes only
// through compare-and-set so two runs can never start together.
class RunState {
public:
    bool tryBegin() {
        bool expected = false;
        return running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }
    void finish() { running_.store(false, std::memory_order_release); }
    bool isRunning() const { return running_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> running_{false};
};

enum class SchedulerState {
    Disabled,
    Idle,
    Running,
    Stopped
};

std::string schedulerStateToString(SchedulerState state);

// Decides when backup runs happen. A single control loop waits on the
// periodic tick, the event channel and shutdown, and hands each run to
// its own thread so the loop keeps serving events while a pass is active.
class BackupScheduler {
public:
    using RunCallback = std::function<void(const Config& snapshot, const CancellationToken& token)>;

    // tickUnit is the length of one configured "minute"
    BackupScheduler(std::string configPath,
                    const Config& initialConfig,
                    EventChannel& events,
                    RunCallback runCallback,
                    std::chrono::milliseconds tickUnit = std::chrono::minutes(1));
    ~BackupScheduler();

    BackupScheduler(const BackupScheduler&) = delete;
    BackupScheduler& operator=(const BackupScheduler&) = delete;

    void start();

    // Stops the control loop, cancels the active run's token and waits
    // for that run to return. The event channel is closed.
    void stop();

    bool isRunning() const { return loopRunning_; }
    SchedulerState getState() const;
    int getIntervalMinutes() const { return intervalMinutes_; }
    size_t getRunsStarted() const { return runsStarted_; }
    size_t getRunsSkipped() const { return runsSkipped_; }

private:
    struct SchedulerTimer {
        int intervalMinutes;
        std::chrono::steady_clock::duration period;
        std::chrono::steady_clock::time_point nextTick;
    };

    void controlLoop();
    void triggerRun(const std::string& reason);
    void reloadTimerIfNeeded();
    void armTimer(int intervalMinutes);
    bool reloadConfig(Config& cfg);
    Config takeSnapshot();

    const std::string configPath_;
    EventChannel& events_;
    RunCallback runCallback_;
    const std::chrono::milliseconds tickUnit_;

    // Control loop thread only
    std::optional<SchedulerTimer> timer_;
    std::future<void> inFlight_;

    Config lastGood_;
    std::mutex configMutex_;

    RunState runState_;
    CancellationToken cancel_;
    std::atomic<int> intervalMinutes_{0};
    std::atomic<size_t> runsStarted_{0};
    std::atomic<size_t> runsSkipped_{0};

    std::thread loopThread_;
    std::atomic<bool> loopRunning_{false};
    std::atomic<bool> stopRequested_{false};
    std::mutex lifecycleMutex_;
};
