#include "backup/backup_scheduler.hpp"
#include "common/logger.hpp"
#include "common/thread_utils.hpp"
#include <system_error>

namespace {

// Longest wait between ticks; larger intervals never fire in practice
constexpr std::chrono::hours kMaxTimerPeriod{24 * 365 * 100};

// Clears the run flag however the run callback exits
class RunGuard {
public:
    explicit RunGuard(RunState& state) : state_(state) {}
    ~RunGuard() { state_.finish(); }

    RunGuard(const RunGuard&) = delete;
    RunGuard& operator=(const RunGuard&) = delete;

private:
    RunState& state_;
};

} // namespace

std::string schedulerStateToString(SchedulerState state) {
    switch (state) {
        case SchedulerState::Disabled: return "disabled";
        case SchedulerState::Idle:     return "idle";
        case SchedulerState::Running:  return "running";
        case SchedulerState::Stopped:  return "stopped";
        default:                       return "unknown";
    }
}

BackupScheduler::BackupScheduler(std::string configPath,
                                 const Config& initialConfig,
                                 EventChannel& events,
                                 RunCallback runCallback,
                                 std::chrono::milliseconds tickUnit)
    : configPath_(std::move(configPath))
    , events_(events)
    , runCallback_(std::move(runCallback))
    , tickUnit_(tickUnit.count() > 0 ? tickUnit : std::chrono::milliseconds(1))
    , lastGood_(initialConfig) {
    intervalMinutes_ = normalizeInterval(initialConfig.intervalMinutes);
}

BackupScheduler::~BackupScheduler() {
    stop();
}

void BackupScheduler::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (loopRunning_ || stopRequested_) {
        return;
    }

    armTimer(intervalMinutes_);
    if (timer_) {
        Logger::info("scheduler started", {{"interval_minutes", timer_->intervalMinutes}});
    } else {
        Logger::info("scheduler disabled (IntervalMinutes=0)");
    }

    loopRunning_ = true;
    loopThread_ = std::thread(&BackupScheduler::controlLoop, this);
}

void BackupScheduler::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (stopRequested_) {
        return;
    }
    stopRequested_ = true;

    events_.close();
    if (loopThread_.joinable()) {
        loopThread_.join();
    }
    loopRunning_ = false;

    cancel_.cancel();
    if (inFlight_.valid()) {
        Logger::info("scheduler: waiting for in-flight run to finish");
        inFlight_.wait();
    }
    Logger::info("scheduler stopped");
}

SchedulerState BackupScheduler::getState() const {
    if (stopRequested_) {
        return SchedulerState::Stopped;
    }
    if (runState_.isRunning()) {
        return SchedulerState::Running;
    }
    return intervalMinutes_ > 0 ? SchedulerState::Idle : SchedulerState::Disabled;
}

void BackupScheduler::armTimer(int intervalMinutes) {
    intervalMinutes_ = intervalMinutes;
    if (intervalMinutes <= 0) {
        timer_.reset();
        return;
    }

    // Saturate instead of overflowing the clock's representation
    using Duration = std::chrono::steady_clock::duration;
    const Duration unit = std::chrono::duration_cast<Duration>(tickUnit_);
    Duration period = kMaxTimerPeriod;
    if (intervalMinutes < kMaxTimerPeriod / unit) {
        period = unit * intervalMinutes;
    }
    timer_ = SchedulerTimer{intervalMinutes, period, std::chrono::steady_clock::now() + period};
}

void BackupScheduler::controlLoop() {
    while (!stopRequested_) {
        std::optional<EventChannel::Clock::time_point> deadline;
        if (timer_) {
            deadline = timer_->nextTick;
        }

        Event event{};
        EventChannel::ReceiveStatus status = events_.receive(event, deadline);
        if (status == EventChannel::ReceiveStatus::Closed || stopRequested_) {
            break;
        }

        if (status == EventChannel::ReceiveStatus::Timeout) {
            if (timer_ && std::chrono::steady_clock::now() >= timer_->nextTick) {
                timer_->nextTick = std::chrono::steady_clock::now() + timer_->period;
                triggerRun("ticker");
            }
            continue;
        }

        switch (event.type) {
            case EventType::ConfigChanged:
                Logger::info("event: config changed -> reloading scheduler");
                reloadTimerIfNeeded();
                break;
            case EventType::RunNow:
                Logger::info("event: run now");
                triggerRun("run-now");
                break;
        }
    }

    Logger::info("scheduler loop exited");
}

void BackupScheduler::triggerRun(const std::string& reason) {
    if (!runState_.tryBegin()) {
        ++runsSkipped_;
        Logger::warning("run skipped: already running", {{"reason", reason}});
        return;
    }

    ++runsStarted_;
    try {
        // The previous run has released the flag, so this join is immediate
        inFlight_ = ThreadUtils::async([this, reason]() {
            RunGuard guard(runState_);
            Config snapshot = takeSnapshot();
            Logger::info("run started", {{"reason", reason}});
            try {
                runCallback_(snapshot, cancel_);
            } catch (const std::exception& e) {
                Logger::error("run failed", {{"reason", reason}, {"err", e.what()}});
            }
        });
    } catch (const std::system_error& e) {
        runState_.finish();
        Logger::error("failed to launch run", {{"reason", reason}, {"err", e.what()}});
    }
}

void BackupScheduler::reloadTimerIfNeeded() {
    Config cfg;
    if (!reloadConfig(cfg)) {
        return;
    }

    int newInterval = normalizeInterval(cfg.intervalMinutes);
    int current = timer_ ? timer_->intervalMinutes : 0;
    if (newInterval == current) {
        return;
    }

    armTimer(newInterval);
    if (current == 0) {
        Logger::info("scheduler enabled", {{"interval_minutes", newInterval}});
    } else if (newInterval == 0) {
        Logger::info("scheduler disabled (IntervalMinutes=0)");
    } else {
        Logger::info("scheduler interval updated", {{"interval_minutes", newInterval}});
    }
}

bool BackupScheduler::reloadConfig(Config& cfg) {
    try {
        cfg = ConfigStore::loadOrCreate(configPath_);
    } catch (const ConfigError& e) {
        Logger::error("failed to reload config", {{"path", configPath_}, {"err", e.what()}});
        return false;
    }

    std::lock_guard<std::mutex> lock(configMutex_);
    lastGood_ = cfg;
    return true;
}

Config BackupScheduler::takeSnapshot() {
    Config cfg;
    if (reloadConfig(cfg)) {
        return cfg;
    }

    Logger::warning("using last good config for this run");
    std::lock_guard<std::mutex> lock(configMutex_);
    return lastGood_;
}
