#pragma once

#include "backup/backup_config.hpp"
#include "backup/http_fetcher.hpp"
#include "common/cancellation_token.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

enum class BackupError {
    None,
    SiteValidation,   // Empty name or URL
    Network,          // Connection failure, timeout, non-2xx status
    Storage,          // mkdir, write or rename failure
    Cancelled         // Run cancelled before or during the transfer
};

std::string backupErrorToString(BackupError error);

struct SiteResult {
    std::string siteName;
    BackupError error{BackupError::None};
    std::string message;
    std::string archivePath;   // Final path, set on success
    uint64_t bytesWritten{0};
    long statusCode{0};

    bool succeeded() const { return error == BackupError::None; }
};

struct RunSummary {
    std::vector<SiteResult> sites;
    size_t succeeded{0};
    size_t failed{0};
    size_t cancelled{0};
};

// Executes one backup pass: every enabled site downloaded concurrently,
// at most maxParallel transfers in flight, each committed atomically and
// followed by retention for that site.
class BackupRunner {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr int kDefaultMaxParallel = 5;
    static constexpr const char* kMaxParallelEnv = "HTTPBACKUP_MAX_PARALLEL";

    BackupRunner(std::shared_ptr<HttpFetcher> fetcher, int maxParallel = kDefaultMaxParallel);

    RunSummary runAll(const Config& snapshot, const CancellationToken& token);
    SiteResult runOne(const Config& snapshot, const Site& site, const CancellationToken& token);

    int getMaxParallel() const { return maxParallel_; }

    // Replaces the wall clock used for archive timestamps
    void setClock(Clock clock) { clock_ = std::move(clock); }

    // Positive integer from value, otherwise the default
    static int resolveMaxParallel(const char* value);
    static int maxParallelFromEnvironment();

    // backup_<site>_<DD-MM-YYYY_HH-mm-ss>.zip in local time
    static std::string archiveFileName(const std::string& siteName,
                                       std::chrono::system_clock::time_point when);

private:
    SiteResult fail(SiteResult result, BackupError error, const std::string& message) const;

    std::shared_ptr<HttpFetcher> fetcher_;
    int maxParallel_;
    Clock clock_;
};
