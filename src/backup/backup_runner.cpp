#include "backup/backup_runner.hpp"
#include "backup/retention_policy.hpp"
#include "common/admission_gate.hpp"
#include "common/logger.hpp"
#include "common/thread_utils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <future>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct FileCloser {
    void operator()(FILE* file) const {
        if (file) {
            fclose(file);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileCloser>;

void removeTempFile(const fs::path& tmpPath) {
    std::error_code ec;
    fs::remove(tmpPath, ec);
    if (ec) {
        Logger::warning("backup: failed to remove temp file", {{"file", tmpPath.string()}, {"err", ec.message()}});
    }
}

} // namespace

std::string backupErrorToString(BackupError error) {
    switch (error) {
        case BackupError::None:           return "none";
        case BackupError::SiteValidation: return "site-validation";
        case BackupError::Network:        return "network";
        case BackupError::Storage:        return "storage";
        case BackupError::Cancelled:      return "cancelled";
        default:                          return "unknown";
    }
}

BackupRunner::BackupRunner(std::shared_ptr<HttpFetcher> fetcher, int maxParallel)
    : fetcher_(std::move(fetcher))
    , maxParallel_(maxParallel > 0 ? maxParallel : kDefaultMaxParallel)
    , clock_([] { return std::chrono::system_clock::now(); }) {
    if (!fetcher_) {
        throw std::invalid_argument("BackupRunner requires an HTTP fetcher");
    }
}

int BackupRunner::resolveMaxParallel(const char* value) {
    if (value == nullptr || *value == '\0') {
        return kDefaultMaxParallel;
    }

    std::string text = trimCopy(value);
    try {
        size_t consumed = 0;
        int parsed = std::stoi(text, &consumed);
        if (consumed == text.size() && parsed > 0) {
            return parsed;
        }
    } catch (const std::exception&) {
        // Unparseable or out of range
    }
    return kDefaultMaxParallel;
}

int BackupRunner::maxParallelFromEnvironment() {
    return resolveMaxParallel(std::getenv(kMaxParallelEnv));
}

std::string BackupRunner::archiveFileName(const std::string& siteName,
                                          std::chrono::system_clock::time_point when) {
    std::time_t time = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&time, &local);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%d-%m-%Y_%H-%M-%S", &local);
    return "backup_" + siteName + "_" + stamp + ".zip";
}

RunSummary BackupRunner::runAll(const Config& snapshot, const CancellationToken& token) {
    RunSummary summary;

    std::vector<Site> sites;
    for (const auto& site : snapshot.sites) {
        if (site.enabled) {
            sites.push_back(site);
        }
    }
    if (sites.empty()) {
        Logger::info("backup: no enabled sites");
        return summary;
    }

    Logger::info("backup: starting run", {{"sites", sites.size()}, {"max_parallel", maxParallel_}});

    AdmissionGate gate(static_cast<size_t>(maxParallel_));
    std::vector<std::future<SiteResult>> tasks;
    tasks.reserve(sites.size());

    for (const auto& site : sites) {
        tasks.push_back(ThreadUtils::async([this, &gate, &snapshot, &token, site]() {
            AdmissionGate::Slot slot(gate, token);
            if (!slot.held()) {
                SiteResult skipped;
                skipped.siteName = site.name;
                skipped.error = BackupError::Cancelled;
                skipped.message = "run cancelled before start";
                return skipped;
            }
            try {
                return runOne(snapshot, site, token);
            } catch (const std::exception& e) {
                SiteResult crashed;
                crashed.siteName = site.name;
                return fail(crashed, BackupError::Storage, std::string("unexpected error: ") + e.what());
            }
        }));
    }

    summary.sites = ThreadUtils::waitAll(tasks);

    for (const auto& result : summary.sites) {
        if (result.succeeded()) {
            ++summary.succeeded;
            Logger::info("backup: site OK", {{"site", result.siteName}, {"file", result.archivePath}, {"bytes", result.bytesWritten}});
        } else if (result.error == BackupError::Cancelled) {
            ++summary.cancelled;
            Logger::warning("backup: site cancelled", {{"site", result.siteName}, {"err", result.message}});
        } else {
            ++summary.failed;
            Logger::error("backup: site failed", {{"site", result.siteName},
                                                  {"kind", backupErrorToString(result.error)},
                                                  {"err", result.message}});
        }
    }

    Logger::info("backup: run finished", {{"succeeded", summary.succeeded},
                                          {"failed", summary.failed},
                                          {"cancelled", summary.cancelled}});
    return summary;
}

SiteResult BackupRunner::fail(SiteResult result, BackupError error, const std::string& message) const {
    result.error = error;
    result.message = message;
    return result;
}

SiteResult BackupRunner::runOne(const Config& snapshot, const Site& site, const CancellationToken& token) {
    SiteResult result;
    const std::string name = trimCopy(site.name);
    const std::string url = trimCopy(site.url);
    result.siteName = name.empty() ? site.name : name;

    if (name.empty()) {
        return fail(result, BackupError::SiteValidation, "site name is empty");
    }
    if (url.empty()) {
        return fail(result, BackupError::SiteValidation, "site url is empty");
    }

    if (token.isCancelled()) {
        return fail(result, BackupError::Cancelled, "run cancelled before request");
    }

    const fs::path siteDir = fs::path(snapshot.backupFolder).lexically_normal() / name;
    std::error_code ec;
    fs::create_directories(siteDir, ec);
    if (ec) {
        return fail(result, BackupError::Storage, "mkdir \"" + siteDir.string() + "\": " + ec.message());
    }

    const fs::path finalPath = siteDir / archiveFileName(name, clock_());
    const fs::path tmpPath = fs::path(finalPath.string() + ".tmp");

    FilePtr file(fopen(tmpPath.c_str(), "wb"));
    if (!file) {
        std::string reason = strerror(errno);
        return fail(result, BackupError::Storage, "create \"" + tmpPath.string() + "\": " + reason);
    }

    std::string writeError;
    HttpFetcher::ChunkSink sink = [&file, &writeError](const char* data, size_t size) {
        if (fwrite(data, 1, size, file.get()) != size) {
            writeError = strerror(errno);
            return false;
        }
        return true;
    };

    FetchResult fetched = fetcher_->fetch(url, sink, token);
    result.statusCode = fetched.statusCode;

    if (!writeError.empty()) {
        file.reset();
        removeTempFile(tmpPath);
        return fail(result, BackupError::Storage, "write file: " + writeError);
    }
    if (fetched.cancelled) {
        file.reset();
        removeTempFile(tmpPath);
        return fail(result, BackupError::Cancelled, fetched.error);
    }
    if (!fetched.transferred) {
        file.reset();
        removeTempFile(tmpPath);
        return fail(result, BackupError::Network, "http get: " + fetched.error);
    }
    if (!fetched.isSuccessStatus()) {
        file.reset();
        removeTempFile(tmpPath);
        return fail(result, BackupError::Network,
                    "http status " + std::to_string(fetched.statusCode) + ": " + trimCopy(fetched.bodySnippet));
    }

    if (fflush(file.get()) != 0 || fsync(fileno(file.get())) != 0) {
        std::string reason = strerror(errno);
        file.reset();
        removeTempFile(tmpPath);
        return fail(result, BackupError::Storage, "sync file: " + reason);
    }
    if (fclose(file.release()) != 0) {
        std::string reason = strerror(errno);
        removeTempFile(tmpPath);
        return fail(result, BackupError::Storage, "close file: " + reason);
    }

    fs::rename(tmpPath, finalPath, ec);
    if (ec) {
        removeTempFile(tmpPath);
        return fail(result, BackupError::Storage, "rename to final: " + ec.message());
    }

    result.archivePath = finalPath.string();
    result.bytesWritten = fetched.bytesWritten;
    Logger::info("backup: saved archive", {{"site", name}, {"file", result.archivePath}, {"bytes", result.bytesWritten}});

    // Best effort: a retention problem never fails the backup
    RetentionResult retention = RetentionPolicy::cleanupSite(siteDir.string(), name, snapshot.retention);
    if (!retention.ok()) {
        Logger::warning("backup: retention incomplete", {{"site", name}, {"errors", retention.errors}});
    }

    return result;
}
