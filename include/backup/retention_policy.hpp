#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Outcome of one retention pass. Failures are collected, never thrown.
struct RetentionResult {
    size_t matched{0};
    std::vector<std::string> removed;
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
};

class RetentionPolicy {
public:
    // Keeps the newest `keep` archives named backup_<siteName>_*.zip in
    // siteDirectory and deletes the rest, oldest first. keep <= 0 is a no-op.
    static RetentionResult cleanupSite(const std::string& siteDirectory,
                                       const std::string& siteName,
                                       int keep);

    static bool isArchiveName(const std::string& fileName, const std::string& siteName);
};
