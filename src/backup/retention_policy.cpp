#include "backup/retention_policy.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

struct ArchiveEntry {
    fs::path path;
    fs::file_time_type modified;
};

const std::string kArchiveSuffix = ".zip";

} // namespace

bool RetentionPolicy::isArchiveName(const std::string& fileName, const std::string& siteName) {
    const std::string prefix = "backup_" + siteName + "_";
    if (fileName.size() < prefix.size() + kArchiveSuffix.size()) {
        return false;
    }
    return fileName.compare(0, prefix.size(), prefix) == 0 &&
           fileName.compare(fileName.size() - kArchiveSuffix.size(), kArchiveSuffix.size(), kArchiveSuffix) == 0;
}

RetentionResult RetentionPolicy::cleanupSite(const std::string& siteDirectory,
                                             const std::string& siteName,
                                             int keep) {
    RetentionResult result;
    if (keep <= 0) {
        return result;
    }

    std::error_code ec;
    fs::directory_iterator it(siteDirectory, ec);
    if (ec) {
        result.errors.push_back("readdir \"" + siteDirectory + "\": " + ec.message());
        Logger::error("retention: list failed", {{"dir", siteDirectory}, {"err", ec.message()}});
        return result;
    }

    std::vector<ArchiveEntry> archives;
    for (fs::directory_iterator last; it != last; ) {
        const fs::directory_entry& entry = *it;
        std::error_code statEc;
        std::string name = entry.path().filename().string();

        if (entry.is_regular_file(statEc) && isArchiveName(name, siteName)) {
            auto modified = entry.last_write_time(statEc);
            if (statEc) {
                result.errors.push_back("stat \"" + name + "\": " + statEc.message());
                Logger::warning("retention: stat failed", {{"file", name}, {"err", statEc.message()}});
            } else {
                archives.push_back({entry.path(), modified});
            }
        }

        it.increment(ec);
        if (ec) {
            result.errors.push_back("readdir \"" + siteDirectory + "\": " + ec.message());
            Logger::error("retention: list failed", {{"dir", siteDirectory}, {"err", ec.message()}});
            break;
        }
    }

    result.matched = archives.size();
    if (archives.size() <= static_cast<size_t>(keep)) {
        return result;
    }

    // Oldest first; ties keep listing order
    std::stable_sort(archives.begin(), archives.end(), [](const ArchiveEntry& a, const ArchiveEntry& b) {
        return a.modified < b.modified;
    });

    size_t toDelete = archives.size() - static_cast<size_t>(keep);
    for (size_t i = 0; i < toDelete; ++i) {
        const auto& archive = archives[i];
        std::error_code removeEc;
        if (fs::remove(archive.path, removeEc)) {
            result.removed.push_back(archive.path.string());
            Logger::info("retention: removed old backup", {{"site", siteName}, {"file", archive.path.filename().string()}});
        } else {
            std::string reason = removeEc ? removeEc.message() : "file vanished";
            result.errors.push_back("remove \"" + archive.path.string() + "\": " + reason);
            Logger::warning("retention: failed to remove", {{"file", archive.path.string()}, {"err", reason}});
        }
    }

    return result;
}
