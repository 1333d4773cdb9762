#include "backup/backup_config.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const char* kDefaultListenAddr = "127.0.0.1:8123";
const int kDefaultRetention = 30;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string trimCopy(const std::string& value) {
    const char* whitespace = " \t\r\n\f\v";
    auto begin = value.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}

int normalizeInterval(int intervalMinutes) {
    if (intervalMinutes < 0) {
        return 1;
    }
    return intervalMinutes;
}

void Config::validateAndNormalize() {
    intervalMinutes = normalizeInterval(intervalMinutes);
    if (retention <= 0) {
        retention = kDefaultRetention;
    }

    backupFolder = trimCopy(backupFolder);
    if (backupFolder.empty()) {
        backupFolder = ConfigStore::defaultBackupFolder();
    }

    webListenAddr = trimCopy(webListenAddr);
    if (webListenAddr.empty()) {
        webListenAddr = kDefaultListenAddr;
    }

    std::vector<Site> normalized;
    normalized.reserve(sites.size());
    std::set<std::string> seen;

    for (auto site : sites) {
        site.name = trimCopy(site.name);
        site.url = trimCopy(site.url);

        // Rows left blank by an editor
        if (site.name.empty() && site.url.empty()) {
            continue;
        }

        // Keep the first occurrence of a name, drop later duplicates
        if (!site.name.empty()) {
            if (!seen.insert(toLower(site.name)).second) {
                Logger::warning("config: dropping duplicate site", {{"site", site.name}});
                continue;
            }
        }

        normalized.push_back(std::move(site));
    }
    sites = std::move(normalized);
}

std::string ConfigStore::defaultBackupFolder() {
    const char* programData = std::getenv("ProgramData");
    if (programData && *programData) {
        return (fs::path(programData) / "httpbackup" / "Backups").string();
    }
    return "Backups";
}

Config ConfigStore::defaultConfig() {
    Config cfg;
    cfg.webListenAddr = kDefaultListenAddr;
    cfg.intervalMinutes = 5;
    cfg.backupFolder = defaultBackupFolder();
    cfg.retention = kDefaultRetention;
    cfg.sites.push_back(Site{true, "Example Site", "http://example.com/backup.zip"});
    return cfg;
}

Config ConfigStore::loadOrCreate(const std::string& path) {
    std::string trimmed = trimCopy(path);
    if (trimmed.empty()) {
        throw ConfigError("config path is empty");
    }

    std::error_code ec;
    if (!fs::exists(trimmed, ec)) {
        if (ec) {
            throw ConfigError("failed to read config \"" + trimmed + "\": " + ec.message());
        }
        Config cfg = defaultConfig();
        cfg.validateAndNormalize();
        try {
            save(trimmed, cfg);
        } catch (const ConfigError& e) {
            throw ConfigError("failed to create default config at \"" + trimmed + "\": " + e.what());
        }
        Logger::info("config: created default config", {{"path", trimmed}});
        return cfg;
    }

    std::ifstream file(trimmed, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigError("failed to read config \"" + trimmed + "\"");
    }

    Config cfg;
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            throw ConfigError("failed to parse config \"" + trimmed + "\": not a JSON object");
        }
        cfg = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("failed to parse config \"" + trimmed + "\": " + e.what());
    }

    cfg.validateAndNormalize();
    return cfg;
}

void ConfigStore::save(const std::string& path, Config cfg) {
    std::string trimmed = trimCopy(path);
    if (trimmed.empty()) {
        throw ConfigError("config path is empty");
    }

    cfg.validateAndNormalize();

    std::error_code ec;
    fs::path parent = fs::path(trimmed).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw ConfigError("failed to create config directory: " + ec.message());
        }
    }

    std::string body = nlohmann::json(cfg).dump(2) + "\n";

    std::string tmpPath = trimmed + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw ConfigError("failed to write temp config \"" + tmpPath + "\"");
        }
        out << body;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmpPath, ec);
            throw ConfigError("failed to write temp config \"" + tmpPath + "\"");
        }
    }

    fs::rename(tmpPath, trimmed, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        throw ConfigError("failed to replace config: " + ec.message());
    }
}

void to_json(nlohmann::json& j, const Site& site) {
    j = nlohmann::json{
        {"Enabled", site.enabled},
        {"Name", site.name},
        {"Url", site.url}
    };
}

void from_json(const nlohmann::json& j, Site& site) {
    site.enabled = j.value("Enabled", false);
    site.name = j.value("Name", std::string());
    site.url = j.value("Url", std::string());
}

void to_json(nlohmann::json& j, const Config& cfg) {
    j = nlohmann::json{
        {"WebListenAddr", cfg.webListenAddr},
        {"IntervalMinutes", cfg.intervalMinutes},
        {"BackupFolder", cfg.backupFolder},
        {"Retention", cfg.retention},
        {"Sites", cfg.sites}
    };
}

void from_json(const nlohmann::json& j, Config& cfg) {
    cfg.webListenAddr = j.value("WebListenAddr", std::string());
    cfg.intervalMinutes = j.value("IntervalMinutes", 0);
    cfg.backupFolder = j.value("BackupFolder", std::string());
    cfg.retention = j.value("Retention", 0);
    cfg.sites.clear();
    if (j.contains("Sites") && !j.at("Sites").is_null()) {
        cfg.sites = j.at("Sites").get<std::vector<Site>>();
    }
}
