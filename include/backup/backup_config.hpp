#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

// A named HTTP endpoint serving one backup archive
struct Site {
    bool enabled{false};
    std::string name;
    std::string url;
};

// Daemon configuration as stored in the JSON config file
struct Config {
    std::string webListenAddr;
    int intervalMinutes{0};      // 0 disables scheduled runs
    std::string backupFolder;    // Root directory, one subdirectory per site
    int retention{0};            // Archives kept per site
    std::vector<Site> sites;

    // Applies defaults and drops unusable or duplicate sites. Never fails.
    void validateAndNormalize();
};

// Raised when the config file cannot be read, parsed or written
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigStore {
public:
    // Loads the config at path, creating it with defaults when missing.
    // Throws ConfigError on read or parse failure.
    static Config loadOrCreate(const std::string& path);

    // Normalizes and writes cfg atomically (temp file + rename).
    // Throws ConfigError on failure.
    static void save(const std::string& path, Config cfg);

    static Config defaultConfig();
    static std::string defaultBackupFolder();
};

// Negative intervals run every minute; zero stays disabled.
int normalizeInterval(int intervalMinutes);

std::string trimCopy(const std::string& value);

void to_json(nlohmann::json& j, const Site& site);
void from_json(const nlohmann::json& j, Site& site);
void to_json(nlohmann::json& j, const Config& cfg);
void from_json(const nlohmann::json& j, Config& cfg);
