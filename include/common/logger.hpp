#pragma once

#include <string>
#include <mutex>
#include <nlohmann/json.hpp>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Process-wide logger. Every record is written as one JSON object per line
// to stdout (stderr for ERROR and above) and appended to the log file.
class Logger {
public:
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO, bool toStdout = true);
    static void shutdown();
    static void setLogLevel(LogLevel level);

    static void debug(const std::string& message, const nlohmann::json& fields = nlohmann::json::object());
    static void info(const std::string& message, const nlohmann::json& fields = nlohmann::json::object());
    static void warning(const std::string& message, const nlohmann::json& fields = nlohmann::json::object());
    static void error(const std::string& message, const nlohmann::json& fields = nlohmann::json::object());
    static void fatal(const std::string& message, const nlohmann::json& fields = nlohmann::json::object());
    static bool isInitialized();

    static bool parseLevel(const std::string& text, LogLevel& level);
    static std::string levelToString(LogLevel level);

private:
    static void log(LogLevel level, const std::string& message, const nlohmann::json& fields);

    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static bool toStdout_;
    static std::string logPath_;
};
