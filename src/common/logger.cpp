#include "common/logger.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <cstring>  // for strerror
#include <cerrno>   // for errno
#include <algorithm>
#include <cctype>

std::mutex Logger::mutex_;
LogLevel Logger::currentLevel_ = LogLevel::INFO;
bool Logger::initialized_ = false;
bool Logger::toStdout_ = true;
std::string Logger::logPath_ = "log.json";

namespace {

// RFC3339 with numeric UTC offset, e.g. 2024-05-01T13:45:10+02:00
std::string rfc3339Now() {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &local);

    char offset[8];
    std::strftime(offset, sizeof(offset), "%z", &local);
    std::string zone(offset);
    if (zone.size() == 5) {
        zone.insert(3, ":");
    }
    if (zone == "+00:00") {
        zone = "Z";
    }
    return std::string(stamp) + zone;
}

} // namespace

bool Logger::initialize(const std::string& logPath, LogLevel level, bool toStdout) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        std::cerr << "Logger already initialized" << std::endl;
        return false;
    }

    try {
        if (!logPath.empty()) {
            std::filesystem::path logDir = std::filesystem::path(logPath).parent_path();
            if (!logDir.empty() && !std::filesystem::exists(logDir)) {
                std::filesystem::create_directories(logDir);
            }

            // Test if we can write to the log file
            FILE* testFile = fopen(logPath.c_str(), "a");
            if (!testFile) {
                std::cerr << "Failed to open log file " << logPath << ": " << strerror(errno) << std::endl;
                return false;
            }
            fclose(testFile);
        }

        logPath_ = logPath;
        currentLevel_ = level;
        // Nothing would ever be written without at least one sink.
        toStdout_ = toStdout || logPath.empty();
        initialized_ = true;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        return false;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = false;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

bool Logger::isInitialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

void Logger::log(LogLevel level, const std::string& message, const nlohmann::json& fields) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_ || level < currentLevel_) {
        return;
    }

    nlohmann::json record = {
        {"time", rfc3339Now()},
        {"level", levelToString(level)},
        {"msg", message}
    };
    if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            record[it.key()] = it.value();
        }
    }

    // Invalid UTF-8 in a field (e.g. a response snippet) must not throw here.
    std::string line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";

    if (toStdout_) {
        if (level >= LogLevel::ERROR) {
            std::cerr << line;
            std::cerr.flush();
        } else {
            std::cout << line;
            std::cout.flush();
        }
    }

    if (logPath_.empty()) {
        return;
    }

    FILE* logFile = fopen(logPath_.c_str(), "a");
    if (logFile) {
        fputs(line.c_str(), logFile);
        fflush(logFile);
        fclose(logFile);
    } else {
        std::cerr << "Failed to open log file: " << strerror(errno) << std::endl;
    }
}

void Logger::debug(const std::string& message, const nlohmann::json& fields) {
    log(LogLevel::DEBUG, message, fields);
}

void Logger::info(const std::string& message, const nlohmann::json& fields) {
    log(LogLevel::INFO, message, fields);
}

void Logger::warning(const std::string& message, const nlohmann::json& fields) {
    log(LogLevel::WARNING, message, fields);
}

void Logger::error(const std::string& message, const nlohmann::json& fields) {
    log(LogLevel::ERROR, message, fields);
}

void Logger::fatal(const std::string& message, const nlohmann::json& fields) {
    log(LogLevel::FATAL, message, fields);
}

bool Logger::parseLevel(const std::string& text, LogLevel& level) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        level = LogLevel::INFO;
    } else if (upper == "WARNING" || upper == "WARN") {
        level = LogLevel::WARNING;
    } else if (upper == "ERROR") {
        level = LogLevel::ERROR;
    } else if (upper == "FATAL") {
        level = LogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:            return "UNKNOWN";
    }
}
