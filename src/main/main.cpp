#include "backup/backup_config.hpp"
#include "backup/backup_runner.hpp"
#include "backup/backup_scheduler.hpp"
#include "backup/curl_http_fetcher.hpp"
#include "common/event_channel.hpp"
#include "common/logger.hpp"
#include "common/thread_utils.hpp"
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace {

volatile std::sig_atomic_t g_shutdown = 0;
volatile std::sig_atomic_t g_reload = 0;
volatile std::sig_atomic_t g_runNow = 0;

void onSignal(int sig) {
    switch (sig) {
        case SIGHUP:  g_reload = 1; break;
        case SIGUSR1: g_runNow = 1; break;
        default:      g_shutdown = 1; break;
    }
}

// %ProgramData%/httpbackup/<file> when set, otherwise the working directory
std::string defaultDataPath(const std::string& fileName) {
    const char* programData = std::getenv("ProgramData");
    if (programData && *programData) {
        return (std::filesystem::path(programData) / "httpbackup" / fileName).string();
    }
    return fileName;
}

void printUsage() {
    std::cout << "Usage: httpbackup [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH     Config file (created with defaults if missing)\n"
              << "  -l, --log PATH        JSON log file\n"
              << "      --log-level LVL   debug, info, warning, error\n"
              << "      --run-now         Start a backup run immediately\n"
              << "  -h, --help            Show this help message\n"
              << "  -v, --version         Show version information\n"
              << "\n"
              << "Signals:\n"
              << "  SIGHUP                Reload config and adjust the schedule\n"
              << "  SIGUSR1               Start a backup run now\n"
              << "  SIGINT, SIGTERM       Graceful shutdown\n"
              << "\n"
              << "Environment:\n"
              << "  " << BackupRunner::kMaxParallelEnv << "  Concurrent downloads (default "
              << BackupRunner::kDefaultMaxParallel << ")\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = defaultDataPath("config.json");
    std::string logPath = defaultDataPath("log.json");
    LogLevel level = LogLevel::INFO;
    bool runNow = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "httpbackup version 1.0.0\n";
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if ((arg == "-l" || arg == "--log") && i + 1 < argc) {
            logPath = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!Logger::parseLevel(value, level)) {
                std::cerr << "Error: Unknown log level: " << value << std::endl;
                return 1;
            }
        } else if (arg == "--run-now") {
            runNow = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            printUsage();
            return 1;
        }
    }

    if (!Logger::initialize(logPath, level)) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return 1;
    }
    Logger::info("logging initialized", {{"log_path", logPath}});

    Config cfg;
    try {
        cfg = ConfigStore::loadOrCreate(configPath);
    } catch (const ConfigError& e) {
        Logger::fatal("failed to load config", {{"path", configPath}, {"err", e.what()}});
        Logger::shutdown();
        return 1;
    }
    Logger::info("config loaded", {{"path", configPath},
                                   {"sites", cfg.sites.size()},
                                   {"backup_folder", cfg.backupFolder},
                                   {"web_listen_addr", cfg.webListenAddr}});

    try {
        CurlHttpFetcher::globalInit();
    } catch (const std::exception& e) {
        Logger::fatal(e.what());
        Logger::shutdown();
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    std::signal(SIGHUP, onSignal);
    std::signal(SIGUSR1, onSignal);
    std::signal(SIGPIPE, SIG_IGN);

    int exitCode = 0;
    try {
        auto fetcher = std::make_shared<CurlHttpFetcher>();
        EventChannel events(8);

        BackupScheduler scheduler(configPath, cfg, events,
            [fetcher](const Config& snapshot, const CancellationToken& token) {
                BackupRunner runner(fetcher, BackupRunner::maxParallelFromEnvironment());
                runner.runAll(snapshot, token);
            });
        scheduler.start();

        if (runNow && !events.trySend(Event{EventType::RunNow})) {
            Logger::warning("event dropped", {{"event", eventTypeToString(EventType::RunNow)}});
        }

        // Signal handlers only set flags; forward them from here
        while (!g_shutdown) {
            if (g_reload) {
                g_reload = 0;
                if (!events.trySend(Event{EventType::ConfigChanged})) {
                    Logger::warning("event dropped", {{"event", eventTypeToString(EventType::ConfigChanged)}});
                }
            }
            if (g_runNow) {
                g_runNow = 0;
                if (!events.trySend(Event{EventType::RunNow})) {
                    Logger::warning("event dropped", {{"event", eventTypeToString(EventType::RunNow)}});
                }
            }
            ThreadUtils::sleepFor(std::chrono::milliseconds(200));
        }

        Logger::info("shutdown signal received");
        scheduler.stop();
    } catch (const std::exception& e) {
        Logger::error("Error in main: " + std::string(e.what()));
        exitCode = 1;
    }

    CurlHttpFetcher::globalCleanup();
    Logger::info("exiting");
    Logger::shutdown();
    return exitCode;
}
