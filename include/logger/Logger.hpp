//
// Created by redeg on 26/04/2025.
//

#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <condition_variable>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

struct LoggerOptions {
    std::string directory = "logs";
    std::string filePrefix = "roll_tracker_";
    size_t maxFileSize = 50 * 1024 * 1024; // 50MB
    size_t maxFiles = 10;
    std::chrono::hours retention{24 * 7}; // 7 days
    bool consoleEnabled = true;
    bool fileEnabled = true;
    LogLevel minLevel = LogLevel::Info;
};

class Logger {
public:
    static void init(const LoggerOptions &options = LoggerOptions{});

    static void shutdown();

    static void setMinLevel(LogLevel level);

    static LogLevel parseLevel(const std::string &name, LogLevel fallback = LogLevel::Info);

    static void logDebug(const std::string &message);

    static void logInfo(const std::string &message);

    static void logWarning(const std::string &message);

    static void logError(const std::string &message);

private:
    static std::ofstream logFile_;
    static std::mutex logMutex_;
    static LoggerOptions options_;
    static std::string currentLogPath_;
    static std::atomic<size_t> currentLogSize_;
    static std::atomic<int> minLevel_;
    static std::atomic<bool> consoleEnabled_;
    static std::thread cleanupThread_;
    static std::atomic<bool> shutdownRequested_;
    static std::mutex cleanupMutex_;
    static std::condition_variable cleanupCondition_;

    static void log(LogLevel level, const std::string &message);

    static const char *levelName(LogLevel level);

    static void rotateLogFile();

    static void startCleanupThread();

    static void cleanupOldLogs();

    static std::string currentTimestamp();

    static std::string generateLogFilename();
};
