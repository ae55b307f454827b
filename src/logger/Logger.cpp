//
// Created by redeg on 26/04/2025.
//

#include "logger/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <thread>
#include <atomic>
#include <vector>

namespace fs = std::filesystem;

std::ofstream Logger::logFile_;
std::mutex Logger::logMutex_;
LoggerOptions Logger::options_;
std::string Logger::currentLogPath_;
std::atomic<size_t> Logger::currentLogSize_{0};
std::atomic<int> Logger::minLevel_{static_cast<int>(LogLevel::Info)};
std::atomic<bool> Logger::consoleEnabled_{true};
std::thread Logger::cleanupThread_;
std::atomic<bool> Logger::shutdownRequested_{false};
std::mutex Logger::cleanupMutex_;
std::condition_variable Logger::cleanupCondition_;

void Logger::init(const LoggerOptions &options) {
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        options_ = options;
        minLevel_ = static_cast<int>(options.minLevel);
        consoleEnabled_ = options.consoleEnabled;
        if (options_.fileEnabled) {
            rotateLogFile();
        }
    }

    if (options_.fileEnabled && !cleanupThread_.joinable()) {
        shutdownRequested_ = false;
        startCleanupThread();
    }

    if (consoleEnabled_) {
        std::cout << "[Logger] Initialized"
                << (options_.fileEnabled
                        ? " with auto-rotation (max " + std::to_string(options_.maxFileSize / 1024 / 1024) + "MB)"
                        : " (console only)")
                << std::endl;
    }
}

void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> lock(cleanupMutex_);
        shutdownRequested_ = true;
    }
    cleanupCondition_.notify_all();
    if (cleanupThread_.joinable()) {
        cleanupThread_.join();
    }
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::setMinLevel(LogLevel level) {
    minLevel_ = static_cast<int>(level);
}

LogLevel Logger::parseLevel(const std::string &name, LogLevel fallback) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warning" || lowered == "warn") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    return fallback;
}

void Logger::logDebug(const std::string &message) {
    log(LogLevel::Debug, message);
}

void Logger::logInfo(const std::string &message) {
    log(LogLevel::Info, message);
}

void Logger::logWarning(const std::string &message) {
    log(LogLevel::Warning, message);
}

void Logger::logError(const std::string &message) {
    log(LogLevel::Error, message);
}

const char *Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
        default: return "INFO";
    }
}

void Logger::log(LogLevel level, const std::string &message) {
    if (static_cast<int>(level) < minLevel_.load()) {
        return;
    }
    if (message.empty() || message.find_first_not_of(" \t\r\n") == std::string::npos) {
        return;
    }

    std::string timestamp = currentTimestamp();
    std::string formatted = "[" + std::string(levelName(level)) + "] [" + timestamp + "] " + message;

    std::lock_guard<std::mutex> lock(logMutex_);
    if (consoleEnabled_) {
        if (level >= LogLevel::Warning) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    if (!options_.fileEnabled) {
        return;
    }

    if (currentLogSize_ > options_.maxFileSize) {
        rotateLogFile();
    }

    if (logFile_.is_open()) {
        logFile_ << formatted << std::endl;
        currentLogSize_ += formatted.length() + 1;
    }
}

void Logger::rotateLogFile() {
    if (logFile_.is_open()) {
        logFile_.close();
    }

    try {
        currentLogPath_ = generateLogFilename();
    } catch (const std::exception &e) {
        std::cerr << "[Logger] ERROR: Cannot prepare log folder: " << e.what() << std::endl;
        return;
    }
    logFile_.open(currentLogPath_, std::ios::out | std::ios::trunc);
    currentLogSize_ = 0;

    if (!logFile_.is_open()) {
        std::cerr << "[Logger] ERROR: Cannot open log file: " << currentLogPath_ << std::endl;
    }
}

void Logger::startCleanupThread() {
    cleanupThread_ = std::thread([]() {
        std::unique_lock<std::mutex> lock(cleanupMutex_);
        while (!shutdownRequested_) {
            lock.unlock();
            cleanupOldLogs();
            lock.lock();
            cleanupCondition_.wait_for(lock, std::chrono::hours(1), [] { return shutdownRequested_.load(); });
        }
    });
}

void Logger::cleanupOldLogs() {
    try {
        const std::string &logsFolder = options_.directory;
        if (!fs::exists(logsFolder)) return;

        auto cutoffTime = std::chrono::system_clock::now() - options_.retention;
        std::vector<fs::path> logFiles;

        for (const auto &entry: fs::directory_iterator(logsFolder)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().rfind(options_.filePrefix, 0) == 0) {
                auto writeTime = fs::last_write_time(entry);
                auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                    writeTime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());

                if (sctp < cutoffTime && entry.path().string() != currentLogPath_) {
                    fs::remove(entry);
                } else {
                    logFiles.push_back(entry.path());
                }
            }
        }

        if (logFiles.size() > options_.maxFiles) {
            std::sort(logFiles.begin(), logFiles.end(), [](const fs::path &a, const fs::path &b) {
                return fs::last_write_time(a) < fs::last_write_time(b);
            });

            for (size_t i = 0; i < logFiles.size() - options_.maxFiles; ++i) {
                if (logFiles[i].string() != currentLogPath_) {
                    fs::remove(logFiles[i]);
                }
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "[Logger] Cleanup error: " << e.what() << std::endl;
    }
}

std::string Logger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&in_time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&in_time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y%m%d_%H%M%S");

    const std::string &logsFolder = options_.directory;
    if (!fs::exists(logsFolder)) {
        fs::create_directories(logsFolder);
    }

    return (fs::path(logsFolder) / (options_.filePrefix + ss.str() + ".log")).string();
}
