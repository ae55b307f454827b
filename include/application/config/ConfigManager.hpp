//
// Created by Andrea on 27/08/2025.
//

#pragma once

#include <string>
#include <unordered_map>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace core::config {
    struct WatchConfig {
        std::string directory = ".";
        std::string extension = ".csv";
        int pollIntervalMs = 1000;
        bool processExisting = false;
    };

    struct IngestConfig {
        std::string printerColumn = "Printer Name";
        std::string outcomeColumn = "Outcome Message";
        std::string legacyOutcomeColumn = "Failure Message";
        std::string passValue = "Pass (Label)";
        std::string failValue = "Fail (Label)";
        std::string defaultPrinter = "Printer_1";
    };

    struct StoreConfig {
        std::string path = "printer_jobs.db";
    };

    struct MonitorConfig {
        int reportIntervalSec = 30;
    };

    struct LoggingConfig {
        std::string directory = "logs";
        int maxFileSizeMb = 50;
        int maxFiles = 10;
        int retentionHours = 168;
        bool consoleEnabled = true;
        std::string level = "info";
    };

    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        ConfigManager();

        // Load configuration
        void loadFromFile(const std::string &configPath = "config.json");

        void loadFromEnv();

        void set(const std::string &key, const std::string &value);

        const std::string &getConfigPath() const { return configPath_; }

        // Configuration access
        WatchConfig getWatchConfig() const;

        IngestConfig getIngestConfig() const;

        StoreConfig getStoreConfig() const;

        MonitorConfig getMonitorConfig() const;

        LoggingConfig getLoggingConfig() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        // Validation
        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;
        std::string configPath_;

        void setDefaults();
    };

    // Template specializations
    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }

    template<>
    inline double ConfigManager::get<double>(const std::string &key, const double &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stod(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }
} // namespace core::config
