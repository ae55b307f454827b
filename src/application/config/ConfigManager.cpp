//
// Created by Andrea on 27/08/2025.
//

#include "application/config/ConfigManager.hpp"
#include "logger/Logger.hpp"
#include <utility>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <cstdlib>
#include <stdexcept>

namespace core::config {
    namespace {
        struct EnvBinding {
            const char *envVar;
            const char *key;
        };

        // Environment variable -> dotted key (upper-case, '_' for '.')
        const EnvBinding ENV_BINDINGS[] = {
            {"WATCH_DIRECTORY", "watch.directory"},
            {"WATCH_EXTENSION", "watch.extension"},
            {"WATCH_POLL_INTERVAL_MS", "watch.pollIntervalMs"},
            {"WATCH_PROCESS_EXISTING", "watch.processExisting"},
            {"INGEST_PRINTER_COLUMN", "ingest.printerColumn"},
            {"INGEST_OUTCOME_COLUMN", "ingest.outcomeColumn"},
            {"INGEST_LEGACY_OUTCOME_COLUMN", "ingest.legacyOutcomeColumn"},
            {"INGEST_PASS_VALUE", "ingest.passValue"},
            {"INGEST_FAIL_VALUE", "ingest.failValue"},
            {"INGEST_DEFAULT_PRINTER", "ingest.defaultPrinter"},
            {"STORE_PATH", "store.path"},
            {"MONITOR_REPORT_INTERVAL_SEC", "monitor.reportIntervalSec"},
            {"LOGGING_DIRECTORY", "logging.directory"},
            {"LOGGING_MAX_FILE_SIZE_MB", "logging.maxFileSizeMb"},
            {"LOGGING_MAX_FILES", "logging.maxFiles"},
            {"LOGGING_RETENTION_HOURS", "logging.retentionHours"},
            {"LOGGING_CONSOLE_ENABLED", "logging.consoleEnabled"},
            {"LOGGING_LEVEL", "logging.level"},
        };
    }

    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    ConfigManager::ConfigManager() {
        setDefaults();
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        std::lock_guard<std::mutex> lock(configMutex_);
        configPath_ = configPath;
        setDefaults();

        if (!std::filesystem::exists(configPath)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return;
        }

        try {
            std::ifstream file(configPath);
            nlohmann::json json;
            file >> json;

            std::unordered_map<std::string, std::string> loaded;

            // Flatten JSON into key-value pairs
            std::function<void(const nlohmann::json &, const std::string &)> flatten;
            flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
                for (auto it = obj.begin(); it != obj.end(); ++it) {
                    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                    if (it.value().is_object()) {
                        flatten(it.value(), key);
                    } else if (it.value().is_string()) {
                        loaded[key] = it.value().get<std::string>();
                    } else {
                        loaded[key] = it.value().dump();
                    }
                }
            };

            if (!json.is_object()) {
                throw std::runtime_error("top level value is not an object");
            }
            flatten(json, "");

            for (auto &[key, value]: loaded) {
                config_[key] = std::move(value);
            }

            Logger::logInfo(
                "[ConfigManager] Loaded " + std::to_string(loaded.size()) + " settings from " + configPath);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config: " + std::string(e.what()));
            setDefaults();
        }
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        int loaded = 0;
        for (const auto &binding: ENV_BINDINGS) {
            const char *value = std::getenv(binding.envVar);
            if (value) {
                config_[binding.key] = value;
                loaded++;
            }
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[key] = value;
    }

    WatchConfig ConfigManager::getWatchConfig() const {
        WatchConfig config;
        config.directory = get<std::string>("watch.directory", config.directory);
        config.extension = get<std::string>("watch.extension", config.extension);
        config.pollIntervalMs = get<int>("watch.pollIntervalMs", config.pollIntervalMs);
        config.processExisting = get<bool>("watch.processExisting", config.processExisting);
        return config;
    }

    IngestConfig ConfigManager::getIngestConfig() const {
        IngestConfig config;
        config.printerColumn = get<std::string>("ingest.printerColumn", config.printerColumn);
        config.outcomeColumn = get<std::string>("ingest.outcomeColumn", config.outcomeColumn);
        config.legacyOutcomeColumn = get<std::string>("ingest.legacyOutcomeColumn", config.legacyOutcomeColumn);
        config.passValue = get<std::string>("ingest.passValue", config.passValue);
        config.failValue = get<std::string>("ingest.failValue", config.failValue);
        config.defaultPrinter = get<std::string>("ingest.defaultPrinter", config.defaultPrinter);
        return config;
    }

    StoreConfig ConfigManager::getStoreConfig() const {
        StoreConfig config;
        config.path = get<std::string>("store.path", config.path);
        return config;
    }

    MonitorConfig ConfigManager::getMonitorConfig() const {
        MonitorConfig config;
        config.reportIntervalSec = get<int>("monitor.reportIntervalSec", config.reportIntervalSec);
        return config;
    }

    LoggingConfig ConfigManager::getLoggingConfig() const {
        LoggingConfig config;
        config.directory = get<std::string>("logging.directory", config.directory);
        config.maxFileSizeMb = get<int>("logging.maxFileSizeMb", config.maxFileSizeMb);
        config.maxFiles = get<int>("logging.maxFiles", config.maxFiles);
        config.retentionHours = get<int>("logging.retentionHours", config.retentionHours);
        config.consoleEnabled = get<bool>("logging.consoleEnabled", config.consoleEnabled);
        config.level = get<std::string>("logging.level", config.level);
        return config;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        if (get<int>("watch.pollIntervalMs", -1) < 50) {
            result.errors.push_back("watch.pollIntervalMs must be >= 50");
        }

        if (get<std::string>("watch.extension", "").empty()) {
            result.errors.push_back("watch.extension must not be empty");
        }

        if (get<std::string>("ingest.defaultPrinter", "").empty()) {
            result.errors.push_back("ingest.defaultPrinter must not be empty");
        }

        if (get<std::string>("store.path", "").empty()) {
            result.errors.push_back("store.path must not be empty");
        }

        if (get<int>("monitor.reportIntervalSec", -1) < 1) {
            result.errors.push_back("monitor.reportIntervalSec must be >= 1");
        }

        result.isValid = result.errors.empty();
        return result;
    }

    void ConfigManager::setDefaults() {
        config_.clear();

        // Watch defaults
        config_["watch.directory"] = ".";
        config_["watch.extension"] = ".csv";
        config_["watch.pollIntervalMs"] = "1000";
        config_["watch.processExisting"] = "false";

        // Ingest defaults
        config_["ingest.printerColumn"] = "Printer Name";
        config_["ingest.outcomeColumn"] = "Outcome Message";
        config_["ingest.legacyOutcomeColumn"] = "Failure Message";
        config_["ingest.passValue"] = "Pass (Label)";
        config_["ingest.failValue"] = "Fail (Label)";
        config_["ingest.defaultPrinter"] = "Printer_1";

        // Store defaults
        config_["store.path"] = "printer_jobs.db";

        // Monitor defaults
        config_["monitor.reportIntervalSec"] = "30";

        // Logging defaults
        config_["logging.directory"] = "logs";
        config_["logging.maxFileSizeMb"] = "50";
        config_["logging.maxFiles"] = "10";
        config_["logging.retentionHours"] = "168";
        config_["logging.consoleEnabled"] = "true";
        config_["logging.level"] = "info";
    }
} // namespace core::config
