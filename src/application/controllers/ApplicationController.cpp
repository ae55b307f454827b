//
// Created by Andrea on 23/08/2025.
//

#include "application/controllers/ApplicationController.hpp"
#include "application/config/ConfigManager.hpp"
#include "connector/events/console/ConsoleCommandReceiver.hpp"
#include "core/events/EventSystem.hpp"
#include "core/store/SqliteJobStore.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <iostream>

ApplicationController::ApplicationController()
        : isRunning_(false),
          initializationComplete_(false) {
}

ApplicationController::~ApplicationController() {
    shutdown();
}

bool ApplicationController::initialize(const std::string &configPath) {
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] STARTING ROLL TRACKER");
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] Build Date: " + std::string(__DATE__) + " " + std::string(__TIME__));

    try {
        // Step 1: Configuration
        Logger::logInfo("[ApplicationController] [1/8] Loading configuration...");
        loadConfiguration(configPath);

        // Step 2: Logger
        initializeLogger();
        Logger::logInfo("[ApplicationController] [2/8] Logger configured");

        // Step 3: Store
        Logger::logInfo("[ApplicationController] [3/8] Opening job store...");
        if (!initializeStore()) {
            Logger::logError("[ApplicationController] ✗ Job store initialization FAILED");
            return false;
        }
        Logger::logInfo("[ApplicationController] ✓ Job store ready");

        // Step 4 + 5: Ingestion and tracking
        Logger::logInfo("[ApplicationController] [4/8] Creating ingestion pipeline...");
        initializeIngestion();
        Logger::logInfo("[ApplicationController] [5/8] Job tracker subscribed to counter updates");

        // Step 6: Watcher
        Logger::logInfo("[ApplicationController] [6/8] Starting directory watcher...");
        if (!initializeWatcher()) {
            Logger::logError("[ApplicationController] ✗ Directory watcher initialization FAILED");
            return false;
        }
        Logger::logInfo("[ApplicationController] ✓ Watching " + watcher_->getOptions().directory);

        // Step 7: Command channel
        Logger::logInfo("[ApplicationController] [7/8] Starting command channel...");
        initializeCommandChannel();

        // Step 8: Monitor
        Logger::logInfo("[ApplicationController] [8/8] Starting System Monitor...");
        auto monitorConfig = core::config::ConfigManager::getInstance().getMonitorConfig();
        monitor_ = std::make_unique<SystemMonitor>(watcher_, pipeline_, tracker_, commandController_,
                                                   std::chrono::seconds(monitorConfig.reportIntervalSec));
        monitor_->start();
    } catch (const core::types::TrackerException &e) {
        Logger::logError("[ApplicationController] " + std::string(e.what()));
        return false;
    }

    printInitializationSummary();

    initializationComplete_ = true;
    isRunning_ = true;

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] SYSTEM READY - WAITING FOR PRINTER LOGS");
    Logger::logInfo("===============================================");

    return true;
}

void ApplicationController::shutdown() {
    if (!isRunning_ && !initializationComplete_ && !store_) {
        return; // Already shut down or never initialized
    }

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] SHUTTING DOWN APPLICATION");
    Logger::logInfo("===============================================");

    isRunning_ = false;
    initializationComplete_ = false;

    // Stop components in reverse order
    if (monitor_) {
        monitor_->stop();
        monitor_.reset();
        Logger::logInfo("[ApplicationController] ✓ System Monitor stopped");
    }

    if (commandController_) {
        commandController_->stop();
        commandController_.reset();
        Logger::logInfo("[ApplicationController] ✓ Command channel stopped");
    }

    if (watcher_) {
        // Drains the in-flight notification before returning
        watcher_->stop();
        watcher_.reset();
        Logger::logInfo("[ApplicationController] ✓ Directory watcher stopped");
    }

    tracker_.reset();
    pipeline_.reset();

    if (store_) {
        store_.reset();
        Logger::logInfo("[ApplicationController] ✓ Job store closed");
    }

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] APPLICATION SHUTDOWN COMPLETE");
    Logger::logInfo("===============================================");
}

bool ApplicationController::loadConfiguration(const std::string &configPath) {
    auto &config = core::config::ConfigManager::getInstance();
    config.loadFromFile(configPath);
    config.loadFromEnv();

    auto validation = config.validate();
    if (!validation.isValid) {
        std::string joined;
        for (const auto &error: validation.errors) {
            Logger::logError("[ApplicationController] Config: " + error);
            joined += (joined.empty() ? "" : "; ") + error;
        }
        throw core::types::ConfigException(joined);
    }
    return true;
}

void ApplicationController::initializeLogger() {
    auto config = core::config::ConfigManager::getInstance().getLoggingConfig();

    LoggerOptions options;
    options.directory = config.directory;
    options.maxFileSize = static_cast<size_t>(std::max(1, config.maxFileSizeMb)) * 1024 * 1024;
    options.maxFiles = static_cast<size_t>(std::max(1, config.maxFiles));
    options.retention = std::chrono::hours(std::max(1, config.retentionHours));
    options.consoleEnabled = config.consoleEnabled;
    options.minLevel = Logger::parseLevel(config.level);

    Logger::init(options);
}

bool ApplicationController::initializeStore() {
    auto config = core::config::ConfigManager::getInstance().getStoreConfig();
    try {
        store_ = std::make_shared<core::store::SqliteJobStore>(config.path);

        auto active = store_->getActiveJobs();
        Logger::logInfo("[ApplicationController] Database: " + config.path + " (" +
                        std::to_string(active.size()) + " active jobs)");
        return true;
    } catch (const core::types::StoreException &e) {
        Logger::logError("[ApplicationController] " + std::string(e.what()));
        store_.reset();
        return false;
    }
}

void ApplicationController::initializeIngestion() {
    auto ingest = core::config::ConfigManager::getInstance().getIngestConfig();

    core::ingest::RowParserConfig parserConfig;
    parserConfig.printerColumn = ingest.printerColumn;
    parserConfig.outcomeColumn = ingest.outcomeColumn;
    parserConfig.legacyOutcomeColumn = ingest.legacyOutcomeColumn;
    parserConfig.passValue = ingest.passValue;
    parserConfig.failValue = ingest.failValue;
    parserConfig.defaultPrinter = ingest.defaultPrinter;

    auto reader = std::make_shared<core::ingest::IncrementalFileReader>(core::ingest::RowParser(parserConfig));
    auto aggregator = std::make_shared<core::ingest::PrinterAggregator>();
    auto &eventBus = core::events::EventBus::getInstance();

    pipeline_ = std::make_shared<core::ingest::IngestionPipeline>(reader, aggregator, eventBus);

    tracker_ = std::make_shared<core::jobs::JobTracker>(store_);
    eventBus.subscribe(tracker_);
    Logger::logInfo("[ApplicationController] EventBus observers: " + std::to_string(eventBus.observerCount()));
}

bool ApplicationController::initializeWatcher() {
    auto config = core::config::ConfigManager::getInstance().getWatchConfig();

    core::watch::WatchOptions options;
    options.directory = config.directory;
    options.extension = config.extension;
    options.pollInterval = std::chrono::milliseconds(config.pollIntervalMs);
    options.processExisting = config.processExisting;

    auto pipeline = pipeline_;
    watcher_ = std::make_shared<core::watch::DirectoryWatcher>(options, [pipeline](const core::watch::FileEvent &event) {
        pipeline->onFileEvent(event);
    });

    try {
        watcher_->start();
    } catch (const std::exception &e) {
        Logger::logError("[ApplicationController] Cannot watch " + options.directory + ": " + e.what());
        watcher_.reset();
        return false;
    }
    return watcher_->isRunning();
}

void ApplicationController::initializeCommandChannel() {
    auto receiver = std::make_shared<connector::events::console::ConsoleCommandReceiver>(0);
    commandController_ = std::make_shared<connector::controllers::CommandController>(tracker_, receiver, std::cout);
    commandController_->start();
}

void ApplicationController::printInitializationSummary() {
    auto &config = core::config::ConfigManager::getInstance();
    auto watch = config.getWatchConfig();
    auto ingest = config.getIngestConfig();

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] INITIALIZATION SUMMARY");
    Logger::logInfo("===============================================");
    Logger::logInfo("  Ingestion:");
    Logger::logInfo("    Directory: " + watch.directory + " (*" + watch.extension + ", every " +
                    std::to_string(watch.pollIntervalMs) + " ms)");
    Logger::logInfo("    Columns: " + ingest.printerColumn + " / " + ingest.outcomeColumn +
                    " (legacy " + ingest.legacyOutcomeColumn + ")");
    Logger::logInfo("    Default printer: " + ingest.defaultPrinter);
    Logger::logInfo("    Watcher: " + std::string(watcher_ && watcher_->isRunning() ? "✓ RUNNING" : "✗ STOPPED"));

    Logger::logInfo("  Tracking:");
    Logger::logInfo("    Database: " + config.getStoreConfig().path);
    Logger::logInfo("    Commands: " + std::string(
            commandController_ && commandController_->isRunning() ? "✓ LISTENING" : "⚠ CLOSED"));

    Logger::logInfo("  System Monitor: " + std::string(monitor_ ? "✓ ACTIVE" : "✗ INACTIVE"));
    Logger::logInfo("===============================================");
}
