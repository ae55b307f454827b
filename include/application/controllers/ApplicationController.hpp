//
// Created by Andrea on 23/08/2025.
//

#pragma once

#include <memory>
#include <atomic>
#include <string>

// Core includes
#include "core/ingest/IngestionPipeline.hpp"
#include "core/jobs/tracking/JobTracker.hpp"
#include "core/store/JobStore.hpp"
#include "core/watch/DirectoryWatcher.hpp"

// Connector includes
#include "connector/controllers/CommandController.hpp"
#include "application/monitor/SystemMonitor.hpp"


/**
 * @class ApplicationController
 * @brief Main application controller for the roll tracker daemon
 *
 * Wires the ingestion side (watcher, reader, aggregator) to the tracking side
 * (open jobs and their rolls) through the EventBus, and exposes the operator
 * command channel on stdin/stdout.
 */
class ApplicationController {
public:
    ApplicationController();

    ~ApplicationController();

    /**
     * @brief Initialize all application components
     *
     * Initialization sequence:
     * 1. Configuration (file, then environment)
     * 2. Logger
     * 3. Job store
     * 4. Ingestion pipeline (reader, aggregator)
     * 5. Job tracker, subscribed to counter updates
     * 6. Directory watcher
     * 7. Command channel
     * 8. System monitor
     *
     * @return true if initialization successful, false otherwise
     */
    bool initialize(const std::string &configPath = "config.json");

    /**
     * @brief Shutdown the application gracefully
     *
     * Stops all components in reverse initialization order
     */
    void shutdown();

    bool isRunning() const { return isRunning_; }

    std::shared_ptr<core::jobs::JobTracker> getJobTracker() const { return tracker_; }

private:
    // ========== Storage ==========
    std::shared_ptr<core::store::JobStore> store_;

    // ========== Ingestion ==========
    std::shared_ptr<core::ingest::IngestionPipeline> pipeline_;
    std::shared_ptr<core::watch::DirectoryWatcher> watcher_;

    // ========== Tracking ==========
    std::shared_ptr<core::jobs::JobTracker> tracker_;

    // ========== Operator channel ==========
    std::shared_ptr<connector::controllers::CommandController> commandController_;

    // ========== Monitoring ==========
    std::unique_ptr<SystemMonitor> monitor_;

    // ========== State Management ==========
    std::atomic<bool> isRunning_;
    std::atomic<bool> initializationComplete_;

    bool loadConfiguration(const std::string &configPath);

    void initializeLogger();

    bool initializeStore();

    void initializeIngestion();

    bool initializeWatcher();

    void initializeCommandChannel();

    void printInitializationSummary();
};
