#include "application/monitor/SystemMonitor.hpp"
#include "logger/Logger.hpp"
#include <utility>

SystemMonitor::SystemMonitor(std::shared_ptr<core::watch::DirectoryWatcher> watcher,
                             std::shared_ptr<core::ingest::IngestionPipeline> pipeline,
                             std::shared_ptr<core::jobs::JobTracker> tracker,
                             std::shared_ptr<connector::controllers::CommandController> commandController,
                             std::chrono::seconds reportInterval)
        : watcher_(std::move(watcher)),
          pipeline_(std::move(pipeline)),
          tracker_(std::move(tracker)),
          commandController_(std::move(commandController)),
          reportInterval_(reportInterval) {
}

SystemMonitor::~SystemMonitor() {
    stop();
}

void SystemMonitor::start() {
    if (running_) {
        Logger::logWarning("[SystemMonitor] Already running");
        return;
    }

    running_ = true;
    monitorThread_ = std::thread([this]() {
        try {
            monitorLoop();
        } catch (const std::exception &e) {
            Logger::logError("[SystemMonitor] Monitor thread crashed: " + std::string(e.what()));
        }
    });

    Logger::logInfo("[SystemMonitor] Started");
}

void SystemMonitor::stop() {
    if (!running_) return;

    running_ = false;
    if (monitorThread_.joinable()) {
        monitorThread_.join();
    }

    Logger::logInfo("[SystemMonitor] Stopped");
}

bool SystemMonitor::isRunning() const {
    return running_;
}

void SystemMonitor::monitorLoop() {
    Logger::logInfo("[SystemMonitor] Monitor loop started");
    long long elapsed = 0;

    while (running_) {
        try {
            if (++elapsed >= reportInterval_.count()) {
                reportStatus();
                elapsed = 0;
            }
        } catch (const std::exception &e) {
            Logger::logError("[SystemMonitor] Loop error: " + std::string(e.what()));
        }

        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
}

void SystemMonitor::reportStatus() const {
    Logger::logInfo("[SystemMonitor] ===== System Status Report =====");

    if (watcher_) {
        auto stats = watcher_->getStatistics();
        Logger::logInfo("[SystemMonitor] Watcher: " + std::string(watcher_->isRunning() ? "RUNNING" : "STOPPED") +
                        " on " + watcher_->getOptions().directory +
                        " | Scans: " + std::to_string(stats.scans) +
                        " | Files: " + std::to_string(stats.filesSeen) +
                        " | Existing: " + std::to_string(stats.existingFiles) +
                        " | Created: " + std::to_string(stats.createdEvents) +
                        " | Modified: " + std::to_string(stats.modifiedEvents) +
                        " | Scan errors: " + std::to_string(stats.scanErrors));
    }

    if (pipeline_) {
        auto stats = pipeline_->getStatistics();
        auto readerStats = pipeline_->getReader()->getStatistics();
        Logger::logInfo("[SystemMonitor] Ingestion: Files tracked: " + std::to_string(readerStats.filesTracked) +
                        " | Rows consumed: " + std::to_string(readerStats.rowsConsumed) +
                        " | Events: " + std::to_string(stats.eventsApplied) +
                        " | Batches: " + std::to_string(stats.batchesPublished) +
                        " | Transient failures: " + std::to_string(readerStats.transientFailures) +
                        " | Shrink anomalies: " + std::to_string(readerStats.shrinkAnomalies));

        for (const auto &[printerId, counters]: pipeline_->getAggregator()->snapshot()) {
            Logger::logInfo("[SystemMonitor]   " + printerId +
                            ": pass=" + std::to_string(counters.cumulativePass) +
                            " fail=" + std::to_string(counters.cumulativeFail));
        }
    }

    if (tracker_) {
        auto stats = tracker_->getStatistics();
        Logger::logInfo("[SystemMonitor] Jobs: Open: " + std::to_string(stats.openJobs) +
                        " | Updates routed: " + std::to_string(stats.updatesRouted) +
                        " | Rolls completed: " + std::to_string(stats.rollsCompleted));

        for (const auto &coordinator: tracker_->getOpenJobs()) {
            auto running = coordinator->getRunningRoll();
            size_t finished = 0;
            for (const auto &roll: coordinator->getRollSnapshots()) {
                if (core::jobs::isTerminal(roll.state)) finished++;
            }
            std::string line = "[SystemMonitor]   Job " + std::to_string(coordinator->getJobId()) +
                               " on " + coordinator->getPrinterName() + " (" + std::to_string(finished) + "/" +
                               std::to_string(coordinator->getTotalRolls()) + " rolls done): ";
            if (running) {
                auto roll = coordinator->getRollSnapshot(*running);
                line += "roll " + std::to_string(*running) + " RUN " +
                        std::to_string(roll ? roll->progress : 0) + "/" + std::to_string(roll ? roll->labelsGoal : 0);
            } else {
                line += coordinator->isCompleted() ? "completed" : "no running roll";
            }
            Logger::logInfo(line);
        }
    }

    if (commandController_) {
        auto stats = commandController_->getStatistics();
        Logger::logInfo("[SystemMonitor] Commands: " +
                        std::string(commandController_->isRunning() ? "LISTENING" : "CLOSED") +
                        " | Requests: " + std::to_string(stats.requests) +
                        " | Failed: " + std::to_string(stats.failedRequests));
    }

    Logger::logInfo("[SystemMonitor] ================================");
}
