//
// Created by Andrea on 23/08/2025.
//

#pragma once

#include "connector/controllers/CommandController.hpp"
#include "core/ingest/IngestionPipeline.hpp"
#include "core/jobs/tracking/JobTracker.hpp"
#include "core/watch/DirectoryWatcher.hpp"
#include <chrono>
#include <memory>
#include <thread>
#include <atomic>

class SystemMonitor {
public:
    SystemMonitor(std::shared_ptr<core::watch::DirectoryWatcher> watcher,
                  std::shared_ptr<core::ingest::IngestionPipeline> pipeline,
                  std::shared_ptr<core::jobs::JobTracker> tracker,
                  std::shared_ptr<connector::controllers::CommandController> commandController,
                  std::chrono::seconds reportInterval = std::chrono::seconds(30));

    ~SystemMonitor();

    void start();

    void stop();

    bool isRunning() const;

    void reportStatus() const;

private:
    std::atomic<bool> running_{false};
    std::thread monitorThread_;

    std::shared_ptr<core::watch::DirectoryWatcher> watcher_;
    std::shared_ptr<core::ingest::IngestionPipeline> pipeline_;
    std::shared_ptr<core::jobs::JobTracker> tracker_;
    std::shared_ptr<connector::controllers::CommandController> commandController_;
    std::chrono::seconds reportInterval_;

    void monitorLoop();
};
