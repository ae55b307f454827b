#include "application/controllers/ApplicationController.hpp"
#include "logger/Logger.hpp"
#include <chrono>
#include <csignal>
#include <string>
#include <atomic>
#include <condition_variable>
#include <mutex>

// Global shutdown mechanism
std::atomic<bool> running{true};
std::condition_variable shutdownCondition;
std::mutex shutdownMutex;

void handleSignal(int) {
    running = false;
    shutdownCondition.notify_all();
}

void waitForShutdownSignal() {
    std::unique_lock<std::mutex> lock(shutdownMutex);
    // Signals cannot lock the mutex, so re-check periodically
    while (running.load()) {
        shutdownCondition.wait_for(lock, std::chrono::milliseconds(500));
    }
}

int main(int argc, char *argv[]) {
    const std::string configPath = argc > 1 ? argv[1] : "config.json";

    try {
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        ApplicationController app;
        if (!app.initialize(configPath)) {
            Logger::logError("Application initialization failed");
            app.shutdown();
            Logger::shutdown();
            return 1;
        }

        // Wait for shutdown signal
        waitForShutdownSignal();
        Logger::logInfo("Received shutdown signal");

        app.shutdown();
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        Logger::shutdown();
        return 1;
    }

    Logger::shutdown();
    return 0;
}
