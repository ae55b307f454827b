//
// Created by Andrea on 18/10/2026.
//

#include "connector/controllers/CommandController.hpp"
#include "connector/models/control/ControlResponse.hpp"
#include "logger/Logger.hpp"
#include <utility>

namespace connector::controllers {
    CommandController::CommandController(std::shared_ptr<core::jobs::JobTracker> tracker,
                                         std::shared_ptr<events::BaseReceiver> receiver,
                                         std::ostream &output)
        : tracker_(std::move(tracker)), receiver_(std::move(receiver)), output_(output) {
        processor_ = std::make_shared<processors::control::ControlProcessor>(tracker_);

        receiver_->setMessageCallback([this](const std::string &message) {
            onMessageReceived(message);
        });

        Logger::logInfo("[CommandController] Created with " + receiver_->getReceiverName());
    }

    CommandController::~CommandController() {
        stop();
    }

    void CommandController::start() {
        if (running_) {
            Logger::logWarning("[CommandController] Already running");
            return;
        }

        if (!processor_->isReady()) {
            Logger::logError("[CommandController] Cannot start - processor not ready");
            return;
        }

        receiver_->startReceiving();
        running_ = true;
        Logger::logInfo("[CommandController] Started successfully");
    }

    void CommandController::stop() {
        if (!running_) return;
        running_ = false;

        receiver_->stopReceiving();
        Logger::logInfo("[CommandController] Stopped");
    }

    bool CommandController::isRunning() const {
        return running_ && receiver_->isReceiving();
    }

    CommandController::Statistics CommandController::getStatistics() const {
        Statistics stats;
        stats.requests = requests_.load();
        stats.failedRequests = failedRequests_.load();
        return stats;
    }

    void CommandController::onMessageReceived(const std::string &message) {
        requests_++;

        models::control::ControlResponse response;
        try {
            response = processor_->processMessage(message);
        } catch (const std::exception &e) {
            Logger::logError("[CommandController] Request failed: " + std::string(e.what()));
            response = models::control::ControlResponse::error(e.what());
        }

        if (!response.ok) {
            failedRequests_++;
        }

        std::lock_guard<std::mutex> lock(outputMutex_);
        output_ << response.toJson().dump() << std::endl;
    }
}
