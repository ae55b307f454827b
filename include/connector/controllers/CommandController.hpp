//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include "../events/console/ConsoleCommandReceiver.hpp"
#include "../processors/control/ControlProcessor.hpp"
#include "core/jobs/tracking/JobTracker.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>

namespace connector::controllers {
    /**
     * @brief Operator command channel: request lines in, one JSON response line out per request
     */
    class CommandController {
    public:
        CommandController(std::shared_ptr<core::jobs::JobTracker> tracker,
                          std::shared_ptr<events::BaseReceiver> receiver,
                          std::ostream &output);

        ~CommandController();

        void start();

        void stop();

        bool isRunning() const;

        struct Statistics {
            size_t requests = 0;
            size_t failedRequests = 0;
        };

        Statistics getStatistics() const;

    private:
        std::shared_ptr<core::jobs::JobTracker> tracker_;
        std::shared_ptr<events::BaseReceiver> receiver_;
        std::shared_ptr<processors::control::ControlProcessor> processor_;

        std::ostream &output_;
        std::mutex outputMutex_;

        std::atomic<size_t> requests_{0};
        std::atomic<size_t> failedRequests_{0};
        std::atomic<bool> running_{false};

        void onMessageReceived(const std::string &message);
    };
}
