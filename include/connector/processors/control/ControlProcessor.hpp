#pragma once

#include "../BaseProcessor.hpp"
#include "../../models/control/ControlResponse.hpp"
#include "../../models/control/JobRequest.hpp"
#include "../../models/control/RollControlRequest.hpp"
#include "core/jobs/tracking/JobTracker.hpp"
#include <memory>
#include <string>

namespace connector::processors::control {
    /**
     * @brief Executes operator requests against the job tracker.
     *
     * Never throws: malformed input and store failures come back as error responses.
     */
    class ControlProcessor : public BaseProcessor {
    public:
        explicit ControlProcessor(std::shared_ptr<core::jobs::JobTracker> tracker);

        /**
         * @brief Parse one JSON request line and execute it
         */
        models::control::ControlResponse processMessage(const std::string &message) const;

        models::control::ControlResponse processJobRequest(const models::control::JobRequest &request) const;

        models::control::ControlResponse processRollRequest(const models::control::RollControlRequest &request) const;

        std::string getProcessorName() const override {
            return "ControlProcessor";
        }

        bool isReady() const override {
            return tracker_ != nullptr;
        }

    private:
        std::shared_ptr<core::jobs::JobTracker> tracker_;

        nlohmann::json describeOpenJob(const core::jobs::JobCoordinator &coordinator) const;
    };

    nlohmann::json jobToJson(const core::jobs::Job &job);

    nlohmann::json rollToJson(const core::jobs::RollSnapshot &roll);
}
