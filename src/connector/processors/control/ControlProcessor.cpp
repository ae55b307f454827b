//
// Created by Andrea on 18/10/2026.
//

#include "connector/processors/control/ControlProcessor.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <utility>

namespace connector::processors::control {
    using models::control::ControlResponse;
    using core::types::Result;

    ControlProcessor::ControlProcessor(std::shared_ptr<core::jobs::JobTracker> tracker)
        : tracker_(std::move(tracker)) {
    }

    ControlResponse ControlProcessor::processMessage(const std::string &message) const {
        ControlResponse response;
        try {
            nlohmann::json json = nlohmann::json::parse(message);
            if (!json.is_object()) {
                return ControlResponse::error("Request must be a JSON object");
            }

            const std::string type = json.value("type", std::string());
            if (type == "job") {
                response = processJobRequest(models::control::JobRequest(json));
            } else if (type == "roll") {
                response = processRollRequest(models::control::RollControlRequest(json));
            } else {
                response = ControlResponse::error("Unknown request type '" + type + "'");
            }
        } catch (const nlohmann::json::exception &e) {
            Logger::logWarning("[ControlProcessor] Malformed request: " + std::string(e.what()));
            response = ControlResponse::error("Malformed request: " + std::string(e.what()));
        }
        return response;
    }

    ControlResponse ControlProcessor::processJobRequest(const models::control::JobRequest &request) const {
        if (!request.isValid()) {
            Logger::logWarning("[ControlProcessor] Invalid job request: " + request.command);
            return ControlResponse::error("Invalid job request '" + request.command + "'");
        }

        Logger::logInfo("[ControlProcessor] Job request: " + request.command +
                        (request.jobId > 0 ? " " + std::to_string(request.jobId) : ""));

        try {
            if (request.command == "add") {
                int64_t jobId = 0;
                auto result = tracker_->addJob(request.fields, jobId);
                nlohmann::json data = nlohmann::json::object();
                if (result.isSuccess()) data["jobId"] = jobId;
                return ControlResponse::fromResult(result, data);
            }

            if (request.command == "update") {
                return ControlResponse::fromResult(tracker_->updateJob(request.jobId, request.fields));
            }

            if (request.command == "list") {
                nlohmann::json active = nlohmann::json::array();
                for (const auto &job: tracker_->getActiveJobs()) active.push_back(jobToJson(job));
                nlohmann::json completed = nlohmann::json::array();
                for (const auto &job: tracker_->getCompletedJobs()) completed.push_back(jobToJson(job));

                return ControlResponse::fromResult(
                    Result::success(std::to_string(active.size()) + " active, " +
                                    std::to_string(completed.size()) + " completed"),
                    nlohmann::json{{"active", active}, {"completed", completed}});
            }

            if (request.command == "open") {
                auto coordinator = tracker_->openJob(request.jobId);
                if (!coordinator) {
                    return ControlResponse::fromResult(
                        Result::notFound("Job " + std::to_string(request.jobId) + " does not exist"));
                }
                return ControlResponse::fromResult(Result::success("Job " + std::to_string(request.jobId) + " open"),
                                                   describeOpenJob(*coordinator));
            }

            if (request.command == "close") {
                if (!tracker_->closeJob(request.jobId)) {
                    return ControlResponse::fromResult(
                        Result::notFound("Job " + std::to_string(request.jobId) + " is not open"));
                }
                return ControlResponse::fromResult(Result::success("Job " + std::to_string(request.jobId) + " closed"));
            }

            if (request.command == "complete") {
                auto coordinator = tracker_->openJob(request.jobId);
                if (!coordinator) {
                    return ControlResponse::fromResult(
                        Result::notFound("Job " + std::to_string(request.jobId) + " does not exist"));
                }
                auto result = coordinator->completeJob(request.confirm);
                return ControlResponse::fromResult(result, describeOpenJob(*coordinator));
            }

            // status
            nlohmann::json data;
            if (auto coordinator = tracker_->getCoordinator(request.jobId)) {
                data = describeOpenJob(*coordinator);
            } else {
                auto job = tracker_->getJobRecord(request.jobId);
                if (!job) {
                    return ControlResponse::fromResult(
                        Result::notFound("Job " + std::to_string(request.jobId) + " does not exist"));
                }
                data = nlohmann::json{{"job", jobToJson(*job)}, {"open", false}};
            }

            nlohmann::json history = nlohmann::json::array();
            for (const auto &action: tracker_->getRollHistory(request.jobId)) {
                history.push_back({
                    {"rollNumber", action.rollNumber},
                    {"action", action.action},
                    {"note", action.note},
                    {"timestamp", action.timestamp}
                });
            }
            data["history"] = history;
            return ControlResponse::fromResult(Result::success("Job " + std::to_string(request.jobId)), data);
        } catch (const core::types::StoreException &e) {
            Logger::logError("[ControlProcessor] Job request " + request.command + " failed: " + e.what());
            return ControlResponse::error(e.what());
        }
    }

    ControlResponse ControlProcessor::processRollRequest(const models::control::RollControlRequest &request) const {
        if (!request.isValid()) {
            Logger::logWarning("[ControlProcessor] Invalid roll request: " + request.command);
            return ControlResponse::error("Invalid roll request '" + request.command + "'");
        }

        auto coordinator = tracker_->getCoordinator(request.jobId);
        if (!coordinator) {
            return ControlResponse::fromResult(Result::notFound("Job " + std::to_string(request.jobId) + " is not open"));
        }

        Logger::logInfo("[ControlProcessor] Roll request: " + request.command + " job " +
                        std::to_string(request.jobId) + " roll " + std::to_string(request.rollNumber));

        Result result = Result::error("Unhandled roll command");
        if (request.command == "start") {
            result = coordinator->startRoll(request.rollNumber);
        } else if (request.command == "pause") {
            result = coordinator->pauseRoll(request.rollNumber);
        } else if (request.command == "resume") {
            result = coordinator->resumeRoll(request.rollNumber);
        } else if (request.command == "stop") {
            result = coordinator->stopRoll(request.rollNumber, request.confirm);
        } else if (request.command == "note") {
            result = coordinator->submitNote(request.rollNumber, request.note);
        } else if (request.command == "draft") {
            result = coordinator->setNoteDraft(request.rollNumber, request.note);
        } else if (request.command == "discard") {
            result = coordinator->discardNote(request.rollNumber);
        }

        nlohmann::json data = nlohmann::json::object();
        if (auto roll = coordinator->getRollSnapshot(request.rollNumber)) {
            data["roll"] = rollToJson(*roll);
        }
        return ControlResponse::fromResult(result, data);
    }

    nlohmann::json ControlProcessor::describeOpenJob(const core::jobs::JobCoordinator &coordinator) const {
        nlohmann::json rolls = nlohmann::json::array();
        for (const auto &roll: coordinator.getRollSnapshots()) {
            rolls.push_back(rollToJson(roll));
        }

        nlohmann::json data{
            {"job", jobToJson(coordinator.getJob())},
            {"open", true},
            {"rolls", rolls}
        };
        auto running = coordinator.getRunningRoll();
        data["runningRoll"] = running ? nlohmann::json(*running) : nlohmann::json(nullptr);
        return data;
    }

    nlohmann::json jobToJson(const core::jobs::Job &job) {
        return nlohmann::json{
            {"id", job.id},
            {"customer", job.customer},
            {"ticket", job.ticket},
            {"inlayType", job.inlayType},
            {"quantity", job.quantity},
            {"labelsPerRoll", job.labelsPerRoll},
            {"printerName", job.printerName},
            {"createdAt", job.createdAt},
            {"completed", job.completed},
            {"totalRolls", job.totalRolls()}
        };
    }

    nlohmann::json rollToJson(const core::jobs::RollSnapshot &roll) {
        nlohmann::json notes = nlohmann::json::array();
        for (const auto &note: roll.notes) {
            notes.push_back({{"timestamp", note.timestamp}, {"progress", note.progressAtTime}, {"text", note.text}});
        }

        return nlohmann::json{
            {"rollNumber", roll.rollNumber},
            {"state", core::jobs::rollStateToCode(roll.state)},
            {"labelsGoal", roll.labelsGoal},
            {"progress", roll.progress},
            {"deltaPass", roll.deltaPass},
            {"deltaFail", roll.deltaFail},
            {"baselinePass", roll.baselinePass ? nlohmann::json(*roll.baselinePass) : nlohmann::json(nullptr)},
            {"baselineFail", roll.baselineFail ? nlohmann::json(*roll.baselineFail) : nlohmann::json(nullptr)},
            {"noteEntryOpen", roll.noteEntryOpen},
            {"noteDraft", roll.noteDraft},
            {"notes", notes}
        };
    }
}
