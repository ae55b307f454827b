//
// Created by Andrea on 18/10/2026.
//

#include "core/jobs/JobCoordinator.hpp"
#include "logger/Logger.hpp"
#include <exception>
#include <utility>

namespace core::jobs {
    JobCoordinator::JobCoordinator(Job job, std::shared_ptr<store::JobStore> store)
        : job_(std::move(job)), totalRolls_(job_.totalRolls()), store_(std::move(store)) {
        Logger::logInfo("[JobCoordinator] Opened job " + std::to_string(job_.id) + " (" + job_.ticket + ") on " +
                        job_.printerName + ", " + std::to_string(totalRolls_) + " rolls");
    }

    std::string JobCoordinator::getPrinterName() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return job_.printerName;
    }

    Job JobCoordinator::getJob() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return job_;
    }

    bool JobCoordinator::isCompleted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return job_.completed;
    }

    types::Result JobCoordinator::startRoll(int64_t rollNumber) {
        std::lock_guard<std::mutex> lock(mutex_);

        Roll *roll = findRoll(rollNumber);
        if (!roll) return rollNotFound(rollNumber);

        if (job_.completed) {
            Logger::logWarning("[JobCoordinator] Job " + std::to_string(job_.id) + " is completed, roll " +
                               std::to_string(rollNumber) + " not started");
            return types::Result::invalidTransition("Job " + std::to_string(job_.id) + " is already completed");
        }

        auto running = runningRollLocked();
        if (running && *running != rollNumber) {
            return types::Result::invalidTransition("Roll " + std::to_string(*running) + " is already running");
        }

        return roll->start();
    }

    types::Result JobCoordinator::pauseRoll(int64_t rollNumber) {
        std::lock_guard<std::mutex> lock(mutex_);
        Roll *roll = findRoll(rollNumber);
        if (!roll) return rollNotFound(rollNumber);
        return roll->pause();
    }

    types::Result JobCoordinator::resumeRoll(int64_t rollNumber) {
        std::lock_guard<std::mutex> lock(mutex_);

        Roll *roll = findRoll(rollNumber);
        if (!roll) return rollNotFound(rollNumber);

        auto running = runningRollLocked();
        if (running && *running != rollNumber) {
            return types::Result::invalidTransition("Roll " + std::to_string(*running) + " is already running");
        }

        return roll->resume();
    }

    types::Result JobCoordinator::stopRoll(int64_t rollNumber, bool confirmed) {
        std::lock_guard<std::mutex> lock(mutex_);
        Roll *roll = findRoll(rollNumber);
        if (!roll) return rollNotFound(rollNumber);
        return roll->stop(confirmed);
    }

    types::Result JobCoordinator::setNoteDraft(int64_t rollNumber, const std::string &text) {
        std::lock_guard<std::mutex> lock(mutex_);
        Roll *roll = findRoll(rollNumber);
        if (!roll) return rollNotFound(rollNumber);
        return roll->setNoteDraft(text);
    }

    types::Result JobCoordinator::submitNote(int64_t rollNumber, const std::string &text) {
        std::lock_guard<std::mutex> lock(mutex_);
        Roll *roll = findRoll(rollNumber);
        if (!roll) return rollNotFound(rollNumber);
        return roll->submitNote(text);
    }

    types::Result JobCoordinator::discardNote(int64_t rollNumber) {
        std::lock_guard<std::mutex> lock(mutex_);
        Roll *roll = findRoll(rollNumber);
        if (!roll) return rollNotFound(rollNumber);
        return roll->discardNote();
    }

    types::Result JobCoordinator::routeUpdate(const std::string &printerId, const ingest::PrinterCounters &cumulative) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (printerId != job_.printerName) {
            return types::Result::skip("Printer " + printerId + " is not assigned to job " + std::to_string(job_.id));
        }

        auto running = runningRollLocked();
        if (!running) {
            return types::Result::skip("No running roll in job " + std::to_string(job_.id));
        }

        return rolls_.at(*running).updateProgress(cumulative);
    }

    types::Result JobCoordinator::completeJob(bool confirmed) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (job_.completed) {
            return types::Result::invalidTransition("Job " + std::to_string(job_.id) + " is already completed");
        }
        if (!confirmed) {
            return types::Result::confirmationRequired(
                "Marking job " + std::to_string(job_.id) + " complete cannot be undone");
        }

        job_.completed = true;
        auto result = types::Result::success("Job " + std::to_string(job_.id) + " marked as complete");

        if (store_) {
            try {
                store_->updateJobCompletion(job_.id, true);
            } catch (const std::exception &e) {
                Logger::logError("[JobCoordinator] Failed to persist completion of job " +
                                 std::to_string(job_.id) + ": " + e.what());
                result.withWarning(std::string("Completion was not saved: ") + e.what());
            }
            try {
                store_->logRollAction(job_.id, 0, store::actions::JOB_COMPLETED, "Job marked as complete");
            } catch (const std::exception &e) {
                Logger::logError("[JobCoordinator] Failed to record completion of job " +
                                 std::to_string(job_.id) + ": " + e.what());
                result.withWarning(std::string("Action 'job completed' was not recorded: ") + e.what());
            }
        }

        Logger::logInfo("[JobCoordinator] Job " + std::to_string(job_.id) + " completed");
        return result;
    }

    std::optional<int64_t> JobCoordinator::getRunningRoll() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return runningRollLocked();
    }

    std::optional<RollSnapshot> JobCoordinator::getRollSnapshot(int64_t rollNumber) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rollNumber < 1 || rollNumber > totalRolls_) return std::nullopt;

        auto it = rolls_.find(rollNumber);
        if (it != rolls_.end()) return it->second.snapshot();
        return makeRoll(rollNumber).snapshot();
    }

    std::vector<RollSnapshot> JobCoordinator::getRollSnapshots() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<RollSnapshot> result;
        result.reserve(static_cast<size_t>(totalRolls_));
        for (int64_t number = 1; number <= totalRolls_; ++number) {
            auto it = rolls_.find(number);
            result.push_back(it != rolls_.end() ? it->second.snapshot() : makeRoll(number).snapshot());
        }
        return result;
    }

    Roll *JobCoordinator::findRoll(int64_t rollNumber) {
        if (rollNumber < 1 || rollNumber > totalRolls_) return nullptr;

        auto it = rolls_.find(rollNumber);
        if (it == rolls_.end()) {
            it = rolls_.emplace(rollNumber, makeRoll(rollNumber)).first;
        }
        return &it->second;
    }

    Roll JobCoordinator::makeRoll(int64_t rollNumber) const {
        // Every roll, including the last, targets labelsPerRoll
        return Roll(job_.id, rollNumber, job_.labelsPerRoll, store_);
    }

    std::optional<int64_t> JobCoordinator::runningRollLocked() const {
        for (const auto &[number, roll]: rolls_) {
            if (roll.isRunning()) return number;
        }
        return std::nullopt;
    }

    types::Result JobCoordinator::rollNotFound(int64_t rollNumber) const {
        return types::Result::notFound("Job " + std::to_string(job_.id) + " has no roll " +
                                       std::to_string(rollNumber) + " (1-" + std::to_string(totalRolls_) + ")");
    }
} // namespace core::jobs
