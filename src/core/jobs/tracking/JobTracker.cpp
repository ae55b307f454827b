//
// Created by Andrea on 27/08/2025.
//

#include "core/jobs/tracking/JobTracker.hpp"
#include "logger/Logger.hpp"
#include <utility>

namespace core::jobs {
    JobTracker::JobTracker(std::shared_ptr<store::JobStore> store) : store_(std::move(store)) {
    }

    types::Result JobTracker::addJob(const JobFields &fields, int64_t &jobId) {
        auto errors = fields.validate();
        if (!errors.empty()) {
            types::Result result = types::Result::error("Invalid job: " + errors.front());
            result.body = errors;
            return result;
        }

        jobId = store_->addJob(fields.normalized());
        Logger::logInfo("[JobTracker] Created job " + std::to_string(jobId) + " for " + fields.customer +
                        " (" + fields.ticket + ")");
        return types::Result::success("Job " + std::to_string(jobId) + " created");
    }

    types::Result JobTracker::updateJob(int64_t jobId, const JobFields &fields) {
        auto errors = fields.validate();
        if (!errors.empty()) {
            types::Result result = types::Result::error("Invalid job: " + errors.front());
            result.body = errors;
            return result;
        }
        if (!store_->getJob(jobId)) {
            return types::Result::notFound("Job " + std::to_string(jobId) + " does not exist");
        }

        store_->updateJob(jobId, fields.normalized());
        Logger::logInfo("[JobTracker] Updated job " + std::to_string(jobId));

        types::Result result = types::Result::success("Job " + std::to_string(jobId) + " updated");
        if (getCoordinator(jobId)) {
            result.withWarning("Job is open: reopen it to track the new roll layout");
        }
        return result;
    }

    std::vector<Job> JobTracker::getActiveJobs() const {
        return store_->getActiveJobs();
    }

    std::vector<Job> JobTracker::getCompletedJobs() const {
        return store_->getCompletedJobs();
    }

    std::optional<Job> JobTracker::getJobRecord(int64_t jobId) const {
        return store_->getJob(jobId);
    }

    std::vector<store::RollActionRecord> JobTracker::getRollHistory(int64_t jobId) const {
        return store_->getRollActions(jobId);
    }

    std::shared_ptr<JobCoordinator> JobTracker::openJob(int64_t jobId) {
        if (auto existing = getCoordinator(jobId)) {
            return existing;
        }

        auto job = store_->getJob(jobId);
        if (!job) {
            Logger::logWarning("[JobTracker] Job " + std::to_string(jobId) + " not found");
            return nullptr;
        }

        std::lock_guard<std::mutex> lock(jobsMutex_);
        // Another caller may have opened it while we were reading the store
        auto it = jobs_.find(jobId);
        if (it != jobs_.end()) {
            return it->second;
        }

        auto coordinator = std::make_shared<JobCoordinator>(std::move(*job), store_);
        jobs_.emplace(jobId, coordinator);
        return coordinator;
    }

    bool JobTracker::closeJob(int64_t jobId) {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        if (jobs_.erase(jobId) == 0) {
            return false;
        }
        Logger::logInfo("[JobTracker] Closed job " + std::to_string(jobId));
        return true;
    }

    std::shared_ptr<JobCoordinator> JobTracker::getCoordinator(int64_t jobId) const {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        auto it = jobs_.find(jobId);
        return it != jobs_.end() ? it->second : nullptr;
    }

    std::vector<std::shared_ptr<JobCoordinator> > JobTracker::getOpenJobs() const {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        std::vector<std::shared_ptr<JobCoordinator> > open;
        open.reserve(jobs_.size());
        for (const auto &[id, coordinator]: jobs_) {
            open.push_back(coordinator);
        }
        return open;
    }

    void JobTracker::onEvent(const events::Event &event) {
        if (event.type != events::EventType::COUNTERS_UPDATED) return;
        routeCounters(event.counters);
    }

    size_t JobTracker::routeCounters(const ingest::CountersSnapshot &snapshot) {
        size_t routed = 0;

        for (const auto &coordinator: getOpenJobs()) {
            auto counters = snapshot.find(coordinator->getPrinterName());
            if (counters == snapshot.end()) continue;

            auto running = coordinator->getRunningRoll();
            if (!running) continue;

            auto result = coordinator->routeUpdate(counters->first, counters->second);
            if (!result.isSuccess()) continue;
            routed++;

            auto roll = coordinator->getRollSnapshot(*running);
            if (roll && roll->state == RollState::Completed) {
                rollsCompleted_++;
            }
            for (const auto &warning: result.body) {
                Logger::logWarning("[JobTracker] Job " + std::to_string(coordinator->getJobId()) + ": " + warning);
            }
        }

        updatesRouted_ += routed;
        return routed;
    }

    JobTracker::Statistics JobTracker::getStatistics() const {
        Statistics stats;
        {
            std::lock_guard<std::mutex> lock(jobsMutex_);
            stats.openJobs = jobs_.size();
        }
        stats.updatesRouted = updatesRouted_.load();
        stats.rollsCompleted = rollsCompleted_.load();
        return stats;
    }
} // namespace core::jobs
