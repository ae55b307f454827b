//
// Created by Andrea on 27/08/2025.
//

#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "core/events/EventSystem.hpp"
#include "core/jobs/JobCoordinator.hpp"
#include "core/store/JobStore.hpp"
#include "core/types/Result.hpp"

namespace core::jobs {
    /**
     * @brief Registry of the jobs currently open for tracking.
     *
     * Receives COUNTERS_UPDATED from the EventBus and hands each open job the
     * counters of its printer.
     */
    class JobTracker : public events::IEventObserver {
    public:
        explicit JobTracker(std::shared_ptr<store::JobStore> store);

        ~JobTracker() override = default;

        // Job records
        types::Result addJob(const JobFields &fields, int64_t &jobId);

        types::Result updateJob(int64_t jobId, const JobFields &fields);

        std::vector<Job> getActiveJobs() const;

        std::vector<Job> getCompletedJobs() const;

        std::optional<Job> getJobRecord(int64_t jobId) const;

        std::vector<store::RollActionRecord> getRollHistory(int64_t jobId) const;

        // Open jobs
        std::shared_ptr<JobCoordinator> openJob(int64_t jobId);

        bool closeJob(int64_t jobId);

        std::shared_ptr<JobCoordinator> getCoordinator(int64_t jobId) const;

        std::vector<std::shared_ptr<JobCoordinator> > getOpenJobs() const;

        // Counters routing
        void onEvent(const events::Event &event) override;

        size_t routeCounters(const ingest::CountersSnapshot &snapshot);

        struct Statistics {
            size_t openJobs = 0;
            size_t updatesRouted = 0;
            size_t rollsCompleted = 0;
        };

        Statistics getStatistics() const;

    private:
        std::shared_ptr<store::JobStore> store_;

        mutable std::mutex jobsMutex_;
        std::map<int64_t, std::shared_ptr<JobCoordinator> > jobs_;

        std::atomic<size_t> updatesRouted_{0};
        std::atomic<size_t> rollsCompleted_{0};
    };
} // namespace core::jobs
