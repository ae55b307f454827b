//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/ingest/LogEvent.hpp"
#include "core/jobs/Job.hpp"
#include "core/jobs/Roll.hpp"
#include "core/store/JobStore.hpp"
#include "core/types/Result.hpp"

namespace core::jobs {
    /**
     * @brief Rolls of one open job.
     *
     * Rolls are numbered 1..ceil(quantity / labelsPerRoll) and created on first
     * use. At most one roll runs at a time; counters updates for the job's
     * printer go to that roll. All methods are thread safe (one lock per job).
     */
    class JobCoordinator {
    public:
        JobCoordinator(Job job, std::shared_ptr<store::JobStore> store);

        int64_t getJobId() const { return job_.id; }

        std::string getPrinterName() const;

        Job getJob() const;

        int64_t getTotalRolls() const { return totalRolls_; }

        bool isCompleted() const;

        // Roll control
        types::Result startRoll(int64_t rollNumber);

        types::Result pauseRoll(int64_t rollNumber);

        types::Result resumeRoll(int64_t rollNumber);

        types::Result stopRoll(int64_t rollNumber, bool confirmed);

        types::Result setNoteDraft(int64_t rollNumber, const std::string &text);

        types::Result submitNote(int64_t rollNumber, const std::string &text);

        types::Result discardNote(int64_t rollNumber);

        /**
         * @brief Forward the cumulative counters of printerId to the running roll
         * @return Skip when the printer is not the job's or no roll is running
         */
        types::Result routeUpdate(const std::string &printerId, const ingest::PrinterCounters &cumulative);

        types::Result completeJob(bool confirmed);

        std::optional<int64_t> getRunningRoll() const;

        std::optional<RollSnapshot> getRollSnapshot(int64_t rollNumber) const;

        std::vector<RollSnapshot> getRollSnapshots() const;

    private:
        mutable std::mutex mutex_;
        Job job_;
        int64_t totalRolls_;
        std::shared_ptr<store::JobStore> store_;
        std::map<int64_t, Roll> rolls_;

        Roll *findRoll(int64_t rollNumber);

        Roll makeRoll(int64_t rollNumber) const;

        std::optional<int64_t> runningRollLocked() const;

        types::Result rollNotFound(int64_t rollNumber) const;
    };
} // namespace core::jobs
