//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/jobs/Job.hpp"

namespace core::store {
    namespace actions {
        constexpr const char *START = "start";
        constexpr const char *RESUME = "resume";
        constexpr const char *STOP = "stop";
        constexpr const char *COMPLETED = "completed";
        constexpr const char *PAUSE_NOTE = "pause note";
        constexpr const char *JOB_COMPLETED = "job completed";
    }

    struct RollActionRecord {
        int64_t id = 0;
        int64_t jobId = 0;
        int64_t rollNumber = 0; // 0 for job-level actions
        std::string action;
        std::string note;
        std::string timestamp;
    };

    /**
     * @brief Durable home of jobs and of the append-only roll action log.
     *
     * Every operation is synchronous and throws core::types::StoreException on failure.
     */
    class JobStore {
    public:
        virtual ~JobStore() = default;

        virtual int64_t addJob(const jobs::JobFields &fields) = 0;

        virtual std::vector<jobs::Job> getActiveJobs() = 0;

        virtual std::vector<jobs::Job> getCompletedJobs() = 0;

        virtual std::optional<jobs::Job> getJob(int64_t jobId) = 0;

        virtual void updateJob(int64_t jobId, const jobs::JobFields &fields) = 0;

        virtual void updateJobCompletion(int64_t jobId, bool completed) = 0;

        virtual void logRollAction(int64_t jobId, int64_t rollNumber, const std::string &action,
                                   const std::string &note = "") = 0;

        virtual std::vector<RollActionRecord> getRollActions(int64_t jobId) = 0;
    };
} // namespace core::store
