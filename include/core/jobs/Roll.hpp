//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/ingest/LogEvent.hpp"
#include "core/jobs/RollState.hpp"
#include "core/store/JobStore.hpp"
#include "core/types/Result.hpp"

namespace core::jobs {
    struct RollNote {
        std::string timestamp;
        int64_t progressAtTime = 0;
        std::string text;
    };

    struct RollSnapshot {
        int64_t jobId = 0;
        int64_t rollNumber = 0;
        RollState state = RollState::Idle;
        int64_t labelsGoal = 0;
        int64_t progress = 0;
        int64_t deltaPass = 0;
        int64_t deltaFail = 0;
        std::optional<int64_t> baselinePass;
        std::optional<int64_t> baselineFail;
        std::vector<RollNote> notes;
        bool noteEntryOpen = false;
        std::string noteDraft;
    };

    /**
     * @brief Progress state machine of one roll of a job.
     *
     * Progress is the pass count since the baseline captured on the first
     * counters update after start. Not synchronized: the owning JobCoordinator
     * serializes access.
     */
    class Roll {
    public:
        Roll(int64_t jobId, int64_t rollNumber, int64_t labelsGoal, std::shared_ptr<store::JobStore> store);

        // Operator transitions
        types::Result start();

        types::Result pause();

        types::Result resume();

        types::Result stop(bool confirmed);

        /**
         * @brief Feed the cumulative counters of the job's printer.
         *
         * Skip unless Running. The first update after start only records the
         * baseline. Reaching the goal completes the roll.
         */
        types::Result updateProgress(const ingest::PrinterCounters &cumulative);

        // Pause notes
        types::Result setNoteDraft(const std::string &text);

        types::Result submitNote(const std::string &text);

        types::Result discardNote();

        RollState getState() const { return state_; }

        int64_t getRollNumber() const { return rollNumber_; }

        int64_t getProgress() const { return progress_; }

        bool isRunning() const { return state_ == RollState::Running; }

        RollSnapshot snapshot() const;

    private:
        int64_t jobId_;
        int64_t rollNumber_;
        int64_t labelsGoal_;
        std::shared_ptr<store::JobStore> store_;

        RollState state_ = RollState::Idle;
        std::optional<int64_t> baselinePass_;
        std::optional<int64_t> baselineFail_;
        int64_t deltaPass_ = 0;
        int64_t deltaFail_ = 0;
        int64_t progress_ = 0;
        std::vector<RollNote> notes_;
        bool noteEntryOpen_ = false;
        std::string noteDraft_;

        std::string describe() const;

        types::Result rejected(const std::string &operation) const;

        void record(types::Result &result, const std::string &action, const std::string &note = "");
    };
} // namespace core::jobs
