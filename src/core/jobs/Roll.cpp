//
// Created by Andrea on 18/10/2026.
//

#include "core/jobs/Roll.hpp"
#include "core/utils/Time.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <exception>
#include <utility>

namespace core::jobs {
    namespace {
        std::string trim(const std::string &value) {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) return "";
            const auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, last - first + 1);
        }
    }

    Roll::Roll(int64_t jobId, int64_t rollNumber, int64_t labelsGoal, std::shared_ptr<store::JobStore> store)
        : jobId_(jobId), rollNumber_(rollNumber), labelsGoal_(labelsGoal), store_(std::move(store)) {
    }

    types::Result Roll::start() {
        if (state_ != RollState::Idle) {
            return rejected("start");
        }

        state_ = RollState::Running;
        baselinePass_.reset();
        baselineFail_.reset();
        deltaPass_ = 0;
        deltaFail_ = 0;
        progress_ = 0;

        auto result = types::Result::success("Roll " + std::to_string(rollNumber_) + " started");
        record(result, store::actions::START);
        Logger::logInfo("[Roll] " + describe() + " started, goal " + std::to_string(labelsGoal_));
        return result;
    }

    types::Result Roll::pause() {
        if (state_ != RollState::Running) {
            return rejected("pause");
        }

        state_ = RollState::Paused;
        noteEntryOpen_ = true;
        noteDraft_.clear();

        Logger::logInfo("[Roll] " + describe() + " paused at " + std::to_string(progress_));
        // Nothing is recorded until the note is submitted or discarded
        return types::Result::success("Roll " + std::to_string(rollNumber_) + " paused");
    }

    types::Result Roll::resume() {
        if (state_ != RollState::Paused) {
            return rejected("resume");
        }

        state_ = RollState::Running;
        noteEntryOpen_ = false;
        noteDraft_.clear();

        auto result = types::Result::success("Roll " + std::to_string(rollNumber_) + " resumed");
        record(result, store::actions::RESUME);
        Logger::logInfo("[Roll] " + describe() + " resumed");
        return result;
    }

    types::Result Roll::stop(bool confirmed) {
        if (state_ != RollState::Running && state_ != RollState::Paused) {
            return rejected("stop");
        }
        if (!confirmed) {
            return types::Result::confirmationRequired(
                "Stopping roll " + std::to_string(rollNumber_) + " cannot be undone");
        }

        state_ = RollState::Stopped;
        noteEntryOpen_ = false;
        noteDraft_.clear();

        auto result = types::Result::success("Roll " + std::to_string(rollNumber_) + " stopped");
        record(result, store::actions::STOP);
        Logger::logInfo("[Roll] " + describe() + " stopped at " + std::to_string(progress_));
        return result;
    }

    types::Result Roll::updateProgress(const ingest::PrinterCounters &cumulative) {
        if (state_ != RollState::Running) {
            return types::Result::skip("Roll " + std::to_string(rollNumber_) + " is " + rollStateToCode(state_));
        }

        if (!baselinePass_ || !baselineFail_) {
            baselinePass_ = cumulative.cumulativePass;
            baselineFail_ = cumulative.cumulativeFail;
            Logger::logDebug("[Roll] " + describe() + " baseline pass=" + std::to_string(*baselinePass_) +
                             " fail=" + std::to_string(*baselineFail_));
            return types::Result::success("Baseline captured");
        }

        deltaPass_ = cumulative.cumulativePass - *baselinePass_;
        deltaFail_ = cumulative.cumulativeFail - *baselineFail_;
        progress_ = std::max<int64_t>(0, std::min(deltaPass_, labelsGoal_));

        if (progress_ < labelsGoal_) {
            return types::Result::success("Progress " + std::to_string(progress_) + "/" + std::to_string(labelsGoal_));
        }

        state_ = RollState::Completed;
        noteEntryOpen_ = false;
        noteDraft_.clear();

        auto result = types::Result::success("Roll " + std::to_string(rollNumber_) + " completed");
        record(result, store::actions::COMPLETED, "Roll complete");
        Logger::logInfo("[Roll] " + describe() + " completed (" + std::to_string(deltaFail_) + " failed labels)");
        return result;
    }

    types::Result Roll::setNoteDraft(const std::string &text) {
        if (state_ != RollState::Paused || !noteEntryOpen_) {
            return rejected("edit note");
        }
        noteDraft_ = text;
        return types::Result::success("Draft saved");
    }

    types::Result Roll::submitNote(const std::string &text) {
        if (state_ != RollState::Paused) {
            return rejected("add note");
        }

        const std::string trimmed = trim(text);
        if (trimmed.empty()) {
            return types::Result::error("Note text is empty");
        }

        RollNote note{utils::displayTimestamp(), progress_, trimmed};
        const std::string logged = "[" + note.timestamp + "] Paused at " + std::to_string(progress_) + ": " + trimmed;
        notes_.push_back(std::move(note));
        noteDraft_.clear();

        auto result = types::Result::success("Note added to roll " + std::to_string(rollNumber_));
        record(result, store::actions::PAUSE_NOTE, logged);
        return result;
    }

    types::Result Roll::discardNote() {
        if (state_ != RollState::Paused) {
            return rejected("discard note");
        }
        noteDraft_.clear();
        noteEntryOpen_ = false;
        return types::Result::success("Note discarded");
    }

    RollSnapshot Roll::snapshot() const {
        RollSnapshot snap;
        snap.jobId = jobId_;
        snap.rollNumber = rollNumber_;
        snap.state = state_;
        snap.labelsGoal = labelsGoal_;
        snap.progress = progress_;
        snap.deltaPass = deltaPass_;
        snap.deltaFail = deltaFail_;
        snap.baselinePass = baselinePass_;
        snap.baselineFail = baselineFail_;
        snap.notes = notes_;
        snap.noteEntryOpen = noteEntryOpen_;
        snap.noteDraft = noteDraft_;
        return snap;
    }

    std::string Roll::describe() const {
        return "job " + std::to_string(jobId_) + " roll " + std::to_string(rollNumber_);
    }

    types::Result Roll::rejected(const std::string &operation) const {
        Logger::logWarning("[Roll] Cannot " + operation + " " + describe() + " in state " + rollStateToCode(state_));
        return types::Result::invalidTransition(
            "Cannot " + operation + " roll " + std::to_string(rollNumber_) + " while " + rollStateToCode(state_));
    }

    void Roll::record(types::Result &result, const std::string &action, const std::string &note) {
        if (!store_) return;
        try {
            store_->logRollAction(jobId_, rollNumber_, action, note);
        } catch (const std::exception &e) {
            Logger::logError("[Roll] Failed to record '" + action + "' for " + describe() + ": " + e.what());
            result.withWarning("Action '" + action + "' was not recorded: " + e.what());
        }
    }
} // namespace core::jobs
