#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "TestUtils.hpp"
#include "core/jobs/Roll.hpp"
#include "core/types/Error.hpp"

using namespace core::jobs;
using core::types::ResultCode;
using test_utils::counters;
using test_utils::MockJobStore;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::StartsWith;
using ::testing::Throw;

class RollTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockJobStore> > store = std::make_shared<NiceMock<MockJobStore> >();

    Roll makeRoll(int64_t goal = 100) { return Roll(7, 1, goal, store); }
};

TEST_F(RollTest, StartRecordsActionAndRuns) {
    EXPECT_CALL(*store, logRollAction(7, 1, "start", ""));
    Roll roll = makeRoll();

    auto result = roll.start();

    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(roll.getState(), RollState::Running);
    EXPECT_EQ(roll.getProgress(), 0);
}

TEST_F(RollTest, FirstUpdateCapturesBaselineThenCountsFromIt) {
    Roll roll = makeRoll();
    roll.start();

    roll.updateProgress(counters("P1", 2, 1));
    EXPECT_EQ(roll.getProgress(), 0);
    EXPECT_EQ(roll.snapshot().baselinePass.value_or(-1), 2);
    EXPECT_EQ(roll.snapshot().baselineFail.value_or(-1), 1);

    roll.updateProgress(counters("P1", 40, 4));
    auto snap = roll.snapshot();
    EXPECT_EQ(snap.progress, 38);
    EXPECT_EQ(snap.deltaPass, 38);
    EXPECT_EQ(snap.deltaFail, 3);
    EXPECT_EQ(snap.state, RollState::Running);
}

TEST_F(RollTest, ReachingGoalCompletesRoll) {
    EXPECT_CALL(*store, logRollAction(7, 1, "start", _));
    EXPECT_CALL(*store, logRollAction(7, 1, "completed", "Roll complete"));
    Roll roll = makeRoll(100);
    roll.start();

    roll.updateProgress(counters("P1", 2));
    auto result = roll.updateProgress(counters("P1", 102));

    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(roll.getProgress(), 100);
    EXPECT_EQ(roll.getState(), RollState::Completed);
}

TEST_F(RollTest, ProgressIsClampedToGoal) {
    Roll roll = makeRoll(10);
    roll.start();
    roll.updateProgress(counters("P1", 0));

    roll.updateProgress(counters("P1", 500));

    EXPECT_EQ(roll.getProgress(), 10);
    EXPECT_EQ(roll.snapshot().deltaPass, 500);
}

TEST_F(RollTest, CompletedRollIgnoresFurtherUpdates) {
    Roll roll = makeRoll(5);
    roll.start();
    roll.updateProgress(counters("P1", 0));
    roll.updateProgress(counters("P1", 5));
    ASSERT_EQ(roll.getState(), RollState::Completed);

    EXPECT_TRUE(roll.updateProgress(counters("P1", 50)).isSkip());
    EXPECT_EQ(roll.getProgress(), 5);
    EXPECT_EQ(roll.start().code, ResultCode::InvalidTransition);
    EXPECT_EQ(roll.pause().code, ResultCode::InvalidTransition);
    EXPECT_EQ(roll.stop(true).code, ResultCode::InvalidTransition);
}

TEST_F(RollTest, PausedRollIgnoresUpdates) {
    Roll roll = makeRoll();
    roll.start();
    roll.updateProgress(counters("P1", 10));
    roll.updateProgress(counters("P1", 30));
    roll.pause();

    auto result = roll.updateProgress(counters("P1", 90));

    EXPECT_TRUE(result.isSkip());
    EXPECT_EQ(roll.getProgress(), 20);
    EXPECT_EQ(roll.getState(), RollState::Paused);
}

TEST_F(RollTest, ResumeKeepsBaseline) {
    Roll roll = makeRoll();
    roll.start();
    roll.updateProgress(counters("P1", 10));
    roll.pause();
    roll.resume();

    roll.updateProgress(counters("P1", 60));

    EXPECT_EQ(roll.getProgress(), 50);
}

TEST_F(RollTest, PauseRecordsNothingUntilNoteSubmitted) {
    EXPECT_CALL(*store, logRollAction(_, _, "start", _));
    EXPECT_CALL(*store, logRollAction(_, _, "pause note", _)).Times(0);
    Roll roll = makeRoll();
    roll.start();

    auto result = roll.pause();

    EXPECT_TRUE(result.isSuccess());
    EXPECT_TRUE(roll.snapshot().noteEntryOpen);
}

TEST_F(RollTest, SubmitNoteRecordsTimestampedEntry) {
    EXPECT_CALL(*store, logRollAction(_, _, "start", _));
    EXPECT_CALL(*store, logRollAction(7, 1, "pause note",
                                      ::testing::AllOf(StartsWith("["), HasSubstr("] Paused at 20: ribbon jam"))));
    Roll roll = makeRoll();
    roll.start();
    roll.updateProgress(counters("P1", 0));
    roll.updateProgress(counters("P1", 20));
    roll.pause();
    roll.setNoteDraft("ribbon");

    auto result = roll.submitNote("  ribbon jam  ");

    EXPECT_TRUE(result.isSuccess());
    auto snap = roll.snapshot();
    ASSERT_EQ(snap.notes.size(), 1u);
    EXPECT_EQ(snap.notes[0].text, "ribbon jam");
    EXPECT_EQ(snap.notes[0].progressAtTime, 20);
    EXPECT_TRUE(snap.noteDraft.empty());
    EXPECT_TRUE(snap.noteEntryOpen);
}

TEST_F(RollTest, EmptyNoteIsRejected) {
    Roll roll = makeRoll();
    roll.start();
    roll.pause();

    auto result = roll.submitNote("   ");

    EXPECT_TRUE(result.isError());
    EXPECT_TRUE(roll.snapshot().notes.empty());
}

TEST_F(RollTest, NotesOnlyWhilePaused) {
    Roll roll = makeRoll();
    EXPECT_EQ(roll.submitNote("x").code, ResultCode::InvalidTransition);
    roll.start();
    EXPECT_EQ(roll.submitNote("x").code, ResultCode::InvalidTransition);
    EXPECT_EQ(roll.setNoteDraft("x").code, ResultCode::InvalidTransition);
}

TEST_F(RollTest, DiscardClosesNoteEntry) {
    Roll roll = makeRoll();
    roll.start();
    roll.pause();
    roll.setNoteDraft("draft");

    EXPECT_TRUE(roll.discardNote().isSuccess());

    auto snap = roll.snapshot();
    EXPECT_FALSE(snap.noteEntryOpen);
    EXPECT_TRUE(snap.noteDraft.empty());
    EXPECT_EQ(roll.setNoteDraft("again").code, ResultCode::InvalidTransition);
    EXPECT_EQ(roll.getState(), RollState::Paused);
}

TEST_F(RollTest, StopNeedsConfirmation) {
    EXPECT_CALL(*store, logRollAction(_, _, "start", _));
    EXPECT_CALL(*store, logRollAction(7, 1, "stop", ""));
    Roll roll = makeRoll();
    roll.start();

    EXPECT_TRUE(roll.stop(false).needsConfirmation());
    EXPECT_EQ(roll.getState(), RollState::Running);

    EXPECT_TRUE(roll.stop(true).isSuccess());
    EXPECT_EQ(roll.getState(), RollState::Stopped);
    EXPECT_EQ(roll.resume().code, ResultCode::InvalidTransition);
}

TEST_F(RollTest, IllegalTransitionsFromIdle) {
    Roll roll = makeRoll();

    EXPECT_EQ(roll.pause().code, ResultCode::InvalidTransition);
    EXPECT_EQ(roll.resume().code, ResultCode::InvalidTransition);
    EXPECT_EQ(roll.stop(true).code, ResultCode::InvalidTransition);
    EXPECT_TRUE(roll.updateProgress(counters("P1", 5)).isSkip());
    EXPECT_EQ(roll.getState(), RollState::Idle);
}

TEST_F(RollTest, StoreFailureBecomesWarning) {
    ON_CALL(*store, logRollAction(_, _, _, _))
            .WillByDefault(Throw(core::types::StoreException("disk I/O error")));
    Roll roll = makeRoll();

    auto result = roll.start();

    EXPECT_TRUE(result.isSuccess());
    ASSERT_TRUE(result.hasWarnings());
    EXPECT_THAT(result.body[0], HasSubstr("disk I/O error"));
    EXPECT_EQ(roll.getState(), RollState::Running);
}
