#include <gtest/gtest.h>

#include "core/store/SqliteJobStore.hpp"
#include "connector/processors/control/ControlProcessor.hpp"

using connector::models::control::ControlResponse;
using connector::processors::control::ControlProcessor;

class ControlProcessorTest : public ::testing::Test {
protected:
    std::shared_ptr<core::jobs::JobTracker> tracker =
            std::make_shared<core::jobs::JobTracker>(std::make_shared<core::store::SqliteJobStore>(":memory:"));
    ControlProcessor processor{tracker};

    ControlResponse send(const nlohmann::json &request) {
        return processor.processMessage(request.dump());
    }

    int64_t addJob(const std::string &printer = "P1") {
        auto response = send({
            {"type", "job"}, {"command", "add"},
            {"fields", {
                {"customer", "Acme"}, {"ticket", "T-9"}, {"inlayType", "UHF"},
                {"quantity", 250}, {"labelsPerRoll", 100}, {"printerName", printer}
            }}
        });
        EXPECT_TRUE(response.ok) << response.message;
        return response.data.value("jobId", int64_t{0});
    }

    ControlResponse roll(const std::string &command, int64_t jobId, int64_t rollNumber,
                         const nlohmann::json &extra = nlohmann::json::object()) {
        nlohmann::json request{{"type", "roll"}, {"command", command}, {"jobId", jobId}, {"rollNumber", rollNumber}};
        request.update(extra);
        return send(request);
    }
};

TEST_F(ControlProcessorTest, AddAndListJobs) {
    const auto id = addJob();

    auto response = send({{"type", "job"}, {"command", "list"}});

    ASSERT_TRUE(response.ok);
    ASSERT_EQ(response.data["active"].size(), 1u);
    EXPECT_EQ(response.data["active"][0]["id"], id);
    EXPECT_EQ(response.data["active"][0]["totalRolls"], 3);
    EXPECT_TRUE(response.data["completed"].empty());
}

TEST_F(ControlProcessorTest, InvalidFieldsAreReported) {
    auto response = send({{"type", "job"}, {"command", "add"}, {"fields", {{"customer", "Acme"}}}});

    EXPECT_FALSE(response.ok);
    EXPECT_EQ(response.code, "ERROR");
    EXPECT_FALSE(response.warnings.empty());
}

TEST_F(ControlProcessorTest, OpenDescribesRolls) {
    const auto id = addJob();

    auto response = send({{"type", "job"}, {"command", "open"}, {"jobId", id}});

    ASSERT_TRUE(response.ok);
    EXPECT_TRUE(response.data["open"].get<bool>());
    ASSERT_EQ(response.data["rolls"].size(), 3u);
    EXPECT_EQ(response.data["rolls"][0]["state"], "IDL");
    EXPECT_TRUE(response.data["runningRoll"].is_null());
}

TEST_F(ControlProcessorTest, OpenUnknownJobIsNotFound) {
    auto response = send({{"type", "job"}, {"command", "open"}, {"jobId", 404}});

    EXPECT_FALSE(response.ok);
    EXPECT_EQ(response.code, "NOT_FOUND");
}

TEST_F(ControlProcessorTest, RollCommandsNeedOpenJob) {
    const auto id = addJob();

    auto response = roll("start", id, 1);

    EXPECT_EQ(response.code, "NOT_FOUND");
}

TEST_F(ControlProcessorTest, StartPauseNoteResumeFlow) {
    const auto id = addJob();
    send({{"type", "job"}, {"command", "open"}, {"jobId", id}});

    auto started = roll("start", id, 1);
    ASSERT_TRUE(started.ok) << started.message;
    EXPECT_EQ(started.data["roll"]["state"], "RUN");

    auto rejected = roll("start", id, 2);
    EXPECT_EQ(rejected.code, "INVALID_TRANSITION");

    auto paused = roll("pause", id, 1);
    EXPECT_TRUE(paused.data["roll"]["noteEntryOpen"].get<bool>());

    auto noted = roll("note", id, 1, {{"note", "core changed"}});
    ASSERT_TRUE(noted.ok);
    EXPECT_EQ(noted.data["roll"]["notes"][0]["text"], "core changed");

    auto resumed = roll("resume", id, 1);
    EXPECT_EQ(resumed.data["roll"]["state"], "RUN");

    auto status = send({{"type", "job"}, {"command", "status"}, {"jobId", id}});
    ASSERT_TRUE(status.ok);
    EXPECT_EQ(status.data["runningRoll"], 1);
    ASSERT_EQ(status.data["history"].size(), 3u);
    EXPECT_EQ(status.data["history"][1]["action"], "pause note");
}

TEST_F(ControlProcessorTest, DraftIsKeptWhilePausedOnly) {
    const auto id = addJob();
    send({{"type", "job"}, {"command", "open"}, {"jobId", id}});
    roll("start", id, 1);

    auto running = roll("draft", id, 1, {{"note", "too early"}});
    EXPECT_EQ(running.code, "INVALID_TRANSITION");

    roll("pause", id, 1);
    auto drafted = roll("draft", id, 1, {{"note", "half"}});
    ASSERT_TRUE(drafted.ok) << drafted.message;
    EXPECT_EQ(drafted.data["roll"]["noteDraft"], "half");
    EXPECT_TRUE(drafted.data["roll"]["notes"].empty());
}

TEST_F(ControlProcessorTest, StopAndCompleteAskForConfirmation) {
    const auto id = addJob();
    send({{"type", "job"}, {"command", "open"}, {"jobId", id}});
    roll("start", id, 1);

    auto unconfirmed = roll("stop", id, 1);
    EXPECT_EQ(unconfirmed.code, "CONFIRMATION_REQUIRED");
    auto confirmed = roll("stop", id, 1, {{"confirm", true}});
    EXPECT_EQ(confirmed.data["roll"]["state"], "STP");

    auto complete = send({{"type", "job"}, {"command", "complete"}, {"jobId", id}});
    EXPECT_EQ(complete.code, "CONFIRMATION_REQUIRED");
    complete = send({{"type", "job"}, {"command", "complete"}, {"jobId", id}, {"confirm", true}});
    ASSERT_TRUE(complete.ok);
    EXPECT_TRUE(complete.data["job"]["completed"].get<bool>());
}

TEST_F(ControlProcessorTest, StatusOfClosedJob) {
    const auto id = addJob();

    auto response = send({{"type", "job"}, {"command", "status"}, {"jobId", id}});

    ASSERT_TRUE(response.ok);
    EXPECT_FALSE(response.data["open"].get<bool>());
    EXPECT_TRUE(response.data["history"].empty());
}

TEST_F(ControlProcessorTest, CloseJob) {
    const auto id = addJob();
    send({{"type", "job"}, {"command", "open"}, {"jobId", id}});

    EXPECT_TRUE(send({{"type", "job"}, {"command", "close"}, {"jobId", id}}).ok);
    EXPECT_EQ(send({{"type", "job"}, {"command", "close"}, {"jobId", id}}).code, "NOT_FOUND");
}

TEST_F(ControlProcessorTest, MalformedInputNeverThrows) {
    EXPECT_FALSE(processor.processMessage("{not json").ok);
    EXPECT_FALSE(processor.processMessage("[1,2]").ok);
    EXPECT_FALSE(processor.processMessage(R"({"type":"printer"})").ok);
    EXPECT_FALSE(processor.processMessage(R"({"type":"roll","command":"start"})").ok);
    EXPECT_FALSE(processor.processMessage(R"({"type":"job","command":"open","jobId":"x"})").ok);
    EXPECT_FALSE(processor.processMessage(R"({"type":"roll","command":"fly","jobId":1,"rollNumber":1})").ok);
}

TEST_F(ControlProcessorTest, ResponseSerializesAsOneJsonObject) {
    auto response = processor.processMessage(R"({"type":"job","command":"list"})");

    auto json = nlohmann::json::parse(response.toJson().dump());
    ControlResponse parsed(json);
    EXPECT_TRUE(parsed.ok);
    EXPECT_EQ(parsed.code, "SUCCESS");
}
