#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "connector/controllers/CommandController.hpp"
#include "core/store/SqliteJobStore.hpp"

using connector::controllers::CommandController;

namespace {
    class ScriptedReceiver : public connector::events::BaseReceiver {
    public:
        void startReceiving() override { receiving_ = true; }

        void stopReceiving() override { receiving_ = false; }

        bool isReceiving() const override { return receiving_; }

        std::string getSourceName() const override { return "script"; }

        std::string getReceiverName() const override { return "ScriptedReceiver"; }

        void feed(const std::string &line) {
            if (messageCallback_) messageCallback_(line);
        }

    private:
        bool receiving_ = false;
    };
}

class CommandControllerTest : public ::testing::Test {
protected:
    std::shared_ptr<ScriptedReceiver> receiver = std::make_shared<ScriptedReceiver>();
    std::ostringstream output;
    CommandController controller{
        std::make_shared<core::jobs::JobTracker>(std::make_shared<core::store::SqliteJobStore>(":memory:")),
        receiver, output
    };

    std::vector<nlohmann::json> responses() const {
        std::vector<nlohmann::json> parsed;
        std::istringstream lines(output.str());
        std::string line;
        while (std::getline(lines, line)) parsed.push_back(nlohmann::json::parse(line));
        return parsed;
    }
};

TEST_F(CommandControllerTest, WritesOneResponseLinePerRequest) {
    controller.start();
    ASSERT_TRUE(controller.isRunning());

    receiver->feed(R"({"type":"job","command":"list"})");
    receiver->feed("garbage");

    auto written = responses();
    ASSERT_EQ(written.size(), 2u);
    EXPECT_TRUE(written[0]["ok"].get<bool>());
    EXPECT_FALSE(written[1]["ok"].get<bool>());

    auto stats = controller.getStatistics();
    EXPECT_EQ(stats.requests, 2u);
    EXPECT_EQ(stats.failedRequests, 1u);
}

TEST_F(CommandControllerTest, StopStopsReceiver) {
    controller.start();

    controller.stop();

    EXPECT_FALSE(receiver->isReceiving());
    EXPECT_FALSE(controller.isRunning());
}
