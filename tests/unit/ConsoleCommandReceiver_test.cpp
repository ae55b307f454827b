#include <gtest/gtest.h>

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

#include "connector/events/console/ConsoleCommandReceiver.hpp"

using connector::events::console::ConsoleCommandReceiver;

class ConsoleCommandReceiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::pipe(fds), 0);
    }

    void TearDown() override {
        if (fds[0] >= 0) ::close(fds[0]);
        if (fds[1] >= 0) ::close(fds[1]);
    }

    void write(const std::string &data) {
        ASSERT_EQ(::write(fds[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void closeWriter() {
        ::close(fds[1]);
        fds[1] = -1;
    }

    bool waitForLines(size_t count) {
        std::unique_lock<std::mutex> lock(mutex);
        return condition.wait_for(lock, std::chrono::seconds(5), [&] { return lines.size() >= count; });
    }

    void record(const std::string &line) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            lines.push_back(line);
        }
        condition.notify_all();
    }

    int fds[2] = {-1, -1};
    std::mutex mutex;
    std::condition_variable condition;
    std::vector<std::string> lines;
};

TEST_F(ConsoleCommandReceiverTest, SplitsLinesAndSkipsBlanks) {
    ConsoleCommandReceiver receiver(fds[0], std::chrono::milliseconds(20));
    receiver.setMessageCallback([this](const std::string &line) { record(line); });
    receiver.startReceiving();

    write("{\"a\":1}\r\n\n   \n{\"b\"");
    write(":2}\n");

    ASSERT_TRUE(waitForLines(2));
    receiver.stopReceiving();

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(lines[0], "{\"a\":1}");
    EXPECT_EQ(lines[1], "{\"b\":2}");
    EXPECT_EQ(receiver.getLinesReceived(), 2u);
}

TEST_F(ConsoleCommandReceiverTest, DispatchesUnterminatedLineOnEof) {
    ConsoleCommandReceiver receiver(fds[0], std::chrono::milliseconds(20));
    receiver.setMessageCallback([this](const std::string &line) { record(line); });
    receiver.startReceiving();

    write("last");
    closeWriter();

    ASSERT_TRUE(waitForLines(1));
    receiver.stopReceiving();
    EXPECT_TRUE(receiver.isInputClosed());
    EXPECT_FALSE(receiver.isReceiving());
}

TEST_F(ConsoleCommandReceiverTest, StopDoesNotWaitForInput) {
    ConsoleCommandReceiver receiver(fds[0], std::chrono::milliseconds(20));
    receiver.startReceiving();
    EXPECT_TRUE(receiver.isReceiving());

    auto begin = std::chrono::steady_clock::now();
    receiver.stopReceiving();

    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(2));
    EXPECT_FALSE(receiver.isReceiving());
}

TEST_F(ConsoleCommandReceiverTest, CallbackFailureKeepsReading) {
    ConsoleCommandReceiver receiver(fds[0], std::chrono::milliseconds(20));
    receiver.setMessageCallback([this](const std::string &line) {
        record(line);
        if (line == "bad") throw std::runtime_error("boom");
    });
    receiver.startReceiving();

    write("bad\ngood\n");

    ASSERT_TRUE(waitForLines(2));
    receiver.stopReceiving();
}
