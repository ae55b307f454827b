#pragma once

#include "../BaseReceiver.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

namespace connector::events::console {
    /**
     * @brief Reads JSON-lines requests from a file descriptor (stdin for the daemon).
     *
     * Each complete, non-blank line is handed to the message callback on the
     * reader thread. The descriptor is polled so stopReceiving() never waits on
     * a blocked read.
     */
    class ConsoleCommandReceiver : public BaseReceiver {
    public:
        explicit ConsoleCommandReceiver(int inputFd = 0,
                                        std::chrono::milliseconds pollTimeout = std::chrono::milliseconds(200));

        ~ConsoleCommandReceiver() override;

        // BaseReceiver implementation
        void startReceiving() override;

        void stopReceiving() override;

        bool isReceiving() const override;

        std::string getSourceName() const override;

        std::string getReceiverName() const override {
            return "ConsoleCommandReceiver";
        }

        bool isInputClosed() const { return inputClosed_; }

        size_t getLinesReceived() const { return linesReceived_; }

    private:
        int inputFd_;
        std::chrono::milliseconds pollTimeout_;
        std::thread readerThread_;
        std::atomic<bool> running_{false};
        std::atomic<bool> receiving_{false};
        std::atomic<bool> inputClosed_{false};
        std::atomic<size_t> linesReceived_{0};

        void readerLoop();

        void dispatchLine(std::string line);
    };
}
