//
// Created by Andrea on 18/10/2026.
//

#include "connector/events/console/ConsoleCommandReceiver.hpp"
#include "logger/Logger.hpp"
#include <utility>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace connector::events::console {
    ConsoleCommandReceiver::ConsoleCommandReceiver(int inputFd, std::chrono::milliseconds pollTimeout)
        : inputFd_(inputFd), pollTimeout_(pollTimeout) {
    }

    ConsoleCommandReceiver::~ConsoleCommandReceiver() {
        stopReceiving();
    }

    void ConsoleCommandReceiver::startReceiving() {
        if (receiving_) {
            Logger::logWarning("[" + getReceiverName() + "] Already receiving");
            return;
        }

        running_ = true;
        receiving_ = true;
        inputClosed_ = false;

        readerThread_ = std::thread([this]() {
            try {
                readerLoop();
            } catch (const std::exception &e) {
                Logger::logError("[" + getReceiverName() + "] Reader thread crashed: " + std::string(e.what()));
            }
        });

        Logger::logInfo("[" + getReceiverName() + "] Started receiving from " + getSourceName());
    }

    void ConsoleCommandReceiver::stopReceiving() {
        if (!receiving_) {
            return;
        }

        running_ = false;
        if (readerThread_.joinable()) {
            readerThread_.join();
        }

        receiving_ = false;
        Logger::logInfo("[" + getReceiverName() + "] Stopped receiving");
    }

    bool ConsoleCommandReceiver::isReceiving() const {
        return receiving_ && !inputClosed_;
    }

    std::string ConsoleCommandReceiver::getSourceName() const {
        return inputFd_ == 0 ? "stdin" : "fd " + std::to_string(inputFd_);
    }

    void ConsoleCommandReceiver::readerLoop() {
        std::string pending;
        char buffer[4096];

        while (running_) {
            pollfd pfd{};
            pfd.fd = inputFd_;
            pfd.events = POLLIN;

            int ready = ::poll(&pfd, 1, static_cast<int>(pollTimeout_.count()));
            if (ready < 0) {
                if (errno == EINTR) continue;
                Logger::logError("[" + getReceiverName() + "] poll failed: " + std::strerror(errno));
                break;
            }
            if (ready == 0) continue;

            ssize_t n = ::read(inputFd_, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                Logger::logError("[" + getReceiverName() + "] read failed: " + std::strerror(errno));
                break;
            }
            if (n == 0) {
                // EOF: an unterminated last line still counts as a request
                if (!pending.empty()) {
                    dispatchLine(std::move(pending));
                    pending.clear();
                }
                inputClosed_ = true;
                Logger::logInfo("[" + getReceiverName() + "] Input closed");
                break;
            }

            pending.append(buffer, static_cast<size_t>(n));

            size_t newline;
            while ((newline = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, newline);
                pending.erase(0, newline + 1);
                dispatchLine(std::move(line));
            }
        }
    }

    void ConsoleCommandReceiver::dispatchLine(std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            return;
        }

        linesReceived_++;
        if (!messageCallback_) {
            Logger::logWarning("[" + getReceiverName() + "] No callback set, request dropped");
            return;
        }

        try {
            messageCallback_(line);
        } catch (const std::exception &e) {
            Logger::logError("[" + getReceiverName() + "] Callback failed: " + std::string(e.what()));
        }
    }
}
