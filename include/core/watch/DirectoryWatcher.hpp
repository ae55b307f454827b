//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "core/watch/FileEvent.hpp"

namespace core::watch {
    struct WatchOptions {
        std::string directory = ".";
        std::string extension = ".csv";
        std::chrono::milliseconds pollInterval{1000};
        bool processExisting = false;
    };

    /**
     * @brief Polls one directory (non-recursive) and reports created/modified export files.
     *
     * Events may be coalesced (several appends between two polls give one Modified).
     * Files found by the first scan are reported as Existing unless processExisting is set.
     * The callback runs on the watcher thread.
     */
    class DirectoryWatcher {
    public:
        using EventCallback = std::function<void(const FileEvent &event)>;

        DirectoryWatcher(WatchOptions options, EventCallback callback);

        ~DirectoryWatcher();

        DirectoryWatcher(const DirectoryWatcher &) = delete;

        DirectoryWatcher &operator=(const DirectoryWatcher &) = delete;

        void start();

        /**
         * @brief Wake the thread, let the in-flight callback finish, join
         */
        void stop();

        bool isRunning() const { return running_; }

        /**
         * @brief Run one scan synchronously on the caller's thread
         */
        void pollOnce();

        const WatchOptions &getOptions() const { return options_; }

        struct Statistics {
            size_t scans = 0;
            size_t filesSeen = 0;
            size_t createdEvents = 0;
            size_t modifiedEvents = 0;
            size_t existingFiles = 0;
            size_t scanErrors = 0;
        };

        Statistics getStatistics() const;

    private:
        struct FileState {
            std::uintmax_t size = 0;
            std::filesystem::file_time_type writeTime{};
        };

        WatchOptions options_;
        EventCallback callback_;

        std::thread watchThread_;
        std::atomic<bool> running_{false};
        std::mutex wakeMutex_;
        std::condition_variable wakeCondition_;

        std::mutex scanMutex_;
        std::unordered_map<std::string, FileState> known_;
        bool primed_ = false;

        mutable std::mutex statsMutex_;
        Statistics stats_;

        void watchLoop();

        void scan(FileEventKind newFileKind);

        void dispatch(const FileEvent &event);

        bool matchesExtension(const std::filesystem::path &path) const;
    };
} // namespace core::watch
