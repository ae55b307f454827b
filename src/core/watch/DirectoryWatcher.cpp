//
// Created by Andrea on 18/10/2026.
//

#include "core/watch/DirectoryWatcher.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace core::watch {
    namespace {
        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }
    }

    DirectoryWatcher::DirectoryWatcher(WatchOptions options, EventCallback callback)
        : options_(std::move(options)), callback_(std::move(callback)) {
        if (!options_.extension.empty() && options_.extension.front() != '.') {
            options_.extension.insert(options_.extension.begin(), '.');
        }
        options_.extension = toLower(options_.extension);
    }

    DirectoryWatcher::~DirectoryWatcher() {
        stop();
    }

    void DirectoryWatcher::start() {
        if (running_) {
            Logger::logWarning("[DirectoryWatcher] Already running");
            return;
        }

        std::error_code ec;
        if (!fs::exists(options_.directory, ec)) {
            fs::create_directories(options_.directory, ec);
            if (ec) {
                Logger::logWarning("[DirectoryWatcher] Cannot create " + options_.directory + ": " + ec.message());
            } else {
                Logger::logInfo("[DirectoryWatcher] Created watch directory " + options_.directory);
            }
        }

        running_ = true;
        watchThread_ = std::thread([this]() {
            try {
                watchLoop();
            } catch (const std::exception &e) {
                Logger::logError("[DirectoryWatcher] Watch thread crashed: " + std::string(e.what()));
                running_ = false;
            }
        });

        Logger::logInfo("[DirectoryWatcher] Watching " + options_.directory + " for *" + options_.extension +
                        " every " + std::to_string(options_.pollInterval.count()) + "ms");
    }

    void DirectoryWatcher::stop() {
        {
            std::lock_guard<std::mutex> lock(wakeMutex_);
            if (!running_ && !watchThread_.joinable()) return;
            running_ = false;
        }
        wakeCondition_.notify_all();

        if (watchThread_.joinable()) {
            watchThread_.join();
        }

        Logger::logInfo("[DirectoryWatcher] Stopped");
    }

    void DirectoryWatcher::watchLoop() {
        while (running_) {
            pollOnce();

            std::unique_lock<std::mutex> lock(wakeMutex_);
            wakeCondition_.wait_for(lock, options_.pollInterval, [this] { return !running_.load(); });
        }
    }

    void DirectoryWatcher::pollOnce() {
        std::lock_guard<std::mutex> lock(scanMutex_);
        if (!primed_) {
            scan(options_.processExisting ? FileEventKind::Created : FileEventKind::Existing);
            primed_ = true;
        } else {
            scan(FileEventKind::Created);
        }
    }

    void DirectoryWatcher::scan(FileEventKind newFileKind) {
        std::vector<FileEvent> pending;
        std::unordered_map<std::string, FileState> current;

        std::error_code ec;
        fs::directory_iterator it(options_.directory, ec);
        if (ec) {
            Logger::logWarning("[DirectoryWatcher] Cannot list " + options_.directory + ": " + ec.message());
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.scans++;
            stats_.scanErrors++;
            return;
        }

        for (const fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                Logger::logWarning("[DirectoryWatcher] Listing interrupted: " + ec.message());
                break;
            }

            const auto &entry = *it;
            std::error_code entryEc;
            if (!entry.is_regular_file(entryEc) || !matchesExtension(entry.path())) {
                continue;
            }

            const std::string path = entry.path().lexically_normal().string();
            auto known = known_.find(path);

            FileState state;
            state.size = entry.file_size(entryEc);
            if (!entryEc) {
                state.writeTime = entry.last_write_time(entryEc);
            }
            if (entryEc) {
                // Busy or vanished between listing and stat: keep what we knew, look again next poll
                if (known != known_.end()) current.emplace(path, known->second);
                continue;
            }

            if (known == known_.end()) {
                pending.push_back(FileEvent{newFileKind, path});
            } else if (known->second.size != state.size || known->second.writeTime != state.writeTime) {
                pending.push_back(FileEvent{FileEventKind::Modified, path});
            }
            current.emplace(path, state);
        }

        if (ec) {
            // Partial listing: files not reached this time are not gone
            for (const auto &[path, state]: known_) {
                current.emplace(path, state);
            }
        }
        known_ = std::move(current);

        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.scans++;
            stats_.filesSeen = known_.size();
            if (ec) stats_.scanErrors++;
        }

        std::sort(pending.begin(), pending.end(),
                  [](const FileEvent &a, const FileEvent &b) { return a.path < b.path; });
        for (const auto &event: pending) {
            dispatch(event);
        }
    }

    void DirectoryWatcher::dispatch(const FileEvent &event) {
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            switch (event.kind) {
                case FileEventKind::Created: stats_.createdEvents++;
                    break;
                case FileEventKind::Modified: stats_.modifiedEvents++;
                    break;
                case FileEventKind::Existing: stats_.existingFiles++;
                    break;
            }
        }

        if (!callback_) return;
        try {
            callback_(event);
        } catch (const std::exception &e) {
            Logger::logError("[DirectoryWatcher] Handler failed for " + event.path + ": " + e.what());
        }
    }

    bool DirectoryWatcher::matchesExtension(const fs::path &path) const {
        return toLower(path.extension().string()) == options_.extension;
    }

    DirectoryWatcher::Statistics DirectoryWatcher::getStatistics() const {
        std::lock_guard<std::mutex> lock(statsMutex_);
        return stats_;
    }
} // namespace core::watch
