#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include <gmock/gmock.h>

#include "core/ingest/LogEvent.hpp"
#include "core/store/JobStore.hpp"

namespace test_utils {
    /**
     * @brief Scratch directory removed on destruction
     */
    class TempDir {
    public:
        TempDir() {
            static std::atomic<int> counter{0};
            path_ = std::filesystem::temp_directory_path() /
                    ("roll_tracker_test_" + std::to_string(::getpid()) + "_" +
                     std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
                     std::to_string(counter++));
            std::filesystem::create_directories(path_);
        }

        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;

        TempDir &operator=(const TempDir &) = delete;

        std::string file(const std::string &name) const { return (path_ / name).string(); }

        std::string path() const { return path_.string(); }

    private:
        std::filesystem::path path_;
    };

    inline void writeFile(const std::string &path, const std::string &content) {
        std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
        out << content;
    }

    inline void appendFile(const std::string &path, const std::string &content) {
        std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::app);
        out << content;
    }

    constexpr const char *EXPORT_HEADER = "Printer Name,Outcome Message,Serial\n";

    inline std::string passRow(const std::string &printer) {
        return printer + ",Pass (Label),0\n";
    }

    inline std::string failRow(const std::string &printer) {
        return printer + ",Fail (Label),0\n";
    }

    class MockJobStore : public core::store::JobStore {
    public:
        MOCK_METHOD(int64_t, addJob, (const core::jobs::JobFields &fields), (override));
        MOCK_METHOD(std::vector<core::jobs::Job>, getActiveJobs, (), (override));
        MOCK_METHOD(std::vector<core::jobs::Job>, getCompletedJobs, (), (override));
        MOCK_METHOD(std::optional<core::jobs::Job>, getJob, (int64_t jobId), (override));
        MOCK_METHOD(void, updateJob, (int64_t jobId, const core::jobs::JobFields &fields), (override));
        MOCK_METHOD(void, updateJobCompletion, (int64_t jobId, bool completed), (override));
        MOCK_METHOD(void, logRollAction, (int64_t jobId, int64_t rollNumber, const std::string &action,
                        const std::string &note), (override));
        MOCK_METHOD(std::vector<core::store::RollActionRecord>, getRollActions, (int64_t jobId), (override));
    };

    inline core::jobs::Job makeJob(int64_t id, int64_t quantity, int64_t labelsPerRoll,
                                   const std::string &printer = "Printer_1") {
        core::jobs::Job job;
        job.id = id;
        job.customer = "Acme";
        job.ticket = "T-" + std::to_string(id);
        job.inlayType = "UHF";
        job.quantity = quantity;
        job.labelsPerRoll = labelsPerRoll;
        job.printerName = printer;
        job.createdAt = "2026-10-18T08:00:00";
        return job;
    }

    inline core::ingest::PrinterCounters counters(const std::string &printer, int64_t pass, int64_t fail = 0) {
        return core::ingest::PrinterCounters{printer, pass, fail};
    }
}
