//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "core/store/JobStore.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace core::store {
    /**
     * @brief JobStore on a local SQLite file (":memory:" for tests).
     *
     * Creates the jobs and roll_tracking tables on open. Calls are serialized.
     */
    class SqliteJobStore : public JobStore {
    public:
        explicit SqliteJobStore(const std::string &databasePath);

        ~SqliteJobStore() override;

        SqliteJobStore(const SqliteJobStore &) = delete;

        SqliteJobStore &operator=(const SqliteJobStore &) = delete;

        int64_t addJob(const jobs::JobFields &fields) override;

        std::vector<jobs::Job> getActiveJobs() override;

        std::vector<jobs::Job> getCompletedJobs() override;

        std::optional<jobs::Job> getJob(int64_t jobId) override;

        void updateJob(int64_t jobId, const jobs::JobFields &fields) override;

        void updateJobCompletion(int64_t jobId, bool completed) override;

        void logRollAction(int64_t jobId, int64_t rollNumber, const std::string &action,
                           const std::string &note = "") override;

        std::vector<RollActionRecord> getRollActions(int64_t jobId) override;

        const std::string &getPath() const { return path_; }

    private:
        struct StatementDeleter {
            void operator()(sqlite3_stmt *stmt) const;
        };

        using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

        std::string path_;
        sqlite3 *db_ = nullptr;
        std::mutex dbMutex_;

        void configure();

        void createTables();

        void exec(const std::string &sql);

        Statement prepare(const std::string &sql);

        void stepDone(sqlite3_stmt *stmt, const char *what);

        std::vector<jobs::Job> queryJobs(bool completed);

        static jobs::Job readJob(sqlite3_stmt *stmt);

        void throwIf(int rc, const char *what) const;
    };
} // namespace core::store
