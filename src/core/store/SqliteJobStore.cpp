//
// Created by Andrea on 18/10/2026.
//

#include "core/store/SqliteJobStore.hpp"
#include "core/types/Error.hpp"
#include "core/utils/Time.hpp"
#include "logger/Logger.hpp"
#include <sqlite3.h>
#include <utility>

namespace core::store {
    namespace {
        constexpr const char *JOB_COLUMNS =
                "id, customer, job_ticket, inlay_type, quantity, labels_per_roll, printer_name, created_at, completed";

        std::string columnText(sqlite3_stmt *stmt, int column) {
            const unsigned char *text = sqlite3_column_text(stmt, column);
            return text ? reinterpret_cast<const char *>(text) : "";
        }

        void bindText(sqlite3_stmt *stmt, int index, const std::string &value) {
            sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
        }
    }

    void SqliteJobStore::StatementDeleter::operator()(sqlite3_stmt *stmt) const {
        sqlite3_finalize(stmt);
    }

    SqliteJobStore::SqliteJobStore(const std::string &databasePath) : path_(databasePath) {
        int rc = sqlite3_open_v2(path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
            if (db_) sqlite3_close(db_);
            db_ = nullptr;
            throw types::StoreException("cannot open " + path_ + ": " + msg);
        }

        try {
            configure();
            createTables();
        } catch (...) {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }

        Logger::logInfo("[SqliteJobStore] Opened job database " + path_);
    }

    SqliteJobStore::~SqliteJobStore() {
        if (db_) sqlite3_close(db_);
    }

    void SqliteJobStore::configure() {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        exec("PRAGMA foreign_keys=ON;");
        throwIf(sqlite3_busy_timeout(db_, 5000), "busy_timeout");
    }

    void SqliteJobStore::createTables() {
        exec(R"SQL(
            CREATE TABLE IF NOT EXISTS jobs (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                customer TEXT,
                job_ticket TEXT,
                inlay_type TEXT,
                quantity INTEGER,
                labels_per_roll INTEGER,
                printer_name TEXT,
                created_at TEXT,
                completed INTEGER DEFAULT 0
            )
        )SQL");
        exec(R"SQL(
            CREATE TABLE IF NOT EXISTS roll_tracking (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                job_id INTEGER,
                roll_number INTEGER,
                action TEXT,
                note TEXT,
                timestamp TEXT,
                FOREIGN KEY(job_id) REFERENCES jobs(id)
            )
        )SQL");
    }

    int64_t SqliteJobStore::addJob(const jobs::JobFields &fields) {
        const jobs::JobFields job = fields.normalized();
        std::lock_guard<std::mutex> lock(dbMutex_);

        auto stmt = prepare(R"SQL(
            INSERT INTO jobs (customer, job_ticket, inlay_type, quantity, labels_per_roll, printer_name, created_at)
            VALUES (?, ?, ?, ?, ?, ?, ?)
        )SQL");
        int i = 1;
        bindText(stmt.get(), i++, job.customer);
        bindText(stmt.get(), i++, job.ticket);
        bindText(stmt.get(), i++, job.inlayType);
        sqlite3_bind_int64(stmt.get(), i++, job.quantity);
        sqlite3_bind_int64(stmt.get(), i++, job.labelsPerRoll);
        bindText(stmt.get(), i++, job.printerName);
        bindText(stmt.get(), i++, utils::isoTimestamp());
        stepDone(stmt.get(), "addJob");

        return sqlite3_last_insert_rowid(db_);
    }

    std::vector<jobs::Job> SqliteJobStore::getActiveJobs() {
        return queryJobs(false);
    }

    std::vector<jobs::Job> SqliteJobStore::getCompletedJobs() {
        return queryJobs(true);
    }

    std::optional<jobs::Job> SqliteJobStore::getJob(int64_t jobId) {
        std::lock_guard<std::mutex> lock(dbMutex_);
        auto stmt = prepare(std::string("SELECT ") + JOB_COLUMNS + " FROM jobs WHERE id=?");
        sqlite3_bind_int64(stmt.get(), 1, jobId);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW) {
            return readJob(stmt.get());
        }
        if (rc != SQLITE_DONE) {
            throwIf(rc, "getJob");
        }
        return std::nullopt;
    }

    void SqliteJobStore::updateJob(int64_t jobId, const jobs::JobFields &fields) {
        const jobs::JobFields job = fields.normalized();
        std::lock_guard<std::mutex> lock(dbMutex_);

        auto stmt = prepare(R"SQL(
            UPDATE jobs
            SET customer=?, job_ticket=?, inlay_type=?, quantity=?, labels_per_roll=?, printer_name=?
            WHERE id=?
        )SQL");
        int i = 1;
        bindText(stmt.get(), i++, job.customer);
        bindText(stmt.get(), i++, job.ticket);
        bindText(stmt.get(), i++, job.inlayType);
        sqlite3_bind_int64(stmt.get(), i++, job.quantity);
        sqlite3_bind_int64(stmt.get(), i++, job.labelsPerRoll);
        bindText(stmt.get(), i++, job.printerName);
        sqlite3_bind_int64(stmt.get(), i++, jobId);
        stepDone(stmt.get(), "updateJob");

        if (sqlite3_changes(db_) == 0) {
            throw types::StoreException("updateJob: no job with id " + std::to_string(jobId));
        }
    }

    void SqliteJobStore::updateJobCompletion(int64_t jobId, bool completed) {
        std::lock_guard<std::mutex> lock(dbMutex_);

        auto stmt = prepare("UPDATE jobs SET completed=? WHERE id=?");
        sqlite3_bind_int(stmt.get(), 1, completed ? 1 : 0);
        sqlite3_bind_int64(stmt.get(), 2, jobId);
        stepDone(stmt.get(), "updateJobCompletion");

        if (sqlite3_changes(db_) == 0) {
            throw types::StoreException("updateJobCompletion: no job with id " + std::to_string(jobId));
        }
    }

    void SqliteJobStore::logRollAction(int64_t jobId, int64_t rollNumber, const std::string &action,
                                       const std::string &note) {
        std::lock_guard<std::mutex> lock(dbMutex_);

        auto stmt = prepare(R"SQL(
            INSERT INTO roll_tracking (job_id, roll_number, action, note, timestamp)
            VALUES (?, ?, ?, ?, ?)
        )SQL");
        sqlite3_bind_int64(stmt.get(), 1, jobId);
        sqlite3_bind_int64(stmt.get(), 2, rollNumber);
        bindText(stmt.get(), 3, action);
        bindText(stmt.get(), 4, note);
        bindText(stmt.get(), 5, utils::isoTimestamp());
        stepDone(stmt.get(), "logRollAction");
    }

    std::vector<RollActionRecord> SqliteJobStore::getRollActions(int64_t jobId) {
        std::lock_guard<std::mutex> lock(dbMutex_);

        auto stmt = prepare(R"SQL(
            SELECT id, job_id, roll_number, action, note, timestamp
            FROM roll_tracking WHERE job_id=? ORDER BY id
        )SQL");
        sqlite3_bind_int64(stmt.get(), 1, jobId);

        std::vector<RollActionRecord> records;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            RollActionRecord record;
            record.id = sqlite3_column_int64(stmt.get(), 0);
            record.jobId = sqlite3_column_int64(stmt.get(), 1);
            record.rollNumber = sqlite3_column_int64(stmt.get(), 2);
            record.action = columnText(stmt.get(), 3);
            record.note = columnText(stmt.get(), 4);
            record.timestamp = columnText(stmt.get(), 5);
            records.push_back(std::move(record));
        }
        if (rc != SQLITE_DONE) {
            throwIf(rc, "getRollActions");
        }
        return records;
    }

    std::vector<jobs::Job> SqliteJobStore::queryJobs(bool completed) {
        std::lock_guard<std::mutex> lock(dbMutex_);

        auto stmt = prepare(std::string("SELECT ") + JOB_COLUMNS + " FROM jobs WHERE completed=? ORDER BY id");
        sqlite3_bind_int(stmt.get(), 1, completed ? 1 : 0);

        std::vector<jobs::Job> result;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            result.push_back(readJob(stmt.get()));
        }
        if (rc != SQLITE_DONE) {
            throwIf(rc, completed ? "getCompletedJobs" : "getActiveJobs");
        }
        return result;
    }

    jobs::Job SqliteJobStore::readJob(sqlite3_stmt *stmt) {
        jobs::Job job;
        job.id = sqlite3_column_int64(stmt, 0);
        job.customer = columnText(stmt, 1);
        job.ticket = columnText(stmt, 2);
        job.inlayType = columnText(stmt, 3);
        job.quantity = sqlite3_column_int64(stmt, 4);
        job.labelsPerRoll = sqlite3_column_int64(stmt, 5);
        job.printerName = columnText(stmt, 6);
        job.createdAt = columnText(stmt, 7);
        job.completed = sqlite3_column_int(stmt, 8) != 0;
        return job;
    }

    void SqliteJobStore::exec(const std::string &sql) {
        char *err = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : "sqlite exec failed";
            sqlite3_free(err);
            throw types::StoreException(msg);
        }
    }

    SqliteJobStore::Statement SqliteJobStore::prepare(const std::string &sql) {
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
        Statement owned(stmt);
        throwIf(rc, "prepare");
        return owned;
    }

    void SqliteJobStore::stepDone(sqlite3_stmt *stmt, const char *what) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            throwIf(rc == SQLITE_ROW ? SQLITE_MISUSE : rc, what);
        }
    }

    void SqliteJobStore::throwIf(int rc, const char *what) const {
        if (rc != SQLITE_OK) {
            throw types::StoreException(std::string(what) + ": " + sqlite3_errmsg(db_));
        }
    }
} // namespace core::store
