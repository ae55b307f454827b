//
// Created by Andrea on 18/10/2026.
//

#include "core/ingest/IncrementalFileReader.hpp"
#include "core/ingest/CsvReader.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <filesystem>
#include <utility>

namespace core::ingest {
    std::string consumeStatusToString(ConsumeStatus status) {
        switch (status) {
            case ConsumeStatus::Ok: return "OK";
            case ConsumeStatus::NoNewRows: return "NO_NEW_ROWS";
            case ConsumeStatus::TransientFailure: return "TRANSIENT_FAILURE";
            case ConsumeStatus::Reset: return "RESET";
            default: return "UNKNOWN";
        }
    }

    IncrementalFileReader::IncrementalFileReader(RowParser parser) : parser_(std::move(parser)) {
    }

    ConsumeResult IncrementalFileReader::consume(const std::string &filePath) {
        const std::string key = normalize(filePath);
        auto slot = slotFor(key);

        // One pass per path at a time; the cursor map lock is never held across the read
        std::lock_guard<std::mutex> pass(slot->passMutex);

        size_t lastCount;
        {
            std::lock_guard<std::mutex> lock(cursorsMutex_);
            lastCount = slot->rowsConsumed;
        }

        ConsumeResult result;
        CsvTable table;
        try {
            table = CsvReader::readFile(key);
        } catch (const types::FileAccessException &e) {
            Logger::logWarning("[IncrementalFileReader] " + std::string(e.what()) + " - will retry on next change");
            result.status = ConsumeStatus::TransientFailure;
            result.error = e.what();
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.transientFailures++;
            return result;
        }

        const size_t totalRows = table.rowCount();
        result.totalRows = totalRows;

        size_t firstRow = lastCount;
        if (totalRows < lastCount) {
            Logger::logWarning("[IncrementalFileReader] " + key + " shrank from " + std::to_string(lastCount) +
                               " to " + std::to_string(totalRows) + " rows - reprocessing from the start");
            firstRow = 0;
            result.status = ConsumeStatus::Reset;
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.shrinkAnomalies++;
        }

        for (size_t row = firstRow; row < totalRows; ++row) {
            auto event = parser_.parse(table.record(row));
            if (event) {
                result.events.push_back(std::move(*event));
            } else {
                result.skippedRows++;
            }
        }
        result.newRows = totalRows - firstRow;

        if (result.status != ConsumeStatus::Reset) {
            result.status = result.newRows > 0 ? ConsumeStatus::Ok : ConsumeStatus::NoNewRows;
        }

        {
            std::lock_guard<std::mutex> lock(cursorsMutex_);
            slot->rowsConsumed = totalRows;
        }

        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.rowsConsumed += result.newRows;
            stats_.eventsParsed += result.events.size();
            stats_.rowsSkipped += result.skippedRows;
        }

        if (result.newRows > 0) {
            Logger::logDebug("[IncrementalFileReader] " + key + ": " + std::to_string(result.newRows) +
                             " new rows, " + std::to_string(result.events.size()) + " pass/fail events, cursor " +
                             std::to_string(totalRows));
        }
        if (table.partialTail) {
            Logger::logDebug("[IncrementalFileReader] " + key + ": trailing row still being written");
        }

        return result;
    }

    ConsumeResult IncrementalFileReader::seedCursor(const std::string &filePath) {
        const std::string key = normalize(filePath);
        auto slot = slotFor(key);

        std::lock_guard<std::mutex> pass(slot->passMutex);

        ConsumeResult result;
        CsvTable table;
        try {
            table = CsvReader::readFile(key);
        } catch (const types::FileAccessException &e) {
            Logger::logWarning("[IncrementalFileReader] Cannot seed " + key + ": " + e.what() +
                               " - existing rows will be read on next change");
            result.status = ConsumeStatus::TransientFailure;
            result.error = e.what();
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.transientFailures++;
            return result;
        }

        result.totalRows = table.rowCount();
        result.status = ConsumeStatus::NoNewRows;
        {
            std::lock_guard<std::mutex> lock(cursorsMutex_);
            slot->rowsConsumed = result.totalRows;
        }
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.filesSeeded++;
        }

        Logger::logInfo("[IncrementalFileReader] " + key + ": skipping " + std::to_string(result.totalRows) +
                        " existing rows");
        return result;
    }

    void IncrementalFileReader::resetCursor(const std::string &filePath) {
        const std::string key = normalize(filePath);
        auto slot = slotFor(key);

        std::lock_guard<std::mutex> pass(slot->passMutex);
        std::lock_guard<std::mutex> lock(cursorsMutex_);
        slot->rowsConsumed = 0;
    }

    std::optional<FileCursor> IncrementalFileReader::cursor(const std::string &filePath) const {
        const std::string key = normalize(filePath);
        std::lock_guard<std::mutex> lock(cursorsMutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) return std::nullopt;
        return FileCursor{key, it->second->rowsConsumed};
    }

    std::vector<FileCursor> IncrementalFileReader::cursors() const {
        std::lock_guard<std::mutex> lock(cursorsMutex_);
        std::vector<FileCursor> result;
        result.reserve(slots_.size());
        for (const auto &[path, slot]: slots_) {
            result.push_back(FileCursor{path, slot->rowsConsumed});
        }
        return result;
    }

    IncrementalFileReader::Statistics IncrementalFileReader::getStatistics() const {
        Statistics snapshot;
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            snapshot = stats_;
        }
        std::lock_guard<std::mutex> lock(cursorsMutex_);
        snapshot.filesTracked = slots_.size();
        return snapshot;
    }

    std::shared_ptr<IncrementalFileReader::PathSlot> IncrementalFileReader::slotFor(const std::string &key) {
        std::lock_guard<std::mutex> lock(cursorsMutex_);
        auto &slot = slots_[key];
        if (!slot) {
            slot = std::make_shared<PathSlot>();
        }
        return slot;
    }

    std::string IncrementalFileReader::normalize(const std::string &filePath) {
        return std::filesystem::path(filePath).lexically_normal().string();
    }
} // namespace core::ingest
