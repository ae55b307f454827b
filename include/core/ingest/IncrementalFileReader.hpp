//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/ingest/LogEvent.hpp"
#include "core/ingest/RowParser.hpp"

namespace core::ingest {
    /**
     * @brief Rows of a watched file already ingested. Never exceeds the file's row count,
     * never shrinks except through an explicit reset.
     */
    struct FileCursor {
        std::string filePath;
        size_t rowsConsumed = 0;
    };

    enum class ConsumeStatus {
        Ok,
        NoNewRows,
        TransientFailure,
        Reset // file got shorter than the cursor, reprocessed from the first row
    };

    std::string consumeStatusToString(ConsumeStatus status);

    struct ConsumeResult {
        ConsumeStatus status = ConsumeStatus::NoNewRows;
        std::vector<LogEvent> events;
        size_t totalRows = 0;
        size_t newRows = 0;
        size_t skippedRows = 0;
        std::string error;
    };

    class IncrementalFileReader {
    public:
        explicit IncrementalFileReader(RowParser parser = RowParser{});

        /**
         * @brief Read the rows appended to filePath since the last successful pass.
         *
         * Passes for the same path are serialized; passes for distinct paths run
         * independently. A read failure leaves the cursor untouched.
         */
        ConsumeResult consume(const std::string &filePath);

        /**
         * @brief Place the cursor after the rows filePath holds now, without emitting them.
         *
         * Used for exports that predate the watcher; only rows appended later are ingested.
         */
        ConsumeResult seedCursor(const std::string &filePath);

        void resetCursor(const std::string &filePath);

        std::optional<FileCursor> cursor(const std::string &filePath) const;

        std::vector<FileCursor> cursors() const;

        struct Statistics {
            size_t filesTracked = 0;
            size_t rowsConsumed = 0;
            size_t eventsParsed = 0;
            size_t rowsSkipped = 0;
            size_t transientFailures = 0;
            size_t shrinkAnomalies = 0;
            size_t filesSeeded = 0;
        };

        Statistics getStatistics() const;

    private:
        struct PathSlot {
            std::mutex passMutex;
            size_t rowsConsumed = 0;
        };

        RowParser parser_;

        mutable std::mutex cursorsMutex_;
        std::unordered_map<std::string, std::shared_ptr<PathSlot> > slots_;

        mutable std::mutex statsMutex_;
        Statistics stats_;

        std::shared_ptr<PathSlot> slotFor(const std::string &key);

        static std::string normalize(const std::string &filePath);
    };
} // namespace core::ingest
