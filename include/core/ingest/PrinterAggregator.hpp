//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "core/ingest/LogEvent.hpp"

namespace core::ingest {
    /**
     * @brief Cumulative pass/fail counters per printer for the life of the process.
     *
     * Counters only grow. Snapshots are copies taken under the same lock as a whole
     * batch apply, so no reader sees half a batch.
     */
    class PrinterAggregator {
    public:
        /**
         * @brief Apply a batch of events
         * @return snapshot of all counters right after this batch
         */
        CountersSnapshot apply(const std::vector<LogEvent> &events);

        CountersSnapshot snapshot() const;

        PrinterCounters counters(const std::string &printerId) const;

        size_t printerCount() const;

    private:
        mutable std::mutex countersMutex_;
        CountersSnapshot counters_;
    };
} // namespace core::ingest
