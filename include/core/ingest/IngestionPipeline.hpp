//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <memory>
#include <mutex>

#include "core/events/EventSystem.hpp"
#include "core/ingest/IncrementalFileReader.hpp"
#include "core/ingest/PrinterAggregator.hpp"
#include "core/watch/FileEvent.hpp"

namespace core::ingest {
    /**
     * @brief File notification -> new rows -> cumulative counters -> COUNTERS_UPDATED.
     *
     * Safe to call from several notification threads; ordering guarantees come from
     * the reader's per-path serialization.
     */
    class IngestionPipeline {
    public:
        IngestionPipeline(std::shared_ptr<IncrementalFileReader> reader,
                          std::shared_ptr<PrinterAggregator> aggregator,
                          events::EventBus &eventBus);

        void onFileEvent(const watch::FileEvent &event);

        std::shared_ptr<IncrementalFileReader> getReader() const { return reader_; }

        std::shared_ptr<PrinterAggregator> getAggregator() const { return aggregator_; }

        struct Statistics {
            size_t notificationsHandled = 0;
            size_t batchesPublished = 0;
            size_t eventsApplied = 0;
            size_t failedPasses = 0;
        };

        Statistics getStatistics() const;

    private:
        std::shared_ptr<IncrementalFileReader> reader_;
        std::shared_ptr<PrinterAggregator> aggregator_;
        events::EventBus &eventBus_;
        std::mutex publishMutex_;

        mutable std::mutex statsMutex_;
        Statistics stats_;
    };
} // namespace core::ingest
