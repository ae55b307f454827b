//
// Created by Andrea on 18/10/2026.
//

#include "core/ingest/IngestionPipeline.hpp"
#include "logger/Logger.hpp"
#include <utility>

namespace core::ingest {
    IngestionPipeline::IngestionPipeline(std::shared_ptr<IncrementalFileReader> reader,
                                         std::shared_ptr<PrinterAggregator> aggregator,
                                         events::EventBus &eventBus)
        : reader_(std::move(reader)), aggregator_(std::move(aggregator)), eventBus_(eventBus) {
    }

    void IngestionPipeline::onFileEvent(const watch::FileEvent &event) {
        Logger::logDebug("[IngestionPipeline] " + watch::fileEventKindToString(event.kind) + " " + event.path);

        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.notificationsHandled++;
        }

        if (event.kind == watch::FileEventKind::Created) {
            reader_->resetCursor(event.path);
        }

        ConsumeResult result = event.kind == watch::FileEventKind::Existing
                                   ? reader_->seedCursor(event.path)
                                   : reader_->consume(event.path);

        if (result.status == ConsumeStatus::TransientFailure) {
            {
                std::lock_guard<std::mutex> lock(statsMutex_);
                stats_.failedPasses++;
            }
            eventBus_.publish(events::Event(events::EventType::FILE_ACCESS_FAILED, event.path, result.error));
            return;
        }

        if (result.status == ConsumeStatus::Reset) {
            eventBus_.publish(events::Event(events::EventType::FILE_SHRINK_DETECTED, event.path,
                                            "File shrank, reprocessed " + std::to_string(result.totalRows) +
                                            " rows"));
        }

        if (result.events.empty()) {
            Logger::logDebug("[IngestionPipeline] " + event.path + ": " + consumeStatusToString(result.status) +
                             ", nothing to apply");
            return;
        }

        {
            // Snapshots reach observers in the order they were applied
            std::lock_guard<std::mutex> publish(publishMutex_);
            auto snapshot = aggregator_->apply(result.events);
            eventBus_.publish(events::Event::countersUpdated(event.path, std::move(snapshot)));
        }

        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.batchesPublished++;
        stats_.eventsApplied += result.events.size();
    }

    IngestionPipeline::Statistics IngestionPipeline::getStatistics() const {
        std::lock_guard<std::mutex> lock(statsMutex_);
        return stats_;
    }
} // namespace core::ingest
