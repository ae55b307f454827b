//
// Created by Andrea on 18/10/2026.
//

#include "core/ingest/PrinterAggregator.hpp"

namespace core::ingest {
    CountersSnapshot PrinterAggregator::apply(const std::vector<LogEvent> &events) {
        std::lock_guard<std::mutex> lock(countersMutex_);
        for (const auto &event: events) {
            auto &entry = counters_[event.printerId];
            if (entry.printerId.empty()) {
                entry.printerId = event.printerId;
            }
            if (event.outcome == Outcome::Pass) {
                entry.cumulativePass++;
            } else {
                entry.cumulativeFail++;
            }
        }
        return counters_;
    }

    CountersSnapshot PrinterAggregator::snapshot() const {
        std::lock_guard<std::mutex> lock(countersMutex_);
        return counters_;
    }

    PrinterCounters PrinterAggregator::counters(const std::string &printerId) const {
        std::lock_guard<std::mutex> lock(countersMutex_);
        auto it = counters_.find(printerId);
        if (it == counters_.end()) {
            return PrinterCounters{printerId, 0, 0};
        }
        return it->second;
    }

    size_t PrinterAggregator::printerCount() const {
        std::lock_guard<std::mutex> lock(countersMutex_);
        return counters_.size();
    }
} // namespace core::ingest
