//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace core::ingest {
    enum class Outcome {
        Pass,
        Fail
    };

    /**
     * @brief One classified label row from a printer log export
     */
    struct LogEvent {
        std::string printerId;
        Outcome outcome;
    };

    /**
     * @brief Lifetime pass/fail totals of a printer, never decremented
     */
    struct PrinterCounters {
        std::string printerId;
        int64_t cumulativePass = 0;
        int64_t cumulativeFail = 0;

        bool operator==(const PrinterCounters &other) const {
            return printerId == other.printerId &&
                   cumulativePass == other.cumulativePass &&
                   cumulativeFail == other.cumulativeFail;
        }
    };

    using CountersSnapshot = std::map<std::string, PrinterCounters>;
} // namespace core::ingest
