//
// Created by Andrea on 18/10/2026.
//

#include "core/ingest/RowParser.hpp"
#include <utility>

namespace core::ingest {
    RowParser::RowParser(RowParserConfig config) : config_(std::move(config)) {
    }

    std::optional<LogEvent> RowParser::parse(const CsvRecord &record) const {
        auto rawOutcome = outcomeField(record);
        if (!rawOutcome) {
            return std::nullopt;
        }

        const std::string outcome = trim(*rawOutcome);
        if (outcome.empty()) {
            return std::nullopt;
        }

        LogEvent event;
        if (outcome == config_.passValue) {
            event.outcome = Outcome::Pass;
        } else if (outcome == config_.failValue) {
            event.outcome = Outcome::Fail;
        } else {
            return std::nullopt;
        }

        auto printer = record.get(config_.printerColumn);
        event.printerId = printer ? trim(*printer) : std::string();
        if (event.printerId.empty()) {
            event.printerId = config_.defaultPrinter;
        }

        return event;
    }

    std::optional<std::string> RowParser::outcomeField(const CsvRecord &record) const {
        if (record.hasColumn(config_.outcomeColumn)) {
            return record.get(config_.outcomeColumn);
        }
        if (!config_.legacyOutcomeColumn.empty() && record.hasColumn(config_.legacyOutcomeColumn)) {
            return record.get(config_.legacyOutcomeColumn);
        }
        return std::nullopt;
    }

    std::string RowParser::trim(const std::string &value) {
        const auto first = value.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        const auto last = value.find_last_not_of(" \t\r\n");
        return value.substr(first, last - first + 1);
    }
} // namespace core::ingest
