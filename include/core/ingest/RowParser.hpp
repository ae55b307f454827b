//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <optional>
#include <string>

#include "core/ingest/CsvReader.hpp"
#include "core/ingest/LogEvent.hpp"

namespace core::ingest {
    struct RowParserConfig {
        std::string printerColumn = "Printer Name";
        std::string outcomeColumn = "Outcome Message";
        std::string legacyOutcomeColumn = "Failure Message";
        std::string passValue = "Pass (Label)";
        std::string failValue = "Fail (Label)";
        std::string defaultPrinter = "Printer_1";
    };

    /**
     * @brief Classifies one export record into a pass/fail event.
     *
     * Returns nullopt (ParseSkip) when the outcome is missing, blank or not one of
     * the two recognized sentinel strings. A missing printer name falls back to the
     * configured default printer.
     */
    class RowParser {
    public:
        explicit RowParser(RowParserConfig config = RowParserConfig{});

        std::optional<LogEvent> parse(const CsvRecord &record) const;

        const RowParserConfig &config() const { return config_; }

    private:
        RowParserConfig config_;

        std::optional<std::string> outcomeField(const CsvRecord &record) const;

        static std::string trim(const std::string &value);
    };
} // namespace core::ingest
