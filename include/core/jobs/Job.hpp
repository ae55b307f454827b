//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace core::jobs {
    constexpr const char *DEFAULT_PRINTER_NAME = "Printer_1";

    /**
     * @brief Editable job attributes, as entered by the operator
     */
    struct JobFields {
        std::string customer;
        std::string ticket;
        std::string inlayType;
        int64_t quantity = 0;
        int64_t labelsPerRoll = 0;
        std::string printerName;

        /**
         * @brief Blank printer name becomes the default printer
         */
        JobFields normalized() const;

        std::vector<std::string> validate() const;
    };

    struct Job {
        int64_t id = 0;
        std::string customer;
        std::string ticket;
        std::string inlayType;
        int64_t quantity = 0;
        int64_t labelsPerRoll = 0;
        std::string printerName;
        std::string createdAt;
        bool completed = false;

        JobFields fields() const;

        int64_t totalRolls() const;
    };

    /**
     * @brief ceil(quantity / labelsPerRoll), 0 when either side is not positive
     */
    int64_t computeTotalRolls(int64_t quantity, int64_t labelsPerRoll);
} // namespace core::jobs
