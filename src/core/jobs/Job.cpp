//
// Created by Andrea on 18/10/2026.
//

#include "core/jobs/Job.hpp"

namespace core::jobs {
    namespace {
        std::string trim(const std::string &value) {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) return "";
            const auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, last - first + 1);
        }
    }

    JobFields JobFields::normalized() const {
        JobFields copy = *this;
        copy.customer = trim(customer);
        copy.ticket = trim(ticket);
        copy.inlayType = trim(inlayType);
        copy.printerName = trim(printerName);
        if (copy.printerName.empty()) {
            copy.printerName = DEFAULT_PRINTER_NAME;
        }
        return copy;
    }

    std::vector<std::string> JobFields::validate() const {
        std::vector<std::string> errors;
        if (trim(customer).empty()) {
            errors.emplace_back("customer is required");
        }
        if (trim(ticket).empty()) {
            errors.emplace_back("job ticket is required");
        }
        if (quantity <= 0) {
            errors.emplace_back("quantity must be > 0");
        }
        if (labelsPerRoll <= 0) {
            errors.emplace_back("labels per roll must be > 0");
        }
        return errors;
    }

    JobFields Job::fields() const {
        return JobFields{customer, ticket, inlayType, quantity, labelsPerRoll, printerName};
    }

    int64_t Job::totalRolls() const {
        return computeTotalRolls(quantity, labelsPerRoll);
    }

    int64_t computeTotalRolls(int64_t quantity, int64_t labelsPerRoll) {
        if (quantity <= 0 || labelsPerRoll <= 0) return 0;
        return (quantity + labelsPerRoll - 1) / labelsPerRoll;
    }
} // namespace core::jobs
