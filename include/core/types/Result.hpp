#pragma once

#include <string>
#include <vector>

namespace core::types {

    enum class ResultCode {
        Success,
        Error,
        Skip,
        NotFound,
        InvalidTransition,
        ConfirmationRequired
    };

    inline std::string resultCodeToString(ResultCode code) {
        switch (code) {
            case ResultCode::Success: return "SUCCESS";
            case ResultCode::Error: return "ERROR";
            case ResultCode::Skip: return "SKIP";
            case ResultCode::NotFound: return "NOT_FOUND";
            case ResultCode::InvalidTransition: return "INVALID_TRANSITION";
            case ResultCode::ConfirmationRequired: return "CONFIRMATION_REQUIRED";
            default: return "UNKNOWN";
        }
    }

    struct Result {
        ResultCode code;
        std::string message;
        std::vector<std::string> body; // warnings, e.g. audit writes that did not land

        inline bool isSuccess() const {
            return code == ResultCode::Success;
        }

        inline bool isError() const {
            return code == ResultCode::Error;
        }

        inline bool isSkip() const {
            return code == ResultCode::Skip;
        }

        inline bool isInvalidTransition() const {
            return code == ResultCode::InvalidTransition;
        }

        inline bool needsConfirmation() const {
            return code == ResultCode::ConfirmationRequired;
        }

        inline bool hasWarnings() const {
            return !body.empty();
        }

        inline Result &withWarning(const std::string &warning) {
            body.push_back(warning);
            return *this;
        }

        static inline Result success(const std::string &msg = "Success") {
            return {ResultCode::Success, msg, {}};
        }

        static inline Result error(const std::string &msg = "Error") {
            return {ResultCode::Error, msg, {}};
        }

        static inline Result skip(const std::string &msg = "Skipped") {
            return {ResultCode::Skip, msg, {}};
        }

        static inline Result notFound(const std::string &msg) {
            return {ResultCode::NotFound, msg, {}};
        }

        static inline Result invalidTransition(const std::string &msg) {
            return {ResultCode::InvalidTransition, msg, {}};
        }

        static inline Result confirmationRequired(const std::string &msg) {
            return {ResultCode::ConfirmationRequired, msg, {}};
        }
    };

}
