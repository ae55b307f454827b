#pragma once

#include "../BaseModel.hpp"
#include "core/jobs/Job.hpp"
#include <cstdint>
#include <string>

namespace connector::models::control {
    /**
     * @brief Job level operator request: {"type":"job","command":"add",...}
     */
    class JobRequest : public BaseModel {
    public:
        std::string command; // add, update, list, open, close, complete, status
        int64_t jobId = 0;
        core::jobs::JobFields fields;
        bool hasFields = false;
        bool confirm = false;

        JobRequest() = default;

        explicit JobRequest(const nlohmann::json &json) { fromJson(json); }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            nlohmann::json json{
                {"type", "job"},
                {"command", command},
                {"jobId", jobId},
                {"confirm", confirm}
            };
            if (hasFields) {
                json["fields"] = {
                    {"customer", fields.customer},
                    {"ticket", fields.ticket},
                    {"inlayType", fields.inlayType},
                    {"quantity", fields.quantity},
                    {"labelsPerRoll", fields.labelsPerRoll},
                    {"printerName", fields.printerName}
                };
            }
            return json;
        }

        void fromJson(const nlohmann::json &json) override {
            command = json.at("command").get<std::string>();

            // Optional fields - handle null safely
            if (json.contains("jobId") && !json["jobId"].is_null()) {
                jobId = json["jobId"].get<int64_t>();
            }
            if (json.contains("confirm") && !json["confirm"].is_null()) {
                confirm = json["confirm"].get<bool>();
            }
            if (json.contains("fields") && json["fields"].is_object()) {
                const auto &f = json["fields"];
                fields.customer = f.value("customer", std::string());
                fields.ticket = f.value("ticket", std::string());
                fields.inlayType = f.value("inlayType", std::string());
                fields.quantity = f.value("quantity", int64_t{0});
                fields.labelsPerRoll = f.value("labelsPerRoll", int64_t{0});
                fields.printerName = f.value("printerName", std::string());
                hasFields = true;
            }
        }

        bool isValid() const override {
            if (command == "list") return true;
            if (command == "add") return hasFields;
            if (command == "update") return jobId > 0 && hasFields;
            if (command == "open" || command == "close" || command == "complete" || command == "status") {
                return jobId > 0;
            }
            return false;
        }

        std::string getTypeName() const override {
            return "JobRequest";
        }
    };
}
