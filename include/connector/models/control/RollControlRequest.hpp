#pragma once

#include "../BaseModel.hpp"
#include <cstdint>
#include <string>
#include <utility>

namespace connector::models::control {
    /**
     * @brief Roll level operator request: {"type":"roll","command":"start","jobId":1,"rollNumber":2}
     */
    class RollControlRequest : public BaseModel {
    public:
        std::string command; // start, pause, resume, stop, note, draft, discard
        int64_t jobId = 0;
        int64_t rollNumber = 0;
        std::string note;
        bool confirm = false;

        RollControlRequest() = default;

        RollControlRequest(std::string command, int64_t jobId, int64_t rollNumber)
            : command(std::move(command)), jobId(jobId), rollNumber(rollNumber) {
        }

        explicit RollControlRequest(const nlohmann::json &json) { fromJson(json); }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            return nlohmann::json{
                {"type", "roll"},
                {"command", command},
                {"jobId", jobId},
                {"rollNumber", rollNumber},
                {"note", note},
                {"confirm", confirm}
            };
        }

        void fromJson(const nlohmann::json &json) override {
            command = json.at("command").get<std::string>();
            jobId = json.at("jobId").get<int64_t>();
            rollNumber = json.at("rollNumber").get<int64_t>();

            if (json.contains("note") && !json["note"].is_null()) {
                note = json["note"].get<std::string>();
            }
            if (json.contains("confirm") && !json["confirm"].is_null()) {
                confirm = json["confirm"].get<bool>();
            }
        }

        bool isValid() const override {
            bool known = command == "start" || command == "pause" || command == "resume" ||
                         command == "stop" || command == "note" || command == "draft" ||
                         command == "discard";
            return known && jobId > 0 && rollNumber > 0;
        }

        std::string getTypeName() const override {
            return "RollControlRequest";
        }
    };
}
