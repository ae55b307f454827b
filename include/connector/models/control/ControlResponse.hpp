#pragma once

#include "../BaseModel.hpp"
#include "core/types/Result.hpp"
#include <string>
#include <utility>
#include <vector>

namespace connector::models::control {
    /**
     * @brief One response line per request: {"ok":true,"code":"SUCCESS","message":"...","warnings":[],"data":{}}
     */
    class ControlResponse : public BaseModel {
    public:
        bool ok = false;
        std::string code;
        std::string message;
        std::vector<std::string> warnings;
        nlohmann::json data = nlohmann::json::object();

        ControlResponse() = default;

        explicit ControlResponse(const nlohmann::json &json) { fromJson(json); }

        static ControlResponse fromResult(const core::types::Result &result,
                                          nlohmann::json data = nlohmann::json::object()) {
            ControlResponse response;
            response.ok = result.isSuccess();
            response.code = core::types::resultCodeToString(result.code);
            response.message = result.message;
            response.warnings = result.body;
            response.data = std::move(data);
            return response;
        }

        static ControlResponse error(const std::string &message) {
            return fromResult(core::types::Result::error(message));
        }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            return nlohmann::json{
                {"ok", ok},
                {"code", code},
                {"message", message},
                {"warnings", warnings},
                {"data", data}
            };
        }

        void fromJson(const nlohmann::json &json) override {
            ok = json.at("ok").get<bool>();
            code = json.at("code").get<std::string>();
            message = json.value("message", std::string());
            warnings.clear();
            if (json.contains("warnings") && json["warnings"].is_array()) {
                warnings = json["warnings"].get<std::vector<std::string> >();
            }
            data = json.contains("data") ? json["data"] : nlohmann::json::object();
        }

        bool isValid() const override {
            return !code.empty();
        }

        std::string getTypeName() const override {
            return "ControlResponse";
        }
    };
}
