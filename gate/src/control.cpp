#include "control.hpp"
#include "json_codec.hpp"
#include <spdlog/spdlog.h>

ControlResult ControlHandler::apply(Pipeline& pipeline, const nlohmann::json& command) {
    ControlResult result{false, "", ""};
    if (!command.is_object()) {
        result.error = "command must be an object";
        spdlog::warn("Ignoring control message that is not an object");
        return result;
    }
    result.cmd = command.value("cmd", std::string());

    try {
        if (result.cmd == "update_weights") {
            pipeline.update_weights(JsonCodec::parse_weights_update(command.at("weights")));
        } else if (result.cmd == "set_threat_modifier") {
            pipeline.set_threat_modifier(command.at("value").get<double>());
        } else if (result.cmd == "reduce_confidence") {
            pipeline.reduce_confidence(command.at("pct").get<double>());
        } else if (result.cmd == "set_baseline") {
            pipeline.set_backtest_baseline(JsonCodec::parse_performance(command.at("snapshot")));
        } else if (result.cmd == "set_expected_model") {
            pipeline.set_expected_model(JsonCodec::parse_performance(command.at("snapshot")));
        } else {
            result.error = "unknown command";
            spdlog::warn("Ignoring unknown control command '{}'", result.cmd);
            return result;
        }
    } catch (const nlohmann::json::exception& e) {
        result.error = e.what();
        spdlog::error("Malformed control command '{}': {}", result.cmd, e.what());
        return result;
    }

    result.applied = true;
    spdlog::debug("Applied control command '{}'", result.cmd);
    return result;
}
