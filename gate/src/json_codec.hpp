#pragma once

#include "types.hpp"
#include "pipeline.hpp"
#include <nlohmann/json.hpp>

// Bus payloads. Absent fields inside a section take the struct defaults.
class JsonCodec {
public:
    static IntelligenceSnapshot parse_intelligence(const nlohmann::json& j);
    static TechnicalSnapshot parse_technical(const nlohmann::json& j);
    static PerformanceSnapshot parse_performance(const nlohmann::json& j);
    // Accepts a single snapshot object or an array of them
    static std::vector<PerformanceSnapshot> parse_live_results(const nlohmann::json& j);
    static DivergenceReading parse_divergence_reading(const nlohmann::json& j);
    static FusionWeightsUpdate parse_weights_update(const nlohmann::json& j);

    static nlohmann::json to_json(const FusionOutput& fusion);
    static nlohmann::json to_json(const StabilizedFusion& stabilized);
    static nlohmann::json to_json(const DivergenceThreatScore& threat);
    static nlohmann::json to_json(const DivergenceThreatSummary& summary);
    static nlohmann::json to_json(const DivergenceReport& report);
    static nlohmann::json to_json(const TradeDecision& decision);
    static nlohmann::json to_json(const TriggerOutput& trigger);
    static nlohmann::json to_json(const TickResult& result);

private:
    static Direction parse_direction(const std::string& s);
};
