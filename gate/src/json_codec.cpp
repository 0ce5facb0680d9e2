#include "json_codec.hpp"
#include "util.hpp"

IntelligenceSnapshot JsonCodec::parse_intelligence(const nlohmann::json& j) {
    IntelligenceSnapshot intel;
    intel.intelligence_score = j.value("intelligence_score", intel.intelligence_score);
    intel.risk_level = j.value("risk_level", intel.risk_level);
    intel.cascade_risk = j.value("cascade_risk", intel.cascade_risk);
    return intel;
}

TechnicalSnapshot JsonCodec::parse_technical(const nlohmann::json& j) {
    TechnicalSnapshot tech;
    tech.rsi = j.value("rsi", tech.rsi);
    tech.momentum_pct = j.value("momentum_pct", tech.momentum_pct);
    tech.macd_histogram = j.value("macd_histogram", tech.macd_histogram);
    tech.volume_ratio = j.value("volume_ratio", tech.volume_ratio);
    tech.atr_pct = j.value("atr_pct", tech.atr_pct);
    tech.bollinger_width_pct = j.value("bollinger_width_pct", tech.bollinger_width_pct);
    return tech;
}

PerformanceSnapshot JsonCodec::parse_performance(const nlohmann::json& j) {
    PerformanceSnapshot snap;
    snap.win_rate = j.value("win_rate", 0.0);
    snap.avg_slippage = j.value("avg_slippage", 0.0);
    snap.avg_spread = j.value("avg_spread", 0.0);
    snap.volatility = j.value("volatility", 0.0);
    snap.liquidity = j.value("liquidity", 0.0);
    snap.fill_quality = j.value("fill_quality", 0.0);
    snap.timestamp_ms = j.value("ts_ms", util::current_timestamp_ms());
    return snap;
}

std::vector<PerformanceSnapshot> JsonCodec::parse_live_results(const nlohmann::json& j) {
    std::vector<PerformanceSnapshot> results;
    if (j.is_array()) {
        for (const auto& entry : j) {
            results.push_back(parse_performance(entry));
        }
    } else {
        results.push_back(parse_performance(j));
    }
    return results;
}

DivergenceReading JsonCodec::parse_divergence_reading(const nlohmann::json& j) {
    DivergenceReading reading;
    reading.strength = j.value("strength", 0.0);
    reading.confidence = j.value("confidence", 0.0);
    reading.volatility = j.value("volatility", 0.0);
    reading.direction = parse_direction(j.value("direction", std::string("NEUTRAL")));
    reading.timestamp_ms = j.value("ts_ms", util::current_timestamp_ms());
    return reading;
}

FusionWeightsUpdate JsonCodec::parse_weights_update(const nlohmann::json& j) {
    FusionWeightsUpdate update;
    if (j.contains("fusion_core")) update.fusion_core = j.at("fusion_core").get<double>();
    if (j.contains("divergence")) update.divergence = j.at("divergence").get<double>();
    if (j.contains("stabilizer")) update.stabilizer = j.at("stabilizer").get<double>();
    if (j.contains("stability_penalty")) {
        update.stability_penalty = j.at("stability_penalty").get<double>();
    }
    if (j.contains("correlation_penalty")) {
        update.correlation_penalty = j.at("correlation_penalty").get<double>();
    }
    return update;
}

Direction JsonCodec::parse_direction(const std::string& s) {
    if (s == "BULLISH") return Direction::Bullish;
    if (s == "BEARISH") return Direction::Bearish;
    return Direction::Neutral;
}

nlohmann::json JsonCodec::to_json(const FusionOutput& fusion) {
    return {
        {"fusion_score", fusion.fusion_score},
        {"signal", to_string(fusion.signal)},
        {"risk_class", to_string(fusion.risk_class)},
        {"volatility", fusion.volatility},
        {"intelligence_score", fusion.intelligence_score},
        {"technical_score", fusion.technical_score},
        {"stability_penalty", fusion.stability_penalty},
        {"correlation_penalty", fusion.correlation_penalty},
        {"trend", fusion.trend},
        {"ts_ms", fusion.timestamp_ms},
        {"weighted", {
            {"core", fusion.weighted.core},
            {"divergence", fusion.weighted.divergence},
            {"stabilizer", fusion.weighted.stabilizer}
        }}
    };
}

nlohmann::json JsonCodec::to_json(const StabilizedFusion& stabilized) {
    return {
        {"score", stabilized.score},
        {"confidence", stabilized.confidence},
        {"signal", to_string(stabilized.signal)},
        {"ts_ms", stabilized.timestamp_ms}
    };
}

nlohmann::json JsonCodec::to_json(const DivergenceThreatScore& threat) {
    return {
        {"strength", threat.strength},
        {"confidence", threat.confidence},
        {"volatility", threat.volatility},
        {"direction", to_string(threat.direction)},
        {"threat_score", threat.threat_score},
        {"level", to_string(threat.level)},
        {"ts_ms", threat.timestamp_ms}
    };
}

nlohmann::json JsonCodec::to_json(const DivergenceThreatSummary& summary) {
    return {
        {"current", to_json(summary.current)},
        {"average_score", summary.average_score},
        {"peak_score", summary.peak_score},
        {"trend", summary.trend},
        {"samples", summary.samples}
    };
}

nlohmann::json JsonCodec::to_json(const DivergenceReport& report) {
    return {
        {"slippage_deviation", report.slippage_deviation},
        {"spread_deviation", report.spread_deviation},
        {"volatility_mismatch", report.volatility_mismatch},
        {"liquidity_mismatch", report.liquidity_mismatch},
        {"fill_quality_rating", report.fill_quality_rating},
        {"execution_risk_score", report.execution_risk_score},
        {"truth_gap", report.truth_gap},
        {"status", to_string(report.status)},
        {"win_rate_drift", report.win_rate_drift},
        {"live_samples", report.live_samples}
    };
}

nlohmann::json JsonCodec::to_json(const TradeDecision& decision) {
    return {
        {"score", decision.score},
        {"action", to_string(decision.action)},
        {"reason", decision.reason},
        {"reasons", decision.reasons},
        {"ts_ms", decision.timestamp_ms}
    };
}

nlohmann::json JsonCodec::to_json(const TriggerOutput& trigger) {
    return {
        {"approved", trigger.approved},
        {"action", to_string(trigger.action)},
        {"confidence", trigger.confidence},
        {"reason", trigger.reason},
        {"cooldown_min", trigger.cooldown_remaining_min},
        {"ts_ms", trigger.timestamp_ms}
    };
}

nlohmann::json JsonCodec::to_json(const TickResult& result) {
    nlohmann::json j = {
        {"type", "gate_decision"},
        {"ts", util::to_iso8601(result.timestamp_ms)},
        {"fusion", to_json(result.fusion)},
        {"stabilized", to_json(result.stabilized)},
        {"threat", to_json(result.threat)},
        {"reality", to_json(result.report)},
        {"decision", to_json(result.decision)},
        {"trigger", to_json(result.trigger)}
    };

    if (result.threat_summary) {
        j["threat_summary"] = to_json(*result.threat_summary);
    } else {
        j["threat_summary"] = nullptr;
    }
    return j;
}
