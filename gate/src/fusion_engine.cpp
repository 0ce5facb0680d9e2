#include "fusion_engine.hpp"
#include "technical.hpp"
#include "filters.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

FusionEngine::FusionEngine(const FusionConfig& config)
    : config_(config)
    , weights_(config.weights)
    , threat_modifier_(config.threat_modifier)
    , confidence_reduction_(0.0)
    , last_signal_(Signal::Wait)
    , history_(config.history_size)
{}

FusionOutput FusionEngine::compute_fusion(const IntelligenceSnapshot& intel,
                                          const TechnicalSnapshot& tech) {
    return compute_fusion(intel, tech, util::current_timestamp_ms());
}

FusionOutput FusionEngine::compute_fusion(const IntelligenceSnapshot& intel,
                                          const TechnicalSnapshot& tech,
                                          int64_t now_ms) {
    FusionOutput out;
    out.timestamp_ms = now_ms;
    out.intelligence_score = intel.intelligence_score;
    out.technical_score = TechnicalScorer::strength_score(tech);
    out.volatility = TechnicalScorer::volatility_score(tech);

    out.stability_penalty = weights_.stability_penalty * (intel.risk_level / 100.0);
    out.correlation_penalty = weights_.correlation_penalty * intel.cascade_risk;

    double core_score = (intel.intelligence_score + out.technical_score) / 2.0;
    double divergence_score = std::abs(intel.intelligence_score - out.technical_score);
    double stabilizer_score = 100.0 - out.volatility;

    out.weighted.core = core_score * weights_.fusion_core;
    out.weighted.divergence = divergence_score * weights_.divergence;
    out.weighted.stabilizer = stabilizer_score * weights_.stabilizer;

    double fusion = out.weighted.core + out.weighted.divergence + out.weighted.stabilizer;
    fusion -= out.stability_penalty * config_.stability_penalty_scale;
    fusion -= out.correlation_penalty * config_.correlation_penalty_scale;

    fusion *= threat_modifier_;
    fusion *= (1.0 - confidence_reduction_ / 100.0);

    fusion = filters::clamp(fusion, 0.0, 100.0);
    fusion = filters::smooth(fusion, history_);
    history_.push(fusion);

    out.fusion_score = fusion;
    out.trend = filters::trend(history_);
    out.signal = classify_signal(fusion, out.trend);
    out.risk_class = classify_risk(fusion, out.volatility);

    last_signal_ = out.signal;

    spdlog::debug("Fusion: score={:.2f} intel={:.1f} tech={:.1f} vol={:.1f} trend={:.3f} signal={}",
                  fusion, out.intelligence_score, out.technical_score,
                  out.volatility, out.trend, to_string(out.signal));

    return out;
}

Signal FusionEngine::classify_signal(double fusion, double trend) const {
    // Evaluated in priority order
    if (fusion <= config_.sell_max_score && trend < config_.sell_trend) {
        return Signal::Sell;
    }
    if (fusion > config_.buy_min_score && trend > config_.buy_trend) {
        return Signal::Buy;
    }
    if (fusion > config_.hold_low && fusion < config_.hold_high) {
        return Signal::Hold;
    }
    return Signal::Wait;
}

RiskClass FusionEngine::classify_risk(double fusion, double volatility) const {
    if (fusion >= config_.low_risk_min_score && volatility <= config_.low_risk_max_volatility) {
        return RiskClass::Low;
    }
    if (fusion >= config_.medium_risk_min_score && volatility <= config_.medium_risk_max_volatility) {
        return RiskClass::Medium;
    }
    if (fusion < config_.high_risk_max_score && volatility >= config_.high_risk_min_volatility) {
        return RiskClass::High;
    }
    return RiskClass::Medium;
}

void FusionEngine::update_weights(const FusionWeightsUpdate& update) {
    if (update.fusion_core) weights_.fusion_core = *update.fusion_core;
    if (update.divergence) weights_.divergence = *update.divergence;
    if (update.stabilizer) weights_.stabilizer = *update.stabilizer;
    if (update.stability_penalty) weights_.stability_penalty = *update.stability_penalty;
    if (update.correlation_penalty) weights_.correlation_penalty = *update.correlation_penalty;

    spdlog::info("Fusion weights updated: core={} divergence={} stabilizer={}",
                 weights_.fusion_core, weights_.divergence, weights_.stabilizer);
}

void FusionEngine::set_threat_modifier(double modifier) {
    threat_modifier_ = modifier;
    spdlog::info("Threat modifier set to {}", modifier);
}

void FusionEngine::reduce_confidence(double pct) {
    confidence_reduction_ = pct;
    spdlog::info("Confidence reduction set to {}%", pct);
}
