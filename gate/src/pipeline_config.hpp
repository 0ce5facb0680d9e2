#pragma once

#include <cstddef>
#include <optional>

struct FusionWeights {
    double fusion_core = 0.60;
    double divergence = 0.25;
    double stabilizer = 0.15;
    double stability_penalty = 0.25;
    double correlation_penalty = 0.30;
};

// Partial weight update; unset fields keep their current value
struct FusionWeightsUpdate {
    std::optional<double> fusion_core;
    std::optional<double> divergence;
    std::optional<double> stabilizer;
    std::optional<double> stability_penalty;
    std::optional<double> correlation_penalty;
};

struct FusionConfig {
    FusionWeights weights;
    double threat_modifier = 1.0;
    size_t history_size = 20;

    double stability_penalty_scale = 20.0;
    double correlation_penalty_scale = 15.0;

    // Signal thresholds
    double sell_max_score = 35.0;
    double sell_trend = -0.2;
    double buy_min_score = 60.0;
    double buy_trend = 0.25;
    double hold_low = 40.0;
    double hold_high = 70.0;

    // Risk class thresholds
    double low_risk_min_score = 80.0;
    double low_risk_max_volatility = 40.0;
    double medium_risk_min_score = 55.0;
    double medium_risk_max_volatility = 55.0;
    double high_risk_max_score = 40.0;
    double high_risk_min_volatility = 60.0;
};

struct StabilizerConfig {
    double smoothing_factor = 0.35;
    double confidence_weight = 0.25;
    double noise_gate = 0.7;
    double drift_threshold = 12.0;
    double volatility_dampening = 0.15;
    double shield_penalty = 0.22;
    double noise_alpha = 0.3;
    double drift_alpha = 0.25;
    double correlation_scale = 10.0;
    size_t history_size = 25;
};

struct DivergenceConfig {
    size_t history_size = 200;
    double strength_weight = 0.6;
    double volatility_weight = 0.4;
    double critical_threshold = 70.0;
    double high_threshold = 45.0;
    double moderate_threshold = 20.0;
};

struct RealityConfig {
    size_t live_history_size = 100;
    double aligned_below = 0.1;
    double drifting_below = 0.3;
};

struct DecisionConfig {
    double opportunity_weight = 0.4;
    double trend_min = 0.5;
    double trend_bonus = 20.0;
    double stability_min = 0.6;
    double stability_bonus = 15.0;
    double risk_max = 0.4;
    double risk_bonus = 15.0;
    double shield_max = 0.5;
    double shield_bonus = 15.0;
    double performance_bonus = 10.0;
    double enter_threshold = 60.0;
};

struct TriggerConfig {
    double cooldown_minutes = 3.0;
};

// How the pipeline derives downstream inputs from stage outputs
struct ContextConfig {
    double direction_band = 5.0;
    double drifting_stability_factor = 0.75;
    double critical_stability_factor = 0.4;
};

struct PipelineConfig {
    FusionConfig fusion;
    StabilizerConfig stabilizer;
    DivergenceConfig divergence;
    RealityConfig reality;
    DecisionConfig decision;
    TriggerConfig trigger;
    ContextConfig context;
};
