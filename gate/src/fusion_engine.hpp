#pragma once

#include "types.hpp"
#include "pipeline_config.hpp"
#include "rolling_window.hpp"

// Blends intelligence and technical strength into a single 0-100 score.
// Owns the last fusion_config.history_size fused scores.
class FusionEngine {
public:
    explicit FusionEngine(const FusionConfig& config = FusionConfig());

    FusionOutput compute_fusion(const IntelligenceSnapshot& intel,
                                const TechnicalSnapshot& tech);
    FusionOutput compute_fusion(const IntelligenceSnapshot& intel,
                                const TechnicalSnapshot& tech,
                                int64_t now_ms);

    // Live re-tuning. No validation: callers keep the weights sensible.
    void update_weights(const FusionWeightsUpdate& update);
    void set_threat_modifier(double modifier);
    void reduce_confidence(double pct);

    const FusionWeights& weights() const { return weights_; }
    double threat_modifier() const { return threat_modifier_; }
    double confidence_reduction() const { return confidence_reduction_; }
    Signal last_signal() const { return last_signal_; }
    const RollingWindow<double>& history() const { return history_; }

private:
    FusionConfig config_;
    FusionWeights weights_;
    double threat_modifier_;
    double confidence_reduction_;
    Signal last_signal_;
    RollingWindow<double> history_;

    Signal classify_signal(double fusion, double trend) const;
    RiskClass classify_risk(double fusion, double volatility) const;
};
