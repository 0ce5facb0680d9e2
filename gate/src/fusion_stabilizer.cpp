#include "fusion_stabilizer.hpp"
#include "filters.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

FusionStabilizer::FusionStabilizer(const StabilizerConfig& config)
    : config_(config)
    , history_(config.history_size)
    , confidence_history_(1)
{}

StabilizedFusion FusionStabilizer::stabilize(const FusionOutput& raw) {
    return stabilize(raw, util::current_timestamp_ms());
}

StabilizedFusion FusionStabilizer::stabilize(const FusionOutput& raw, int64_t now_ms) {
    double score = apply_noise_gate(raw.fusion_score);
    score = apply_drift_control(score);
    double drift_corrected = score;

    score -= raw.volatility * config_.volatility_dampening;
    score -= raw.stability_penalty * config_.shield_penalty;
    score -= raw.correlation_penalty * config_.correlation_scale;

    double smoothed = filters::smooth(filters::clamp(score, 0.0, 100.0), history_);
    double confidence = compute_confidence(raw.volatility, drift_corrected);

    history_.push(smoothed);
    confidence_history_.push(confidence);

    spdlog::debug("Stabilizer: raw={:.2f} corrected={:.2f} smoothed={:.2f} confidence={:.2f}",
                  raw.fusion_score, drift_corrected, smoothed, confidence);

    StabilizedFusion out;
    out.score = smoothed;
    out.confidence = confidence;
    out.signal = raw.signal;
    out.timestamp_ms = now_ms;
    return out;
}

double FusionStabilizer::apply_noise_gate(double score) const {
    double z = filters::zscore(score, history_);
    if (std::abs(z) > config_.noise_gate) {
        return filters::ema(score, config_.noise_alpha, history_);
    }
    return score;
}

double FusionStabilizer::apply_drift_control(double score) const {
    if (history_.size() < 2) return score;

    if (std::abs(score - history_.back()) > config_.drift_threshold) {
        return filters::ema(score, config_.drift_alpha, history_);
    }
    return score;
}

double FusionStabilizer::compute_confidence(double volatility, double drift_corrected) const {
    double base = filters::clamp(100.0 - volatility - drift_corrected, 0.0, 100.0);
    base *= (1.0 - config_.confidence_weight);

    // Only the previous confidence is kept, below the smoothing window, so this yields base
    return filters::smooth(base, confidence_history_);
}
