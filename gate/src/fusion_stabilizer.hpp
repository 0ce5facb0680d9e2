#pragma once

#include "types.hpp"
#include "pipeline_config.hpp"
#include "rolling_window.hpp"

// Post-processes a raw fusion score: noise gate, drift control,
// volatility/shield corrections and smoothing.
class FusionStabilizer {
public:
    explicit FusionStabilizer(const StabilizerConfig& config = StabilizerConfig());

    StabilizedFusion stabilize(const FusionOutput& raw);
    StabilizedFusion stabilize(const FusionOutput& raw, int64_t now_ms);

    const StabilizerConfig& config() const { return config_; }
    const RollingWindow<double>& history() const { return history_; }
    double last_confidence() const {
        return confidence_history_.empty() ? 0.0 : confidence_history_.back();
    }

private:
    StabilizerConfig config_;
    RollingWindow<double> history_;
    RollingWindow<double> confidence_history_;

    double apply_noise_gate(double score) const;
    double apply_drift_control(double score) const;
    double compute_confidence(double volatility, double drift_corrected) const;
};
