#pragma once

#include "types.hpp"
#include "pipeline_config.hpp"
#include "rolling_window.hpp"
#include <optional>

// Compares live execution against the expected model and backtest baseline
class RealityScanner {
public:
    explicit RealityScanner(const RealityConfig& config = RealityConfig());

    // Last write wins
    void set_backtest_baseline(const PerformanceSnapshot& snapshot);
    void set_expected_model(const PerformanceSnapshot& snapshot);

    void register_live_result(const PerformanceSnapshot& snapshot);

    // Neutral empty report until baseline, model and at least one live result exist
    DivergenceReport scan() const;

    RealityStatus classify_truth_gap(double truth_gap) const;
    PerformanceSnapshot live_average() const;

    bool has_baseline() const { return baseline_.has_value(); }
    bool has_expected_model() const { return expected_.has_value(); }
    size_t live_count() const { return live_.size(); }

private:
    RealityConfig config_;
    std::optional<PerformanceSnapshot> baseline_;
    std::optional<PerformanceSnapshot> expected_;
    RollingWindow<PerformanceSnapshot> live_;
};
