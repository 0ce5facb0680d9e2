#pragma once

#include "types.hpp"
#include "pipeline_config.hpp"
#include "fusion_engine.hpp"
#include "fusion_stabilizer.hpp"
#include "divergence_controller.hpp"
#include "reality_scanner.hpp"
#include "decision_scorer.hpp"
#include "trade_trigger.hpp"
#include <optional>
#include <vector>

struct TickInput {
    IntelligenceSnapshot intel;
    TechnicalSnapshot tech;
    std::vector<PerformanceSnapshot> live_results;
    std::optional<DivergenceReading> divergence;  // overrides the derived reading
    double daily_performance = 0.0;
};

struct TickResult {
    FusionOutput fusion;
    StabilizedFusion stabilized;
    DivergenceThreatScore threat;
    std::optional<DivergenceThreatSummary> threat_summary;
    DivergenceReport report;
    DecisionContext context;
    TradeDecision decision;
    TriggerOutput trigger;
    int64_t timestamp_ms = 0;
};

// Every stateful stage of the pipeline. Copyable so a tick can be rolled back.
struct PipelineState {
    FusionEngine fusion;
    FusionStabilizer stabilizer;
    DivergenceController divergence;
    RealityScanner reality;
    TradeTrigger trigger;
    std::optional<RealityStatus> last_status;
};

class Pipeline {
public:
    explicit Pipeline(const PipelineConfig& config = PipelineConfig());

    TickResult run_tick(const TickInput& input);
    TickResult run_tick(const TickInput& input, int64_t now_ms);

    PipelineState checkpoint() const { return state_; }
    // Copies into existing storage; history buffers of equal capacity are not reallocated
    void checkpoint(PipelineState& into) const { into = state_; }
    void restore(const PipelineState& state) { state_ = state; }

    // Control surface, applied between ticks
    void update_weights(const FusionWeightsUpdate& update);
    void set_threat_modifier(double modifier);
    void reduce_confidence(double pct);
    void set_backtest_baseline(const PerformanceSnapshot& snapshot);
    void set_expected_model(const PerformanceSnapshot& snapshot);

    const FusionEngine& fusion_engine() const { return state_.fusion; }
    const FusionStabilizer& stabilizer() const { return state_.stabilizer; }
    const DivergenceController& divergence_controller() const { return state_.divergence; }
    const RealityScanner& reality_scanner() const { return state_.reality; }
    const TradeTrigger& trade_trigger() const { return state_.trigger; }

    DivergenceReading derive_reading(const FusionOutput& fusion,
                                     const StabilizedFusion& stabilized) const;
    DecisionContext build_context(const TickInput& input,
                                  const FusionOutput& fusion,
                                  const StabilizedFusion& stabilized,
                                  const DivergenceThreatScore& threat,
                                  const DivergenceReport& report) const;

private:
    PipelineConfig config_;
    DecisionScorer scorer_;
    PipelineState state_;

    void log_status_change(RealityStatus status, const DivergenceReport& report);
};
