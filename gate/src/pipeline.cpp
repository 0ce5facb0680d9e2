#include "pipeline.hpp"
#include "filters.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

Pipeline::Pipeline(const PipelineConfig& config)
    : config_(config)
    , scorer_(config.decision)
    , state_{FusionEngine(config.fusion),
             FusionStabilizer(config.stabilizer),
             DivergenceController(config.divergence),
             RealityScanner(config.reality),
             TradeTrigger(config.trigger),
             std::nullopt}
{}

TickResult Pipeline::run_tick(const TickInput& input) {
    return run_tick(input, util::current_timestamp_ms());
}

TickResult Pipeline::run_tick(const TickInput& input, int64_t now_ms) {
    TickResult result;
    result.timestamp_ms = now_ms;

    result.fusion = state_.fusion.compute_fusion(input.intel, input.tech, now_ms);
    result.stabilized = state_.stabilizer.stabilize(result.fusion, now_ms);

    for (const auto& live : input.live_results) {
        state_.reality.register_live_result(live);
    }

    DivergenceReading reading = input.divergence ? *input.divergence
                                                 : derive_reading(result.fusion, result.stabilized);
    result.threat = state_.divergence.update(reading);
    result.threat_summary = state_.divergence.get_summary();

    result.report = state_.reality.scan();
    log_status_change(result.report.status, result.report);

    result.context = build_context(input, result.fusion, result.stabilized,
                                   result.threat, result.report);
    result.decision = scorer_.score(result.context, now_ms);
    result.trigger = state_.trigger.fire(result.decision, now_ms);

    return result;
}

DivergenceReading Pipeline::derive_reading(const FusionOutput& fusion,
                                           const StabilizedFusion& stabilized) const {
    DivergenceReading reading;
    reading.strength = std::abs(fusion.intelligence_score - fusion.technical_score);
    reading.confidence = stabilized.confidence;
    reading.volatility = fusion.volatility;
    reading.timestamp_ms = fusion.timestamp_ms;

    double gap = fusion.intelligence_score - fusion.technical_score;
    if (gap > config_.context.direction_band) {
        reading.direction = Direction::Bullish;
    } else if (gap < -config_.context.direction_band) {
        reading.direction = Direction::Bearish;
    } else {
        reading.direction = Direction::Neutral;
    }
    return reading;
}

DecisionContext Pipeline::build_context(const TickInput& input,
                                        const FusionOutput& fusion,
                                        const StabilizedFusion& stabilized,
                                        const DivergenceThreatScore& threat,
                                        const DivergenceReport& report) const {
    double status_factor = 1.0;
    if (report.status == RealityStatus::Drifting) {
        status_factor = config_.context.drifting_stability_factor;
    } else if (report.status == RealityStatus::Critical) {
        status_factor = config_.context.critical_stability_factor;
    }

    DecisionContext ctx;
    ctx.opportunity_score = stabilized.score;
    ctx.trend_alignment = filters::clamp(0.5 + 0.5 * fusion.trend, 0.0, 1.0);
    ctx.risk_level = filters::clamp(input.intel.risk_level / 100.0, 0.0, 1.0);
    ctx.shield_threat = filters::clamp(threat.threat_score / 100.0, 0.0, 1.0);
    ctx.market_stability = filters::clamp((100.0 - fusion.volatility) / 100.0 * status_factor,
                                          0.0, 1.0);
    ctx.daily_performance = input.daily_performance;
    return ctx;
}

void Pipeline::log_status_change(RealityStatus status, const DivergenceReport& report) {
    if (state_.last_status && *state_.last_status == status) return;

    if (status == RealityStatus::Critical) {
        spdlog::warn("Reality divergence CRITICAL: truth_gap={:.3f} slippage_dev={:.3f} spread_dev={:.3f}",
                     report.truth_gap, report.slippage_deviation, report.spread_deviation);
    } else {
        spdlog::info("Reality divergence status: {} (truth_gap={:.3f})",
                     to_string(status), report.truth_gap);
    }
    state_.last_status = status;
}

void Pipeline::update_weights(const FusionWeightsUpdate& update) {
    state_.fusion.update_weights(update);
}

void Pipeline::set_threat_modifier(double modifier) {
    state_.fusion.set_threat_modifier(modifier);
}

void Pipeline::reduce_confidence(double pct) {
    state_.fusion.reduce_confidence(pct);
}

void Pipeline::set_backtest_baseline(const PerformanceSnapshot& snapshot) {
    state_.reality.set_backtest_baseline(snapshot);
}

void Pipeline::set_expected_model(const PerformanceSnapshot& snapshot) {
    state_.reality.set_expected_model(snapshot);
}
