#include "reality_scanner.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

RealityScanner::RealityScanner(const RealityConfig& config)
    : config_(config)
    , live_(config.live_history_size)
{}

void RealityScanner::set_backtest_baseline(const PerformanceSnapshot& snapshot) {
    baseline_ = snapshot;
    spdlog::info("Backtest baseline set: win_rate={} slippage={} spread={}",
                 snapshot.win_rate, snapshot.avg_slippage, snapshot.avg_spread);
}

void RealityScanner::set_expected_model(const PerformanceSnapshot& snapshot) {
    expected_ = snapshot;
    spdlog::info("Expected model set: slippage={} spread={} volatility={} liquidity={}",
                 snapshot.avg_slippage, snapshot.avg_spread,
                 snapshot.volatility, snapshot.liquidity);
}

void RealityScanner::register_live_result(const PerformanceSnapshot& snapshot) {
    live_.push(snapshot);
}

PerformanceSnapshot RealityScanner::live_average() const {
    PerformanceSnapshot avg;
    if (live_.empty()) return avg;

    for (const auto& s : live_) {
        avg.win_rate += s.win_rate;
        avg.avg_slippage += s.avg_slippage;
        avg.avg_spread += s.avg_spread;
        avg.volatility += s.volatility;
        avg.liquidity += s.liquidity;
        avg.fill_quality += s.fill_quality;
    }

    double n = static_cast<double>(live_.size());
    avg.win_rate /= n;
    avg.avg_slippage /= n;
    avg.avg_spread /= n;
    avg.volatility /= n;
    avg.liquidity /= n;
    avg.fill_quality /= n;
    avg.timestamp_ms = live_.back().timestamp_ms;
    return avg;
}

DivergenceReport RealityScanner::scan() const {
    DivergenceReport report;
    if (!baseline_ || !expected_ || live_.empty()) {
        return report;
    }

    PerformanceSnapshot live = live_average();
    const PerformanceSnapshot& expected = *expected_;

    report.slippage_deviation = std::abs(live.avg_slippage - expected.avg_slippage);
    report.spread_deviation = std::abs(live.avg_spread - expected.avg_spread);
    report.volatility_mismatch = std::abs(live.volatility - expected.volatility);
    report.liquidity_mismatch = std::abs(live.liquidity - expected.liquidity);

    report.fill_quality_rating = std::max(0.0,
        100.0 - (report.slippage_deviation * 10.0 + report.spread_deviation * 5.0));

    report.execution_risk_score =
        0.4 * report.slippage_deviation +
        0.3 * report.spread_deviation +
        0.2 * report.volatility_mismatch +
        0.1 * report.liquidity_mismatch;

    report.truth_gap = (report.slippage_deviation + report.spread_deviation +
                        report.volatility_mismatch + report.liquidity_mismatch) / 4.0;
    report.status = classify_truth_gap(report.truth_gap);

    report.win_rate_drift = std::abs(live.win_rate - baseline_->win_rate);
    report.live_samples = live_.size();

    spdlog::debug("Reality scan: truth_gap={:.3f} status={} samples={}",
                  report.truth_gap, to_string(report.status), report.live_samples);

    return report;
}

RealityStatus RealityScanner::classify_truth_gap(double truth_gap) const {
    if (truth_gap < config_.aligned_below) return RealityStatus::Aligned;
    if (truth_gap < config_.drifting_below) return RealityStatus::Drifting;
    return RealityStatus::Critical;
}
