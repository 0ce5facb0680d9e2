#pragma once

#include <string>
#include <vector>
#include <cstdint>

enum class Signal {
    Buy,
    Sell,
    Hold,
    Wait
};

enum class RiskClass {
    Low,
    Medium,
    High
};

enum class Direction {
    Bullish,
    Bearish,
    Neutral
};

enum class ThreatLevel {
    Low,
    Moderate,
    High,
    Critical
};

enum class RealityStatus {
    Aligned,
    Drifting,
    Critical
};

enum class TradeAction {
    Enter,
    Skip
};

std::string to_string(Signal signal);
std::string to_string(RiskClass risk);
std::string to_string(Direction direction);
std::string to_string(ThreatLevel level);
std::string to_string(RealityStatus status);
std::string to_string(TradeAction action);

// Per-cycle intelligence metrics
struct IntelligenceSnapshot {
    double intelligence_score = 0.0;  // 0-100
    double risk_level = 0.0;          // 0-100
    double cascade_risk = 0.0;        // 0-1
};

// Per-cycle technical indicators; defaults describe a flat, quiet market
struct TechnicalSnapshot {
    double rsi = 50.0;
    double momentum_pct = 0.0;
    double macd_histogram = 0.0;
    double volume_ratio = 1.0;        // current volume / average volume
    double atr_pct = 0.0;             // ATR as % of price
    double bollinger_width_pct = 0.0;
};

struct FusionWeighted {
    double core = 0.0;
    double divergence = 0.0;
    double stabilizer = 0.0;
};

struct FusionOutput {
    double fusion_score = 0.0;
    Signal signal = Signal::Wait;
    RiskClass risk_class = RiskClass::Medium;
    double volatility = 0.0;
    double intelligence_score = 0.0;
    double technical_score = 0.0;
    double stability_penalty = 0.0;
    double correlation_penalty = 0.0;
    double trend = 0.0;
    int64_t timestamp_ms = 0;
    FusionWeighted weighted;
};

struct StabilizedFusion {
    double score = 0.0;
    double confidence = 0.0;
    Signal signal = Signal::Wait;
    int64_t timestamp_ms = 0;
};

struct DivergenceReading {
    double strength = 0.0;    // 0-100, absent = 0
    double confidence = 0.0;  // 0-100
    double volatility = 0.0;  // 0-100, absent = 0
    Direction direction = Direction::Neutral;
    int64_t timestamp_ms = 0;
};

struct DivergenceThreatScore {
    double strength = 0.0;
    double confidence = 0.0;
    double volatility = 0.0;
    Direction direction = Direction::Neutral;
    double threat_score = 0.0;
    ThreatLevel level = ThreatLevel::Low;
    int64_t timestamp_ms = 0;
};

struct DivergenceThreatSummary {
    DivergenceThreatScore current;
    double average_score = 0.0;
    double peak_score = 0.0;
    double trend = 0.0;
    size_t samples = 0;
};

struct PerformanceSnapshot {
    double win_rate = 0.0;
    double avg_slippage = 0.0;
    double avg_spread = 0.0;
    double volatility = 0.0;
    double liquidity = 0.0;
    double fill_quality = 0.0;
    int64_t timestamp_ms = 0;
};

struct DivergenceReport {
    double slippage_deviation = 0.0;
    double spread_deviation = 0.0;
    double volatility_mismatch = 0.0;
    double liquidity_mismatch = 0.0;
    double fill_quality_rating = 100.0;
    double execution_risk_score = 0.0;
    double truth_gap = 0.0;
    RealityStatus status = RealityStatus::Aligned;
    double win_rate_drift = 0.0;
    size_t live_samples = 0;
};

struct DecisionContext {
    double opportunity_score = 0.0;  // 0-100
    double trend_alignment = 0.0;    // 0-1
    double risk_level = 0.0;         // 0-1
    double shield_threat = 0.0;      // 0-1
    double market_stability = 0.0;   // 0-1
    double daily_performance = 0.0;
};

struct TradeDecision {
    double score = 0.0;
    TradeAction action = TradeAction::Skip;
    std::string reason;
    std::vector<std::string> reasons;
    int64_t timestamp_ms = 0;
};

struct TriggerOutput {
    bool approved = false;
    TradeAction action = TradeAction::Skip;
    double confidence = 0.0;
    std::string reason;
    int64_t timestamp_ms = 0;
    double cooldown_remaining_min = 0.0;
};
