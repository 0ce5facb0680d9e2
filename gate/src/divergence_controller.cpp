#include "divergence_controller.hpp"
#include "filters.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

DivergenceController::DivergenceController(const DivergenceConfig& config)
    : config_(config)
    , history_(config.history_size)
    , scores_(config.history_size)
{}

DivergenceThreatScore DivergenceController::update(const DivergenceReading& reading) {
    DivergenceThreatScore score = classify(reading);

    if (summary_ && summary_->current.level != score.level) {
        spdlog::info("Divergence threat level {} -> {} (score {:.1f})",
                     to_string(summary_->current.level), to_string(score.level),
                     score.threat_score);
    }

    history_.push(score);
    scores_.push(score.threat_score);
    summary_ = summarize();

    return score;
}

DivergenceThreatScore DivergenceController::classify(const DivergenceReading& reading) const {
    DivergenceThreatScore score;
    score.strength = reading.strength;
    score.confidence = reading.confidence;
    score.volatility = reading.volatility;
    score.timestamp_ms = reading.timestamp_ms;

    // Missing strength or volatility data means nothing to classify
    if (reading.strength <= 0.0 || reading.volatility <= 0.0) {
        score.direction = Direction::Neutral;
        score.threat_score = 0.0;
        score.level = ThreatLevel::Low;
        return score;
    }

    double magnitude = config_.strength_weight * filters::clamp(reading.strength, 0.0, 100.0) +
                       config_.volatility_weight * filters::clamp(reading.volatility, 0.0, 100.0);
    double certainty = 0.5 + 0.5 * filters::clamp(reading.confidence, 0.0, 100.0) / 100.0;

    score.direction = reading.direction;
    score.threat_score = filters::clamp(magnitude * certainty, 0.0, 100.0);
    score.level = level_for(score.threat_score);
    return score;
}

ThreatLevel DivergenceController::level_for(double threat_score) const {
    if (threat_score >= config_.critical_threshold) return ThreatLevel::Critical;
    if (threat_score >= config_.high_threshold) return ThreatLevel::High;
    if (threat_score >= config_.moderate_threshold) return ThreatLevel::Moderate;
    return ThreatLevel::Low;
}

DivergenceThreatSummary DivergenceController::summarize() const {
    DivergenceThreatSummary summary;
    summary.current = history_.back();
    summary.samples = history_.size();

    for (double score : scores_) {
        summary.peak_score = std::max(summary.peak_score, score);
    }
    summary.average_score = filters::mean(scores_);
    summary.trend = filters::trend(scores_);
    return summary;
}
