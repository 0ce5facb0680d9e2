#include "technical.hpp"
#include "filters.hpp"
#include <algorithm>

double TechnicalScorer::strength_score(const TechnicalSnapshot& tech) {
    // Neutral market sits at 50
    double score = 50.0;

    score += rsi_component(tech.rsi);
    score += momentum_component(tech.momentum_pct);
    score += macd_component(tech.macd_histogram);
    score += volume_component(tech.volume_ratio);

    return filters::clamp(score, 0.0, 100.0);
}

double TechnicalScorer::volatility_score(const TechnicalSnapshot& tech) {
    // ATR of 5% or a 20% band width each saturate the scale
    double score = tech.atr_pct * 20.0 + tech.bollinger_width_pct * 5.0;
    return filters::clamp(score, 0.0, 100.0);
}

double TechnicalScorer::rsi_component(double rsi) {
    return (rsi - 50.0) * 0.6;
}

double TechnicalScorer::momentum_component(double momentum_pct) {
    return filters::clamp(momentum_pct * 5.0, -25.0, 25.0);
}

double TechnicalScorer::macd_component(double macd_histogram) {
    return filters::clamp(macd_histogram * 10.0, -15.0, 15.0);
}

double TechnicalScorer::volume_component(double volume_ratio) {
    // Volume only confirms; below-average volume is not penalized
    if (volume_ratio <= 1.0) return 0.0;
    return std::min(10.0, (volume_ratio - 1.0) * 10.0);
}
