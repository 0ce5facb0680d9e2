#pragma once

#include "types.hpp"

// Derives 0-100 scores from raw technical indicators
class TechnicalScorer {
public:
    static double strength_score(const TechnicalSnapshot& tech);
    static double volatility_score(const TechnicalSnapshot& tech);

private:
    static double rsi_component(double rsi);
    static double momentum_component(double momentum_pct);
    static double macd_component(double macd_histogram);
    static double volume_component(double volume_ratio);
};
