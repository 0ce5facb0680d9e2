#pragma once

#include "rolling_window.hpp"

// Numeric primitives shared by every pipeline stage. History arguments are
// ordered oldest first and never modified.
namespace filters {
    double clamp(double v, double lo, double hi);

    // alpha in (0,1]; returns value unchanged when history is empty
    double ema(double value, double alpha, const RollingWindow<double>& history);

    // Population z-score; 0 with fewer than 2 samples or zero deviation
    double zscore(double value, const RollingWindow<double>& history);

    // 0.6 * value + 0.4 * mean(last 3); value unchanged with fewer than 3 samples
    double smooth(double value, const RollingWindow<double>& history);

    // Slope over the last 5 points, normalized to [-1, 1]
    double trend(const RollingWindow<double>& history);

    double mean(const RollingWindow<double>& history);
}
