#include "filters.hpp"
#include <algorithm>
#include <cmath>

namespace filters {

double clamp(double v, double lo, double hi) {
    return std::max(lo, std::min(hi, v));
}

double ema(double value, double alpha, const RollingWindow<double>& history) {
    if (history.empty()) return value;
    return alpha * value + (1.0 - alpha) * history.back();
}

double mean(const RollingWindow<double>& history) {
    if (history.empty()) return 0.0;
    double sum = 0.0;
    for (double v : history) {
        sum += v;
    }
    return sum / static_cast<double>(history.size());
}

double zscore(double value, const RollingWindow<double>& history) {
    if (history.size() < 2) return 0.0;

    double m = mean(history);
    double variance = 0.0;
    for (double v : history) {
        variance += (v - m) * (v - m);
    }
    variance /= static_cast<double>(history.size());

    double stddev = std::sqrt(variance);
    if (stddev == 0.0) return 0.0;

    return (value - m) / stddev;
}

double smooth(double value, const RollingWindow<double>& history) {
    if (history.size() < 3) return value;

    size_t n = history.size();
    double recent = (history[n - 1] + history[n - 2] + history[n - 3]) / 3.0;
    return 0.6 * value + 0.4 * recent;
}

double trend(const RollingWindow<double>& history) {
    if (history.size() < 5) return 0.0;

    size_t n = history.size();
    double slope = (history[n - 1] - history[n - 5]) / 4.0;
    return clamp(slope / 10.0, -1.0, 1.0);
}

} // namespace filters
