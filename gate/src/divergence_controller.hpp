#pragma once

#include "types.hpp"
#include "pipeline_config.hpp"
#include "rolling_window.hpp"
#include <optional>

// Turns divergence readings into a bounded threat score series and a
// current threat summary.
class DivergenceController {
public:
    explicit DivergenceController(const DivergenceConfig& config = DivergenceConfig());

    DivergenceThreatScore update(const DivergenceReading& reading);

    // Empty until the first update
    std::optional<DivergenceThreatSummary> get_summary() const { return summary_; }
    const RollingWindow<DivergenceThreatScore>& get_history() const { return history_; }

    DivergenceThreatScore classify(const DivergenceReading& reading) const;

private:
    DivergenceConfig config_;
    RollingWindow<DivergenceThreatScore> history_;
    RollingWindow<double> scores_;  // threat_score of each history_ entry
    std::optional<DivergenceThreatSummary> summary_;

    ThreatLevel level_for(double threat_score) const;
    DivergenceThreatSummary summarize() const;
};
