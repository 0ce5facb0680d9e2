#pragma once

#include "types.hpp"
#include "pipeline_config.hpp"

// Stateless entry scoring: opportunity plus threshold-gated bonuses
class DecisionScorer {
public:
    explicit DecisionScorer(const DecisionConfig& config = DecisionConfig());

    TradeDecision score(const DecisionContext& ctx) const;
    TradeDecision score(const DecisionContext& ctx, int64_t now_ms) const;

    static constexpr const char* kFallbackReason = "Insufficient conditions";

private:
    DecisionConfig config_;
};
