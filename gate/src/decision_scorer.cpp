#include "decision_scorer.hpp"
#include "filters.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

DecisionScorer::DecisionScorer(const DecisionConfig& config)
    : config_(config) {}

TradeDecision DecisionScorer::score(const DecisionContext& ctx) const {
    return score(ctx, util::current_timestamp_ms());
}

TradeDecision DecisionScorer::score(const DecisionContext& ctx, int64_t now_ms) const {
    TradeDecision decision;
    decision.timestamp_ms = now_ms;

    double total = ctx.opportunity_score * config_.opportunity_weight;

    // Bonuses apply in a fixed order; the order is visible in the reason text
    if (ctx.trend_alignment > config_.trend_min) {
        total += config_.trend_bonus;
        decision.reasons.push_back("Strong trend alignment");
    }
    if (ctx.market_stability > config_.stability_min) {
        total += config_.stability_bonus;
        decision.reasons.push_back("Stable market");
    }
    if (ctx.risk_level < config_.risk_max) {
        total += config_.risk_bonus;
        decision.reasons.push_back("Low risk");
    }
    if (ctx.shield_threat < config_.shield_max) {
        total += config_.shield_bonus;
        decision.reasons.push_back("Low shield threat");
    }
    if (ctx.daily_performance > 0.0) {
        total += config_.performance_bonus;
        decision.reasons.push_back("Positive daily performance");
    }

    decision.score = filters::clamp(total, 0.0, 100.0);
    decision.action = decision.score > config_.enter_threshold ? TradeAction::Enter
                                                               : TradeAction::Skip;
    decision.reason = decision.reasons.empty() ? kFallbackReason
                                               : util::join(decision.reasons, ", ");

    spdlog::debug("Decision: score={:.1f} action={} reason={}",
                  decision.score, to_string(decision.action), decision.reason);

    return decision;
}
