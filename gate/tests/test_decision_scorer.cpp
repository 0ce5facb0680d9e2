#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/decision_scorer.hpp"

using Catch::Approx;

namespace {

DecisionContext favourable_context() {
    DecisionContext ctx;
    ctx.opportunity_score = 75.0;
    ctx.trend_alignment = 0.8;
    ctx.market_stability = 0.9;
    ctx.risk_level = 0.2;
    ctx.shield_threat = 0.1;
    ctx.daily_performance = 0.0;
    return ctx;
}

} // namespace

TEST_CASE("Decision scoring", "[decision]") {
    DecisionScorer scorer;
    
    SECTION("Favourable conditions enter") {
        auto decision = scorer.score(favourable_context(), 42);
        
        // 75*0.4 + 20 + 15 + 15 + 15
        REQUIRE(decision.score == Approx(95.0));
        REQUIRE(decision.action == TradeAction::Enter);
        REQUIRE(decision.reason ==
                "Strong trend alignment, Stable market, Low risk, Low shield threat");
        REQUIRE(decision.reasons.size() == 4);
        REQUIRE(decision.timestamp_ms == 42);
    }
    
    SECTION("Score is capped at 100") {
        auto ctx = favourable_context();
        ctx.opportunity_score = 100.0;
        ctx.daily_performance = 2.5;
        
        auto decision = scorer.score(ctx, 1);
        REQUIRE(decision.score == 100.0);
        REQUIRE(decision.reasons.back() == "Positive daily performance");
    }
    
    SECTION("No bonuses falls back to the default reason") {
        DecisionContext ctx;
        ctx.opportunity_score = 50.0;
        ctx.trend_alignment = 0.2;
        ctx.market_stability = 0.3;
        ctx.risk_level = 0.9;
        ctx.shield_threat = 0.9;
        ctx.daily_performance = -1.0;
        
        auto decision = scorer.score(ctx, 1);
        REQUIRE(decision.score == Approx(20.0));
        REQUIRE(decision.action == TradeAction::Skip);
        REQUIRE(decision.reason == DecisionScorer::kFallbackReason);
        REQUIRE(decision.reasons.empty());
    }
    
    SECTION("Thresholds are strict") {
        DecisionContext ctx;
        ctx.opportunity_score = 0.0;
        ctx.trend_alignment = 0.5;
        ctx.market_stability = 0.6;
        ctx.risk_level = 0.4;
        ctx.shield_threat = 0.5;
        ctx.daily_performance = 0.0;
        
        auto decision = scorer.score(ctx, 1);
        REQUIRE(decision.score == 0.0);
        REQUIRE(decision.reasons.empty());
    }
    
    SECTION("A score of exactly 60 does not enter") {
        DecisionContext ctx;
        ctx.opportunity_score = 50.0;  // 20
        ctx.trend_alignment = 0.9;     // +20
        ctx.market_stability = 0.0;
        ctx.risk_level = 0.1;          // +15
        ctx.shield_threat = 1.0;
        ctx.daily_performance = 1.0;   // +10
        
        auto decision = scorer.score(ctx, 1);
        REQUIRE(decision.score == Approx(65.0));
        REQUIRE(decision.action == TradeAction::Enter);
        
        ctx.daily_performance = 0.0;
        ctx.opportunity_score = 62.5;  // 25
        decision = scorer.score(ctx, 1);
        REQUIRE(decision.score == 60.0);
        REQUIRE(decision.action == TradeAction::Skip);
    }
}
