#include "trade_trigger.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

std::string to_string(TriggerState state) {
    return state == TriggerState::Ready ? "READY" : "COOLING_DOWN";
}

TradeTrigger::TradeTrigger(const TriggerConfig& config) : config_(config) {}

TriggerOutput TradeTrigger::fire(const TradeDecision& decision) {
    return fire(decision, util::current_timestamp_ms());
}

TriggerOutput TradeTrigger::fire(const TradeDecision& decision, int64_t now_ms) {
    TriggerOutput out;
    out.timestamp_ms = now_ms;

    if (state(now_ms) == TriggerState::CoolingDown) {
        out.approved = false;
        out.action = TradeAction::Skip;
        out.reason = "Cooldown active";
        out.cooldown_remaining_min = cooldown_remaining_min(now_ms);
        return out;
    }

    if (decision.action != TradeAction::Enter) {
        out.approved = false;
        out.action = TradeAction::Skip;
        out.reason = "Conditions not strong enough";
        out.cooldown_remaining_min = 0.0;
        return out;
    }

    last_trade_ms_ = now_ms;

    out.approved = true;
    out.action = TradeAction::Enter;
    out.confidence = decision.score;
    out.reason = decision.reason;
    out.cooldown_remaining_min = config_.cooldown_minutes;

    spdlog::info("Trade approved: confidence={:.1f} reason={}", out.confidence, out.reason);
    return out;
}

TriggerState TradeTrigger::state(int64_t now_ms) const {
    return cooldown_remaining_min(now_ms) > 0.0 ? TriggerState::CoolingDown
                                                : TriggerState::Ready;
}

double TradeTrigger::cooldown_remaining_min(int64_t now_ms) const {
    if (!last_trade_ms_) return 0.0;

    // A clock that stepped backwards counts as no time elapsed
    double elapsed_min = std::max(0.0, static_cast<double>(now_ms - *last_trade_ms_) / 60000.0);
    if (elapsed_min >= config_.cooldown_minutes) return 0.0;
    return config_.cooldown_minutes - elapsed_min;
}
