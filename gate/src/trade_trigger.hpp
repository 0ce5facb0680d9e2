#pragma once

#include "types.hpp"
#include "pipeline_config.hpp"
#include <optional>
#include <cstdint>

enum class TriggerState {
    Ready,
    CoolingDown
};

std::string to_string(TriggerState state);

// Cooldown-gated approval gate. The only mutable state is the time of the
// last approved trade.
class TradeTrigger {
public:
    explicit TradeTrigger(const TriggerConfig& config = TriggerConfig());

    TriggerOutput fire(const TradeDecision& decision);
    TriggerOutput fire(const TradeDecision& decision, int64_t now_ms);

    TriggerState state(int64_t now_ms) const;
    double cooldown_remaining_min(int64_t now_ms) const;
    std::optional<int64_t> last_trade_time() const { return last_trade_ms_; }

private:
    TriggerConfig config_;
    std::optional<int64_t> last_trade_ms_;
};
