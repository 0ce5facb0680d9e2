#include "types.hpp"

std::string to_string(Signal signal) {
    switch (signal) {
        case Signal::Buy: return "BUY";
        case Signal::Sell: return "SELL";
        case Signal::Hold: return "HOLD";
        case Signal::Wait: return "WAIT";
    }
    return "WAIT";
}

std::string to_string(RiskClass risk) {
    switch (risk) {
        case RiskClass::Low: return "LOW";
        case RiskClass::Medium: return "MEDIUM";
        case RiskClass::High: return "HIGH";
    }
    return "MEDIUM";
}

std::string to_string(Direction direction) {
    switch (direction) {
        case Direction::Bullish: return "BULLISH";
        case Direction::Bearish: return "BEARISH";
        case Direction::Neutral: return "NEUTRAL";
    }
    return "NEUTRAL";
}

std::string to_string(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::Low: return "LOW";
        case ThreatLevel::Moderate: return "MODERATE";
        case ThreatLevel::High: return "HIGH";
        case ThreatLevel::Critical: return "CRITICAL";
    }
    return "LOW";
}

std::string to_string(RealityStatus status) {
    switch (status) {
        case RealityStatus::Aligned: return "ALIGNED";
        case RealityStatus::Drifting: return "DRIFTING";
        case RealityStatus::Critical: return "CRITICAL";
    }
    return "ALIGNED";
}

std::string to_string(TradeAction action) {
    return action == TradeAction::Enter ? "ENTER" : "SKIP";
}
