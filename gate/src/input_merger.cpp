#include "input_merger.hpp"
#include "json_codec.hpp"
#include <spdlog/spdlog.h>

bool InputMerger::add(const nlohmann::json& payload) {
    if (!payload.is_object()) return false;

    // Parse everything before touching state
    std::optional<IntelligenceSnapshot> intel;
    std::optional<TechnicalSnapshot> tech;
    std::optional<DivergenceReading> divergence;
    std::optional<double> daily_performance;
    std::vector<PerformanceSnapshot> live;

    if (payload.contains("intel")) {
        intel = JsonCodec::parse_intelligence(payload.at("intel"));
    }
    if (payload.contains("tech")) {
        tech = JsonCodec::parse_technical(payload.at("tech"));
    }
    if (payload.contains("divergence")) {
        divergence = JsonCodec::parse_divergence_reading(payload.at("divergence"));
    }
    if (payload.contains("daily_performance")) {
        daily_performance = payload.at("daily_performance").get<double>();
    }
    if (payload.contains("live")) {
        live = JsonCodec::parse_live_results(payload.at("live"));
    }

    if (intel) {
        intel_ = *intel;
        fresh_snapshot_ = true;
    }
    if (tech) {
        tech_ = *tech;
        fresh_snapshot_ = true;
    }
    if (divergence) divergence_ = divergence;
    if (daily_performance) daily_performance_ = *daily_performance;
    live_.insert(live_.end(), live.begin(), live.end());

    return true;
}

size_t InputMerger::add_batch(const std::vector<Message>& messages, const Consumed& consumed) {
    size_t dropped = 0;

    for (const auto& [msg_id, payload] : messages) {
        try {
            if (!add(payload)) {
                dropped++;
                spdlog::warn("Dropping snapshot message {}: payload is not an object", msg_id);
            }
        } catch (const nlohmann::json::exception& e) {
            dropped++;
            spdlog::warn("Dropping malformed snapshot message {}: {}", msg_id, e.what());
        }
        consumed(msg_id);
    }

    if (messages.size() > 1) {
        spdlog::debug("Merged {} queued snapshots ({} dropped)", messages.size(), dropped);
    }
    return dropped;
}

std::optional<TickInput> InputMerger::take() {
    if (!fresh_snapshot_) return std::nullopt;

    TickInput input;
    input.intel = intel_;
    input.tech = tech_;
    input.daily_performance = daily_performance_;
    input.divergence = divergence_;
    input.live_results.swap(live_);

    divergence_.reset();
    fresh_snapshot_ = false;
    return input;
}
