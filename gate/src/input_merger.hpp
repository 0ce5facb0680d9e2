#pragma once

#include "pipeline.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Folds queued snapshot messages into tick inputs. Each message only updates
// the sections it carries. Intel, tech and daily performance persist across
// ticks; live results and an explicit divergence reading are consumed by the
// tick that takes them.
class InputMerger {
public:
    using Message = std::pair<std::string, nlohmann::json>;
    using Consumed = std::function<void(const std::string& msg_id)>;

    // All-or-nothing per message: throws nlohmann::json::exception on a
    // malformed section and leaves the merger untouched.
    // Returns false for a payload that is not an object.
    bool add(const nlohmann::json& payload);

    // Adds every message, dropping malformed ones with a warning. consumed is
    // called once per message id, in order, whether or not it was accepted.
    // Returns the number of dropped messages.
    size_t add_batch(const std::vector<Message>& messages, const Consumed& consumed);

    // Pending input once an intel or tech snapshot has arrived since the last
    // take. Live results queued before the first snapshot wait for it.
    std::optional<TickInput> take();

    bool has_snapshot() const { return fresh_snapshot_; }
    size_t pending_live() const { return live_.size(); }

private:
    IntelligenceSnapshot intel_;
    TechnicalSnapshot tech_;
    double daily_performance_ = 0.0;
    std::optional<DivergenceReading> divergence_;
    std::vector<PerformanceSnapshot> live_;
    bool fresh_snapshot_ = false;
};
