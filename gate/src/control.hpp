#pragma once

#include "pipeline.hpp"
#include <nlohmann/json.hpp>
#include <string>

struct ControlResult {
    bool applied;
    std::string cmd;
    std::string error;
};

// Runtime re-tuning commands received from the control stream:
//   {"cmd": "update_weights", "weights": {...}}
//   {"cmd": "set_threat_modifier", "value": 0.8}
//   {"cmd": "reduce_confidence", "pct": 15}
//   {"cmd": "set_baseline", "snapshot": {...}}
//   {"cmd": "set_expected_model", "snapshot": {...}}
class ControlHandler {
public:
    static ControlResult apply(Pipeline& pipeline, const nlohmann::json& command);
};
