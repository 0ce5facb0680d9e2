#include "config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::logic_error&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;
    
    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_input = get_env("STREAM_INPUT", "gate.snapshots");
    cfg.stream_control = get_env("STREAM_CONTROL", "gate.control");
    cfg.stream_decisions = get_env("STREAM_DECISIONS", "gate.decisions");
    
    cfg.tick_interval_ms = get_env_int("TICK_INTERVAL_MS", 1000);
    
    // Fusion weights and modifiers; everything else keeps its compiled default
    FusionWeights& w = cfg.pipeline.fusion.weights;
    w.fusion_core = get_env_double("FUSION_W_CORE", w.fusion_core);
    w.divergence = get_env_double("FUSION_W_DIVERGENCE", w.divergence);
    w.stabilizer = get_env_double("FUSION_W_STABILIZER", w.stabilizer);
    cfg.pipeline.fusion.threat_modifier =
        get_env_double("THREAT_MODIFIER", cfg.pipeline.fusion.threat_modifier);
    cfg.pipeline.trigger.cooldown_minutes =
        get_env_double("TRADE_COOLDOWN_MIN", cfg.pipeline.trigger.cooldown_minutes);
    
    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);
    
    cfg.service_name = get_env("SERVICE_NAME", "gate");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

void Config::validate() const {
    if (redis_url.empty()) {
        throw std::runtime_error("REDIS_URL is required");
    }
    if (tick_interval_ms <= 0) {
        throw std::runtime_error("TICK_INTERVAL_MS must be positive");
    }
    if (pipeline.trigger.cooldown_minutes < 0) {
        throw std::runtime_error("TRADE_COOLDOWN_MIN must not be negative");
    }
    
    const FusionWeights& w = pipeline.fusion.weights;
    spdlog::info("Configuration validated successfully");
    spdlog::info("  Tick interval: {}ms", tick_interval_ms);
    spdlog::info("  Fusion weights: core={}, divergence={}, stabilizer={}",
                 w.fusion_core, w.divergence, w.stabilizer);
    spdlog::info("  Trade cooldown: {}min", pipeline.trigger.cooldown_minutes);
}
