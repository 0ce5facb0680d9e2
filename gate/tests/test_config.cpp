#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include <cstdlib>
#include <stdexcept>

TEST_CASE("Configuration from environment", "[config]") {
    unsetenv("TICK_INTERVAL_MS");
    unsetenv("FUSION_W_CORE");
    unsetenv("TRADE_COOLDOWN_MIN");
    unsetenv("THREAT_MODIFIER");
    
    SECTION("Defaults") {
        Config cfg = Config::from_env();
        
        REQUIRE(cfg.tick_interval_ms == 1000);
        REQUIRE(cfg.pipeline.fusion.weights.fusion_core == 0.60);
        REQUIRE(cfg.pipeline.fusion.weights.divergence == 0.25);
        REQUIRE(cfg.pipeline.fusion.weights.stabilizer == 0.15);
        REQUIRE(cfg.pipeline.trigger.cooldown_minutes == 3.0);
        REQUIRE_NOTHROW(cfg.validate());
    }
    
    SECTION("Overrides") {
        setenv("TICK_INTERVAL_MS", "250", 1);
        setenv("FUSION_W_CORE", "0.5", 1);
        setenv("TRADE_COOLDOWN_MIN", "5", 1);
        setenv("THREAT_MODIFIER", "0.8", 1);
        
        Config cfg = Config::from_env();
        REQUIRE(cfg.tick_interval_ms == 250);
        REQUIRE(cfg.pipeline.fusion.weights.fusion_core == 0.5);
        REQUIRE(cfg.pipeline.trigger.cooldown_minutes == 5.0);
        REQUIRE(cfg.pipeline.fusion.threat_modifier == 0.8);
    }
    
    SECTION("Unparseable number keeps the default") {
        setenv("TICK_INTERVAL_MS", "fast", 1);
        REQUIRE(Config::from_env().tick_interval_ms == 1000);
    }
    
    SECTION("Validation rejects bad values") {
        setenv("TICK_INTERVAL_MS", "0", 1);
        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
        unsetenv("TICK_INTERVAL_MS");
        
        setenv("TRADE_COOLDOWN_MIN", "-1", 1);
        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
        unsetenv("TRADE_COOLDOWN_MIN");
        
        Config cfg = Config::from_env();
        cfg.redis_url.clear();
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }
    
    unsetenv("TICK_INTERVAL_MS");
    unsetenv("FUSION_W_CORE");
    unsetenv("TRADE_COOLDOWN_MIN");
    unsetenv("THREAT_MODIFIER");
}
