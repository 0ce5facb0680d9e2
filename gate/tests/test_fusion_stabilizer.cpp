#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/fusion_stabilizer.hpp"

using Catch::Approx;

namespace {

FusionOutput raw_score(double fusion, double volatility = 0.0,
                       double stability_penalty = 0.0, double correlation_penalty = 0.0) {
    FusionOutput raw;
    raw.fusion_score = fusion;
    raw.volatility = volatility;
    raw.stability_penalty = stability_penalty;
    raw.correlation_penalty = correlation_penalty;
    raw.signal = Signal::Hold;
    return raw;
}

} // namespace

TEST_CASE("Stabilizer corrections", "[stabilizer]") {
    FusionStabilizer stabilizer;
    
    SECTION("First score gets volatility and penalty corrections only") {
        auto out = stabilizer.stabilize(raw_score(50.05, 30.0, 0.05, 0.03), 500);
        
        // 50.05 - 30*0.15 - 0.05*0.22 - 0.03*10
        REQUIRE(out.score == Approx(45.239));
        // (100 - 30 - 50.05) * 0.75
        REQUIRE(out.confidence == Approx(14.9625));
        REQUIRE(out.signal == Signal::Hold);
        REQUIRE(out.timestamp_ms == 500);
    }
    
    SECTION("Correlation penalty is scaled by ten") {
        auto out = stabilizer.stabilize(raw_score(60.0, 20.0, 0.1, 0.2), 1);
        REQUIRE(out.score == Approx(54.978));
        REQUIRE(out.confidence == Approx(15.0));
    }
    
    SECTION("Score never leaves 0-100") {
        auto low = stabilizer.stabilize(raw_score(2.0, 90.0, 1.0, 1.0), 1);
        REQUIRE(low.score == 0.0);
        REQUIRE(low.confidence == Approx(6.0));
        
        auto high = stabilizer.stabilize(raw_score(100.0), 2);
        REQUIRE(high.score <= 100.0);
        REQUIRE(high.confidence == 0.0);
    }
}

TEST_CASE("Stabilizer noise gate", "[stabilizer]") {
    FusionStabilizer stabilizer;
    stabilizer.stabilize(raw_score(40.0), 1);
    stabilizer.stabilize(raw_score(60.0), 2);
    
    SECTION("Outlier beyond the gate is pulled toward the last value") {
        // z = (58 - 50) / 10 = 0.8
        auto out = stabilizer.stabilize(raw_score(58.0), 3);
        REQUIRE(out.score == Approx(0.3 * 58.0 + 0.7 * 60.0));
        REQUIRE(out.confidence == Approx(30.45));
    }
    
    SECTION("Score inside the gate passes through") {
        auto out = stabilizer.stabilize(raw_score(55.0), 3);
        REQUIRE(out.score == Approx(55.0));
        REQUIRE(out.confidence == Approx(33.75));
    }
}

TEST_CASE("Stabilizer drift control", "[stabilizer]") {
    FusionStabilizer stabilizer;
    
    SECTION("Large jump is damped once two samples exist") {
        stabilizer.stabilize(raw_score(50.0), 1);
        stabilizer.stabilize(raw_score(50.0), 2);
        
        auto out = stabilizer.stabilize(raw_score(80.0), 3);
        REQUIRE(out.score == Approx(0.25 * 80.0 + 0.75 * 50.0));
        REQUIRE(out.confidence == Approx(31.875));
    }
    
    SECTION("Jump after a single sample is not damped") {
        stabilizer.stabilize(raw_score(50.0), 1);
        
        auto out = stabilizer.stabilize(raw_score(80.0), 2);
        REQUIRE(out.score == Approx(80.0));
    }
}

TEST_CASE("Stabilizer history", "[stabilizer]") {
    FusionStabilizer stabilizer;
    
    for (int i = 0; i < 30; i++) {
        stabilizer.stabilize(raw_score(50.0), i);
    }
    
    REQUIRE(stabilizer.history().size() == 25);
    REQUIRE(stabilizer.last_confidence() == Approx(37.5));
}
