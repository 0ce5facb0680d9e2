#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/reality_scanner.hpp"

using Catch::Approx;

namespace {

PerformanceSnapshot snapshot(double win_rate, double slippage, double spread = 0.0) {
    PerformanceSnapshot s;
    s.win_rate = win_rate;
    s.avg_slippage = slippage;
    s.avg_spread = spread;
    return s;
}

} // namespace

TEST_CASE("Reality scan requires baseline, model and live data", "[reality]") {
    RealityScanner scanner;
    
    SECTION("Nothing registered") {
        auto report = scanner.scan();
        REQUIRE(report.status == RealityStatus::Aligned);
        REQUIRE(report.truth_gap == 0.0);
        REQUIRE(report.fill_quality_rating == 100.0);
        REQUIRE(report.live_samples == 0);
    }
    
    SECTION("Live data without baseline") {
        scanner.set_expected_model(snapshot(0.6, 0.0));
        scanner.register_live_result(snapshot(0.2, 5.0));
        
        auto report = scanner.scan();
        REQUIRE(report.status == RealityStatus::Aligned);
        REQUIRE(report.slippage_deviation == 0.0);
    }
    
    SECTION("Baseline and model without live data") {
        scanner.set_backtest_baseline(snapshot(0.6, 0.0));
        scanner.set_expected_model(snapshot(0.6, 0.0));
        
        REQUIRE(scanner.scan().truth_gap == 0.0);
        REQUIRE(scanner.live_count() == 0);
    }
}

TEST_CASE("Reality divergence metrics", "[reality]") {
    RealityScanner scanner;
    scanner.set_backtest_baseline(snapshot(0.6, 0.0));
    scanner.set_expected_model(snapshot(0.6, 0.0));
    
    SECTION("Slippage deviation drives every derived metric") {
        scanner.register_live_result(snapshot(0.5, 0.8));
        auto report = scanner.scan();
        
        REQUIRE(report.slippage_deviation == Approx(0.8));
        REQUIRE(report.spread_deviation == 0.0);
        REQUIRE(report.fill_quality_rating == Approx(92.0));
        REQUIRE(report.execution_risk_score == Approx(0.32));
        REQUIRE(report.truth_gap == Approx(0.2));
        REQUIRE(report.status == RealityStatus::Drifting);
        REQUIRE(report.win_rate_drift == Approx(0.1));
        REQUIRE(report.live_samples == 1);
    }
    
    SECTION("Live results are averaged") {
        scanner.register_live_result(snapshot(0.6, 0.2, 1.0));
        scanner.register_live_result(snapshot(0.6, 0.6, 3.0));
        auto report = scanner.scan();
        
        REQUIRE(report.slippage_deviation == Approx(0.4));
        REQUIRE(report.spread_deviation == Approx(2.0));
        // 100 - (0.4*10 + 2*5)
        REQUIRE(report.fill_quality_rating == Approx(86.0));
    }
    
    SECTION("Fill quality floors at zero") {
        scanner.register_live_result(snapshot(0.6, 20.0));
        REQUIRE(scanner.scan().fill_quality_rating == 0.0);
    }
    
    SECTION("Truth gap of exactly 0.1 is drifting") {
        scanner.register_live_result(snapshot(0.6, 0.4));
        auto report = scanner.scan();
        REQUIRE(report.truth_gap == 0.1);
        REQUIRE(report.status == RealityStatus::Drifting);
    }
    
    SECTION("Truth gap of exactly 0.3 is critical") {
        scanner.register_live_result(snapshot(0.6, 1.2));
        auto report = scanner.scan();
        REQUIRE(report.truth_gap == 0.3);
        REQUIRE(report.status == RealityStatus::Critical);
    }
    
    SECTION("Later baseline replaces the earlier one") {
        scanner.set_backtest_baseline(snapshot(0.9, 0.0));
        scanner.register_live_result(snapshot(0.5, 0.0));
        REQUIRE(scanner.scan().win_rate_drift == Approx(0.4));
    }
}

TEST_CASE("Truth gap classification", "[reality]") {
    RealityScanner scanner;
    
    REQUIRE(scanner.classify_truth_gap(0.0) == RealityStatus::Aligned);
    REQUIRE(scanner.classify_truth_gap(0.0999) == RealityStatus::Aligned);
    REQUIRE(scanner.classify_truth_gap(0.1) == RealityStatus::Drifting);
    REQUIRE(scanner.classify_truth_gap(0.2999) == RealityStatus::Drifting);
    REQUIRE(scanner.classify_truth_gap(0.3) == RealityStatus::Critical);
    REQUIRE(scanner.classify_truth_gap(5.0) == RealityStatus::Critical);
}

TEST_CASE("Live history is bounded", "[reality]") {
    RealityScanner scanner;
    for (int i = 0; i < 150; i++) {
        scanner.register_live_result(snapshot(0.5, 0.1));
    }
    REQUIRE(scanner.live_count() == 100);
}
