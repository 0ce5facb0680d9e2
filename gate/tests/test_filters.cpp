#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/filters.hpp"
#include "../src/rolling_window.hpp"
#include <initializer_list>
#include <vector>

using Catch::Approx;

namespace {

RollingWindow<double> window_of(std::initializer_list<double> values) {
    RollingWindow<double> window(values.size() > 0 ? values.size() : 1);
    for (double v : values) {
        window.push(v);
    }
    return window;
}

} // namespace

TEST_CASE("Filter primitives", "[filters]") {
    SECTION("Clamp bounds values") {
        REQUIRE(filters::clamp(150.0, 0.0, 100.0) == 100.0);
        REQUIRE(filters::clamp(-5.0, 0.0, 100.0) == 0.0);
        REQUIRE(filters::clamp(42.0, 0.0, 100.0) == 42.0);
    }
    
    SECTION("EMA returns value unchanged without history") {
        REQUIRE(filters::ema(42.0, 0.3, window_of({})) == 42.0);
        REQUIRE(filters::ema(-7.5, 1.0, window_of({})) == -7.5);
    }
    
    SECTION("EMA blends with the most recent sample") {
        auto history = window_of({10.0, 20.0, 50.0});
        REQUIRE(filters::ema(80.0, 0.25, history) == Approx(0.25 * 80.0 + 0.75 * 50.0));
        REQUIRE(filters::ema(80.0, 1.0, history) == Approx(80.0));
    }
    
    SECTION("Z-score is zero for short or flat history") {
        REQUIRE(filters::zscore(99.0, window_of({})) == 0.0);
        REQUIRE(filters::zscore(99.0, window_of({5.0})) == 0.0);
        REQUIRE(filters::zscore(99.0, window_of({5.0, 5.0, 5.0})) == 0.0);
    }
    
    SECTION("Z-score uses population deviation") {
        // mean 5, population stddev 2
        auto history = window_of({2, 4, 4, 4, 5, 5, 7, 9});
        REQUIRE(filters::zscore(9.0, history) == Approx(2.0));
        REQUIRE(filters::zscore(1.0, history) == Approx(-2.0));
    }
    
    SECTION("Smooth needs three samples") {
        REQUIRE(filters::smooth(10.0, window_of({1.0, 2.0})) == 10.0);
        
        auto history = window_of({1.0, 2.0, 3.0, 6.0});
        REQUIRE(filters::smooth(10.0, history) == Approx(0.6 * 10.0 + 0.4 * (11.0 / 3.0)));
    }
    
    SECTION("Trend needs five samples") {
        REQUIRE(filters::trend(window_of({1, 2, 3, 4})) == 0.0);
        REQUIRE(filters::trend(window_of({0, 10, 20, 30, 40})) == 1.0);
        REQUIRE(filters::trend(window_of({40, 30, 20, 10, 0})) == -1.0);
    }
    
    SECTION("Trend looks only at the last five points") {
        REQUIRE(filters::trend(window_of({100, 0, 1, 2, 3, 4})) == Approx(0.1));
    }
}

TEST_CASE("Rolling window", "[filters]") {
    RollingWindow<int> window(3);
    
    SECTION("Evicts oldest first") {
        for (int i = 1; i <= 5; i++) {
            window.push(i);
        }
        
        REQUIRE(window.size() == 3);
        REQUIRE(window.capacity() == 3);
        REQUIRE(window.front() == 3);
        REQUIRE(window.back() == 5);
        REQUIRE(window[1] == 4);
    }
    
    SECTION("Holds fewer than capacity without eviction") {
        window.push(7);
        REQUIRE(window.size() == 1);
        REQUIRE(window.front() == 7);
        REQUIRE(window.back() == 7);
    }
    
    SECTION("Iterates oldest to newest after wrapping") {
        for (int i = 1; i <= 7; i++) {
            window.push(i);
        }
        
        std::vector<int> seen(window.begin(), window.end());
        REQUIRE(seen == std::vector<int>{5, 6, 7});
    }
    
    SECTION("Copies keep their own contents") {
        window.push(1);
        window.push(2);
        RollingWindow<int> saved = window;
        
        window.push(3);
        window.push(4);
        window = saved;
        
        REQUIRE(window.size() == 2);
        REQUIRE(window.back() == 2);
    }
    
    SECTION("Clear empties without changing capacity") {
        window.push(1);
        window.clear();
        REQUIRE(window.empty());
        REQUIRE(window.capacity() == 3);
        
        window.push(9);
        REQUIRE(window.front() == 9);
    }
}
