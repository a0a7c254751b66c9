#include <algorithm>
#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "analyzer/technical_analysis/pattern_detector.hpp"
#include "analyzer/technical_analysis/pivot_detection.hpp"

using namespace ChartAnalyzer::Core;
using ChartAnalyzer::Config::PatternConfig;

namespace {
    const PatternMatch* find_pattern(const std::vector<PatternMatch>& matches, PatternType pattern_type) {
        for (const PatternMatch& match : matches) {
            if (match.pattern_type == pattern_type) {
                return &match;
            }
        }
        return nullptr;
    }

    const PatternMatch* find_named(const std::vector<PatternMatch>& matches, const std::string& pattern_name) {
        for (const PatternMatch& match : matches) {
            if (match.pattern_name == pattern_name) {
                return &match;
            }
        }
        return nullptr;
    }

    std::vector<PatternMatch> detect_closes(const std::vector<double>& closes, double half_range = 0.5) {
        PatternDetector detector{PatternConfig()};
        return detector.detect_patterns(TestBars::from_closes(closes, half_range));
    }

    // High and low each move linearly from their starting price; close sits halfway
    BarSeries channel_bars(int count, double high_start, double high_step, double low_start, double low_step) {
        BarSeries bars;
        for (int index = 0; index < count; ++index) {
            double high = high_start + high_step * index;
            double low = low_start + low_step * index;
            double close = (high + low) / 2.0;
            bars.push_back(TestBars::make_bar(index, close, high, low, close, 1e6));
        }
        return bars;
    }

    // Linear interpolation between (index, price) knots
    std::vector<double> piecewise_closes(const std::vector<std::pair<int, double>>& knots) {
        std::vector<double> closes;
        for (size_t knot_index = 0; knot_index + 1 < knots.size(); ++knot_index) {
            int start_index = knots[knot_index].first;
            int end_index = knots[knot_index + 1].first;
            double start_price = knots[knot_index].second;
            double end_price = knots[knot_index + 1].second;
            for (int index = start_index; index < end_index; ++index) {
                double fraction = static_cast<double>(index - start_index) / (end_index - start_index);
                closes.push_back(start_price + (end_price - start_price) * fraction);
            }
        }
        closes.push_back(knots.back().second);
        return closes;
    }
}

TEST_CASE("Pattern detection needs the configured minimum of bars", "[patterns]") {
    PatternDetector detector{PatternConfig()};
    CHECK(detector.detect_patterns(TestBars::smooth_uptrend(19)).empty());
    CHECK(detector.detect_patterns(BarSeries()).empty());
}

TEST_CASE("Breakout above a tight base", "[patterns]") {
    BarSeries bars;
    for (int index = 0; index < 60; ++index) {
        bars.push_back(TestBars::make_bar(index, 100.0, 101.0, 99.0, 100.0, 1e6));
    }
    for (int index = 60; index < 70; ++index) {
        bars.push_back(TestBars::make_bar(index, 103.0, 103.5, 102.5, 103.0, 1e6));
    }

    PatternDetector detector{PatternConfig()};
    std::vector<PatternMatch> matches = detector.detect_patterns(bars);
    const PatternMatch* breakout = find_pattern(matches, PatternType::BASE_BREAKOUT);

    REQUIRE(breakout != nullptr);
    CHECK(breakout->bullish);
    CHECK(breakout->pattern_name == "Base Breakout");
    CHECK(breakout->completion_pct == Approx(85.0));
    CHECK(*breakout->breakout_level == Approx(101.0));
    CHECK(*breakout->target_price == Approx(103.0));
    CHECK(*breakout->stop_loss == Approx(99.0 * 0.98));
    // Flat volume does not confirm the breakout
    CHECK(breakout->confidence == Approx(0.60));
}

TEST_CASE("High tight flag after a doubling", "[patterns]") {
    std::vector<double> closes;
    for (int index = 0; index < 30; ++index) {
        closes.push_back(10.0 + 15.0 * index / 29.0);
    }
    for (int index = 30; index < 60; ++index) {
        closes.push_back(24.5);
    }

    PatternDetector detector{PatternConfig()};
    std::vector<PatternMatch> matches = detector.detect_patterns(TestBars::from_closes(closes, 0.1));
    const PatternMatch* flag = find_pattern(matches, PatternType::HIGH_TIGHT_FLAG);

    REQUIRE(flag != nullptr);
    CHECK(*flag->breakout_level == Approx(24.6));
    CHECK(*flag->target_price == Approx(24.6 * 1.2));
    CHECK(*flag->stop_loss == Approx(24.4 * 0.97));
    CHECK(flag->confidence == Approx(0.75));
}

TEST_CASE("Double bottom with matching troughs", "[patterns]") {
    std::vector<double> closes = piecewise_closes({{0, 110.0}, {20, 100.0}, {40, 110.0}, {60, 100.5}, {79, 112.0}});
    REQUIRE(closes.size() == 80);

    PatternDetector detector{PatternConfig()};
    std::vector<PatternMatch> matches = detector.detect_patterns(TestBars::from_closes(closes, 0.5));

    const PatternMatch* double_bottom = find_pattern(matches, PatternType::DOUBLE_BOTTOM);
    REQUIRE(double_bottom != nullptr);
    CHECK(double_bottom->bullish);
    CHECK(*double_bottom->breakout_level == Approx(112.5));
    CHECK(double_bottom->completion_pct == Approx(70.0));

    // A single peak is not a double top
    CHECK(find_pattern(matches, PatternType::DOUBLE_TOP) == nullptr);
}

TEST_CASE("Double top with matching peaks", "[patterns]") {
    std::vector<PatternMatch> matches =
        detect_closes(piecewise_closes({{0, 95.0}, {20, 110.0}, {40, 100.0}, {60, 110.5}, {79, 99.0}}));
    const PatternMatch* double_top = find_pattern(matches, PatternType::DOUBLE_TOP);

    REQUIRE(double_top != nullptr);
    CHECK_FALSE(double_top->bullish);
    CHECK(double_top->pattern_name == "Double Top");
    // Close is below the midpoint of first peak and neckline
    CHECK(double_top->completion_pct == Approx(70.0));
    CHECK(*double_top->breakout_level == Approx(98.5));
    CHECK(*double_top->target_price == Approx(86.5));
    CHECK(*double_top->stop_loss == Approx(111.0 * 1.02));
    CHECK(double_top->confidence == Approx(0.65));
}

TEST_CASE("Cup with a shallow handle", "[patterns]") {
    std::vector<PatternMatch> matches = detect_closes(
        piecewise_closes({{0, 118.0}, {5, 120.0}, {45, 96.0}, {85, 118.0}, {94, 112.0}, {99, 115.0}}));
    const PatternMatch* cup = find_pattern(matches, PatternType::CUP_HANDLE);

    REQUIRE(cup != nullptr);
    CHECK(cup->bullish);
    CHECK(cup->pattern_name == "Cup and Handle");
    CHECK(cup->completion_pct == Approx(90.0 + 118.5 / 120.5 * 10.0));
    CHECK(*cup->breakout_level == Approx(120.5));
    CHECK(*cup->target_price == Approx(144.6));
    CHECK(*cup->stop_loss == Approx(112.0 * 0.98));
    CHECK(cup->confidence == Approx(0.75));
}

TEST_CASE("Volatility contraction with drying volume", "[patterns]") {
    // Rising lows leave only swing highs; each spike is smaller than the last
    const std::vector<std::pair<int, double>> spikes{{20, 12.0}, {35, 9.0}, {50, 6.0}, {65, 4.5}, {80, 4.0}};
    BarSeries bars;
    for (int index = 0; index < 100; ++index) {
        double low = 100.0 + 0.1 * index;
        double spike = 1.0;
        for (const std::pair<int, double>& entry : spikes) {
            if (entry.first == index) {
                spike = entry.second;
            }
        }
        double volume = index < 90 ? 1e6 : 5e5;
        bars.push_back(TestBars::make_bar(index, low + 0.5, low + spike, low, low + 0.5, volume));
    }

    PatternDetector detector{PatternConfig()};
    std::vector<PatternMatch> matches = detector.detect_patterns(bars);
    const PatternMatch* vcp = find_pattern(matches, PatternType::VCP);

    REQUIRE(vcp != nullptr);
    CHECK(vcp->bullish);
    CHECK(vcp->description == "4 contractions, volume drying");
    CHECK(vcp->completion_pct == Approx(80.0));
    CHECK(*vcp->breakout_level == Approx(112.0));
    CHECK(*vcp->target_price == Approx(112.0 * 1.15));
    CHECK(*vcp->stop_loss == Approx(108.0 * 0.97));
    CHECK(vcp->confidence == Approx(0.70));
}

TEST_CASE("Head and shoulders and its inverse", "[patterns]") {
    SECTION("top") {
        std::vector<PatternMatch> matches = detect_closes(piecewise_closes(
            {{0, 100.0}, {15, 110.0}, {30, 102.0}, {50, 118.0}, {70, 102.0}, {85, 110.0}, {99, 100.0}}));
        const PatternMatch* top = find_pattern(matches, PatternType::HEAD_SHOULDERS);

        REQUIRE(top != nullptr);
        CHECK_FALSE(top->bullish);
        CHECK(top->completion_pct == Approx(75.0));
        CHECK(*top->breakout_level == Approx(101.5));
        CHECK(*top->target_price == Approx(84.5));
        CHECK(*top->stop_loss == Approx(118.5 * 1.02));
        CHECK(top->confidence == Approx(0.70));
        CHECK(find_pattern(matches, PatternType::HEAD_SHOULDERS_INVERSE) == nullptr);
    }

    SECTION("inverse") {
        std::vector<PatternMatch> matches = detect_closes(piecewise_closes(
            {{0, 120.0}, {15, 110.0}, {30, 118.0}, {50, 102.0}, {70, 118.0}, {85, 110.0}, {99, 120.0}}));
        const PatternMatch* inverse = find_pattern(matches, PatternType::HEAD_SHOULDERS_INVERSE);

        REQUIRE(inverse != nullptr);
        CHECK(inverse->bullish);
        CHECK(inverse->pattern_name == "Inverse Head and Shoulders");
        CHECK(*inverse->breakout_level == Approx(118.5));
        CHECK(*inverse->target_price == Approx(135.5));
        CHECK(*inverse->stop_loss == Approx(101.5 * 0.98));
        CHECK(inverse->confidence == Approx(0.70));
        CHECK(find_pattern(matches, PatternType::HEAD_SHOULDERS) == nullptr);
    }
}

TEST_CASE("Ascending and descending triangles", "[patterns]") {
    PatternDetector detector{PatternConfig()};

    SECTION("flat resistance, rising support") {
        std::vector<PatternMatch> matches = detector.detect_patterns(channel_bars(50, 110.0, 0.0, 100.0, 0.3));
        const PatternMatch* triangle = find_pattern(matches, PatternType::ASCENDING_TRIANGLE);

        REQUIRE(triangle != nullptr);
        CHECK(triangle->bullish);
        CHECK(triangle->completion_pct == Approx(80.0));
        CHECK(*triangle->breakout_level == Approx(110.0));
        CHECK(*triangle->target_price == Approx(121.0));
        CHECK(*triangle->stop_loss == Approx(114.7 * 0.97));
        CHECK(triangle->confidence == Approx(0.70));
        CHECK(find_pattern(matches, PatternType::DESCENDING_TRIANGLE) == nullptr);
    }

    SECTION("falling resistance, flat support") {
        std::vector<PatternMatch> matches = detector.detect_patterns(channel_bars(50, 110.0, -0.3, 100.0, 0.0));
        const PatternMatch* triangle = find_pattern(matches, PatternType::DESCENDING_TRIANGLE);

        REQUIRE(triangle != nullptr);
        CHECK_FALSE(triangle->bullish);
        CHECK(triangle->completion_pct == Approx(80.0));
        CHECK(*triangle->breakout_level == Approx(100.0));
        CHECK(*triangle->target_price == Approx(90.0));
        CHECK(*triangle->stop_loss == Approx(95.3 * 1.03));
        CHECK(triangle->confidence == Approx(0.70));
        CHECK(find_pattern(matches, PatternType::ASCENDING_TRIANGLE) == nullptr);
    }
}

TEST_CASE("Bull flag and pennant after a sharp advance", "[patterns]") {
    SECTION("last close below the consolidation mean is a flag") {
        std::vector<PatternMatch> matches =
            detect_closes(piecewise_closes({{0, 100.0}, {10, 115.0}, {25, 116.0}, {39, 114.0}}));
        const PatternMatch* flag = find_pattern(matches, PatternType::FLAG);

        REQUIRE(flag != nullptr);
        CHECK(flag->bullish);
        CHECK(flag->pattern_name == "Bull Flag");
        CHECK(*flag->breakout_level == Approx(116.5));
        CHECK(*flag->target_price == Approx(114.0 * 1.15));
        CHECK(*flag->stop_loss == Approx(113.5 * 0.98));
        CHECK(flag->confidence == Approx(0.65));
        CHECK(find_pattern(matches, PatternType::PENNANT) == nullptr);
    }

    SECTION("last close above the consolidation mean is a pennant") {
        std::vector<PatternMatch> matches =
            detect_closes(piecewise_closes({{0, 100.0}, {10, 115.0}, {25, 114.0}, {39, 116.0}}));
        const PatternMatch* pennant = find_pattern(matches, PatternType::PENNANT);

        REQUIRE(pennant != nullptr);
        CHECK(pennant->bullish);
        CHECK(pennant->pattern_name == "Bull Pennant");
        CHECK(*pennant->breakout_level == Approx(116.5));
        CHECK(*pennant->target_price == Approx(116.0 * 1.15));
        CHECK(*pennant->stop_loss == Approx((114.0 + 2.0 * 5.0 / 14.0 - 0.5) * 0.98));
        CHECK(pennant->confidence == Approx(0.65));
    }

    SECTION("a sharp decline is not reported") {
        std::vector<PatternMatch> matches =
            detect_closes(piecewise_closes({{0, 115.0}, {10, 100.0}, {25, 101.0}, {39, 99.0}}));
        CHECK(find_pattern(matches, PatternType::FLAG) == nullptr);
        CHECK(find_pattern(matches, PatternType::PENNANT) == nullptr);
    }
}

TEST_CASE("Rising and falling wedges", "[patterns]") {
    PatternDetector detector{PatternConfig()};

    SECTION("support rising faster than resistance") {
        std::vector<PatternMatch> matches = detector.detect_patterns(channel_bars(40, 110.0, 0.2, 100.0, 0.4));
        const PatternMatch* wedge = find_pattern(matches, PatternType::WEDGE_RISING);

        REQUIRE(wedge != nullptr);
        CHECK_FALSE(wedge->bullish);
        CHECK(wedge->completion_pct == Approx(70.0));
        CHECK(*wedge->breakout_level == Approx(114.0));
        CHECK(*wedge->target_price == Approx(116.7 * 0.9));
        CHECK(*wedge->stop_loss == Approx(117.8 * 1.02));
        CHECK(wedge->confidence == Approx(0.60));
    }

    SECTION("resistance falling faster than support") {
        std::vector<PatternMatch> matches = detector.detect_patterns(channel_bars(40, 110.0, -0.4, 100.0, -0.2));
        const PatternMatch* wedge = find_pattern(matches, PatternType::WEDGE_FALLING);

        REQUIRE(wedge != nullptr);
        CHECK(wedge->bullish);
        CHECK(*wedge->breakout_level == Approx(96.0));
        CHECK(*wedge->target_price == Approx(93.3 * 1.15));
        CHECK(*wedge->stop_loss == Approx(92.2 * 0.98));
        CHECK(wedge->confidence == Approx(0.60));
    }
}

TEST_CASE("Pullback to rising moving averages", "[patterns]") {
    // sma_20 ends at 128.425 and sma_50 at 124.78, both within 2% of the last close
    std::vector<PatternMatch> matches = detect_closes(piecewise_closes({{0, 100.0}, {100, 130.0}, {109, 127.0}}));

    const PatternMatch* to_20 = find_named(matches, "Pullback to 20 MA");
    REQUIRE(to_20 != nullptr);
    CHECK(to_20->pattern_type == PatternType::PULLBACK_MA);
    CHECK(to_20->bullish);
    CHECK(*to_20->breakout_level == Approx(127.0 * 1.02));
    CHECK(*to_20->target_price == Approx(127.0 * 1.1));
    CHECK(*to_20->stop_loss == Approx(128.425 * 0.97));
    CHECK(to_20->confidence == Approx(0.65));

    const PatternMatch* to_50 = find_named(matches, "Pullback to 50 MA");
    REQUIRE(to_50 != nullptr);
    CHECK(*to_50->stop_loss == Approx(124.78 * 0.96));

    // Fewer than 100 bars never qualifies
    std::vector<double> short_closes = piecewise_closes({{0, 100.0}, {90, 130.0}, {98, 127.0}});
    CHECK(find_named(detect_closes(short_closes), "Pullback to 20 MA") == nullptr);
}

TEST_CASE("Matches are ordered by descending confidence", "[patterns]") {
    PatternDetector detector{PatternConfig()};
    std::vector<PatternMatch> matches = detector.detect_patterns(TestBars::contracting_uptrend());

    CHECK(std::is_sorted(matches.begin(), matches.end(), [](const PatternMatch& left, const PatternMatch& right) {
        return left.confidence > right.confidence;
    }));
    for (const PatternMatch& match : matches) {
        CHECK(match.confidence >= 0.0);
        CHECK(match.confidence <= 1.0);
    }
}

TEST_CASE("Swing points exclude the edges and list highs before lows", "[patterns][pivots]") {
    // Flat bars are both a swing high and a swing low under inclusive ties
    BarSeries flat = TestBars::flat_series(7);
    std::vector<SwingPoint> pivots = find_swing_points(flat, 2);

    REQUIRE(pivots.size() == 6);
    CHECK(pivots[0].index == 2);
    CHECK(pivots[0].is_high);
    CHECK_FALSE(pivots[1].is_high);
    CHECK(pivots.back().index == 4);

    // Otherwise swing points follow bar order whatever their kind
    std::vector<SwingPoint> ordered =
        find_swing_points(TestBars::from_closes(piecewise_closes({{0, 100.0}, {6, 94.0}, {12, 106.0}, {18, 100.0}}), 0.5), 2);
    REQUIRE(ordered.size() == 2);
    CHECK_FALSE(ordered[0].is_high);
    CHECK(ordered[0].index == 6);
    CHECK(ordered[1].is_high);
    CHECK(ordered[1].index == 12);

    std::vector<double> values{1.0, 3.0, 2.0, 5.0, 4.0, 0.5, 6.0};
    CHECK(find_peaks(values, 1) == std::vector<int>{1, 3});
    CHECK(find_troughs(values, 1) == std::vector<int>{2, 5});
}
