#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "analyzer/technical_analysis/indicators.hpp"

using namespace ChartAnalyzer::Core;
using ChartAnalyzer::Config::IndicatorConfig;

TEST_CASE("Indicator engine returns an empty set below the minimum bar count", "[indicators]") {
    IndicatorEngine engine{IndicatorConfig()};
    IndicatorSet indicators = engine.calculate_all(TestBars::smooth_uptrend(49));
    REQUIRE(indicators.empty());
}

TEST_CASE("Flat prices give degenerate but defined indicator values", "[indicators]") {
    IndicatorEngine engine{IndicatorConfig()};
    IndicatorSet indicators = engine.calculate_all(TestBars::flat_series(60));

    REQUIRE_FALSE(indicators.empty());
    CHECK(indicators.get(IndicatorNames::SMA_50).value() == Approx(100.0));
    CHECK(indicators.get(IndicatorNames::RSI_14).value() == Approx(100.0));
    CHECK(indicators.get(IndicatorNames::ATR_14).value() == Approx(0.0));
    CHECK(indicators.get(IndicatorNames::BB_WIDTH).value() == Approx(0.0));
    CHECK(indicators.get(IndicatorNames::STOCH_K).value() == Approx(0.0));

    // Zero ATR leaves the directional system undefined
    CHECK_FALSE(indicators.has(IndicatorNames::ADX_14));
    CHECK_FALSE(indicators.has(IndicatorNames::PLUS_DI));
    CHECK_FALSE(indicators.has(IndicatorNames::MINUS_DI));

    // Windows longer than the series stay absent
    CHECK_FALSE(indicators.has(IndicatorNames::SMA_150));
    CHECK_FALSE(indicators.has(IndicatorNames::SMA_200));
}

TEST_CASE("EMA spans longer than the series stay absent", "[indicators]") {
    IndicatorConfig config;
    config.ema_periods = {8, 100};
    IndicatorEngine engine{config};
    IndicatorSet indicators = engine.calculate_all(TestBars::smooth_uptrend(60));

    REQUIRE_FALSE(indicators.empty());
    CHECK(indicators.has(IndicatorNames::EMA_8));
    CHECK_FALSE(indicators.has("ema_100"));

    IndicatorSet exact = engine.calculate_all(TestBars::smooth_uptrend(100));
    CHECK(exact.has("ema_100"));
}

TEST_CASE("Smooth uptrend indicator values", "[indicators]") {
    IndicatorEngine engine{IndicatorConfig()};
    IndicatorSet indicators = engine.calculate_all(TestBars::smooth_uptrend());

    CHECK(indicators.get(IndicatorNames::SMA_20).value() == Approx(161.3794).epsilon(1e-5));
    CHECK(indicators.get(IndicatorNames::SMA_50).value() == Approx(156.6693).epsilon(1e-5));
    CHECK(indicators.get(IndicatorNames::SMA_200).value() == Approx(135.7094).epsilon(1e-5));
    CHECK(indicators.get(IndicatorNames::EMA_8).value() == Approx(163.3199).epsilon(1e-5));
    CHECK(indicators.get(IndicatorNames::RSI_14).value() == Approx(100.0));
    CHECK(indicators.get(IndicatorNames::ATR_14).value() == Approx(1.6234).epsilon(1e-4));
    CHECK(indicators.get(IndicatorNames::ADX_14).value() == Approx(100.0));
    CHECK(indicators.get(IndicatorNames::PLUS_DI).value() == Approx(20.0599).epsilon(1e-4));
    CHECK(indicators.get(IndicatorNames::MINUS_DI).value() == Approx(0.0));
    CHECK(indicators.get(IndicatorNames::STOCH_K).value() == Approx(85.92).epsilon(1e-3));
    CHECK(indicators.get(IndicatorNames::OBV).value() == Approx(249000000.0));
    CHECK(indicators.get(IndicatorNames::VOLUME_SMA_20).value() == Approx(1e6));

    // No benchmark, no relative strength
    CHECK_FALSE(indicators.has(IndicatorNames::RELATIVE_STRENGTH));
}

TEST_CASE("Relative strength uses only timestamps both series share", "[indicators]") {
    BarSeries bars = TestBars::smooth_uptrend();
    BarSeries benchmark = TestBars::flat_series(250);

    IndicatorEngine engine{IndicatorConfig()};
    IndicatorSet indicators = engine.calculate_all(bars, benchmark);
    CHECK(indicators.get(IndicatorNames::RELATIVE_STRENGTH).value() == Approx(1.6446).epsilon(1e-4));

    SECTION("benchmark covering only the second half") {
        BarSeries late_benchmark(benchmark.begin() + 125, benchmark.end());
        double expected = bars.back().close_price / bars[125].close_price;
        CHECK(compute_relative_strength(bars, late_benchmark).value() == Approx(expected));
    }

    SECTION("fewer than two shared timestamps") {
        BarSeries single_bar{benchmark.back()};
        CHECK_FALSE(compute_relative_strength(bars, single_bar).has_value());
    }
}

TEST_CASE("True range uses the previous close after the first bar", "[indicators]") {
    BarSeries bars{
        TestBars::make_bar(0, 10.0, 11.0, 9.0, 10.0, 100.0),
        TestBars::make_bar(1, 13.0, 14.0, 12.5, 13.5, 100.0),
        TestBars::make_bar(2, 13.0, 13.2, 7.0, 8.0, 100.0),
    };
    std::vector<double> true_range = compute_true_range(bars);

    REQUIRE(true_range.size() == 3);
    CHECK(true_range[0] == Approx(2.0));
    CHECK(true_range[1] == Approx(4.0));    // High against previous close
    CHECK(true_range[2] == Approx(6.5));    // Previous close against low
}

TEST_CASE("Indicator set drops non-finite values", "[indicators]") {
    IndicatorSet indicators;
    indicators.set(IndicatorNames::MACD, 1.5);
    indicators.set(IndicatorNames::RSI_14, std::nan(""));
    indicators.set(IndicatorNames::ADX_14, std::optional<double>());

    CHECK(indicators.get(IndicatorNames::MACD).value() == Approx(1.5));
    CHECK_FALSE(indicators.get(IndicatorNames::RSI_14).has_value());
    CHECK_FALSE(indicators.has(IndicatorNames::ADX_14));

    const std::vector<std::string>& names = IndicatorSet::reported_names();
    CHECK(names.front() == IndicatorNames::SMA_10);
    CHECK(names.back() == IndicatorNames::RELATIVE_STRENGTH);
}
