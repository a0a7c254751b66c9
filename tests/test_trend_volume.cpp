#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "analyzer/technical_analysis/trend_analyzer.hpp"
#include "analyzer/technical_analysis/volume_analyzer.hpp"

using namespace ChartAnalyzer::Core;
using ChartAnalyzer::Config::TrendConfig;
using ChartAnalyzer::Config::VolumeConfig;

TEST_CASE("Smooth uptrend is a full-strength bullish stage 2", "[trend]") {
    TrendAnalyzer analyzer{TrendConfig()};
    BarSeries bars = TestBars::smooth_uptrend();

    TrendAssessment trend = analyzer.analyze_trend(bars);
    CHECK(trend.trend == TrendType::BULLISH);
    CHECK(trend.strength == Approx(100.0));
    CHECK(trend.notes.find("Higher highs and higher lows") != std::string::npos);
    CHECK(analyzer.is_uptrend(bars));
    CHECK_FALSE(analyzer.is_downtrend(bars));

    StageAssessment stage = analyzer.determine_weinstein_stage(bars);
    CHECK(stage.stage == WeinsteinStage::STAGE_2);
    CHECK(stage.description == "Stage 2: Advancing - BUY ZONE");
}

TEST_CASE("Smooth downtrend is a zero-strength bearish stage 4", "[trend]") {
    TrendAnalyzer analyzer{TrendConfig()};
    BarSeries bars = TestBars::smooth_downtrend();

    TrendAssessment trend = analyzer.analyze_trend(bars);
    CHECK(trend.trend == TrendType::BEARISH);
    CHECK(trend.strength == Approx(0.0));
    CHECK(analyzer.is_downtrend(bars));

    StageAssessment stage = analyzer.determine_weinstein_stage(bars);
    CHECK(stage.stage == WeinsteinStage::STAGE_4);
    CHECK(stage.description == "Stage 4: Declining - AVOID/SHORT");
}

TEST_CASE("Short histories fall back to neutral and stage 1", "[trend]") {
    TrendAnalyzer analyzer{TrendConfig()};

    TrendAssessment trend = analyzer.analyze_trend(TestBars::smooth_uptrend(49));
    CHECK(trend.trend == TrendType::NEUTRAL);
    CHECK(trend.strength == Approx(0.0));
    CHECK(trend.notes == "Insufficient data");

    StageAssessment stage = analyzer.determine_weinstein_stage(TestBars::smooth_uptrend(199));
    CHECK(stage.stage == WeinsteinStage::STAGE_1);
    CHECK(stage.description == "Insufficient data for stage analysis");
}

TEST_CASE("Flat prices sit in a stage 1 consolidation", "[trend]") {
    TrendAnalyzer analyzer{TrendConfig()};
    StageAssessment stage = analyzer.determine_weinstein_stage(TestBars::flat_series(250));
    CHECK(stage.stage == WeinsteinStage::STAGE_1);
    CHECK(stage.description == "Stage 1/3: Consolidating - Wait for direction");
}

TEST_CASE("Counting bar-to-bar increases and decreases", "[trend]") {
    CHECK(count_higher_values({1.0, 2.0, 2.0, 3.0}) == 2);
    CHECK(count_lower_values({3.0, 2.0, 2.0, 1.0, 4.0}) == 2);
    CHECK(count_higher_values({}) == 0);
}

TEST_CASE("Steady volume is stable with a unit ratio", "[volume]") {
    VolumeAnalyzer analyzer{VolumeConfig()};
    VolumeAnalysis analysis = analyzer.analyze_volume(TestBars::smooth_uptrend(60));

    CHECK(analysis.current_volume == Approx(1e6));
    CHECK(*analysis.avg_volume_20 == Approx(1e6));
    CHECK(*analysis.avg_volume_50 == Approx(1e6));
    CHECK(*analysis.volume_ratio == Approx(1.0));
    CHECK(analysis.volume_trend == "stable");
    CHECK_FALSE(analysis.on_breakout);
    CHECK_FALSE(analysis.accumulation_detected);
    CHECK_FALSE(analysis.distribution_detected);
    CHECK(analysis.notes.empty());
}

TEST_CASE("Volume spike on a price jump is breakout volume and a buying climax", "[volume]") {
    BarSeries bars = TestBars::flat_series(59);
    bars.push_back(TestBars::make_bar(59, 100.0, 103.5, 99.5, 103.0, 5e6));

    VolumeAnalyzer analyzer{VolumeConfig()};
    VolumeAnalysis analysis = analyzer.analyze_volume(bars);

    CHECK(*analysis.avg_volume_20 == Approx(1.2e6));
    CHECK(*analysis.volume_ratio == Approx(5.0 / 1.2));
    CHECK(analysis.on_breakout);
    CHECK(analysis.volume_trend == "stable");
    REQUIRE(analysis.notes.size() == 2);
    CHECK(analysis.notes[0] == "Volume 4.2x above average");
    CHECK(analysis.notes[1] == "Breakout volume detected");

    std::optional<VolumeClimax> climax = analyzer.get_volume_climax(bars);
    REQUIRE(climax.has_value());
    CHECK(climax->detected);
    CHECK(climax->climax_type == "buying_climax");
    CHECK(climax->price_change_pct == Approx(3.0));
}

TEST_CASE("Heavy up-day volume is accumulation", "[volume]") {
    BarSeries bars;
    for (int index = 0; index < 30; ++index) {
        bool up_day = index % 2 == 0;
        double open = up_day ? 100.0 : 101.0;
        double close = up_day ? 101.0 : 100.0;
        bars.push_back(TestBars::make_bar(index, open, 101.5, 99.5, close, up_day ? 3e6 : 1e6));
    }

    VolumeAnalyzer analyzer{VolumeConfig()};
    VolumeAnalysis analysis = analyzer.analyze_volume(bars);
    CHECK(analysis.accumulation_detected);
    CHECK_FALSE(analysis.distribution_detected);
    // Below the long window the trend cannot be classified
    CHECK(analysis.volume_trend == "neutral");
    CHECK_FALSE(analysis.avg_volume_50.has_value());

    CandleVolumeSplit split = split_candle_volume(bars, 20);
    CHECK(*split.average_up_volume == Approx(3e6));
    CHECK(*split.average_down_volume == Approx(1e6));
}

TEST_CASE("Doji candles count as neither up nor down volume", "[volume]") {
    CandleVolumeSplit split = split_candle_volume(TestBars::flat_series(20), 20);
    CHECK_FALSE(split.average_up_volume.has_value());
    CHECK_FALSE(split.average_down_volume.has_value());
    CHECK_FALSE(split.both_present());
}

TEST_CASE("Contracting volume below its long average is drying up", "[volume]") {
    BarSeries bars;
    for (int index = 0; index < 50; ++index) {
        bars.push_back(TestBars::make_bar(index, 100.0, 100.5, 99.5, 100.0, 2e6));
    }
    for (int index = 0; index < 10; ++index) {
        bars.push_back(TestBars::make_bar(50 + index, 100.0, 100.5, 99.5, 100.0, 1e6 - index * 5e4));
    }

    VolumeAnalyzer analyzer{VolumeConfig()};
    CHECK(analyzer.is_volume_drying_up(bars));
    CHECK_FALSE(analyzer.is_volume_drying_up(TestBars::flat_series(60)));
    CHECK_FALSE(analyzer.is_volume_drying_up(TestBars::flat_series(5)));
}

TEST_CASE("No climax below the short window or on ordinary volume", "[volume]") {
    VolumeAnalyzer analyzer{VolumeConfig()};
    CHECK_FALSE(analyzer.get_volume_climax(TestBars::flat_series(19)).has_value());

    std::optional<VolumeClimax> climax = analyzer.get_volume_climax(TestBars::flat_series(40));
    REQUIRE(climax.has_value());
    CHECK_FALSE(climax->detected);
}
