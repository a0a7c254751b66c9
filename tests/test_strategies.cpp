#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "analyzer/technical_analysis/indicators.hpp"
#include "analyzer/strategy_analysis/composite_strategy.hpp"

using namespace ChartAnalyzer::Core;
using ChartAnalyzer::Config::CompositeConfig;
using ChartAnalyzer::Config::IndicatorConfig;
using ChartAnalyzer::Config::TrendConfig;

namespace {
    FundamentalData strong_fundamentals() {
        FundamentalData data;
        data.symbol = "GARP";
        data.pe_ratio = 12.0;
        data.eps_growth = 25.0;
        data.revenue_growth = 22.0;
        data.roe = 25.0;
        data.roce = 22.0;
        data.debt_to_equity = 0.2;
        return data;
    }

    StrategyScores scores_of(double minervini, double weinstein, double lynch) {
        StrategyScores scores;
        scores.minervini_score = minervini;
        scores.weinstein_score = weinstein;
        scores.lynch_score = lynch;
        return scores;
    }

    bool contains(const std::vector<std::string>& items, const std::string& text) {
        for (const std::string& item : items) {
            if (item.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
}

TEST_CASE("Strong fundamentals score the maximum", "[fundamentals]") {
    FundamentalScorer scorer;
    std::optional<FundamentalScore> result = scorer.score(strong_fundamentals());

    REQUIRE(result.has_value());
    CHECK(result->detail_scores.at("pe_score") == Approx(25.0));
    CHECK(result->detail_scores.at("growth_score") == Approx(30.0));
    CHECK(result->detail_scores.at("roe_score") == Approx(25.0));
    CHECK(result->detail_scores.at("debt_score") == Approx(20.0));
    CHECK(result->score == Approx(100.0));
    CHECK(result->grade == "A+");
    CHECK(contains(result->bullish_factors, "Excellent PEG ratio (0.48)"));
    CHECK(result->warnings.empty());
}

TEST_CASE("Weak fundamentals collect bearish factors and warnings", "[fundamentals]") {
    FundamentalData data;
    data.pe_ratio = 60.0;
    data.eps_growth = -10.0;
    data.revenue_growth = 3.0;
    data.roce = 3.0;
    data.debt_to_equity = 3.5;

    FundamentalScorer scorer;
    std::optional<FundamentalScore> result = scorer.score(data);

    REQUIRE(result.has_value());
    CHECK(result->score == Approx(2.0));
    CHECK(result->grade == "D");
    CHECK(contains(result->bearish_factors, "High P/E ratio (60.0) - expensive"));
    CHECK(contains(result->bearish_factors, "Declining EPS (-10.0%)"));
    CHECK(contains(result->bearish_factors, "Low ROCE (3.0%)"));
    CHECK(contains(result->warnings, "Excessive leverage"));
}

TEST_CASE("Missing metrics take their penalties and defaults", "[fundamentals]") {
    FundamentalData data;
    data.pe_ratio = 18.0;

    FundamentalScorer scorer;
    std::optional<FundamentalScore> result = scorer.score(data);

    REQUIRE(result.has_value());
    CHECK(result->detail_scores.at("pe_score") == Approx(12.0));
    CHECK(result->detail_scores.at("growth_score") == Approx(0.0));
    CHECK(result->detail_scores.at("roe_score") == Approx(0.0));
    CHECK(result->detail_scores.at("debt_score") == Approx(5.0));
    CHECK(result->score == Approx(17.0));
}

TEST_CASE("Debt alone is not scorable", "[fundamentals]") {
    FundamentalData data;
    data.debt_to_equity = 0.4;

    FundamentalScorer scorer;
    CHECK_FALSE(has_scorable_fundamentals(data));
    CHECK_FALSE(scorer.score(data).has_value());
}

TEST_CASE("Grade boundaries", "[fundamentals]") {
    CHECK(FundamentalScorer::grade_for(90.0) == "A+");
    CHECK(FundamentalScorer::grade_for(89.9) == "A");
    CHECK(FundamentalScorer::grade_for(70.0) == "B+");
    CHECK(FundamentalScorer::grade_for(60.0) == "B");
    CHECK(FundamentalScorer::grade_for(50.0) == "C");
    CHECK(FundamentalScorer::grade_for(49.9) == "D");
}

TEST_CASE("Shared score table", "[strategies]") {
    CHECK(signal_from_score(80.0) == std::make_pair(SignalType::BUY, ConvictionLevel::HIGH));
    CHECK(signal_from_score(65.0) == std::make_pair(SignalType::BUY, ConvictionLevel::MEDIUM));
    CHECK(signal_from_score(50.0) == std::make_pair(SignalType::HOLD, ConvictionLevel::LOW));
    CHECK(signal_from_score(35.0) == std::make_pair(SignalType::AVOID, ConvictionLevel::MEDIUM));
    CHECK(signal_from_score(34.9) == std::make_pair(SignalType::SELL, ConvictionLevel::HIGH));
}

TEST_CASE("Scorers below their minimum history return an insufficient result", "[strategies]") {
    IndicatorEngine engine{IndicatorConfig()};
    BarSeries bars = TestBars::smooth_uptrend(120);
    IndicatorSet indicators = engine.calculate_all(bars);
    std::optional<FundamentalData> fundamentals;
    StrategyContext context(bars, indicators, fundamentals);

    StrategyResult minervini = MinerviniStrategy().analyze(context);
    CHECK(minervini.score == Approx(0.0));
    CHECK(minervini.signal == SignalType::AVOID);
    CHECK(minervini.conviction == ConvictionLevel::LOW);
    CHECK(contains(minervini.bearish_factors, "Insufficient data"));

    StrategyResult weinstein = WeinsteinStrategy(TrendConfig()).analyze(context);
    CHECK(weinstein.score == Approx(0.0));

    BarSeries short_bars = TestBars::smooth_uptrend(49);
    StrategyContext short_context(short_bars, indicators, fundamentals);
    CHECK(LynchStrategy().analyze(short_context).score == Approx(0.0));
}

TEST_CASE("Weinstein scores no stage points between 150 and 199 bars", "[strategies][weinstein]") {
    IndicatorEngine engine{IndicatorConfig()};
    std::optional<FundamentalData> fundamentals;
    WeinsteinStrategy strategy{TrendConfig()};

    BarSeries falling = TestBars::smooth_downtrend(170);
    IndicatorSet falling_indicators = engine.calculate_all(falling);
    StrategyResult falling_result = strategy.analyze(StrategyContext(falling, falling_indicators, fundamentals));
    CHECK(falling_result.sub_scores.at("stage") == Approx(0.0));
    CHECK(contains(falling_result.warnings, "Insufficient data for stage analysis"));
    CHECK_FALSE(contains(falling_result.warnings, "Stage 1 basing"));
    CHECK_FALSE(contains(falling_result.warnings, "Currently in"));

    BarSeries rising = TestBars::smooth_uptrend(170);
    IndicatorSet rising_indicators = engine.calculate_all(rising);
    StrategyResult rising_result = strategy.analyze(StrategyContext(rising, rising_indicators, fundamentals));
    CHECK(rising_result.sub_scores.at("stage") == Approx(0.0));
    CHECK(rising_result.score == Approx(rising_result.sub_scores.at("ma_relationship") +
                                        rising_result.sub_scores.at("price_action") +
                                        rising_result.sub_scores.at("volume")));

    BarSeries long_rising = TestBars::smooth_uptrend(200);
    IndicatorSet long_indicators = engine.calculate_all(long_rising);
    StrategyResult long_result = strategy.analyze(StrategyContext(long_rising, long_indicators, fundamentals));
    CHECK(long_result.sub_scores.at("stage") == Approx(40.0));
}

TEST_CASE("Lynch falls back to a technical score without fundamentals", "[strategies][lynch]") {
    IndicatorEngine engine{IndicatorConfig()};
    BarSeries bars = TestBars::smooth_uptrend();
    IndicatorSet indicators = engine.calculate_all(bars);

    SECTION("no fundamentals") {
        std::optional<FundamentalData> fundamentals;
        StrategyResult result = LynchStrategy().analyze(StrategyContext(bars, indicators, fundamentals));
        CHECK(result.score == Approx(65.0));
        CHECK(result.signal == SignalType::BUY);
        CHECK(result.conviction == ConvictionLevel::MEDIUM);
        CHECK(contains(result.warnings, "Fundamental data unavailable - technical-only score"));
    }

    SECTION("fundamentals without a scorable metric") {
        FundamentalData data;
        data.debt_to_equity = 0.4;
        std::optional<FundamentalData> fundamentals = data;
        StrategyResult result = LynchStrategy().analyze(StrategyContext(bars, indicators, fundamentals));
        CHECK(result.score == Approx(65.0));
    }

    SECTION("scorable fundamentals replace the technical score") {
        std::optional<FundamentalData> fundamentals = strong_fundamentals();
        StrategyResult result = LynchStrategy().analyze(StrategyContext(bars, indicators, fundamentals));
        CHECK(result.score == Approx(100.0));
        CHECK(result.signal == SignalType::BUY);
        CHECK(result.conviction == ConvictionLevel::HIGH);
        CHECK_FALSE(contains(result.warnings, "technical-only"));
    }
}

TEST_CASE("VCP contractions pair pivots two at a time", "[strategies][minervini]") {
    // Peaks at 5 and 23, troughs at 15 and 29, one unit per bar
    std::vector<double> closes;
    const std::vector<std::pair<int, double>> knots{{0, 105.0}, {5, 110.0}, {15, 100.0}, {23, 108.0}, {29, 102.0}, {32, 105.0}};
    for (size_t knot_index = 0; knot_index + 1 < knots.size(); ++knot_index) {
        double step = (knots[knot_index + 1].second - knots[knot_index].second) /
                      (knots[knot_index + 1].first - knots[knot_index].first);
        for (int index = knots[knot_index].first; index < knots[knot_index + 1].first; ++index) {
            closes.push_back(knots[knot_index].second + step * (index - knots[knot_index].first));
        }
    }
    closes.push_back(knots.back().second);

    std::vector<double> contractions = measure_vcp_contractions(TestBars::from_closes(closes, 0.5), 2);

    REQUIRE(contractions.size() == 2);
    CHECK(contractions[0] == Approx(11.0 / 110.5 * 100.0));
    CHECK(contractions[1] == Approx(7.0 / 108.5 * 100.0));
}

TEST_CASE("Composite score is the weighted sum of the four scores", "[composite]") {
    CompositeConfig config;
    CompositeStrategy composite(config, TrendConfig());

    CHECK(config.minervini_weight + config.weinstein_weight + config.lynch_weight + config.technical_weight == Approx(1.0));
    CHECK(composite.compute_composite_score(80.0, 60.0, 40.0, 20.0) == Approx(58.0));
    CHECK(composite.compute_composite_score(100.0, 100.0, 100.0, 100.0) == Approx(100.0));
}

TEST_CASE("Composite signal bands and conviction", "[composite]") {
    CompositeStrategy composite{CompositeConfig{}, TrendConfig{}};

    SECTION("buy band") {
        CHECK(composite.determine_signal(90.0, scores_of(90.0, 88.0, 92.0)) ==
              std::make_pair(SignalType::BUY, ConvictionLevel::HIGH));
        CHECK(composite.determine_signal(90.0, scores_of(100.0, 60.0, 90.0)) ==
              std::make_pair(SignalType::BUY, ConvictionLevel::MEDIUM));
        CHECK(composite.determine_signal(72.0, scores_of(72.0, 72.0, 72.0)) ==
              std::make_pair(SignalType::BUY, ConvictionLevel::MEDIUM));
    }

    SECTION("hold band") {
        CHECK(composite.determine_signal(60.0, scores_of(60.0, 60.0, 60.0)) ==
              std::make_pair(SignalType::HOLD, ConvictionLevel::LOW));
        CHECK(composite.determine_signal(40.0, scores_of(40.0, 40.0, 40.0)) ==
              std::make_pair(SignalType::HOLD, ConvictionLevel::LOW));
    }

    SECTION("avoid band") {
        CHECK(composite.determine_signal(30.0, scores_of(30.0, 30.0, 30.0)) ==
              std::make_pair(SignalType::AVOID, ConvictionLevel::MEDIUM));
        CHECK(composite.determine_signal(20.0, scores_of(15.0, 20.0, 18.0)) ==
              std::make_pair(SignalType::AVOID, ConvictionLevel::HIGH));
        // A zero Lynch score counts as neutral 50 and breaks the agreement
        CHECK(composite.determine_signal(20.0, scores_of(15.0, 20.0, 0.0)) ==
              std::make_pair(SignalType::AVOID, ConvictionLevel::MEDIUM));
    }
}

TEST_CASE("Composite analysis of a smooth uptrend", "[composite]") {
    IndicatorEngine engine{IndicatorConfig()};
    BarSeries bars = TestBars::smooth_uptrend();
    IndicatorSet indicators = engine.calculate_all(bars);
    CompositeStrategy composite{CompositeConfig{}, TrendConfig{}};

    SECTION("without fundamentals") {
        CompositeResult result = composite.analyze(bars, indicators, std::nullopt);

        CHECK(result.scores.minervini_score == Approx(52.0));
        CHECK(result.scores.weinstein_score == Approx(75.0));
        CHECK(result.scores.lynch_score == Approx(65.0));
        CHECK(result.scores.technical_score == Approx(85.0));
        CHECK(result.scores.composite_score == Approx(66.95));
        CHECK(result.signal == SignalType::HOLD);
        CHECK(result.conviction == ConvictionLevel::LOW);
        CHECK_FALSE(result.scores.fundamental_score.has_value());

        REQUIRE(result.strategy_details.size() == 4);
        CHECK(result.strategy_details.at("weinstein").score == Approx(75.0));
        CHECK(result.strategy_details.at("lynch").signal == SignalType::BUY);
        CHECK(result.strategy_details.at("minervini").conviction.has_value());

        const StrategyBreakdown& technical = result.strategy_details.at("technical");
        CHECK(technical.score == Approx(result.scores.technical_score));
        CHECK(technical.score == Approx(85.0));
        CHECK_FALSE(technical.signal.has_value());
        CHECK_FALSE(technical.conviction.has_value());

        REQUIRE_FALSE(result.bullish_factors.empty());
        CHECK(result.bullish_factors.front().rfind("[Minervini] ", 0) == 0);
        CHECK(contains(result.warnings, "[Lynch] "));
    }

    SECTION("with scorable fundamentals") {
        CompositeResult result = composite.analyze(bars, indicators, strong_fundamentals());

        CHECK(result.scores.lynch_score == Approx(100.0));
        CHECK(result.scores.composite_score == Approx(72.2));
        CHECK(result.signal == SignalType::BUY);
        CHECK(result.conviction == ConvictionLevel::MEDIUM);
        CHECK(*result.scores.fundamental_score == Approx(100.0));
        CHECK(*result.scores.fundamental_grade == "A+");
    }
}

TEST_CASE("Contracting ranges earn the VCP score", "[composite][minervini]") {
    IndicatorEngine engine{IndicatorConfig()};
    BarSeries bars = TestBars::contracting_uptrend();
    IndicatorSet indicators = engine.calculate_all(bars);

    CompositeResult result = CompositeStrategy(CompositeConfig(), TrendConfig()).analyze(bars, indicators, std::nullopt);

    CHECK(result.scores.minervini_score == Approx(77.0));
    CHECK(result.scores.weinstein_score == Approx(82.0));
    CHECK(result.scores.technical_score == Approx(90.0));
    CHECK(result.scores.composite_score == Approx(78.9));
    CHECK(result.signal == SignalType::BUY);
    CHECK(result.conviction == ConvictionLevel::MEDIUM);
}

TEST_CASE("Technical score needs indicators", "[composite]") {
    CHECK(compute_technical_score(TestBars::smooth_uptrend(), IndicatorSet()) == Approx(0.0));
    CHECK(compute_technical_score(BarSeries(), IndicatorSet()) == Approx(0.0));
}

TEST_CASE("Strategy summary names every scorer", "[composite]") {
    IndicatorEngine engine{IndicatorConfig()};
    BarSeries bars = TestBars::smooth_uptrend();
    CompositeResult result = CompositeStrategy(CompositeConfig(), TrendConfig())
                                 .analyze(bars, engine.calculate_all(bars), std::nullopt);

    std::string summary = strategy_summary(result);
    CHECK(summary.rfind("Composite Score: ", 0) == 0);
    CHECK(summary.find("Signal: HOLD (LOW)") != std::string::npos);
    CHECK(summary.find("Minervini SEPA: 52.0") != std::string::npos);
    CHECK(summary.find("Weinstein Stage: 75.0") != std::string::npos);
    CHECK(summary.find("Lynch GARP: 65.0") != std::string::npos);
    CHECK(summary.find("Technical: 85.0") != std::string::npos);
}
