#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "analyzer/analysis_service/analysis_service.hpp"
#include "analyzer/serialization/json_serializer.hpp"

using namespace ChartAnalyzer::Core;
using json = nlohmann::json;

TEST_CASE("Rounding to a fixed number of decimals", "[json]") {
    CHECK(JsonSerializer::round_to(66.95001, 1) == Approx(67.0));
    CHECK(JsonSerializer::round_to(102.904, 2) == Approx(102.9));
    CHECK(JsonSerializer::round_to(-1.25, 0) == Approx(-1.0));
}

TEST_CASE("Indicators are listed in reporting order with null when absent", "[json]") {
    IndicatorSet indicators;
    indicators.set(IndicatorNames::RSI_14, 55.5);

    json indicators_json = JsonSerializer::serialize_indicators(indicators);
    CHECK(indicators_json.size() == IndicatorSet::reported_names().size());
    CHECK(indicators_json["rsi_14"].get<double>() == Approx(55.5));
    CHECK(indicators_json["sma_200"].is_null());
    CHECK(indicators_json["relative_strength"].is_null());
}

TEST_CASE("Missing trade suggestion serializes as null", "[json]") {
    CHECK(JsonSerializer::serialize_trade_suggestion(std::nullopt).is_null());
}

TEST_CASE("Trade suggestion prices are rounded to cents", "[json]") {
    TradeSuggestion plan;
    plan.symbol = "ABC";
    plan.action = SignalType::BUY;
    plan.conviction = ConvictionLevel::HIGH;
    plan.entry_price = 100.004;
    plan.entry_zone = EntryZone(99.126, 100.884);
    plan.stop_loss = 96.555;
    plan.stop_loss_type = StopLossType::SUPPORT;
    plan.target_1 = Target(105.123, 1.5, "Conservative target");
    plan.suggested_position_pct = 5.0;

    json plan_json = JsonSerializer::serialize_trade_suggestion(plan);
    CHECK(plan_json["action"].get<std::string>() == "BUY");
    CHECK(plan_json["conviction"].get<std::string>() == "HIGH");
    CHECK(plan_json["stop_loss_type"].get<std::string>() == "SUPPORT");
    CHECK(plan_json["holding_period"].get<std::string>() == "SWING");
    CHECK(plan_json["entry_price"].get<double>() == Approx(100.0));
    CHECK(plan_json["entry_zone"]["low"].get<double>() == Approx(99.13));
    CHECK(plan_json["entry_zone"]["high"].get<double>() == Approx(100.88));
    CHECK(plan_json["target_1"]["price"].get<double>() == Approx(105.12));
    CHECK(plan_json["target_1"]["description"].get<std::string>() == "Conservative target");
    CHECK(plan_json["suggested_position_pct"].get<double>() == Approx(5.0));
}

TEST_CASE("Analysis fields use enum names and an integer stage", "[json]") {
    AnalysisResult analysis;
    analysis.symbol = "ABC";
    analysis.primary_trend = TrendType::BEARISH;
    analysis.weinstein_stage = WeinsteinStage::STAGE_4;
    analysis.signal = SignalType::AVOID;
    analysis.conviction = ConvictionLevel::MEDIUM;
    analysis.scores.minervini_score = 12.345;
    analysis.scores.composite_score = 20.04;
    analysis.support_levels = {Level(95.0, 3, 2, LevelType::SUPPORT, "Swing low")};

    PatternMatch pattern;
    pattern.pattern_type = PatternType::DOUBLE_TOP;
    pattern.pattern_name = "Double Top";
    pattern.completion_pct = 100.0;
    pattern.breakout_level = 90.126;
    analysis.detected_patterns.push_back(pattern);

    json analysis_json = JsonSerializer::serialize_analysis(analysis);
    CHECK(analysis_json["primary_trend"].get<std::string>() == "BEARISH");
    CHECK(analysis_json["weinstein_stage"].get<int>() == 4);
    CHECK(analysis_json["signal"].get<std::string>() == "AVOID");
    CHECK(analysis_json["conviction"].get<std::string>() == "MEDIUM");
    CHECK(analysis_json["timeframe"].get<std::string>() == "1d");
    CHECK(analysis_json["scores"]["minervini_score"].get<double>() == Approx(12.3));
    CHECK(analysis_json["scores"]["composite_score"].get<double>() == Approx(20.0));
    CHECK(analysis_json["scores"]["fundamental_score"].is_null());
    CHECK(analysis_json["scores"]["fundamental_grade"].is_null());
    CHECK(analysis_json["support_levels"][0]["level_type"].get<std::string>() == "SUPPORT");
    CHECK(analysis_json["resistance_levels"].is_array());
    CHECK(analysis_json["resistance_levels"].empty());
    CHECK(analysis_json["detected_patterns"][0]["pattern_type"].get<std::string>() == "DOUBLE_TOP");
    CHECK(analysis_json["detected_patterns"][0]["breakout_level"].get<double>() == Approx(90.13));
    CHECK(analysis_json["detected_patterns"][0]["target_price"].is_null());
    CHECK(analysis_json["volume"]["volume_ratio"].is_null());
}

TEST_CASE("Full report nests strategy details inside the analysis", "[json]") {
    AnalysisService service{ChartAnalyzer::Config::SystemConfig()};
    std::optional<AnalysisReport> report = service.analyze("smooth", TestBars::smooth_uptrend(), std::nullopt, std::nullopt);
    REQUIRE(report.has_value());

    json report_json = JsonSerializer::serialize_report(*report);
    REQUIRE(report_json.contains("analysis"));
    CHECK(report_json["trade_suggestion"].is_null());

    const json& analysis_json = report_json["analysis"];
    CHECK(analysis_json["symbol"].get<std::string>() == "SMOOTH");
    CHECK(analysis_json["weinstein_stage"].get<int>() == 2);
    CHECK(analysis_json["signal"].get<std::string>() == "HOLD");
    CHECK(analysis_json["scores"]["minervini_score"].get<double>() == Approx(52.0));
    CHECK(analysis_json["scores"]["technical_score"].get<double>() == Approx(85.0));
    CHECK(analysis_json["indicators"]["sma_200"].is_number());

    const json& details_json = analysis_json["strategy_details"];
    REQUIRE(details_json.size() == report->composite.strategy_details.size());
    for (const auto& detail_entry : report->composite.strategy_details) {
        REQUIRE(details_json.contains(detail_entry.first));
        CHECK(details_json[detail_entry.first].contains("score"));
        CHECK(details_json[detail_entry.first].contains("signal") == detail_entry.second.signal.has_value());
    }
    REQUIRE(details_json.contains("technical"));
    CHECK(details_json["technical"]["score"].get<double>() == Approx(85.0));
    CHECK(details_json["technical"].size() == 1);
    CHECK(details_json["lynch"]["signal"].get<std::string>() == "BUY");
}

TEST_CASE("Scan results serialize as an array", "[json]") {
    ScanResult result;
    result.symbol = "XYZ";
    result.current_price = 12.345;
    result.composite_score = 71.26;
    result.weinstein_stage = WeinsteinStage::STAGE_2;
    result.patterns = {"VCP"};

    json results_json = JsonSerializer::serialize_scan_results({result});
    REQUIRE(results_json.is_array());
    REQUIRE(results_json.size() == 1);
    CHECK(results_json[0]["symbol"].get<std::string>() == "XYZ");
    CHECK(results_json[0]["composite_score"].get<double>() == Approx(71.3));
    CHECK(results_json[0]["weinstein_stage"].get<int>() == 2);
    CHECK(results_json[0]["patterns"][0].get<std::string>() == "VCP");
    CHECK(results_json[0]["volume_ratio"].is_null());

    CHECK(JsonSerializer::serialize_scan_results({}).is_array());
    CHECK(JsonSerializer::serialize_scan_results({}).empty());
}
