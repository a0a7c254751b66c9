#include "json_serializer.hpp"
#include <cmath>
#include "utils/format_utils.hpp"

using json = nlohmann::json;

namespace ChartAnalyzer {
namespace Core {

namespace {
    const int SCORE_DECIMALS = 1;
    const int PRICE_DECIMALS = 2;

    json optional_to_json(const std::optional<double>& value) {
        if (!value) return json(nullptr);
        return json(*value);
    }

    json rounded_optional(const std::optional<double>& value, int decimals) {
        if (!value) return json(nullptr);
        return json(JsonSerializer::round_to(*value, decimals));
    }
}

double JsonSerializer::round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

json JsonSerializer::serialize_report(const AnalysisReport& report) {
    json report_json;
    report_json["analysis"] = serialize_analysis(report.analysis);
    report_json["analysis"]["strategy_details"] = serialize_composite_details(report.composite);
    report_json["trade_suggestion"] = serialize_trade_suggestion(report.trade_suggestion);
    return report_json;
}

json JsonSerializer::serialize_analysis(const AnalysisResult& analysis) {
    json analysis_json;
    analysis_json["symbol"] = analysis.symbol;
    analysis_json["timestamp"] = analysis.timestamp;
    analysis_json["timeframe"] = analysis.timeframe;
    analysis_json["current_price"] = analysis.current_price;
    analysis_json["primary_trend"] = to_string(analysis.primary_trend);
    analysis_json["trend_strength"] = round_to(analysis.trend_strength, SCORE_DECIMALS);
    analysis_json["trend_notes"] = analysis.trend_notes;
    analysis_json["weinstein_stage"] = to_int(analysis.weinstein_stage);
    analysis_json["stage_description"] = analysis.stage_description;
    analysis_json["scores"] = serialize_scores(analysis.scores);

    json patterns_json = json::array();
    for (const PatternMatch& pattern : analysis.detected_patterns) {
        patterns_json.push_back(serialize_pattern(pattern));
    }
    analysis_json["detected_patterns"] = patterns_json;

    json support_json = json::array();
    for (const Level& level : analysis.support_levels) {
        support_json.push_back(serialize_level(level));
    }
    analysis_json["support_levels"] = support_json;

    json resistance_json = json::array();
    for (const Level& level : analysis.resistance_levels) {
        resistance_json.push_back(serialize_level(level));
    }
    analysis_json["resistance_levels"] = resistance_json;

    analysis_json["signal"] = to_string(analysis.signal);
    analysis_json["conviction"] = to_string(analysis.conviction);
    analysis_json["indicators"] = serialize_indicators(analysis.indicators);
    analysis_json["volume"] = serialize_volume(analysis.volume);
    analysis_json["bullish_factors"] = analysis.bullish_factors;
    analysis_json["bearish_factors"] = analysis.bearish_factors;
    analysis_json["warnings"] = analysis.warnings;
    return analysis_json;
}

json JsonSerializer::serialize_composite_details(const CompositeResult& composite) {
    json details_json = json::object();
    for (const auto& detail_entry : composite.strategy_details) {
        const StrategyBreakdown& breakdown = detail_entry.second;
        json breakdown_json;
        breakdown_json["score"] = round_to(breakdown.score, SCORE_DECIMALS);
        if (breakdown.signal) {
            breakdown_json["signal"] = to_string(*breakdown.signal);
        }
        if (breakdown.conviction) {
            breakdown_json["conviction"] = to_string(*breakdown.conviction);
        }
        details_json[detail_entry.first] = breakdown_json;
    }
    return details_json;
}

json JsonSerializer::serialize_scores(const StrategyScores& scores) {
    json scores_json;
    scores_json["minervini_score"] = round_to(scores.minervini_score, SCORE_DECIMALS);
    scores_json["weinstein_score"] = round_to(scores.weinstein_score, SCORE_DECIMALS);
    scores_json["lynch_score"] = round_to(scores.lynch_score, SCORE_DECIMALS);
    scores_json["technical_score"] = round_to(scores.technical_score, SCORE_DECIMALS);
    scores_json["fundamental_score"] = rounded_optional(scores.fundamental_score, SCORE_DECIMALS);
    scores_json["fundamental_grade"] = scores.fundamental_grade ? json(*scores.fundamental_grade) : json(nullptr);
    scores_json["composite_score"] = round_to(scores.composite_score, SCORE_DECIMALS);
    return scores_json;
}

json JsonSerializer::serialize_level(const Level& level) {
    return {
        {"price", level.price},
        {"strength", level.strength},
        {"touches", level.touches},
        {"level_type", FormatUtils::to_upper(to_string(level.level_type))},
        {"description", level.description}
    };
}

json JsonSerializer::serialize_pattern(const PatternMatch& pattern) {
    return {
        {"pattern_type", to_string(pattern.pattern_type)},
        {"pattern_name", pattern.pattern_name},
        {"bullish", pattern.bullish},
        {"completion_pct", round_to(pattern.completion_pct, SCORE_DECIMALS)},
        {"breakout_level", rounded_optional(pattern.breakout_level, PRICE_DECIMALS)},
        {"target_price", rounded_optional(pattern.target_price, PRICE_DECIMALS)},
        {"stop_loss", rounded_optional(pattern.stop_loss, PRICE_DECIMALS)},
        {"confidence", pattern.confidence},
        {"description", pattern.description}
    };
}

json JsonSerializer::serialize_volume(const VolumeAnalysis& volume) {
    return {
        {"current_volume", volume.current_volume},
        {"avg_volume_20", optional_to_json(volume.avg_volume_20)},
        {"avg_volume_50", optional_to_json(volume.avg_volume_50)},
        {"volume_ratio", optional_to_json(volume.volume_ratio)},
        {"volume_trend", volume.volume_trend},
        {"on_breakout", volume.on_breakout},
        {"accumulation_detected", volume.accumulation_detected},
        {"distribution_detected", volume.distribution_detected},
        {"volume_confirmation", volume.volume_confirmation},
        {"notes", volume.notes}
    };
}

json JsonSerializer::serialize_indicators(const IndicatorSet& indicators) {
    json indicators_json = json::object();
    for (const std::string& indicator_name : IndicatorSet::reported_names()) {
        indicators_json[indicator_name] = optional_to_json(indicators.get(indicator_name));
    }
    return indicators_json;
}

json JsonSerializer::serialize_target(const Target& target) {
    return {
        {"price", round_to(target.price, PRICE_DECIMALS)},
        {"risk_reward", round_to(target.risk_reward, PRICE_DECIMALS)},
        {"description", target.description}
    };
}

json JsonSerializer::serialize_trade_suggestion(const std::optional<TradeSuggestion>& suggestion) {
    if (!suggestion) {
        return json(nullptr);
    }
    const TradeSuggestion& plan = *suggestion;
    json plan_json;
    plan_json["symbol"] = plan.symbol;
    plan_json["timestamp"] = plan.timestamp;
    plan_json["action"] = to_string(plan.action);
    plan_json["conviction"] = to_string(plan.conviction);
    plan_json["entry_price"] = round_to(plan.entry_price, PRICE_DECIMALS);
    plan_json["entry_zone"] = {
        {"low", round_to(plan.entry_zone.low, PRICE_DECIMALS)},
        {"high", round_to(plan.entry_zone.high, PRICE_DECIMALS)}
    };
    plan_json["entry_trigger"] = plan.entry_trigger;
    plan_json["stop_loss"] = round_to(plan.stop_loss, PRICE_DECIMALS);
    plan_json["stop_loss_type"] = to_string(plan.stop_loss_type);
    plan_json["stop_loss_pct"] = round_to(plan.stop_loss_pct, PRICE_DECIMALS);
    plan_json["risk_per_share"] = round_to(plan.risk_per_share, PRICE_DECIMALS);
    plan_json["target_1"] = serialize_target(plan.target_1);
    plan_json["target_2"] = serialize_target(plan.target_2);
    plan_json["target_3"] = serialize_target(plan.target_3);
    plan_json["suggested_position_pct"] = plan.suggested_position_pct;
    plan_json["max_position_pct"] = plan.max_position_pct;
    plan_json["risk_reward_ratio"] = plan.risk_reward_ratio;
    plan_json["holding_period"] = to_string(plan.holding_period);
    plan_json["strategy_source"] = plan.strategy_source;
    plan_json["reasoning"] = plan.reasoning;
    plan_json["warnings"] = plan.warnings;
    return plan_json;
}

json JsonSerializer::serialize_scan_result(const ScanResult& result) {
    return {
        {"symbol", result.symbol},
        {"current_price", round_to(result.current_price, PRICE_DECIMALS)},
        {"composite_score", round_to(result.composite_score, SCORE_DECIMALS)},
        {"signal", to_string(result.signal)},
        {"conviction", to_string(result.conviction)},
        {"trend", to_string(result.trend)},
        {"weinstein_stage", to_int(result.weinstein_stage)},
        {"patterns", result.patterns},
        {"volume_ratio", rounded_optional(result.volume_ratio, PRICE_DECIMALS)},
        {"timestamp", result.timestamp}
    };
}

json JsonSerializer::serialize_scan_results(const std::vector<ScanResult>& results) {
    json results_json = json::array();
    for (const ScanResult& result : results) {
        results_json.push_back(serialize_scan_result(result));
    }
    return results_json;
}

} // namespace Core
} // namespace ChartAnalyzer
