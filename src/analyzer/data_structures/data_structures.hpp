#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "indicator_set.hpp"

namespace ChartAnalyzer {
namespace Core {

// =============================================================================
// MARKET DATA
// =============================================================================

struct Bar {
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    double volume;
    std::string timestamp;
    long long epoch_seconds;    // Parsed from timestamp at ingestion; orders and aligns bars

    Bar() : open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0), volume(0.0), timestamp(""), epoch_seconds(0) {}
};

using BarSeries = std::vector<Bar>;

struct FundamentalData {
    std::string symbol;
    std::optional<double> pe_ratio;
    std::optional<double> pb_ratio;
    std::optional<double> roe;                 // Return on equity, percent
    std::optional<double> roce;                // Return on capital employed, percent
    std::optional<double> debt_to_equity;
    std::optional<double> eps_growth;          // Percent
    std::optional<double> revenue_growth;      // Percent
};

// =============================================================================
// CLASSIFICATIONS
// =============================================================================

enum class TrendType { BULLISH, BEARISH, NEUTRAL };

enum class SignalType { BUY, SELL, HOLD, AVOID };

enum class ConvictionLevel { LOW = 1, MEDIUM = 2, HIGH = 3 };

enum class WeinsteinStage { STAGE_1 = 1, STAGE_2 = 2, STAGE_3 = 3, STAGE_4 = 4 };

enum class LevelType { SUPPORT, RESISTANCE };

enum class PatternType {
    CUP_HANDLE,
    VCP,
    DOUBLE_TOP,
    DOUBLE_BOTTOM,
    HEAD_SHOULDERS,
    HEAD_SHOULDERS_INVERSE,
    ASCENDING_TRIANGLE,
    DESCENDING_TRIANGLE,
    FLAG,
    PENNANT,
    WEDGE_RISING,
    WEDGE_FALLING,
    BASE_BREAKOUT,
    HIGH_TIGHT_FLAG,
    PULLBACK_MA
};

enum class StopLossType { PERCENTAGE, ATR, SUPPORT, SWING_LOW };

enum class HoldingPeriod { INTRADAY, SWING, POSITIONAL };

std::string to_string(TrendType trend);
std::string to_string(SignalType signal);
std::string to_string(ConvictionLevel conviction);
std::string to_string(LevelType level_type);
std::string to_string(PatternType pattern_type);
std::string to_string(StopLossType stop_loss_type);
std::string to_string(HoldingPeriod holding_period);
int to_int(WeinsteinStage stage);

// Parsers throw std::runtime_error on unknown names
TrendType parse_trend_type(const std::string& value);
SignalType parse_signal_type(const std::string& value);
ConvictionLevel parse_conviction_level(const std::string& value);
WeinsteinStage parse_weinstein_stage(int value);

// =============================================================================
// ANALYSIS PRODUCTS
// =============================================================================

struct Level {
    double price;
    int strength;              // 1..5
    int touches;
    LevelType level_type;
    std::string description;

    Level() : price(0.0), strength(1), touches(0), level_type(LevelType::SUPPORT), description("") {}
    Level(double level_price, int level_strength, int level_touches, LevelType type, const std::string& text)
        : price(level_price), strength(level_strength), touches(level_touches), level_type(type), description(text) {}
};

struct PatternMatch {
    PatternType pattern_type;
    std::string pattern_name;
    bool bullish;
    double completion_pct;
    std::optional<double> breakout_level;
    std::optional<double> target_price;
    std::optional<double> stop_loss;
    double confidence;
    std::string description;

    PatternMatch() : pattern_type(PatternType::CUP_HANDLE), pattern_name(""), bullish(false), completion_pct(0.0), confidence(0.0), description("") {}
};

struct TrendAssessment {
    TrendType trend;
    double strength;           // 0..100
    std::string notes;

    TrendAssessment() : trend(TrendType::NEUTRAL), strength(0.0), notes("") {}
};

struct StageAssessment {
    WeinsteinStage stage;
    std::string description;
    bool classified;           // false when the history is too short; stage is then only a placeholder

    StageAssessment() : stage(WeinsteinStage::STAGE_1), description(""), classified(true) {}
};

struct VolumeAnalysis {
    double current_volume;
    std::optional<double> avg_volume_20;
    std::optional<double> avg_volume_50;
    std::optional<double> volume_ratio;
    std::string volume_trend;
    bool on_breakout;
    bool accumulation_detected;
    bool distribution_detected;
    bool volume_confirmation;
    std::vector<std::string> notes;

    VolumeAnalysis()
        : current_volume(0.0), volume_trend("neutral"), on_breakout(false), accumulation_detected(false),
          distribution_detected(false), volume_confirmation(false) {}
};

struct VolumeClimax {
    bool detected;
    double volume_ratio;
    double price_change_pct;
    std::string climax_type;   // buying_climax or selling_climax

    VolumeClimax() : detected(false), volume_ratio(0.0), price_change_pct(0.0), climax_type("") {}
};

// =============================================================================
// STRATEGY PRODUCTS
// =============================================================================

struct StrategyResult {
    double score;
    std::vector<std::string> bullish_factors;
    std::vector<std::string> bearish_factors;
    std::vector<std::string> warnings;
    SignalType signal;
    ConvictionLevel conviction;
    std::map<std::string, double> sub_scores;

    StrategyResult() : score(0.0), signal(SignalType::AVOID), conviction(ConvictionLevel::LOW) {}
};

struct FundamentalScore {
    double score;
    std::string grade;
    std::vector<std::string> bullish_factors;
    std::vector<std::string> bearish_factors;
    std::vector<std::string> warnings;
    std::map<std::string, double> detail_scores;

    FundamentalScore() : score(0.0), grade("D") {}
};

struct StrategyScores {
    double minervini_score;
    double weinstein_score;
    double lynch_score;
    double technical_score;
    std::optional<double> fundamental_score;
    std::optional<std::string> fundamental_grade;
    double composite_score;

    StrategyScores() : minervini_score(0.0), weinstein_score(0.0), lynch_score(0.0), technical_score(0.0), composite_score(0.0) {}
};

// The technical entry carries only a score
struct StrategyBreakdown {
    double score;
    std::optional<SignalType> signal;
    std::optional<ConvictionLevel> conviction;

    StrategyBreakdown() : score(0.0) {}
};

struct CompositeResult {
    StrategyScores scores;
    SignalType signal;
    ConvictionLevel conviction;
    std::vector<std::string> bullish_factors;
    std::vector<std::string> bearish_factors;
    std::vector<std::string> warnings;
    std::map<std::string, StrategyBreakdown> strategy_details;

    CompositeResult() : signal(SignalType::HOLD), conviction(ConvictionLevel::LOW) {}
};

// =============================================================================
// AGGREGATE ROOT AND TRADE PLAN
// =============================================================================

struct AnalysisResult {
    std::string symbol;
    std::string timestamp;     // Timestamp of the last analysed bar
    std::string timeframe;
    double current_price;

    TrendType primary_trend;
    double trend_strength;
    std::string trend_notes;

    WeinsteinStage weinstein_stage;
    std::string stage_description;

    StrategyScores scores;
    std::vector<PatternMatch> detected_patterns;
    std::vector<Level> support_levels;
    std::vector<Level> resistance_levels;

    SignalType signal;
    ConvictionLevel conviction;
    IndicatorSet indicators;
    VolumeAnalysis volume;

    std::vector<std::string> bullish_factors;
    std::vector<std::string> bearish_factors;
    std::vector<std::string> warnings;

    AnalysisResult()
        : timeframe("1d"), current_price(0.0), primary_trend(TrendType::NEUTRAL), trend_strength(0.0),
          weinstein_stage(WeinsteinStage::STAGE_1), signal(SignalType::HOLD), conviction(ConvictionLevel::LOW) {}
};

struct EntryZone {
    double low;
    double high;

    EntryZone() : low(0.0), high(0.0) {}
    EntryZone(double zone_low, double zone_high) : low(zone_low), high(zone_high) {}
};

struct Target {
    double price;
    double risk_reward;
    std::string description;

    Target() : price(0.0), risk_reward(0.0), description("") {}
    Target(double target_price, double target_risk_reward, const std::string& text)
        : price(target_price), risk_reward(target_risk_reward), description(text) {}
};

struct TradeSuggestion {
    std::string symbol;
    std::string timestamp;
    SignalType action;
    ConvictionLevel conviction;

    double entry_price;
    EntryZone entry_zone;
    std::string entry_trigger;

    double stop_loss;
    StopLossType stop_loss_type;
    double stop_loss_pct;
    double risk_per_share;

    Target target_1;
    Target target_2;
    Target target_3;

    double suggested_position_pct;
    double max_position_pct;
    double risk_reward_ratio;
    HoldingPeriod holding_period;

    std::string strategy_source;
    std::vector<std::string> reasoning;
    std::vector<std::string> warnings;

    TradeSuggestion()
        : action(SignalType::HOLD), conviction(ConvictionLevel::LOW), entry_price(0.0), stop_loss(0.0),
          stop_loss_type(StopLossType::PERCENTAGE), stop_loss_pct(0.0), risk_per_share(0.0),
          suggested_position_pct(0.0), max_position_pct(0.0), risk_reward_ratio(0.0),
          holding_period(HoldingPeriod::SWING) {}
};

struct AnalysisReport {
    AnalysisResult analysis;
    CompositeResult composite;
    std::optional<TradeSuggestion> trade_suggestion;
};

} // namespace Core
} // namespace ChartAnalyzer

#endif // DATA_STRUCTURES_HPP
