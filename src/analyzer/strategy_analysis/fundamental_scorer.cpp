#include "fundamental_scorer.hpp"
#include <algorithm>
#include <cmath>
#include "strategy_common.hpp"
#include "utils/format_utils.hpp"

namespace ChartAnalyzer {
namespace Core {

using FormatUtils::format_fixed;

namespace {
    // Shared bucket table for EPS and revenue growth
    double score_growth_metric(const std::optional<double>& growth, const std::string& metric_name,
                               const std::string& decline_name, FundamentalScore& result) {
        if (!growth) {
            return -2.0;
        }

        double value = *growth;
        std::string percent = " (" + format_fixed(value, 1) + "%)";
        if (value > 20.0) {
            result.bullish_factors.push_back("Excellent " + metric_name + " growth" + percent);
            return 15.0;
        }
        if (value > 15.0) {
            result.bullish_factors.push_back("Strong " + metric_name + " growth" + percent);
            return 12.0;
        }
        if (value > 10.0) {
            result.bullish_factors.push_back("Good " + metric_name + " growth" + percent);
            return 9.0;
        }
        if (value > 5.0) {
            return 5.0;
        }
        if (value > 0.0) {
            return 2.0;
        }
        if (value < -5.0) {
            result.bearish_factors.push_back("Declining " + decline_name + percent);
        } else if (value < 0.0) {
            result.bearish_factors.push_back("Negative " + metric_name + " growth" + percent);
        }
        return 0.0;
    }
}

bool has_scorable_fundamentals(const FundamentalData& data) {
    return data.pe_ratio || data.pb_ratio || data.roe || data.roce || data.eps_growth || data.revenue_growth;
}

std::optional<FundamentalScore> FundamentalScorer::score(const FundamentalData& data) const {
    if (!has_scorable_fundamentals(data)) {
        return std::nullopt;
    }

    FundamentalScore result;
    double pe_score = score_pe_ratio(data, result);
    double growth_score = score_growth(data, result);
    double roe_score = score_returns(data, result);
    double debt_score = score_debt(data, result);

    result.detail_scores["pe_score"] = pe_score;
    result.detail_scores["growth_score"] = growth_score;
    result.detail_scores["roe_score"] = roe_score;
    result.detail_scores["debt_score"] = debt_score;
    result.score = pe_score + growth_score + roe_score + debt_score;
    result.grade = grade_for(result.score);
    return result;
}

std::string FundamentalScorer::grade_for(double score) {
    if (score >= 90.0) return "A+";
    if (score >= 80.0) return "A";
    if (score >= 70.0) return "B+";
    if (score >= 60.0) return "B";
    if (score >= 50.0) return "C";
    return "D";
}

double FundamentalScorer::score_pe_ratio(const FundamentalData& data, FundamentalScore& result) const {
    if (!data.pe_ratio) {
        return 0.0;
    }

    double score = 0.0;
    double pe = *data.pe_ratio;
    if (pe < 15.0) {
        score += 10.0;
        result.bullish_factors.push_back("Attractive P/E ratio (" + format_fixed(pe, 1) + ")");
    } else if (pe < 25.0) {
        score += 7.0;
        result.bullish_factors.push_back("Reasonable P/E ratio (" + format_fixed(pe, 1) + ")");
    } else if (pe < 35.0) {
        score += 4.0;
    } else if (pe < 50.0) {
        result.bearish_factors.push_back("Elevated P/E ratio (" + format_fixed(pe, 1) + ")");
    } else {
        result.bearish_factors.push_back("High P/E ratio (" + format_fixed(pe, 1) + ") - expensive");
        result.warnings.push_back("P/E ratio suggests overvaluation");
    }

    if (data.eps_growth && *data.eps_growth > 0.0) {
        double peg = pe / *data.eps_growth;
        if (peg < 0.8) {
            score += 15.0;
            result.bullish_factors.push_back("Excellent PEG ratio (" + format_fixed(peg, 2) + ") - growth at bargain price");
        } else if (peg < 1.0) {
            score += 12.0;
            result.bullish_factors.push_back("Good PEG ratio (" + format_fixed(peg, 2) + ") - reasonably priced growth");
        } else if (peg < 1.3) {
            score += 6.0;
            result.bullish_factors.push_back("Acceptable PEG ratio (" + format_fixed(peg, 2) + ")");
        } else if (peg > 2.0) {
            result.bearish_factors.push_back("High PEG ratio (" + format_fixed(peg, 2) + ") - paying too much for growth");
        }
    } else if (!data.eps_growth && pe < 20.0) {
        score += 5.0;
    }

    return std::min(25.0, score);
}

double FundamentalScorer::score_growth(const FundamentalData& data, FundamentalScore& result) const {
    double score = 0.0;
    score += score_growth_metric(data.eps_growth, "EPS", "EPS", result);
    score += score_growth_metric(data.revenue_growth, "revenue", "revenue", result);

    if (data.eps_growth && data.revenue_growth && *data.eps_growth > 0.0 && *data.revenue_growth > 0.0) {
        if (std::abs(*data.eps_growth - *data.revenue_growth) < 5.0) {
            score += 3.0;
            result.bullish_factors.push_back("Consistent earnings and revenue growth");
        }
    }

    return clamp_score(score, 0.0, 30.0);
}

double FundamentalScorer::score_returns(const FundamentalData& data, FundamentalScore& result) const {
    double score = 0.0;

    if (data.roe) {
        double roe = *data.roe;
        if (roe > 20.0) {
            score += 15.0;
            result.bullish_factors.push_back("Exceptional ROE (" + format_fixed(roe, 1) + "%) - high quality earnings");
        } else if (roe > 15.0) {
            score += 12.0;
            result.bullish_factors.push_back("Strong ROE (" + format_fixed(roe, 1) + "%) - efficient capital use");
        } else if (roe > 10.0) {
            score += 8.0;
            result.bullish_factors.push_back("Good ROE (" + format_fixed(roe, 1) + "%)");
        } else if (roe > 5.0) {
            score += 4.0;
        } else if (roe < 0.0) {
            result.bearish_factors.push_back("Negative ROE (" + format_fixed(roe, 1) + "%)");
        }
    } else {
        score -= 3.0;
    }

    if (data.roce) {
        double roce = *data.roce;
        if (roce > 20.0) {
            score += 10.0;
            result.bullish_factors.push_back("Excellent ROCE (" + format_fixed(roce, 1) + "%)");
        } else if (roce > 15.0) {
            score += 8.0;
            result.bullish_factors.push_back("Strong ROCE (" + format_fixed(roce, 1) + "%)");
        } else if (roce > 10.0) {
            score += 5.0;
        } else if (roce < 5.0) {
            result.bearish_factors.push_back("Low ROCE (" + format_fixed(roce, 1) + "%) - poor capital efficiency");
        }
    } else {
        score -= 2.0;
    }

    // A wide ROE/ROCE gap usually means leverage; zero readings are not compared
    if (data.roe && data.roce && *data.roe != 0.0 && *data.roce != 0.0 && std::abs(*data.roe - *data.roce) > 15.0) {
        result.warnings.push_back("ROE (" + format_fixed(*data.roe, 1) + "%) significantly higher than ROCE (" +
                                  format_fixed(*data.roce, 1) + "%) - check leverage");
    }

    return clamp_score(score, 0.0, 25.0);
}

double FundamentalScorer::score_debt(const FundamentalData& data, FundamentalScore& result) const {
    if (!data.debt_to_equity) {
        return 5.0;
    }

    double ratio = *data.debt_to_equity;
    std::string ratio_text = format_fixed(ratio, 2);
    if (ratio < 0.3) {
        result.bullish_factors.push_back("Very low debt-to-equity (" + ratio_text + ") - strong financial health");
        return 20.0;
    }
    if (ratio < 0.5) {
        result.bullish_factors.push_back("Low debt-to-equity (" + ratio_text + ")");
        return 18.0;
    }
    if (ratio < 0.75) {
        result.bullish_factors.push_back("Conservative debt levels (" + ratio_text + ")");
        return 15.0;
    }
    if (ratio < 1.0) {
        result.bullish_factors.push_back("Manageable debt-to-equity (" + ratio_text + ")");
        return 10.0;
    }
    if (ratio < 1.5) {
        return 5.0;
    }
    if (ratio < 2.0) {
        result.bearish_factors.push_back("Moderate-high debt (" + ratio_text + ")");
    } else if (ratio < 3.0) {
        result.bearish_factors.push_back("High debt-to-equity (" + ratio_text + ")");
        result.warnings.push_back("Elevated debt levels - financial risk");
    } else {
        result.bearish_factors.push_back("Very high debt-to-equity (" + ratio_text + ")");
        result.warnings.push_back("Excessive leverage - significant financial risk");
    }
    return 0.0;
}

} // namespace Core
} // namespace ChartAnalyzer
