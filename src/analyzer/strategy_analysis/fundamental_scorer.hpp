#ifndef FUNDAMENTAL_SCORER_HPP
#define FUNDAMENTAL_SCORER_HPP

#include <optional>
#include <string>
#include "analyzer/data_structures/data_structures.hpp"

namespace ChartAnalyzer {
namespace Core {

/**
 * GARP fundamental scorer.
 * Valuation and PEG (25) + growth quality (30) + ROE/ROCE (25) + debt (20).
 * Returns nothing unless at least one valuation, return or growth metric is present.
 */
class FundamentalScorer {
public:
    std::optional<FundamentalScore> score(const FundamentalData& data) const;

    static std::string grade_for(double score);

private:
    double score_pe_ratio(const FundamentalData& data, FundamentalScore& result) const;
    double score_growth(const FundamentalData& data, FundamentalScore& result) const;
    double score_returns(const FundamentalData& data, FundamentalScore& result) const;
    double score_debt(const FundamentalData& data, FundamentalScore& result) const;
};

bool has_scorable_fundamentals(const FundamentalData& data);

} // namespace Core
} // namespace ChartAnalyzer

#endif // FUNDAMENTAL_SCORER_HPP
