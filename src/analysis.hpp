#ifndef DEBTCALC_ANALYSIS_HPP
#define DEBTCALC_ANALYSIS_HPP

#include "cashflow_series.hpp"
#include "config_parser.hpp"
#include "coverage.hpp"
#include "covenants.hpp"
#include "debt_structuring.hpp"
#include "refinancing.hpp"
#include <optional>
#include <string>
#include <vector>

namespace debtcalc {

// Everything one run produces, in pipeline order
struct AnalysisResult {
    std::string run_id;
    DebtSchedule schedule;
    CoverageMetrics coverage;
    ComplianceReport compliance;
    std::vector<BalloonAssessment> balloons;
    std::optional<RefinancingComparison> refinancing;

    double execution_time_ms;

    AnalysisResult();
};

// Runs the full pipeline for one configured scenario:
//   1. Structure the tranches against CFADS (allocation + amortization)
//   2. Compute DSCR / LLCR / PLCR on the consolidated schedule
//   3. Check covenants and assess balloons
//   4. Evaluate the refinancing case, if one is configured
// Each call is independent; concurrent calls share nothing but the logger.
AnalysisResult run_analysis(const RunConfig& config,
                            const CfadsSeries& cfads,
                            const ExchangeRateSeries& fx);

} // namespace debtcalc

#endif // DEBTCALC_ANALYSIS_HPP
