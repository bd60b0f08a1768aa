#ifndef DEBTCALC_REFINANCING_HPP
#define DEBTCALC_REFINANCING_HPP

#include "cashflow_series.hpp"
#include "coverage.hpp"
#include "debt_structuring.hpp"
#include "tranche.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace debtcalc {

// Thresholds for judging a balloon, as fractions of the tranche principal
struct BalloonPolicy {
    double warn_fraction;             // above this, mitigation is required
    double max_fraction;              // above this, the structure is infeasible
    bool refinancing_enabled;
    double max_refinance_fraction;    // largest balloon a lender will refinance

    BalloonPolicy();
};

struct BalloonAssessment {
    std::string tranche_id;
    double amount;
    double fraction;
    bool feasible;
    bool mitigation_required;
    std::vector<std::string> mitigation_options;
    std::string notes;

    BalloonAssessment();
};

BalloonAssessment assess_balloon(double balloon, double principal,
                                 const BalloonPolicy& policy = BalloonPolicy());

// One assessment per tranche, using its balance at maturity
std::vector<BalloonAssessment> assess_balloons(const DebtSchedule& schedule,
                                               const BalloonPolicy& policy = BalloonPolicy());

// Side-by-side outcome of refinancing the outstanding debt at one period
struct RefinancingComparison {
    size_t refinance_period;
    double refinanced_balance;            // base currency, opening balance at refinance_period
    CoverageMetrics original_metrics;     // original schedule from refinance_period on
    DebtSchedule alternative_schedule;
    CoverageMetrics alternative_metrics;
    double min_dscr_delta;                // alternative - original; NaN if either is empty
    double min_llcr_delta;
    std::vector<BalloonAssessment> original_balloons;
    std::vector<BalloonAssessment> alternative_balloons;

    RefinancingComparison();
};

// Re-runs structuring and coverage for a candidate tranche set that takes
// over the outstanding balance at a given period. The original schedule is
// only read; the comparison owns an independent alternative schedule.
class RefinancingEvaluator {
public:
    RefinancingEvaluator(const StructuringOptions& options,
                         const CoverageConfig& coverage,
                         const BalloonPolicy& balloon = BalloonPolicy());

    // Candidate principals are rescaled pro-rata (in base currency at the
    // refinance period's rate) so they sum to the refinanced balance
    RefinancingComparison evaluate(const DebtSchedule& original,
                                   const CfadsSeries& cfads,
                                   const ExchangeRateSeries& fx,
                                   size_t refinance_period,
                                   const std::vector<Tranche>& candidates) const;

    RefinancingComparison evaluate(const DebtSchedule& original,
                                   const CfadsSeries& cfads,
                                   size_t refinance_period,
                                   const std::vector<Tranche>& candidates) const;

private:
    StructuringOptions options_;
    CoverageAnalyzer analyzer_;
    BalloonPolicy balloon_policy_;
};

} // namespace debtcalc

#endif // DEBTCALC_REFINANCING_HPP
