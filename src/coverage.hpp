#ifndef DEBTCALC_COVERAGE_HPP
#define DEBTCALC_COVERAGE_HPP

#include "cashflow_series.hpp"
#include "debt_structuring.hpp"
#include <cstddef>
#include <vector>

namespace debtcalc {

struct CoverageConfig {
    double hurdle_rate;    // per-period discount rate for LLCR/PLCR

    CoverageConfig();
    explicit CoverageConfig(double hurdle);
};

// Coverage for one period with debt outstanding
struct PeriodCoverage {
    size_t period;
    double cfads;
    double debt_service;
    double outstanding_balance;   // start of period, base currency
    double dscr;                  // +inf when no service is owed
    double llcr;
    double plcr;
    double npv_loan_life;         // CFADS t..loan maturity, discounted to t
    double npv_project_life;      // CFADS t..project end, discounted to t
    bool dscr_is_sentinel;

    PeriodCoverage();
};

// min/max/mean/median over the finite values of a ratio series
struct SeriesStatistics {
    size_t count;
    double min;
    double max;
    double mean;
    double median;

    SeriesStatistics();

    bool empty() const { return count == 0; }
};

// Non-finite values (DSCR sentinels) are skipped
SeriesStatistics compute_statistics(const std::vector<double>& values);

struct CoverageMetrics {
    std::vector<PeriodCoverage> periods;
    SeriesStatistics dscr_stats;
    SeriesStatistics llcr_stats;
    SeriesStatistics plcr_stats;
    double hurdle_rate;
    size_t loan_maturity_period;
    size_t project_end_period;

    CoverageMetrics();

    bool has_period(size_t period) const;
    const PeriodCoverage& at(size_t period) const;

    std::vector<double> dscr_series() const;
    std::vector<double> llcr_series() const;
    std::vector<double> plcr_series() const;
};

// Computes DSCR, LLCR and PLCR for a consolidated schedule.
//
// LLCR_t and PLCR_t divide the discounted CFADS from t to loan maturity
// (resp. project end) by the start-of-period consolidated balance. Rows are
// produced only for periods with a balance outstanding.
class CoverageAnalyzer {
public:
    explicit CoverageAnalyzer(const CoverageConfig& config = CoverageConfig());

    const CoverageConfig& config() const { return config_; }

    CoverageMetrics analyze(const DebtSchedule& schedule, const CfadsSeries& cfads) const;

    // Only periods >= from_period are reported
    CoverageMetrics analyze(const DebtSchedule& schedule, const CfadsSeries& cfads,
                            size_t from_period) const;

private:
    CoverageConfig config_;
};

} // namespace debtcalc

#endif // DEBTCALC_COVERAGE_HPP
