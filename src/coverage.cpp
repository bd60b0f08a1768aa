#include "coverage.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace debtcalc {

namespace {

// Backward accumulation: npv_t = cfads_t + npv_{t+1} / (1 + r), for t in
// 1..horizon. Index 0 is unused so the result is indexed by period.
std::vector<double> discounted_tail(const CfadsSeries& cfads, size_t horizon, double rate) {
    std::vector<double> npv(horizon + 2, 0.0);
    const double discount = 1.0 / (1.0 + rate);
    for (size_t t = horizon; t >= 1; --t) {
        npv[t] = cfads.get(t) + npv[t + 1] * discount;
    }
    return npv;
}

} // anonymous namespace

CoverageConfig::CoverageConfig() : hurdle_rate(0.10) {}

CoverageConfig::CoverageConfig(double hurdle) : hurdle_rate(hurdle) {}

PeriodCoverage::PeriodCoverage()
    : period(0), cfads(0.0), debt_service(0.0), outstanding_balance(0.0),
      dscr(0.0), llcr(0.0), plcr(0.0), npv_loan_life(0.0), npv_project_life(0.0),
      dscr_is_sentinel(false) {}

SeriesStatistics::SeriesStatistics()
    : count(0), min(0.0), max(0.0), mean(0.0), median(0.0) {}

SeriesStatistics compute_statistics(const std::vector<double>& values) {
    std::vector<double> finite;
    finite.reserve(values.size());
    for (double v : values) {
        if (std::isfinite(v)) finite.push_back(v);
    }

    SeriesStatistics stats;
    if (finite.empty()) {
        return stats;
    }

    std::sort(finite.begin(), finite.end());
    stats.count = finite.size();
    stats.min = finite.front();
    stats.max = finite.back();

    double sum = 0.0;
    for (double v : finite) sum += v;
    stats.mean = sum / static_cast<double>(finite.size());

    const size_t mid = finite.size() / 2;
    stats.median = (finite.size() % 2 == 1) ? finite[mid] : 0.5 * (finite[mid - 1] + finite[mid]);
    return stats;
}

// ============================================================================
// CoverageMetrics Implementation
// ============================================================================

CoverageMetrics::CoverageMetrics()
    : hurdle_rate(0.0), loan_maturity_period(0), project_end_period(0) {}

bool CoverageMetrics::has_period(size_t period) const {
    return std::any_of(periods.begin(), periods.end(),
                       [period](const PeriodCoverage& p) { return p.period == period; });
}

const PeriodCoverage& CoverageMetrics::at(size_t period) const {
    for (const auto& p : periods) {
        if (p.period == period) return p;
    }
    throw std::out_of_range("No coverage row for period " + std::to_string(period));
}

std::vector<double> CoverageMetrics::dscr_series() const {
    std::vector<double> out;
    out.reserve(periods.size());
    for (const auto& p : periods) out.push_back(p.dscr);
    return out;
}

std::vector<double> CoverageMetrics::llcr_series() const {
    std::vector<double> out;
    out.reserve(periods.size());
    for (const auto& p : periods) out.push_back(p.llcr);
    return out;
}

std::vector<double> CoverageMetrics::plcr_series() const {
    std::vector<double> out;
    out.reserve(periods.size());
    for (const auto& p : periods) out.push_back(p.plcr);
    return out;
}

// ============================================================================
// CoverageAnalyzer Implementation
// ============================================================================

CoverageAnalyzer::CoverageAnalyzer(const CoverageConfig& config) : config_(config) {
    if (!std::isfinite(config_.hurdle_rate) || config_.hurdle_rate <= -1.0) {
        throw ConfigurationError("Hurdle rate must be greater than -1");
    }
}

CoverageMetrics CoverageAnalyzer::analyze(const DebtSchedule& schedule,
                                          const CfadsSeries& cfads) const {
    return analyze(schedule, cfads, schedule.first_period);
}

CoverageMetrics CoverageAnalyzer::analyze(const DebtSchedule& schedule,
                                          const CfadsSeries& cfads,
                                          size_t from_period) const {
    const size_t maturity = schedule.maturity_period;
    const size_t project_end = cfads.project_end_period();
    if (project_end < maturity) {
        throw ConfigurationError("CFADS series ends at period " + std::to_string(project_end) +
                                 " before loan maturity " + std::to_string(maturity),
                                 "", project_end + 1);
    }

    CoverageMetrics metrics;
    metrics.hurdle_rate = config_.hurdle_rate;
    metrics.loan_maturity_period = maturity;
    metrics.project_end_period = project_end;

    if (schedule.consolidated.empty()) {
        return metrics;
    }

    const std::vector<double> npv_loan = discounted_tail(cfads, maturity, config_.hurdle_rate);
    const std::vector<double> npv_project = discounted_tail(cfads, project_end, config_.hurdle_rate);

    LogContext ctx("coverage");
    const size_t start = std::max(schedule.first_period, from_period);

    for (size_t t = start; t <= maturity; ++t) {
        const ScheduleEntry& row = schedule.at(t);
        if (row.outstanding_balance_start <= kBalanceEpsilon) {
            continue;
        }

        PeriodCoverage pc;
        pc.period = t;
        pc.cfads = cfads.get(t);
        pc.debt_service = row.total_service;
        pc.outstanding_balance = row.outstanding_balance_start;
        pc.dscr = coverage_ratio(pc.cfads, pc.debt_service);
        pc.dscr_is_sentinel = (pc.debt_service == 0.0);
        pc.npv_loan_life = npv_loan[t];
        pc.npv_project_life = npv_project[t];
        pc.llcr = pc.npv_loan_life / pc.outstanding_balance;
        pc.plcr = pc.npv_project_life / pc.outstanding_balance;

        if (pc.plcr < pc.llcr) {
            ctx.period = t;
            std::ostringstream oss;
            oss << "PLCR " << pc.plcr << " below LLCR " << pc.llcr
                << ": post-maturity CFADS is negative";
            Logger::get_instance().log_warning(ctx, oss.str());
        }

        metrics.periods.push_back(pc);
    }
    ctx.period = 0;

    metrics.dscr_stats = compute_statistics(metrics.dscr_series());
    metrics.llcr_stats = compute_statistics(metrics.llcr_series());
    metrics.plcr_stats = compute_statistics(metrics.plcr_series());

    Logger::get_instance().log_coverage_summary(
        ctx, metrics.periods.size(),
        metrics.dscr_stats.empty() ? std::numeric_limits<double>::infinity() : metrics.dscr_stats.min,
        metrics.llcr_stats.empty() ? std::numeric_limits<double>::infinity() : metrics.llcr_stats.min,
        metrics.plcr_stats.empty() ? std::numeric_limits<double>::infinity() : metrics.plcr_stats.min);

    return metrics;
}

} // namespace debtcalc
