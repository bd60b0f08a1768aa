#include "refinancing.hpp"
#include "allocation.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace debtcalc {

namespace {

std::string percent(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return oss.str();
}

double min_delta(const SeriesStatistics& original, const SeriesStatistics& alternative) {
    if (original.empty() || alternative.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return alternative.min - original.min;
}

} // anonymous namespace

BalloonPolicy::BalloonPolicy()
    : warn_fraction(0.05),
      max_fraction(0.10),
      refinancing_enabled(false),
      max_refinance_fraction(0.15) {}

BalloonAssessment::BalloonAssessment()
    : amount(0.0), fraction(0.0), feasible(true), mitigation_required(false) {}

RefinancingComparison::RefinancingComparison()
    : refinance_period(0),
      refinanced_balance(0.0),
      min_dscr_delta(0.0),
      min_llcr_delta(0.0) {}

// ============================================================================
// Balloon assessment
// ============================================================================

BalloonAssessment assess_balloon(double balloon, double principal, const BalloonPolicy& policy) {
    BalloonAssessment result;
    result.amount = balloon;
    result.fraction = principal > 0.0 ? balloon / principal : 0.0;

    const double pct = result.fraction;

    if (pct < 0.01) {
        result.notes = "No material balloon payment";
        return result;
    }

    if (pct <= policy.warn_fraction) {
        result.notes = "Small balloon (" + percent(pct) + ") is acceptable";
        return result;
    }

    result.mitigation_required = true;

    if (pct <= policy.max_fraction) {
        result.mitigation_options = {
            "Refinancing commitment from lender",
            "Cash sweep mechanism to reduce balloon",
            "Equity injection commitment at maturity",
            "Extend amortization period",
            "Increase DSCR target"
        };

        if (!policy.refinancing_enabled) {
            result.feasible = false;
            result.notes = "Balloon " + percent(pct) + " requires mitigation; refinancing disabled";
        } else if (pct <= policy.max_refinance_fraction) {
            result.notes = "Balloon " + percent(pct) + " can be refinanced (max " +
                           percent(policy.max_refinance_fraction) + ")";
        } else {
            result.feasible = false;
            result.notes = "Balloon " + percent(pct) + " exceeds refinancing limit " +
                           percent(policy.max_refinance_fraction);
        }
        return result;
    }

    result.feasible = false;
    result.mitigation_options = {
        "Extend tenor",
        "Increase DSCR target",
        "Reduce debt quantum",
        "Switch to annuity amortization"
    };
    result.notes = "Balloon " + percent(pct) + " exceeds maximum " + percent(policy.max_fraction) +
                   "; debt must be restructured";
    return result;
}

std::vector<BalloonAssessment> assess_balloons(const DebtSchedule& schedule,
                                               const BalloonPolicy& policy) {
    std::vector<BalloonAssessment> out;
    out.reserve(schedule.tranches.size());
    for (const auto& ts : schedule.tranches) {
        BalloonAssessment a = assess_balloon(ts.final_balance(), ts.tranche.principal, policy);
        a.tranche_id = ts.tranche.id;
        out.push_back(a);
    }
    return out;
}

// ============================================================================
// RefinancingEvaluator Implementation
// ============================================================================

RefinancingEvaluator::RefinancingEvaluator(const StructuringOptions& options,
                                           const CoverageConfig& coverage,
                                           const BalloonPolicy& balloon)
    : options_(options), analyzer_(coverage), balloon_policy_(balloon) {}

RefinancingComparison RefinancingEvaluator::evaluate(const DebtSchedule& original,
                                                     const CfadsSeries& cfads,
                                                     size_t refinance_period,
                                                     const std::vector<Tranche>& candidates) const {
    return evaluate(original, cfads, ExchangeRateSeries(), refinance_period, candidates);
}

RefinancingComparison RefinancingEvaluator::evaluate(const DebtSchedule& original,
                                                     const CfadsSeries& cfads,
                                                     const ExchangeRateSeries& fx,
                                                     size_t refinance_period,
                                                     const std::vector<Tranche>& candidates) const {
    if (!original.covers(refinance_period)) {
        throw ConfigurationError("Refinance period " + std::to_string(refinance_period) +
                                 " is outside the original schedule " +
                                 std::to_string(original.first_period) + ".." +
                                 std::to_string(original.maturity_period),
                                 "", refinance_period);
    }

    const double balance = original.opening_balance(refinance_period);
    if (balance <= kBalanceEpsilon) {
        throw ConfigurationError("Nothing outstanding to refinance at period " +
                                 std::to_string(refinance_period), "", refinance_period);
    }
    if (candidates.empty()) {
        throw ConfigurationError("Refinancing requires at least one candidate tranche");
    }

    const Currency base = cfads.base_currency();
    double candidate_total = 0.0;
    for (const auto& tranche : candidates) {
        check_tranche_invariants(tranche);
        candidate_total += tranche_to_base_currency(tranche.principal, tranche, base, fx,
                                                    refinance_period);
    }

    // Candidates keep their relative sizes and take over the balance
    const double scale = balance / candidate_total;
    std::vector<Tranche> scaled = candidates;
    for (auto& tranche : scaled) {
        tranche.principal *= scale;
        tranche.capitalized_idc *= scale;
    }

    StructuringOptions alt_options = options_;
    alt_options.first_period = refinance_period;
    DebtStructurer structurer(alt_options);

    RefinancingComparison cmp;
    cmp.refinance_period = refinance_period;
    cmp.refinanced_balance = balance;
    cmp.alternative_schedule = structurer.run(scaled, cfads, fx);
    cmp.original_metrics = analyzer_.analyze(original, cfads, refinance_period);
    cmp.alternative_metrics = analyzer_.analyze(cmp.alternative_schedule, cfads);
    cmp.min_dscr_delta = min_delta(cmp.original_metrics.dscr_stats, cmp.alternative_metrics.dscr_stats);
    cmp.min_llcr_delta = min_delta(cmp.original_metrics.llcr_stats, cmp.alternative_metrics.llcr_stats);
    cmp.original_balloons = assess_balloons(original, balloon_policy_);
    cmp.alternative_balloons = assess_balloons(cmp.alternative_schedule, balloon_policy_);

    LogContext ctx("refinancing");
    ctx.run_id = options_.run_id;
    ctx.period = refinance_period;
    Logger::get_instance().log_refinancing(ctx, balance, cmp.min_dscr_delta, cmp.min_llcr_delta);

    return cmp;
}

} // namespace debtcalc
