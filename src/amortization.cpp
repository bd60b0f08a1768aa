#include "amortization.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace debtcalc {

namespace {

// Relative slack when comparing solved amounts against zero
constexpr double kSolveTolerance = 1e-9;

double tolerance_for(double magnitude) {
    return kSolveTolerance * std::max(1.0, std::fabs(magnitude));
}

} // anonymous namespace

// ============================================================================
// ScheduleEntry Implementation
// ============================================================================

ScheduleEntry::ScheduleEntry()
    : period(0),
      interest(0.0),
      capitalized_interest(0.0),
      principal_paid(0.0),
      total_service(0.0),
      outstanding_balance_start(0.0),
      outstanding_balance_end(0.0) {}

// ============================================================================
// Closed-form helpers
// ============================================================================

double annuity_payment(double rate, size_t periods, double present_value, double future_value) {
    if (periods == 0) {
        throw ConfigurationError("Annuity payment requires at least one period");
    }

    const double n = static_cast<double>(periods);
    if (rate == 0.0) {
        return (present_value - future_value) / n;
    }

    // PMT = r * (PV * (1+r)^n - FV) / ((1+r)^n - 1)
    const double growth = std::pow(1.0 + rate, n);
    return rate * (present_value * growth - future_value) / (growth - 1.0);
}

double coverage_ratio(double cfads, double debt_service) {
    if (debt_service == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    if (cfads <= 0.0) {
        return 0.0;
    }
    return cfads / debt_service;
}

// ============================================================================
// TrancheScheduler Implementation
// ============================================================================

TrancheScheduler::TrancheScheduler(const Tranche& tranche, size_t first_period)
    : tranche_(tranche),
      first_period_(first_period),
      next_period_(first_period),
      balance_(tranche.principal),
      fixed_payment_(0.0),
      payment_fixed_(false) {
    if (first_period_ < 1) {
        throw ConfigurationError("First schedule period must be >= 1", tranche_.id);
    }
    check_tranche_invariants(tranche_);
    entries_.reserve(tranche_.tenor_periods);
}

double TrancheScheduler::level_payment() const {
    if (payment_fixed_) {
        return fixed_payment_;
    }
    return annuity_payment(tranche_.rate, tranche_.amortizing_periods(), balance_,
                           tranche_.balloon_amount());
}

double TrancheScheduler::cash_demand() const {
    if (finished()) {
        return 0.0;
    }

    const double cover = tranche_.target_dscr > 0.0 ? tranche_.target_dscr : 1.0;
    const double interest = balance_ * tranche_.rate;

    if (in_grace()) {
        return tranche_.capitalize_grace_interest ? 0.0 : cover * interest;
    }

    const double remaining = std::max(0.0, balance_ - tranche_.balloon_amount());
    if (next_period_ == maturity_period() || tranche_.style == AmortizationStyle::Sculpted) {
        return cover * (interest + remaining);
    }
    return cover * level_payment();
}

ScheduleEntry TrancheScheduler::step(double cfads_allocation) {
    if (finished()) {
        throw std::out_of_range("Tranche " + tranche_.id + " already matured at period " +
                                std::to_string(maturity_period()));
    }

    const double interest = balance_ * tranche_.rate;

    ScheduleEntry entry;
    if (in_grace()) {
        entry = grace_step(interest);
    } else if (tranche_.style == AmortizationStyle::Annuity) {
        entry = annuity_step(interest);
    } else {
        entry = sculpted_step(interest, cfads_allocation);
    }

    balance_ = entry.outstanding_balance_end;
    entries_.push_back(entry);
    ++next_period_;

    if (Logger::get_instance().get_min_level() == LogLevel::DEBUG) {
        LogContext ctx("scheduler");
        ctx.tranche_id = tranche_.id;
        ctx.period = entry.period;
        Logger::get_instance().log_period_detail(ctx, "Scheduled period", {
            {"allocation", cfads_allocation},
            {"interest", entry.interest},
            {"principal", entry.principal_paid},
            {"balance_end", entry.outstanding_balance_end}
        });
    }

    return entry;
}

ScheduleEntry TrancheScheduler::grace_step(double interest) {
    ScheduleEntry entry;
    entry.period = next_period_;
    entry.interest = interest;
    entry.outstanding_balance_start = balance_;

    if (tranche_.capitalize_grace_interest) {
        entry.capitalized_interest = interest;
        entry.total_service = 0.0;
        entry.outstanding_balance_end = balance_ + interest;
    } else {
        entry.total_service = interest;
        entry.outstanding_balance_end = balance_;
    }
    return entry;
}

ScheduleEntry TrancheScheduler::annuity_step(double interest) {
    // Level payment is fixed once, on the balance after grace (and any
    // capitalized grace interest)
    if (!payment_fixed_) {
        fixed_payment_ = level_payment();
        payment_fixed_ = true;
    }

    const double balloon = tranche_.balloon_amount();
    double principal;
    if (next_period_ == maturity_period()) {
        principal = balance_ - balloon;
    } else {
        principal = std::min(fixed_payment_ - interest, balance_ - balloon);
    }
    principal = std::max(0.0, principal);

    ScheduleEntry entry;
    entry.period = next_period_;
    entry.interest = interest;
    entry.principal_paid = principal;
    entry.total_service = interest + principal;
    entry.outstanding_balance_start = balance_;
    entry.outstanding_balance_end = balance_ - principal;
    if (std::fabs(entry.outstanding_balance_end) < kBalanceEpsilon) {
        entry.outstanding_balance_end = 0.0;
    }
    return entry;
}

ScheduleEntry TrancheScheduler::sculpted_step(double interest, double cfads_allocation) {
    const double remaining = std::max(0.0, balance_ - tranche_.balloon_amount());

    double principal;
    if (next_period_ == maturity_period()) {
        // Final period is a plug down to the balloon
        principal = remaining;
        const double service = interest + principal;
        if (cfads_allocation < service - tolerance_for(service)) {
            throw InfeasibleSculptError(tranche_.id, next_period_, service - cfads_allocation);
        }
    } else {
        principal = cfads_allocation / tranche_.target_dscr - interest;
        if (principal < -tolerance_for(interest)) {
            throw InfeasibleSculptError(tranche_.id, next_period_,
                                        tranche_.target_dscr * interest - cfads_allocation);
        }
        principal = std::min(std::max(principal, 0.0), remaining);
    }

    ScheduleEntry entry;
    entry.period = next_period_;
    entry.interest = interest;
    entry.principal_paid = principal;
    entry.total_service = interest + principal;
    entry.outstanding_balance_start = balance_;
    entry.outstanding_balance_end = balance_ - principal;
    if (std::fabs(entry.outstanding_balance_end) < kBalanceEpsilon) {
        entry.outstanding_balance_end = 0.0;
    }
    return entry;
}

std::vector<ScheduleEntry> build_schedule(const Tranche& tranche,
                                          const std::vector<double>& cfads_allocation,
                                          size_t first_period) {
    if (tranche.style == AmortizationStyle::Sculpted &&
        cfads_allocation.size() < tranche.tenor_periods) {
        throw ConfigurationError("CFADS allocation covers " + std::to_string(cfads_allocation.size()) +
                                 " periods; tranche " + tranche.id + " needs " +
                                 std::to_string(tranche.tenor_periods),
                                 tranche.id, first_period + cfads_allocation.size());
    }

    TrancheScheduler scheduler(tranche, first_period);
    for (size_t i = 0; i < tranche.tenor_periods; ++i) {
        double allocation = i < cfads_allocation.size() ? cfads_allocation[i] : 0.0;
        scheduler.step(allocation);
    }
    return scheduler.entries();
}

} // namespace debtcalc
