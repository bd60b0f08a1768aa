#ifndef DEBTCALC_AMORTIZATION_HPP
#define DEBTCALC_AMORTIZATION_HPP

#include "tranche.hpp"
#include <cstddef>
#include <vector>

namespace debtcalc {

// One (tranche, period) row of an amortization schedule
struct ScheduleEntry {
    size_t period;                      // 1-based project period
    double interest;                    // interest accrued on the opening balance
    double capitalized_interest;        // part of interest added to the balance (grace, IDC-style)
    double principal_paid;
    double total_service;               // interest paid + principal paid
    double outstanding_balance_start;
    double outstanding_balance_end;     // start - principal_paid + capitalized_interest

    ScheduleEntry();
};

// Level payment that amortizes present_value down to future_value over
// `periods` periods at `rate` per period (Excel PMT with a residual).
double annuity_payment(double rate, size_t periods, double present_value, double future_value = 0.0);

// Steps one tranche through its life, one period at a time.
//
// Each call to step() consumes the CFADS allocated to the tranche for the
// next period (in tranche currency) and appends one ScheduleEntry:
// - Grace periods pay interest only, or capitalize it when the tranche says so
// - Annuity periods pay a level service computed once on the post-grace
//   balance, leaving exactly the balloon at maturity
// - Sculpted periods solve principal so that allocation / service equals the
//   target DSCR, clamped to [0, balance - balloon]; the final period is a
//   plug that retires everything down to the balloon
//
// The scheduler owns a copy of the tranche and all of its state, so separate
// instances never interact.
class TrancheScheduler {
public:
    explicit TrancheScheduler(const Tranche& tranche, size_t first_period = 1);

    const Tranche& tranche() const { return tranche_; }
    size_t first_period() const { return first_period_; }
    size_t maturity_period() const { return first_period_ + tranche_.tenor_periods - 1; }

    // Period the next step() call will produce
    size_t next_period() const { return next_period_; }
    bool finished() const { return next_period_ > maturity_period(); }
    bool is_live(size_t period) const { return period >= first_period_ && period <= maturity_period(); }
    bool in_grace() const { return next_period_ - first_period_ < tranche_.grace_periods; }

    // Balance at the start of the next period
    double opening_balance() const { return balance_; }

    // CFADS the tranche would like next period: its scheduled service scaled
    // by its coverage requirement (target DSCR, or 1.0 when none is set)
    double cash_demand() const;

    // Throws InfeasibleSculptError when a sculpted period cannot be solved
    ScheduleEntry step(double cfads_allocation);

    const std::vector<ScheduleEntry>& entries() const { return entries_; }

private:
    ScheduleEntry grace_step(double interest);
    ScheduleEntry annuity_step(double interest);
    ScheduleEntry sculpted_step(double interest, double cfads_allocation);
    double level_payment() const;

    Tranche tranche_;
    size_t first_period_;
    size_t next_period_;
    double balance_;
    double fixed_payment_;
    bool payment_fixed_;
    std::vector<ScheduleEntry> entries_;
};

// Builds a full schedule for one tranche. cfads_allocation[i] is the
// tranche-currency CFADS for period first_period + i; sculpted tranches need
// at least tenor_periods values (annuity tranches ignore the allocation).
std::vector<ScheduleEntry> build_schedule(const Tranche& tranche,
                                          const std::vector<double>& cfads_allocation,
                                          size_t first_period = 1);

// Debt service coverage for one period. Zero service is the "nothing owed"
// sentinel (+infinity); non-positive CFADS against positive service is 0.
double coverage_ratio(double cfads, double debt_service);

} // namespace debtcalc

#endif // DEBTCALC_AMORTIZATION_HPP
