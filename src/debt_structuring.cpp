#include "debt_structuring.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace debtcalc {

std::string sculpt_fallback_to_string(SculptFallback fallback) {
    return fallback == SculptFallback::Annuity ? "annuity" : "none";
}

SculptFallback sculpt_fallback_from_string(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "none" || v == "error" || v.empty()) return SculptFallback::None;
    if (v == "annuity") return SculptFallback::Annuity;
    throw ConfigurationError("Unknown sculpt fallback: " + value);
}

StructuringOptions::StructuringOptions()
    : first_period(1),
      sculpt_fallback(SculptFallback::None) {}

// ============================================================================
// TrancheSchedule / DebtSchedule
// ============================================================================

TrancheSchedule::TrancheSchedule() : fell_back_to_annuity(false) {}

double TrancheSchedule::total_interest() const {
    double total = 0.0;
    for (const auto& e : entries) total += e.interest;
    return total;
}

double TrancheSchedule::total_capitalized_interest() const {
    double total = 0.0;
    for (const auto& e : entries) total += e.capitalized_interest;
    return total;
}

double TrancheSchedule::total_principal() const {
    double total = 0.0;
    for (const auto& e : entries) total += e.principal_paid;
    return total;
}

double TrancheSchedule::final_balance() const {
    return entries.empty() ? tranche.principal : entries.back().outstanding_balance_end;
}

DebtSchedule::DebtSchedule()
    : base_currency(Currency::HardCurrency),
      first_period(1),
      maturity_period(0) {}

const ScheduleEntry& DebtSchedule::at(size_t period) const {
    if (!covers(period)) {
        throw std::out_of_range("Period " + std::to_string(period) + " outside schedule " +
                                std::to_string(first_period) + ".." +
                                std::to_string(maturity_period));
    }
    return consolidated[period - first_period];
}

const TrancheSchedule& DebtSchedule::tranche(const std::string& id) const {
    for (const auto& ts : tranches) {
        if (ts.tranche.id == id) return ts;
    }
    throw std::out_of_range("No tranche with id '" + id + "' in schedule");
}

// ============================================================================
// DebtStructurer Implementation
// ============================================================================

DebtStructurer::DebtStructurer(const StructuringOptions& options)
    : options_(options), allocator_(options.allocator) {
    if (options_.first_period < 1) {
        throw ConfigurationError("First schedule period must be >= 1");
    }
}

DebtSchedule DebtStructurer::run(const std::vector<Tranche>& tranches,
                                 const CfadsSeries& cfads) const {
    return run(tranches, cfads, ExchangeRateSeries());
}

DebtSchedule DebtStructurer::run(const std::vector<Tranche>& tranches,
                                 const CfadsSeries& cfads,
                                 const ExchangeRateSeries& fx) const {
    LogContext ctx("structurer");
    ctx.run_id = options_.run_id;

    ValidationFindings findings = allocator_.validate(tranches);

    size_t max_tenor = 0;
    for (const auto& tranche : tranches) {
        max_tenor = std::max(max_tenor, tranche.tenor_periods);
    }
    const size_t required = options_.first_period - 1 + max_tenor;
    if (cfads.size() < required) {
        throw ConfigurationError("CFADS series covers " + std::to_string(cfads.size()) +
                                 " periods but debt is outstanding through period " +
                                 std::to_string(required), "", cfads.size() + 1);
    }

    check_exchange_rate_coverage(tranches, cfads.base_currency(), fx, options_.first_period);

    Logger::get_instance().log_structuring_start(
        ctx, tranches.size(), options_.first_period, required,
        allocation_policy_to_string(options_.allocator.policy));

    // Inputs are never modified; fallbacks work on this copy
    std::vector<Tranche> working = tranches;
    std::vector<std::string> fallen_back;

    DebtSchedule schedule;
    while (true) {
        try {
            schedule = run_once(working, cfads, fx);
            break;
        } catch (const InfeasibleSculptError& e) {
            LogContext err_ctx = ctx;
            err_ctx.tranche_id = e.tranche_id();
            err_ctx.period = e.period();

            const bool fall_back = options_.sculpt_fallback == SculptFallback::Annuity;
            Logger::get_instance().log_sculpt_infeasible(err_ctx, e.shortfall(), fall_back);
            if (!fall_back) {
                throw;
            }

            auto it = std::find_if(working.begin(), working.end(),
                                   [&e](const Tranche& t) { return t.id == e.tranche_id(); });
            if (it == working.end() || it->style != AmortizationStyle::Sculpted) {
                throw;
            }
            it->style = AmortizationStyle::Annuity;
            fallen_back.push_back(e.tranche_id());
        }
    }

    for (auto& ts : schedule.tranches) {
        ts.fell_back_to_annuity =
            std::find(fallen_back.begin(), fallen_back.end(), ts.tranche.id) != fallen_back.end();

        LogContext t_ctx = ctx;
        t_ctx.tranche_id = ts.tranche.id;
        Logger::get_instance().log_tranche_scheduled(
            t_ctx, style_to_string(ts.tranche.style), ts.tranche.principal,
            ts.total_interest(), ts.final_balance());
    }
    schedule.fallback_tranches = fallen_back;
    schedule.findings = findings;

    std::ostringstream oss;
    oss << "Structured " << schedule.tranches.size() << " tranches over periods "
        << schedule.first_period << ".." << schedule.maturity_period;
    if (!fallen_back.empty()) {
        oss << " (" << fallen_back.size() << " fell back to annuity)";
    }
    Logger::get_instance().log_info(ctx, oss.str());

    return schedule;
}

DebtSchedule DebtStructurer::run_once(const std::vector<Tranche>& tranches,
                                      const CfadsSeries& cfads,
                                      const ExchangeRateSeries& fx) const {
    const Currency base = cfads.base_currency();
    const size_t first = options_.first_period;

    std::vector<TrancheScheduler> schedulers;
    schedulers.reserve(tranches.size());
    size_t maturity = first;
    for (const auto& tranche : tranches) {
        schedulers.emplace_back(tranche, first);
        maturity = std::max(maturity, schedulers.back().maturity_period());
    }

    DebtSchedule schedule;
    schedule.base_currency = base;
    schedule.first_period = first;
    schedule.maturity_period = maturity;
    schedule.tranches.resize(tranches.size());
    for (size_t i = 0; i < tranches.size(); ++i) {
        schedule.tranches[i].tranche = tranches[i];
    }
    schedule.consolidated.reserve(maturity - first + 1);

    std::vector<TrancheClaim> claims(tranches.size());

    for (size_t period = first; period <= maturity; ++period) {
        const double cfads_base = cfads.get(period);

        for (size_t i = 0; i < schedulers.size(); ++i) {
            const TrancheScheduler& s = schedulers[i];
            TrancheClaim& claim = claims[i];
            claim.live = s.is_live(period);
            claim.seniority = s.tranche().seniority;
            if (!claim.live) {
                claim.opening_balance_base = 0.0;
                claim.original_principal_base = 0.0;
                claim.demand_base = 0.0;
                continue;
            }
            claim.opening_balance_base =
                tranche_to_base_currency(s.opening_balance(), s.tranche(), base, fx, period);
            claim.original_principal_base =
                tranche_to_base_currency(s.tranche().principal, s.tranche(), base, fx, period);
            claim.demand_base =
                tranche_to_base_currency(s.cash_demand(), s.tranche(), base, fx, period);
        }

        std::vector<double> allocation = allocator_.allocate(period, cfads_base, claims);

        ScheduleEntry total;
        total.period = period;
        for (size_t i = 0; i < schedulers.size(); ++i) {
            if (!claims[i].live) continue;

            TrancheScheduler& s = schedulers[i];
            TrancheSchedule& ts = schedule.tranches[i];
            const Tranche& tranche = s.tranche();

            const double local = base_to_tranche_currency(allocation[i], tranche, base, fx, period);
            ScheduleEntry entry = s.step(local);

            ts.entries.push_back(entry);
            ts.cfads_allocation.push_back(local);
            ts.cfads_allocation_base.push_back(allocation[i]);

            auto to_base = [&](double amount) {
                return tranche_to_base_currency(amount, tranche, base, fx, period);
            };
            total.interest += to_base(entry.interest);
            total.capitalized_interest += to_base(entry.capitalized_interest);
            total.principal_paid += to_base(entry.principal_paid);
            total.total_service += to_base(entry.total_service);
            total.outstanding_balance_start += to_base(entry.outstanding_balance_start);
            total.outstanding_balance_end += to_base(entry.outstanding_balance_end);
        }
        schedule.consolidated.push_back(total);
    }

    return schedule;
}

} // namespace debtcalc
