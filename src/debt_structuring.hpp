#ifndef DEBTCALC_DEBT_STRUCTURING_HPP
#define DEBTCALC_DEBT_STRUCTURING_HPP

#include "allocation.hpp"
#include "amortization.hpp"
#include "cashflow_series.hpp"
#include "tranche.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace debtcalc {

// What to do when a sculpted tranche cannot hit its target
enum class SculptFallback : uint8_t {
    None = 0,       // propagate InfeasibleSculptError
    Annuity = 1     // reschedule the offending tranche as an annuity
};

std::string sculpt_fallback_to_string(SculptFallback fallback);
SculptFallback sculpt_fallback_from_string(const std::string& value);

struct StructuringOptions {
    size_t first_period;              // project period of the first schedule row
    AllocatorConfig allocator;
    SculptFallback sculpt_fallback;
    std::string run_id;               // label carried into log records

    StructuringOptions();
};

// Schedule of one tranche together with the CFADS it was given
struct TrancheSchedule {
    Tranche tranche;                           // as scheduled (annuity if it fell back)
    std::vector<ScheduleEntry> entries;        // tranche currency
    std::vector<double> cfads_allocation;      // tranche currency, per entry
    std::vector<double> cfads_allocation_base; // base currency, per entry
    bool fell_back_to_annuity;

    TrancheSchedule();

    size_t first_period() const { return entries.empty() ? 0 : entries.front().period; }
    size_t maturity_period() const { return entries.empty() ? 0 : entries.back().period; }

    double total_interest() const;
    double total_capitalized_interest() const;
    double total_principal() const;
    double final_balance() const;
};

// Consolidated schedule across all tranches, in base currency
struct DebtSchedule {
    std::vector<TrancheSchedule> tranches;
    std::vector<ScheduleEntry> consolidated;   // one row per period, first..maturity
    Currency base_currency;
    size_t first_period;
    size_t maturity_period;                    // latest tranche maturity
    std::vector<std::string> fallback_tranches;
    ValidationFindings findings;

    DebtSchedule();

    bool covers(size_t period) const { return period >= first_period && period <= maturity_period; }

    // Consolidated row for a period; throws std::out_of_range outside the schedule
    const ScheduleEntry& at(size_t period) const;
    const TrancheSchedule& tranche(const std::string& id) const;

    double total_debt_service(size_t period) const { return at(period).total_service; }
    double opening_balance(size_t period) const { return at(period).outstanding_balance_start; }
};

// Drives allocation and amortization together.
//
// Pro-rata weights depend on balances, and sculpted balances depend on the
// CFADS allocated, so all tranche schedulers advance in lock-step: each
// period the allocator splits CFADS using the balances and demands the
// schedulers report, and each scheduler then solves its own period.
class DebtStructurer {
public:
    explicit DebtStructurer(const StructuringOptions& options = StructuringOptions());

    const StructuringOptions& options() const { return options_; }

    // Every tranche must be in the CFADS base currency
    DebtSchedule run(const std::vector<Tranche>& tranches, const CfadsSeries& cfads) const;

    DebtSchedule run(const std::vector<Tranche>& tranches,
                     const CfadsSeries& cfads,
                     const ExchangeRateSeries& fx) const;

private:
    DebtSchedule run_once(const std::vector<Tranche>& tranches,
                          const CfadsSeries& cfads,
                          const ExchangeRateSeries& fx) const;

    StructuringOptions options_;
    TrancheAllocator allocator_;
};

} // namespace debtcalc

#endif // DEBTCALC_DEBT_STRUCTURING_HPP
