#ifndef DEBTCALC_ALLOCATION_HPP
#define DEBTCALC_ALLOCATION_HPP

#include "cashflow_series.hpp"
#include "tranche.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace debtcalc {

enum class AllocationPolicy : uint8_t {
    ProRata = 0,    // by opening balance in base currency
    Priority = 1    // by seniority, residual to the most junior tranche
};

std::string allocation_policy_to_string(AllocationPolicy policy);
AllocationPolicy allocation_policy_from_string(const std::string& value);

// Immutable allocator configuration, fixed at construction
struct AllocatorConfig {
    AllocationPolicy policy;
    ValidationPolicy validation_policy;
    std::optional<FinancingLimits> limits;    // unset: invariants only

    AllocatorConfig();
};

// What one tranche brings to a period's split, all in base currency
struct TrancheClaim {
    bool live;                        // outstanding in this period
    double opening_balance_base;
    double original_principal_base;
    double demand_base;               // CFADS the tranche would like (priority mode)
    int seniority;

    TrancheClaim();
};

// Splits consolidated CFADS across tranches one period at a time.
//
// Holds no per-run state: every call is a pure function of its arguments
// and the configuration, so one allocator may serve concurrent runs.
class TrancheAllocator {
public:
    explicit TrancheAllocator(const AllocatorConfig& config = AllocatorConfig());

    const AllocatorConfig& config() const { return config_; }

    // Invariants always throw; financing limits, when set, follow the
    // validation policy
    ValidationFindings validate(const std::vector<Tranche>& tranches) const;

    // Base-currency allocation per claim for one period. Claims that are not
    // live get 0; the live allocations sum exactly to cfads_base.
    std::vector<double> allocate(size_t period, double cfads_base,
                                 const std::vector<TrancheClaim>& claims) const;

private:
    std::vector<double> allocate_pro_rata(double cfads_base,
                                          const std::vector<TrancheClaim>& claims) const;
    std::vector<double> allocate_priority(double cfads_base,
                                          const std::vector<TrancheClaim>& claims) const;

    AllocatorConfig config_;
};

// Currency conversion at a period's exchange rate. Base-currency tranches
// pass through unchanged and never touch the series.
double base_to_tranche_currency(double amount, const Tranche& tranche, Currency base_currency,
                                const ExchangeRateSeries& fx, size_t period);
double tranche_to_base_currency(double amount, const Tranche& tranche, Currency base_currency,
                                const ExchangeRateSeries& fx, size_t period);

// Throws ConfigurationError naming the tranche and the first uncovered
// period if a non-base tranche is outstanding where the series has no rate.
void check_exchange_rate_coverage(const std::vector<Tranche>& tranches,
                                  Currency base_currency,
                                  const ExchangeRateSeries& fx,
                                  size_t first_period);

} // namespace debtcalc

#endif // DEBTCALC_ALLOCATION_HPP
