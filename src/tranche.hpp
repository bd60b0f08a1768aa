#ifndef DEBTCALC_TRANCHE_HPP
#define DEBTCALC_TRANCHE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace debtcalc {

enum class Currency : uint8_t {
    Domestic = 0,
    HardCurrency = 1
};

enum class AmortizationStyle : uint8_t {
    Annuity = 0,
    Sculpted = 1
};

enum class ValidationPolicy : uint8_t {
    Strict = 0,      // advisory limit breaches are errors
    Permissive = 1   // advisory limit breaches are logged and reported
};

std::string currency_to_string(Currency currency);
Currency currency_from_string(const std::string& value);

std::string style_to_string(AmortizationStyle style);
AmortizationStyle style_from_string(const std::string& value);

std::string validation_policy_to_string(ValidationPolicy policy);
ValidationPolicy validation_policy_from_string(const std::string& value);

// Balances below this are treated as fully repaid
constexpr double kBalanceEpsilon = 1e-6;

// One debt instrument. Built once from validated configuration and never
// mutated afterwards; variants (IDC, fallback, refinancing) are copies.
struct Tranche {
    std::string id;
    Currency currency;
    double principal;                 // in tranche currency
    double rate;                      // per period
    size_t tenor_periods;
    size_t grace_periods;             // interest-only periods at the start
    AmortizationStyle style;
    double target_dscr;               // required for sculpted tranches
    double balloon_fraction;          // of principal, left unpaid at maturity
    bool capitalize_grace_interest;   // accrue grace interest into the balance
    int seniority;                    // lower = more senior (priority allocation)
    double capitalized_idc;           // part of principal that is construction interest

    Tranche();

    double balloon_amount() const { return balloon_fraction * principal; }
    size_t amortizing_periods() const { return tenor_periods - grace_periods; }
    size_t maturity_period(size_t first_period) const { return first_period + tenor_periods - 1; }

    bool operator==(const Tranche& other) const;
};

// Lender limits checked on top of the hard invariants. Breaches are errors
// under ValidationPolicy::Strict and warnings under Permissive. Limits are
// opt-in: tenors count periods, so the defaults assume annual periods.
struct FinancingLimits {
    size_t max_tenor_periods;
    size_t warn_tenor_periods;
    double max_rate;
    double min_sculpt_target_dscr;
    double max_balloon_fraction;

    FinancingLimits();
};

// Outcome of validating a tranche set: hard problems always throw, so only
// advisory findings end up here.
struct ValidationFindings {
    std::vector<std::string> warnings;

    bool empty() const { return warnings.empty(); }
};

// Checks the internal consistency invariants of a single tranche.
// Throws ConfigurationError on the first violation.
void check_tranche_invariants(const Tranche& tranche);

// Validates a whole tranche set: invariants, duplicate ids, and advisory
// limits (when given) according to the policy.
ValidationFindings validate_tranches(const std::vector<Tranche>& tranches,
                                     const std::optional<FinancingLimits>& limits,
                                     ValidationPolicy policy);

} // namespace debtcalc

#endif // DEBTCALC_TRANCHE_HPP
