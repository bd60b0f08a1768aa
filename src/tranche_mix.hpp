#ifndef DEBTCALC_TRANCHE_MIX_HPP
#define DEBTCALC_TRANCHE_MIX_HPP

#include "tranche.hpp"
#include <vector>

namespace debtcalc {

// Shares of the total debt, each a fraction in [0, 1]
struct MixConstraints {
    double domestic_max;          // cap on the domestic-currency tranche
    double dfi_max;               // cap on the development finance tranche
    double usd_commercial_min;    // floor on the hard-currency commercial tranche

    MixConstraints();
};

// Per-period rate for each tranche of the mix
struct MixRates {
    double domestic;
    double usd_commercial;
    double dfi;

    MixRates();
};

// Terms shared by every tranche the mix produces
struct MixTerms {
    size_t tenor_periods;
    size_t grace_periods;
    AmortizationStyle style;
    double target_dscr;

    MixTerms();
};

struct MixAmounts {
    double domestic;
    double usd_commercial;
    double dfi;

    MixAmounts();

    double total() const { return domestic + usd_commercial + dfi; }
};

// Splits debt_total into domestic, DFI and commercial amounts.
//
// Domestic takes up to its cap, DFI up to its cap out of what remains, and
// the commercial tranche the rest. When that leaves the commercial tranche
// below its floor the shortfall is pulled back from domestic first, then
// from DFI. The three amounts always sum to debt_total.
MixAmounts solve_mix_amounts(double debt_total, const MixConstraints& constraints);

// Tranches for the solved mix: "domestic" (Domestic currency), then
// "usd_commercial" and "dfi" (both HardCurrency). Zero-sized tranches are
// left out.
std::vector<Tranche> size_tranche_mix(double debt_total,
                                      const MixConstraints& constraints,
                                      const MixRates& rates,
                                      const MixTerms& terms);

} // namespace debtcalc

#endif // DEBTCALC_TRANCHE_MIX_HPP
