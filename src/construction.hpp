#ifndef DEBTCALC_CONSTRUCTION_HPP
#define DEBTCALC_CONSTRUCTION_HPP

#include "tranche.hpp"
#include <vector>

namespace debtcalc {

// Interest during construction for one facility
struct IdcResult {
    std::vector<double> drawdowns;     // amount drawn per construction period
    std::vector<double> idc;           // interest accrued per construction period
    double total_drawn;
    double total_idc;
    double balance_at_completion;      // drawn + capitalized interest

    IdcResult();
};

// Drawn amount per construction period: facility × fraction.
// Fractions must be non-negative; a total above 100% is logged as a warning.
std::vector<double> construction_drawdowns(double facility,
                                           const std::vector<double>& drawdown_fractions);

// Accrues interest on the cumulative drawn balance each construction period
// and capitalizes it into that balance.
IdcResult compute_idc(const std::vector<double>& drawdowns, double rate);

// Returns a copy of the tranche whose principal is the balance at completion
// (principal drawn over the construction periods plus capitalized IDC).
Tranche with_capitalized_idc(const Tranche& tranche, const std::vector<double>& drawdown_fractions);

} // namespace debtcalc

#endif // DEBTCALC_CONSTRUCTION_HPP
