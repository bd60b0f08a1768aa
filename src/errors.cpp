#include "errors.hpp"
#include <sstream>

namespace debtcalc {

namespace {

std::string describe_infeasible_sculpt(const std::string& tranche_id, size_t period, double shortfall) {
    std::ostringstream oss;
    oss << "Sculpted tranche '" << tranche_id << "' cannot meet its target DSCR in period "
        << period << " (CFADS shortfall " << shortfall << ")";
    return oss.str();
}

} // anonymous namespace

InfeasibleSculptError::InfeasibleSculptError(const std::string& tranche_id, size_t period, double shortfall)
    : std::runtime_error(describe_infeasible_sculpt(tranche_id, period, shortfall)),
      tranche_id_(tranche_id),
      period_(period),
      shortfall_(shortfall) {}

} // namespace debtcalc
