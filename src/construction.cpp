#include "construction.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <cmath>
#include <numeric>
#include <sstream>

namespace debtcalc {

IdcResult::IdcResult()
    : total_drawn(0.0), total_idc(0.0), balance_at_completion(0.0) {}

std::vector<double> construction_drawdowns(double facility,
                                           const std::vector<double>& drawdown_fractions) {
    if (!std::isfinite(facility) || facility < 0.0) {
        throw ConfigurationError("Construction facility must be non-negative");
    }

    std::vector<double> drawn;
    drawn.reserve(drawdown_fractions.size());

    double total_fraction = 0.0;
    for (size_t i = 0; i < drawdown_fractions.size(); ++i) {
        double fraction = drawdown_fractions[i];
        if (!std::isfinite(fraction) || fraction < 0.0) {
            throw ConfigurationError("Drawdown fraction for construction period " +
                                     std::to_string(i + 1) + " must be non-negative", "", i + 1);
        }
        total_fraction += fraction;
        drawn.push_back(facility * fraction);
    }

    if (total_fraction > 1.0 + 1e-9) {
        std::ostringstream oss;
        oss << "Construction drawdowns total " << total_fraction * 100.0
            << "% of the facility";
        Logger::get_instance().log_warning(LogContext("construction"), oss.str());
    }

    return drawn;
}

IdcResult compute_idc(const std::vector<double>& drawdowns, double rate) {
    if (!std::isfinite(rate) || rate < 0.0) {
        throw ConfigurationError("Construction interest rate must be non-negative");
    }

    IdcResult result;
    result.drawdowns = drawdowns;
    result.idc.reserve(drawdowns.size());

    double balance = 0.0;
    for (double drawn : drawdowns) {
        balance += drawn;
        double interest = balance * rate;
        result.idc.push_back(interest);
        balance += interest;
    }

    result.total_drawn = std::accumulate(drawdowns.begin(), drawdowns.end(), 0.0);
    result.total_idc = std::accumulate(result.idc.begin(), result.idc.end(), 0.0);
    result.balance_at_completion = balance;
    return result;
}

Tranche with_capitalized_idc(const Tranche& tranche, const std::vector<double>& drawdown_fractions) {
    if (drawdown_fractions.empty()) {
        return tranche;
    }

    IdcResult idc = compute_idc(construction_drawdowns(tranche.principal, drawdown_fractions),
                                tranche.rate);

    Tranche adjusted = tranche;
    adjusted.principal = idc.balance_at_completion;
    adjusted.capitalized_idc = tranche.capitalized_idc + idc.total_idc;

    LogContext ctx("construction");
    ctx.tranche_id = tranche.id;
    std::ostringstream oss;
    oss << "Capitalized IDC " << idc.total_idc << " over " << drawdown_fractions.size()
        << " construction periods; principal now " << adjusted.principal;
    Logger::get_instance().log_info(ctx, oss.str());

    return adjusted;
}

} // namespace debtcalc
