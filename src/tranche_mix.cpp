#include "tranche_mix.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace debtcalc {

namespace {

void check_share(double value, const char* name) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw ConfigurationError(std::string("Mix constraint ") + name + " must be in [0, 1]");
    }
}

} // anonymous namespace

MixConstraints::MixConstraints()
    : domestic_max(0.0), dfi_max(0.0), usd_commercial_min(0.0) {}

MixRates::MixRates()
    : domestic(0.0), usd_commercial(0.0), dfi(0.0) {}

MixTerms::MixTerms()
    : tenor_periods(1),
      grace_periods(0),
      style(AmortizationStyle::Annuity),
      target_dscr(0.0) {}

MixAmounts::MixAmounts()
    : domestic(0.0), usd_commercial(0.0), dfi(0.0) {}

MixAmounts solve_mix_amounts(double debt_total, const MixConstraints& constraints) {
    if (!std::isfinite(debt_total) || debt_total <= 0.0) {
        throw ConfigurationError("Total debt for the tranche mix must be positive");
    }
    check_share(constraints.domestic_max, "domestic_max");
    check_share(constraints.dfi_max, "dfi_max");
    check_share(constraints.usd_commercial_min, "usd_commercial_min");

    MixAmounts mix;
    mix.domestic = debt_total * constraints.domestic_max;
    mix.dfi = std::min(debt_total * constraints.dfi_max, debt_total - mix.domestic);
    mix.usd_commercial = std::max(0.0, debt_total - mix.domestic - mix.dfi);

    const double usd_floor = debt_total * constraints.usd_commercial_min;
    if (mix.usd_commercial < usd_floor) {
        double need = usd_floor - mix.usd_commercial;

        const double from_domestic = std::min(need, mix.domestic);
        mix.domestic -= from_domestic;
        need -= from_domestic;

        if (need > 0.0) {
            mix.dfi -= std::min(need, mix.dfi);
        }
        mix.usd_commercial = std::max(0.0, debt_total - mix.domestic - mix.dfi);

        std::ostringstream oss;
        oss << "Commercial tranche raised to its " << constraints.usd_commercial_min * 100.0
            << "% floor (domestic " << mix.domestic << ", dfi " << mix.dfi << ")";
        Logger::get_instance().log_info(LogContext("tranche_mix"), oss.str());
    }

    return mix;
}

std::vector<Tranche> size_tranche_mix(double debt_total,
                                      const MixConstraints& constraints,
                                      const MixRates& rates,
                                      const MixTerms& terms) {
    const MixAmounts mix = solve_mix_amounts(debt_total, constraints);

    std::vector<Tranche> tranches;
    auto add = [&](const char* id, Currency currency, double principal, double rate) {
        if (principal <= kBalanceEpsilon) {
            return;
        }
        Tranche t;
        t.id = id;
        t.currency = currency;
        t.principal = principal;
        t.rate = rate;
        t.tenor_periods = terms.tenor_periods;
        t.grace_periods = terms.grace_periods;
        t.style = terms.style;
        t.target_dscr = terms.target_dscr;
        check_tranche_invariants(t);
        tranches.push_back(t);
    };

    add("domestic", Currency::Domestic, mix.domestic, rates.domestic);
    add("usd_commercial", Currency::HardCurrency, mix.usd_commercial, rates.usd_commercial);
    add("dfi", Currency::HardCurrency, mix.dfi, rates.dfi);

    return tranches;
}

} // namespace debtcalc
