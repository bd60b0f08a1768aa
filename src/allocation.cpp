#include "allocation.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <numeric>

namespace debtcalc {

std::string allocation_policy_to_string(AllocationPolicy policy) {
    return policy == AllocationPolicy::ProRata ? "pro_rata" : "priority";
}

AllocationPolicy allocation_policy_from_string(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(v.begin(), v.end(), '-', '_');

    if (v == "pro_rata" || v == "prorata") return AllocationPolicy::ProRata;
    if (v == "priority" || v == "waterfall") return AllocationPolicy::Priority;
    throw ConfigurationError("Unknown allocation policy: " + value);
}

AllocatorConfig::AllocatorConfig()
    : policy(AllocationPolicy::ProRata),
      validation_policy(ValidationPolicy::Strict) {}

TrancheClaim::TrancheClaim()
    : live(false),
      opening_balance_base(0.0),
      original_principal_base(0.0),
      demand_base(0.0),
      seniority(0) {}

// ============================================================================
// TrancheAllocator Implementation
// ============================================================================

TrancheAllocator::TrancheAllocator(const AllocatorConfig& config)
    : config_(config) {}

ValidationFindings TrancheAllocator::validate(const std::vector<Tranche>& tranches) const {
    return validate_tranches(tranches, config_.limits, config_.validation_policy);
}

std::vector<double> TrancheAllocator::allocate(size_t period, double cfads_base,
                                               const std::vector<TrancheClaim>& claims) const {
    std::vector<double> allocation;
    if (config_.policy == AllocationPolicy::Priority) {
        allocation = allocate_priority(cfads_base, claims);
    } else {
        allocation = allocate_pro_rata(cfads_base, claims);
    }

    if (Logger::get_instance().get_min_level() == LogLevel::DEBUG) {
        LogContext ctx("allocator");
        ctx.period = period;
        std::map<std::string, double> values{{"cfads", cfads_base}};
        for (size_t i = 0; i < allocation.size(); ++i) {
            values["tranche_" + std::to_string(i)] = allocation[i];
        }
        Logger::get_instance().log_period_detail(ctx, "Allocated CFADS", values);
    }

    return allocation;
}

std::vector<double> TrancheAllocator::allocate_pro_rata(double cfads_base,
                                                        const std::vector<TrancheClaim>& claims) const {
    std::vector<double> allocation(claims.size(), 0.0);

    std::vector<size_t> live;
    for (size_t i = 0; i < claims.size(); ++i) {
        if (claims[i].live) live.push_back(i);
    }
    if (live.empty()) {
        return allocation;
    }

    // Weights: opening balances, else original principals, else equal shares
    std::vector<double> weights(claims.size(), 0.0);
    double total = 0.0;
    for (size_t i : live) {
        weights[i] = std::max(0.0, claims[i].opening_balance_base);
        total += weights[i];
    }
    if (total <= kBalanceEpsilon) {
        total = 0.0;
        for (size_t i : live) {
            weights[i] = std::max(0.0, claims[i].original_principal_base);
            total += weights[i];
        }
    }
    if (total <= 0.0) {
        for (size_t i : live) weights[i] = 1.0;
        total = static_cast<double>(live.size());
    }

    double assigned = 0.0;
    for (size_t k = 0; k + 1 < live.size(); ++k) {
        size_t i = live[k];
        allocation[i] = cfads_base * (weights[i] / total);
        assigned += allocation[i];
    }
    allocation[live.back()] = cfads_base - assigned;

    return allocation;
}

std::vector<double> TrancheAllocator::allocate_priority(double cfads_base,
                                                        const std::vector<TrancheClaim>& claims) const {
    std::vector<double> allocation(claims.size(), 0.0);

    std::vector<size_t> order;
    for (size_t i = 0; i < claims.size(); ++i) {
        if (claims[i].live) order.push_back(i);
    }
    if (order.empty()) {
        return allocation;
    }

    // Senior first; equal ranks keep input order
    std::stable_sort(order.begin(), order.end(), [&claims](size_t a, size_t b) {
        return claims[a].seniority < claims[b].seniority;
    });

    double remaining = cfads_base;
    for (size_t k = 0; k + 1 < order.size(); ++k) {
        size_t i = order[k];
        double share = std::min(std::max(remaining, 0.0), std::max(0.0, claims[i].demand_base));
        allocation[i] = share;
        remaining -= share;
    }
    allocation[order.back()] = remaining;

    return allocation;
}

// ============================================================================
// Currency helpers
// ============================================================================

double base_to_tranche_currency(double amount, const Tranche& tranche, Currency base_currency,
                                const ExchangeRateSeries& fx, size_t period) {
    if (tranche.currency == base_currency) {
        return amount;
    }
    if (!fx.covers(period)) {
        throw ConfigurationError("No exchange rate for period " + std::to_string(period) +
                                 " (tranche " + tranche.id + ")", tranche.id, period);
    }
    return fx.from_base(amount, period);
}

double tranche_to_base_currency(double amount, const Tranche& tranche, Currency base_currency,
                                const ExchangeRateSeries& fx, size_t period) {
    if (tranche.currency == base_currency) {
        return amount;
    }
    if (!fx.covers(period)) {
        throw ConfigurationError("No exchange rate for period " + std::to_string(period) +
                                 " (tranche " + tranche.id + ")", tranche.id, period);
    }
    return fx.to_base(amount, period);
}

void check_exchange_rate_coverage(const std::vector<Tranche>& tranches,
                                  Currency base_currency,
                                  const ExchangeRateSeries& fx,
                                  size_t first_period) {
    for (const Tranche& tranche : tranches) {
        if (tranche.currency == base_currency) continue;

        const size_t maturity = tranche.maturity_period(first_period);
        for (size_t period = first_period; period <= maturity; ++period) {
            if (!fx.covers(period)) {
                throw ConfigurationError(
                    "Exchange-rate series has no rate for period " + std::to_string(period) +
                    " but " + currency_to_string(tranche.currency) + " tranche '" + tranche.id +
                    "' is outstanding through period " + std::to_string(maturity),
                    tranche.id, period);
            }
        }
    }
}

} // namespace debtcalc
