#include "tranche.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

namespace debtcalc {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // anonymous namespace

// ============================================================================
// Enum conversions
// ============================================================================

std::string currency_to_string(Currency currency) {
    switch (currency) {
        case Currency::Domestic: return "domestic";
        case Currency::HardCurrency: return "hard";
    }
    return "unknown";
}

Currency currency_from_string(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "domestic" || v == "local" || v == "lkr") return Currency::Domestic;
    if (v == "hard" || v == "hard_currency" || v == "usd") return Currency::HardCurrency;
    throw ConfigurationError("Unknown currency: " + value);
}

std::string style_to_string(AmortizationStyle style) {
    switch (style) {
        case AmortizationStyle::Annuity: return "annuity";
        case AmortizationStyle::Sculpted: return "sculpted";
    }
    return "unknown";
}

AmortizationStyle style_from_string(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "annuity" || v == "fixed" || v == "constant") return AmortizationStyle::Annuity;
    if (v == "sculpted" || v == "sculpt" || v == "target_dscr") return AmortizationStyle::Sculpted;
    throw ConfigurationError("Unknown amortization style: " + value);
}

std::string validation_policy_to_string(ValidationPolicy policy) {
    return policy == ValidationPolicy::Strict ? "strict" : "permissive";
}

ValidationPolicy validation_policy_from_string(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "strict") return ValidationPolicy::Strict;
    if (v == "permissive") return ValidationPolicy::Permissive;
    throw ConfigurationError("Unknown validation policy: " + value);
}

// ============================================================================
// Tranche Implementation
// ============================================================================

Tranche::Tranche()
    : currency(Currency::Domestic),
      principal(0.0),
      rate(0.0),
      tenor_periods(1),
      grace_periods(0),
      style(AmortizationStyle::Annuity),
      target_dscr(0.0),
      balloon_fraction(0.0),
      capitalize_grace_interest(false),
      seniority(0),
      capitalized_idc(0.0) {}

bool Tranche::operator==(const Tranche& other) const {
    return id == other.id &&
           currency == other.currency &&
           principal == other.principal &&
           rate == other.rate &&
           tenor_periods == other.tenor_periods &&
           grace_periods == other.grace_periods &&
           style == other.style &&
           target_dscr == other.target_dscr &&
           balloon_fraction == other.balloon_fraction &&
           capitalize_grace_interest == other.capitalize_grace_interest &&
           seniority == other.seniority &&
           capitalized_idc == other.capitalized_idc;
}

FinancingLimits::FinancingLimits()
    : max_tenor_periods(25),
      warn_tenor_periods(20),
      max_rate(0.25),
      min_sculpt_target_dscr(1.0),
      max_balloon_fraction(0.10) {}

// ============================================================================
// Validation
// ============================================================================

void check_tranche_invariants(const Tranche& tranche) {
    const std::string& id = tranche.id;

    if (id.empty()) {
        throw ConfigurationError("Tranche id must not be empty");
    }
    if (!std::isfinite(tranche.principal) || tranche.principal <= 0.0) {
        throw ConfigurationError("Tranche '" + id + "' principal must be positive", id);
    }
    if (!std::isfinite(tranche.rate) || tranche.rate < 0.0) {
        throw ConfigurationError("Tranche '" + id + "' rate must be non-negative", id);
    }
    if (tranche.tenor_periods < 1) {
        throw ConfigurationError("Tranche '" + id + "' tenor must be at least one period", id);
    }
    if (tranche.grace_periods >= tranche.tenor_periods) {
        throw ConfigurationError("Tranche '" + id + "' grace periods (" +
                                 std::to_string(tranche.grace_periods) +
                                 ") must be shorter than the tenor (" +
                                 std::to_string(tranche.tenor_periods) + ")", id);
    }
    if (!std::isfinite(tranche.balloon_fraction) ||
        tranche.balloon_fraction < 0.0 || tranche.balloon_fraction >= 1.0) {
        throw ConfigurationError("Tranche '" + id + "' balloon fraction must be in [0, 1)", id);
    }
    if (tranche.style == AmortizationStyle::Sculpted &&
        (!std::isfinite(tranche.target_dscr) || tranche.target_dscr <= 0.0)) {
        throw ConfigurationError("Sculpted tranche '" + id + "' requires a positive target DSCR", id);
    }
}

ValidationFindings validate_tranches(const std::vector<Tranche>& tranches,
                                     const std::optional<FinancingLimits>& lender_limits,
                                     ValidationPolicy policy) {
    if (tranches.empty()) {
        throw ConfigurationError("At least one tranche is required");
    }

    ValidationFindings findings;
    std::set<std::string> seen_ids;

    auto advisory = [&](const Tranche& tranche, const std::string& message) {
        if (policy == ValidationPolicy::Strict) {
            throw ConfigurationError(message, tranche.id);
        }
        findings.warnings.push_back(message);

        LogContext ctx("validation");
        ctx.tranche_id = tranche.id;
        Logger::get_instance().log_validation_finding(ctx, message);
    };

    for (const Tranche& tranche : tranches) {
        check_tranche_invariants(tranche);

        if (!seen_ids.insert(tranche.id).second) {
            throw ConfigurationError("Duplicate tranche id: " + tranche.id, tranche.id);
        }
        if (!lender_limits) {
            continue;
        }
        const FinancingLimits& limits = *lender_limits;

        std::ostringstream oss;
        if (tranche.tenor_periods > limits.max_tenor_periods) {
            oss << "Tranche '" << tranche.id << "' tenor " << tranche.tenor_periods
                << " exceeds maximum " << limits.max_tenor_periods;
            advisory(tranche, oss.str());
            oss.str("");
        } else if (tranche.tenor_periods > limits.warn_tenor_periods) {
            // Long but inside the hard limit: informational only
            oss << "Tranche '" << tranche.id << "' has a long tenor of "
                << tranche.tenor_periods << " periods";
            findings.warnings.push_back(oss.str());
            oss.str("");
        }

        if (tranche.rate > limits.max_rate) {
            oss << "Tranche '" << tranche.id << "' rate " << tranche.rate
                << " exceeds maximum " << limits.max_rate;
            advisory(tranche, oss.str());
            oss.str("");
        }

        if (tranche.style == AmortizationStyle::Sculpted &&
            tranche.target_dscr < limits.min_sculpt_target_dscr) {
            oss << "Sculpted tranche '" << tranche.id << "' target DSCR " << tranche.target_dscr
                << " is below " << limits.min_sculpt_target_dscr;
            advisory(tranche, oss.str());
            oss.str("");
        }

        if (tranche.balloon_fraction > limits.max_balloon_fraction) {
            oss << "Tranche '" << tranche.id << "' balloon fraction " << tranche.balloon_fraction
                << " exceeds maximum " << limits.max_balloon_fraction;
            advisory(tranche, oss.str());
            oss.str("");
        }
    }

    return findings;
}

} // namespace debtcalc
