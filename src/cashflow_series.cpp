#include "cashflow_series.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace debtcalc {

namespace {

void check_period(size_t period, size_t size, const char* what) {
    if (period < 1 || period > size) {
        throw std::out_of_range(std::string(what) + " period " + std::to_string(period) +
                                " outside 1.." + std::to_string(size));
    }
}

void check_fx_rate(double rate, size_t period) {
    if (!std::isfinite(rate) || rate <= 0.0) {
        throw ConfigurationError("Exchange rate for period " + std::to_string(period) +
                                 " must be positive", "", period);
    }
}

} // anonymous namespace

// ============================================================================
// CfadsSeries Implementation
// ============================================================================

CfadsSeries::CfadsSeries() : base_currency_(Currency::HardCurrency) {}

CfadsSeries::CfadsSeries(std::vector<double> values, Currency base_currency)
    : values_(std::move(values)), base_currency_(base_currency) {
    for (size_t i = 0; i < values_.size(); ++i) {
        if (!std::isfinite(values_[i])) {
            throw ConfigurationError("CFADS for period " + std::to_string(i + 1) +
                                     " is not finite", "", i + 1);
        }
    }
}

double CfadsSeries::get(size_t period) const {
    check_period(period, values_.size(), "CFADS");
    return values_[period - 1];
}

void CfadsSeries::set(size_t period, double value) {
    check_period(period, values_.size(), "CFADS");
    if (!std::isfinite(value)) {
        throw ConfigurationError("CFADS for period " + std::to_string(period) +
                                 " is not finite", "", period);
    }
    values_[period - 1] = value;
}

void CfadsSeries::append(double value) {
    if (!std::isfinite(value)) {
        throw ConfigurationError("CFADS for period " + std::to_string(values_.size() + 1) +
                                 " is not finite", "", values_.size() + 1);
    }
    values_.push_back(value);
}

CfadsSeries CfadsSeries::load_from_csv(const std::string& filepath, Currency base_currency) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open CFADS file: " + filepath);
    }
    return load_from_csv(file, base_currency);
}

CfadsSeries CfadsSeries::load_from_csv(std::istream& is, Currency base_currency) {
    return CfadsSeries(read_period_values_csv(is, "CFADS"), base_currency);
}

// ============================================================================
// ExchangeRateSeries Implementation
// ============================================================================

ExchangeRateSeries::ExchangeRateSeries() = default;

ExchangeRateSeries::ExchangeRateSeries(std::vector<double> rates)
    : rates_(std::move(rates)) {
    for (size_t i = 0; i < rates_.size(); ++i) {
        check_fx_rate(rates_[i], i + 1);
    }
}

double ExchangeRateSeries::get(size_t period) const {
    check_period(period, rates_.size(), "Exchange rate");
    return rates_[period - 1];
}

void ExchangeRateSeries::set(size_t period, double rate) {
    check_period(period, rates_.size(), "Exchange rate");
    check_fx_rate(rate, period);
    rates_[period - 1] = rate;
}

void ExchangeRateSeries::append(double rate) {
    check_fx_rate(rate, rates_.size() + 1);
    rates_.push_back(rate);
}

ExchangeRateSeries ExchangeRateSeries::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open exchange rate file: " + filepath);
    }
    return load_from_csv(file);
}

ExchangeRateSeries ExchangeRateSeries::load_from_csv(std::istream& is) {
    return ExchangeRateSeries(read_period_values_csv(is, "Exchange rate"));
}

} // namespace debtcalc
