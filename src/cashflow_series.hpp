#ifndef DEBTCALC_CASHFLOW_SERIES_HPP
#define DEBTCALC_CASHFLOW_SERIES_HPP

#include "tranche.hpp"
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace debtcalc {

// CfadsSeries: cash flow available for debt service by project period,
// in a declared base currency. Periods are 1-based; the last period is the
// project end.
class CfadsSeries {
public:
    CfadsSeries();
    explicit CfadsSeries(std::vector<double> values,
                         Currency base_currency = Currency::HardCurrency);

    double get(size_t period) const;
    void set(size_t period, double value);
    void append(double value);

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    size_t project_end_period() const { return values_.size(); }

    Currency base_currency() const { return base_currency_; }
    const std::vector<double>& values() const { return values_; }

    // Load from CSV: expects columns period,cfads with contiguous periods from 1
    static CfadsSeries load_from_csv(const std::string& filepath, Currency base_currency);
    static CfadsSeries load_from_csv(std::istream& is, Currency base_currency);

private:
    std::vector<double> values_;
    Currency base_currency_;
};

// ExchangeRateSeries: base-currency units per one unit of the non-base
// currency, by period. Base -> tranche currency divides by the rate.
class ExchangeRateSeries {
public:
    ExchangeRateSeries();
    explicit ExchangeRateSeries(std::vector<double> rates);

    double get(size_t period) const;
    void set(size_t period, double rate);
    void append(double rate);

    bool covers(size_t period) const { return period >= 1 && period <= rates_.size(); }
    size_t size() const { return rates_.size(); }
    bool empty() const { return rates_.empty(); }

    const std::vector<double>& rates() const { return rates_; }

    double to_base(double amount, size_t period) const { return amount * get(period); }
    double from_base(double amount, size_t period) const { return amount / get(period); }

    // Load from CSV: expects columns period,rate with contiguous periods from 1
    static ExchangeRateSeries load_from_csv(const std::string& filepath);
    static ExchangeRateSeries load_from_csv(std::istream& is);

private:
    std::vector<double> rates_;
};

} // namespace debtcalc

#endif // DEBTCALC_CASHFLOW_SERIES_HPP
