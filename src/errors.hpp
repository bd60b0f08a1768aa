#ifndef DEBTCALC_ERRORS_HPP
#define DEBTCALC_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace debtcalc {

/**
 * @brief Malformed tranche, series or covenant configuration
 *
 * Carries the tranche identifier and the 1-based period when the problem is
 * tied to one (empty / 0 otherwise).
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message,
                                const std::string& tranche_id = "",
                                size_t period = 0)
        : std::runtime_error(message), tranche_id_(tranche_id), period_(period) {}

    const std::string& tranche_id() const { return tranche_id_; }
    size_t period() const { return period_; }

private:
    std::string tranche_id_;
    size_t period_;
};

/**
 * @brief Sculpted amortization cannot reach its target DSCR
 *
 * Raised when the CFADS allocated to a tranche is too small to cover interest
 * at the target ratio, or cannot retire the balance in the final period.
 * shortfall() is the additional CFADS that period would have needed.
 */
class InfeasibleSculptError : public std::runtime_error {
public:
    InfeasibleSculptError(const std::string& tranche_id, size_t period, double shortfall);

    const std::string& tranche_id() const { return tranche_id_; }
    size_t period() const { return period_; }
    double shortfall() const { return shortfall_; }

private:
    std::string tranche_id_;
    size_t period_;
    double shortfall_;
};

/**
 * @brief Input file or JSON document could not be parsed
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace debtcalc

#endif // DEBTCALC_ERRORS_HPP
