#ifndef DEBTCALC_CONFIG_PARSER_HPP
#define DEBTCALC_CONFIG_PARSER_HPP

#include "cashflow_series.hpp"
#include "coverage.hpp"
#include "covenants.hpp"
#include "debt_structuring.hpp"
#include "refinancing.hpp"
#include "tranche.hpp"
#include "tranche_mix.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace debtcalc {

/**
 * @brief Where a per-period series comes from: a file, or inline values
 */
struct SeriesSource {
    std::string path;              ///< .csv or .parquet; empty when inline
    std::vector<double> values;    ///< Inline values, period 1 first

    bool empty() const { return path.empty() && values.empty(); }
};

/**
 * @brief Alternative tranche set taking over the debt at a given period
 */
struct RefinancingCase {
    size_t period;
    std::vector<Tranche> tranches;

    RefinancingCase() : period(0) {}
};

/**
 * @brief Total debt split into domestic, commercial and DFI tranches
 */
struct TrancheMixCase {
    double debt_total;
    MixConstraints constraints;
    MixRates rates;
    MixTerms terms;

    TrancheMixCase() : debt_total(0.0) {}
};

/**
 * @brief Fully resolved run configuration
 *
 * Tranches with a construction block already carry their capitalized IDC.
 * Tranches sized from a mix block follow the explicitly listed ones.
 */
struct RunConfig {
    std::string run_id;
    Currency base_currency;
    SeriesSource cfads;
    SeriesSource exchange_rates;
    std::vector<Tranche> tranches;
    std::map<std::string, std::vector<double>> drawdown_fractions;  ///< by tranche id
    std::optional<TrancheMixCase> mix;
    StructuringOptions structuring;
    ValidationPolicy validation_policy;
    CoverageConfig coverage;
    std::vector<CovenantThreshold> covenants;
    BalloonPolicy balloon;
    std::optional<RefinancingCase> refinancing;

    RunConfig();
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Relative series paths are resolved against the config file's directory.
 *
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 * @throws ConfigurationError if a value is out of range
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * @throws ConfigParseError if JSON is invalid or a required field is missing
 * @throws ConfigurationError if a value is out of range
 */
RunConfig parse_run_config_from_string(const std::string& json_string);

/**
 * @brief Loads the CFADS series named by the configuration
 */
CfadsSeries load_cfads(const RunConfig& config);

/**
 * @brief Loads the exchange-rate series; empty when none is configured
 */
ExchangeRateSeries load_exchange_rates(const RunConfig& config);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace debtcalc

#endif // DEBTCALC_CONFIG_PARSER_HPP
