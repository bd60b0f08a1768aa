#include "config_parser.hpp"
#include "construction.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include "io/parquet_reader.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace debtcalc {

namespace {

template <typename T>
T value_or(const json& j, const char* key, T fallback) {
    return j.contains(key) ? j.at(key).get<T>() : fallback;
}

const json& require(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw ConfigParseError(where + " missing required field: " + key);
    }
    return j.at(key);
}

size_t require_count(const json& j, const char* key, const std::string& where) {
    const json& v = require(j, key, where);
    if (!v.is_number_integer() || v.get<long long>() < 0) {
        throw ConfigParseError(where + " field '" + key + "' must be a non-negative integer");
    }
    return v.get<size_t>();
}

Tranche parse_tranche(const json& tj, size_t index, std::vector<double>* drawdowns) {
    Tranche t;

    std::string where = "Tranche " + std::to_string(index);
    t.id = require(tj, "id", where).get<std::string>();
    where = "Tranche '" + t.id + "'";

    t.principal = require(tj, "principal", where).get<double>();
    t.rate = require(tj, "rate", where).get<double>();
    t.tenor_periods = require_count(tj, "tenor_periods", where);
    if (tj.contains("grace_periods")) {
        t.grace_periods = require_count(tj, "grace_periods", where);
    }

    if (tj.contains("currency")) {
        t.currency = currency_from_string(tj["currency"].get<std::string>());
    }
    if (tj.contains("amortization")) {
        t.style = style_from_string(tj["amortization"].get<std::string>());
    } else if (tj.contains("style")) {
        t.style = style_from_string(tj["style"].get<std::string>());
    }

    t.target_dscr = value_or(tj, "target_dscr", 0.0);
    t.balloon_fraction = value_or(tj, "balloon_fraction", 0.0);
    t.capitalize_grace_interest = value_or(tj, "capitalize_grace_interest", false);
    t.seniority = value_or(tj, "seniority", 0);

    if (drawdowns && tj.contains("construction")) {
        const json& cj = tj["construction"];
        for (const auto& f : require(cj, "drawdown_fractions", where + " construction")) {
            drawdowns->push_back(f.get<double>());
        }
    }

    return t;
}

SeriesSource parse_series(const json& sj, const std::string& what) {
    SeriesSource source;
    if (sj.is_array()) {
        source.values = sj.get<std::vector<double>>();
        return source;
    }
    if (sj.contains("source")) {
        source.path = expand_environment_variables(sj["source"].get<std::string>());
    } else if (sj.contains("values")) {
        source.values = sj["values"].get<std::vector<double>>();
    } else {
        throw ConfigParseError(what + " requires either 'source' or 'values'");
    }
    return source;
}

TrancheMixCase parse_mix(const json& mj) {
    const std::string where = "Mix";
    TrancheMixCase mix;
    mix.debt_total = require(mj, "debt_total", where).get<double>();

    if (mj.contains("constraints")) {
        const json& cj = mj["constraints"];
        mix.constraints.domestic_max = value_or(cj, "domestic_max", 0.0);
        mix.constraints.dfi_max = value_or(cj, "dfi_max", 0.0);
        mix.constraints.usd_commercial_min = value_or(cj, "usd_commercial_min", 0.0);
    }

    const json& rj = require(mj, "rates", where);
    mix.rates.domestic = value_or(rj, "domestic", 0.0);
    mix.rates.usd_commercial = value_or(rj, "usd_commercial", 0.0);
    mix.rates.dfi = value_or(rj, "dfi", 0.0);

    mix.terms.tenor_periods = require_count(mj, "tenor_periods", where);
    if (mj.contains("grace_periods")) {
        mix.terms.grace_periods = require_count(mj, "grace_periods", where);
    }
    if (mj.contains("amortization")) {
        mix.terms.style = style_from_string(mj["amortization"].get<std::string>());
    }
    mix.terms.target_dscr = value_or(mj, "target_dscr", 0.0);
    return mix;
}

void parse_limits(const json& lj, FinancingLimits& limits) {
    limits.max_tenor_periods = value_or(lj, "max_tenor_periods", limits.max_tenor_periods);
    limits.warn_tenor_periods = value_or(lj, "warn_tenor_periods", limits.warn_tenor_periods);
    limits.max_rate = value_or(lj, "max_rate", limits.max_rate);
    limits.min_sculpt_target_dscr = value_or(lj, "min_sculpt_target_dscr", limits.min_sculpt_target_dscr);
    limits.max_balloon_fraction = value_or(lj, "max_balloon_fraction", limits.max_balloon_fraction);
}

bool has_extension(const std::string& path, const std::string& ext) {
    std::string e = fs::path(path).extension().string();
    for (auto& c : e) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return e == ext;
}

std::vector<double> load_series_values(const SeriesSource& source, const std::string& what,
                                       const std::string& value_column) {
    if (!source.path.empty()) {
        if (has_extension(source.path, ".parquet")) {
            return ParquetReader::load_period_values(source.path, value_column);
        }
        std::ifstream file(source.path);
        if (!file.is_open()) {
            throw ConfigParseError("Cannot open " + what + " file: " + source.path);
        }
        return read_period_values_csv(file, what);
    }
    return source.values;
}

} // anonymous namespace

RunConfig::RunConfig()
    : base_currency(Currency::HardCurrency),
      validation_policy(ValidationPolicy::Strict),
      covenants(CovenantValidator::default_thresholds()) {}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++;
        }

        // A lone '$' is kept as-is
        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

RunConfig parse_run_config_from_string(const std::string& json_string) {
    RunConfig config;

    try {
        json j = json::parse(json_string);

        config.run_id = value_or<std::string>(j, "run_id", "");
        config.structuring.run_id = config.run_id;

        if (j.contains("base_currency")) {
            config.base_currency = currency_from_string(j["base_currency"].get<std::string>());
        }
        if (j.contains("first_period")) {
            config.structuring.first_period = require_count(j, "first_period", "Config");
        }

        config.cfads = parse_series(require(j, "cfads", "Config"), "cfads");
        if (j.contains("exchange_rates")) {
            config.exchange_rates = parse_series(j["exchange_rates"], "exchange_rates");
        }

        // Tranches: an explicit list, a mix block, or both
        if (!j.contains("mix")) {
            const json& tranches = require(j, "tranches", "Config");
            if (!tranches.is_array() || tranches.empty()) {
                throw ConfigParseError("Config field 'tranches' must be a non-empty array");
            }
        }
        if (j.contains("tranches")) {
            const json& tranches = j["tranches"];
            if (!tranches.is_array()) {
                throw ConfigParseError("Config field 'tranches' must be an array");
            }
            for (size_t i = 0; i < tranches.size(); ++i) {
                std::vector<double> drawdowns;
                Tranche t = parse_tranche(tranches[i], i, &drawdowns);
                if (!drawdowns.empty()) {
                    config.drawdown_fractions[t.id] = drawdowns;
                    t = with_capitalized_idc(t, drawdowns);
                }
                config.tranches.push_back(t);
            }
        }
        if (j.contains("mix")) {
            config.mix = parse_mix(j["mix"]);
            for (const Tranche& t : size_tranche_mix(config.mix->debt_total, config.mix->constraints,
                                                     config.mix->rates, config.mix->terms)) {
                config.tranches.push_back(t);
            }
        }

        if (j.contains("allocation")) {
            const json& aj = j["allocation"];
            if (aj.contains("policy")) {
                config.structuring.allocator.policy =
                    allocation_policy_from_string(aj["policy"].get<std::string>());
            }
        }

        if (j.contains("validation")) {
            const json& vj = j["validation"];
            if (vj.contains("policy")) {
                config.validation_policy =
                    validation_policy_from_string(vj["policy"].get<std::string>());
            }
            if (vj.contains("limits")) {
                FinancingLimits limits;
                parse_limits(vj["limits"], limits);
                config.structuring.allocator.limits = limits;
            }
        }
        config.structuring.allocator.validation_policy = config.validation_policy;

        if (j.contains("sculpt_fallback")) {
            config.structuring.sculpt_fallback =
                sculpt_fallback_from_string(j["sculpt_fallback"].get<std::string>());
        }

        if (j.contains("coverage")) {
            config.coverage.hurdle_rate =
                value_or(j["coverage"], "hurdle_rate", config.coverage.hurdle_rate);
        }

        if (j.contains("covenants")) {
            config.covenants.clear();
            for (const auto& cj : j["covenants"]) {
                CovenantThreshold th;
                th.metric = metric_from_string(require(cj, "metric", "Covenant").get<std::string>());
                th.minimum_value = require(cj, "minimum", "Covenant").get<double>();
                if (cj.contains("warning")) {
                    th.warning_value = cj["warning"].get<double>();
                }
                th.name = value_or<std::string>(cj, "name", "");
                config.covenants.push_back(th);
            }
        }

        if (j.contains("balloon")) {
            const json& bj = j["balloon"];
            config.balloon.warn_fraction = value_or(bj, "warn_fraction", config.balloon.warn_fraction);
            config.balloon.max_fraction = value_or(bj, "max_fraction", config.balloon.max_fraction);
            config.balloon.refinancing_enabled =
                value_or(bj, "refinancing_enabled", config.balloon.refinancing_enabled);
            config.balloon.max_refinance_fraction =
                value_or(bj, "max_refinance_fraction", config.balloon.max_refinance_fraction);
        }

        if (j.contains("refinancing")) {
            const json& rj = j["refinancing"];
            RefinancingCase rc;
            rc.period = require_count(rj, "period", "Refinancing");
            for (size_t i = 0; i < require(rj, "tranches", "Refinancing").size(); ++i) {
                rc.tranches.push_back(parse_tranche(rj["tranches"][i], i, nullptr));
            }
            config.refinancing = rc;
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON range error: ") + e.what());
    }

    if (config.cfads.empty()) {
        throw ConfigParseError("Config field 'cfads' is empty");
    }

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    RunConfig config = parse_run_config_from_string(buffer.str());

    if (!config.cfads.path.empty()) {
        config.cfads.path = resolve_relative_path(config.cfads.path, file_path);
    }
    if (!config.exchange_rates.path.empty()) {
        config.exchange_rates.path = resolve_relative_path(config.exchange_rates.path, file_path);
    }

    return config;
}

CfadsSeries load_cfads(const RunConfig& config) {
    return CfadsSeries(load_series_values(config.cfads, "CFADS", "cfads"), config.base_currency);
}

ExchangeRateSeries load_exchange_rates(const RunConfig& config) {
    if (config.exchange_rates.empty()) {
        return ExchangeRateSeries();
    }
    return ExchangeRateSeries(load_series_values(config.exchange_rates, "Exchange rate", "rate"));
}

} // namespace debtcalc
