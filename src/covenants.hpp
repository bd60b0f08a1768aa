#ifndef DEBTCALC_COVENANTS_HPP
#define DEBTCALC_COVENANTS_HPP

#include "coverage.hpp"
#include "tranche.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace debtcalc {

enum class CoverageMetric : uint8_t {
    DSCR = 0,
    LLCR = 1,
    PLCR = 2
};

enum class Severity : uint8_t {
    None = 0,
    Warning = 1,     // passing, but inside the warning band
    Breach = 2,      // below the minimum
    Critical = 3     // below the minimum and below 1.0x
};

enum class ComplianceStatus : uint8_t {
    Pass = 0,
    Warn = 1,
    Breach = 2
};

std::string metric_to_string(CoverageMetric metric);
CoverageMetric metric_from_string(const std::string& value);
std::string severity_to_string(Severity severity);
std::string status_to_string(ComplianceStatus status);

struct CovenantThreshold {
    CoverageMetric metric;
    double minimum_value;
    std::optional<double> warning_value;   // >= minimum_value when set
    std::string name;

    CovenantThreshold();
    CovenantThreshold(CoverageMetric metric_, double minimum,
                      std::optional<double> warning = std::nullopt,
                      const std::string& name_ = "");

    std::string display_name() const;
};

struct PeriodCompliance {
    size_t period;
    double actual;
    double buffer;        // actual - minimum; +inf on DSCR sentinel periods
    bool passed;
    bool sentinel;        // no debt service owed
    Severity severity;

    PeriodCompliance();
};

struct MetricCompliance {
    CovenantThreshold threshold;
    std::vector<PeriodCompliance> periods;
    size_t violation_count;
    size_t warning_count;
    double min_buffer;     // over non-sentinel periods; +inf if there are none
    ComplianceStatus status;

    MetricCompliance();

    std::vector<size_t> violating_periods() const;
};

struct CovenantViolation {
    CoverageMetric metric;
    std::string covenant;
    size_t period;
    double actual;
    double minimum;
    double shortfall;     // minimum - actual
    Severity severity;

    CovenantViolation();
};

struct ComplianceReport {
    std::vector<MetricCompliance> metrics;
    std::vector<CovenantViolation> violations;
    std::vector<std::string> dropped_thresholds;   // permissive mode only
    ComplianceStatus status;

    ComplianceReport();

    bool passed() const { return violations.empty(); }
    const MetricCompliance& metric(CoverageMetric m) const;
};

// Checks coverage ratios against lender covenants.
//
// Thresholds are checked once at construction. Under Strict validation a
// malformed threshold (non-positive minimum, warning below minimum, metric
// listed twice) throws ConfigurationError; under Permissive it is logged
// and dropped.
class CovenantValidator {
public:
    explicit CovenantValidator(const std::vector<CovenantThreshold>& thresholds,
                               ValidationPolicy policy = ValidationPolicy::Strict);

    const std::vector<CovenantThreshold>& thresholds() const { return thresholds_; }

    ComplianceReport validate(const CoverageMetrics& metrics) const;

    // Lender defaults: DSCR 1.30x, LLCR 1.20x (warn 1.25x), PLCR 1.40x
    static std::vector<CovenantThreshold> default_thresholds();

private:
    std::vector<CovenantThreshold> thresholds_;
    std::vector<std::string> dropped_;
};

} // namespace debtcalc

#endif // DEBTCALC_COVENANTS_HPP
