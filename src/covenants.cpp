#include "covenants.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

namespace debtcalc {

namespace {

double metric_value(const PeriodCoverage& pc, CoverageMetric metric) {
    switch (metric) {
        case CoverageMetric::DSCR: return pc.dscr;
        case CoverageMetric::LLCR: return pc.llcr;
        case CoverageMetric::PLCR: return pc.plcr;
    }
    return pc.dscr;
}

} // anonymous namespace

std::string metric_to_string(CoverageMetric metric) {
    switch (metric) {
        case CoverageMetric::DSCR: return "DSCR";
        case CoverageMetric::LLCR: return "LLCR";
        case CoverageMetric::PLCR: return "PLCR";
    }
    return "UNKNOWN";
}

CoverageMetric metric_from_string(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (v == "DSCR") return CoverageMetric::DSCR;
    if (v == "LLCR") return CoverageMetric::LLCR;
    if (v == "PLCR") return CoverageMetric::PLCR;
    throw ConfigurationError("Unknown coverage metric: " + value);
}

std::string severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::None: return "none";
        case Severity::Warning: return "warning";
        case Severity::Breach: return "breach";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

std::string status_to_string(ComplianceStatus status) {
    switch (status) {
        case ComplianceStatus::Pass: return "PASS";
        case ComplianceStatus::Warn: return "WARN";
        case ComplianceStatus::Breach: return "BREACH";
    }
    return "UNKNOWN";
}

// ============================================================================
// Report types
// ============================================================================

CovenantThreshold::CovenantThreshold()
    : metric(CoverageMetric::DSCR), minimum_value(0.0) {}

CovenantThreshold::CovenantThreshold(CoverageMetric metric_, double minimum,
                                     std::optional<double> warning,
                                     const std::string& name_)
    : metric(metric_), minimum_value(minimum), warning_value(warning), name(name_) {}

std::string CovenantThreshold::display_name() const {
    if (!name.empty()) return name;
    std::ostringstream oss;
    oss << metric_to_string(metric) << " >= " << minimum_value << "x";
    return oss.str();
}

PeriodCompliance::PeriodCompliance()
    : period(0), actual(0.0), buffer(0.0), passed(true), sentinel(false),
      severity(Severity::None) {}

MetricCompliance::MetricCompliance()
    : violation_count(0), warning_count(0),
      min_buffer(std::numeric_limits<double>::infinity()),
      status(ComplianceStatus::Pass) {}

std::vector<size_t> MetricCompliance::violating_periods() const {
    std::vector<size_t> out;
    for (const auto& p : periods) {
        if (!p.passed) out.push_back(p.period);
    }
    return out;
}

CovenantViolation::CovenantViolation()
    : metric(CoverageMetric::DSCR), period(0), actual(0.0), minimum(0.0), shortfall(0.0),
      severity(Severity::Breach) {}

ComplianceReport::ComplianceReport() : status(ComplianceStatus::Pass) {}

const MetricCompliance& ComplianceReport::metric(CoverageMetric m) const {
    for (const auto& mc : metrics) {
        if (mc.threshold.metric == m) return mc;
    }
    throw std::out_of_range("No covenant tracked for " + metric_to_string(m));
}

// ============================================================================
// CovenantValidator Implementation
// ============================================================================

CovenantValidator::CovenantValidator(const std::vector<CovenantThreshold>& thresholds,
                                     ValidationPolicy policy) {
    std::set<CoverageMetric> seen;
    LogContext ctx("covenants");

    for (const auto& th : thresholds) {
        std::string problem;
        if (!std::isfinite(th.minimum_value) || th.minimum_value <= 0.0) {
            problem = "minimum must be a positive ratio";
        } else if (th.warning_value &&
                   (!std::isfinite(*th.warning_value) || *th.warning_value < th.minimum_value)) {
            problem = "warning level must not be below the minimum";
        } else if (seen.count(th.metric) > 0) {
            problem = metric_to_string(th.metric) + " is already tracked";
        }

        if (problem.empty()) {
            seen.insert(th.metric);
            thresholds_.push_back(th);
            continue;
        }

        std::string message = "Covenant '" + th.display_name() + "': " + problem;
        if (policy == ValidationPolicy::Strict) {
            throw ConfigurationError(message);
        }
        Logger::get_instance().log_validation_finding(ctx, message + " (dropped)");
        dropped_.push_back(message);
    }
}

std::vector<CovenantThreshold> CovenantValidator::default_thresholds() {
    return {
        CovenantThreshold(CoverageMetric::DSCR, 1.30, std::nullopt, "Minimum DSCR"),
        CovenantThreshold(CoverageMetric::LLCR, 1.20, 1.25, "Minimum LLCR"),
        CovenantThreshold(CoverageMetric::PLCR, 1.40, std::nullopt, "Minimum PLCR"),
    };
}

ComplianceReport CovenantValidator::validate(const CoverageMetrics& metrics) const {
    ComplianceReport report;
    report.dropped_thresholds = dropped_;

    size_t total_warnings = 0;

    for (const auto& th : thresholds_) {
        MetricCompliance mc;
        mc.threshold = th;
        mc.periods.reserve(metrics.periods.size());

        for (const auto& pc : metrics.periods) {
            PeriodCompliance row;
            row.period = pc.period;
            row.actual = metric_value(pc, th.metric);
            row.sentinel = (th.metric == CoverageMetric::DSCR && pc.dscr_is_sentinel);

            if (row.sentinel) {
                row.buffer = std::numeric_limits<double>::infinity();
                row.passed = true;
                mc.periods.push_back(row);
                continue;
            }

            row.buffer = row.actual - th.minimum_value;
            row.passed = row.actual >= th.minimum_value;

            if (!row.passed) {
                row.severity = row.actual < 1.0 ? Severity::Critical : Severity::Breach;
                ++mc.violation_count;

                CovenantViolation v;
                v.metric = th.metric;
                v.covenant = th.display_name();
                v.period = row.period;
                v.actual = row.actual;
                v.minimum = th.minimum_value;
                v.shortfall = th.minimum_value - row.actual;
                v.severity = row.severity;
                report.violations.push_back(v);
            } else if (th.warning_value && row.actual < *th.warning_value) {
                row.severity = Severity::Warning;
                ++mc.warning_count;
            }

            mc.min_buffer = std::min(mc.min_buffer, row.buffer);
            mc.periods.push_back(row);
        }

        if (mc.violation_count > 0) {
            mc.status = ComplianceStatus::Breach;
        } else if (mc.warning_count > 0) {
            mc.status = ComplianceStatus::Warn;
        }
        report.status = std::max(report.status, mc.status);
        total_warnings += mc.warning_count;

        report.metrics.push_back(mc);
    }

    Logger::get_instance().log_covenant_result(LogContext("covenants"),
                                               status_to_string(report.status),
                                               report.violations.size(), total_warnings);
    return report;
}

} // namespace debtcalc
