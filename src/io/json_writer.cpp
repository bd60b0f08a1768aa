#include "json_writer.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace debtcalc {
namespace io {

namespace {

json entry_to_json(const ScheduleEntry& e) {
    return json{
        {"period", e.period},
        {"interest", e.interest},
        {"capitalized_interest", e.capitalized_interest},
        {"principal_paid", e.principal_paid},
        {"total_service", e.total_service},
        {"balance_start", e.outstanding_balance_start},
        {"balance_end", e.outstanding_balance_end}
    };
}

json stats_to_json(const SeriesStatistics& s) {
    if (s.empty()) {
        return json{{"count", 0}, {"min", nullptr}, {"max", nullptr},
                    {"mean", nullptr}, {"median", nullptr}};
    }
    return json{{"count", s.count}, {"min", s.min}, {"max", s.max},
                {"mean", s.mean}, {"median", s.median}};
}

} // anonymous namespace

json number_or_null(double value) {
    if (!std::isfinite(value)) {
        return nullptr;
    }
    return value;
}

json schedule_to_json(const DebtSchedule& schedule) {
    json tranches = json::array();
    for (const auto& ts : schedule.tranches) {
        const Tranche& t = ts.tranche;

        json entries = json::array();
        for (size_t i = 0; i < ts.entries.size(); ++i) {
            json row = entry_to_json(ts.entries[i]);
            row["cfads_allocation"] = ts.cfads_allocation[i];
            row["cfads_allocation_base"] = ts.cfads_allocation_base[i];
            entries.push_back(row);
        }

        tranches.push_back(json{
            {"id", t.id},
            {"currency", currency_to_string(t.currency)},
            {"style", style_to_string(t.style)},
            {"principal", t.principal},
            {"rate", t.rate},
            {"tenor_periods", t.tenor_periods},
            {"grace_periods", t.grace_periods},
            {"balloon_fraction", t.balloon_fraction},
            {"capitalized_idc", t.capitalized_idc},
            {"fell_back_to_annuity", ts.fell_back_to_annuity},
            {"total_interest", ts.total_interest()},
            {"total_principal", ts.total_principal()},
            {"final_balance", ts.final_balance()},
            {"entries", entries}
        });
    }

    json consolidated = json::array();
    for (const auto& e : schedule.consolidated) {
        consolidated.push_back(entry_to_json(e));
    }

    return json{
        {"base_currency", currency_to_string(schedule.base_currency)},
        {"first_period", schedule.first_period},
        {"maturity_period", schedule.maturity_period},
        {"fallback_tranches", schedule.fallback_tranches},
        {"validation_warnings", schedule.findings.warnings},
        {"tranches", tranches},
        {"consolidated", consolidated}
    };
}

json coverage_to_json(const CoverageMetrics& metrics) {
    json periods = json::array();
    for (const auto& p : metrics.periods) {
        periods.push_back(json{
            {"period", p.period},
            {"cfads", p.cfads},
            {"debt_service", p.debt_service},
            {"outstanding_balance", p.outstanding_balance},
            {"dscr", number_or_null(p.dscr)},
            {"llcr", number_or_null(p.llcr)},
            {"plcr", number_or_null(p.plcr)},
            {"npv_loan_life", p.npv_loan_life},
            {"npv_project_life", p.npv_project_life},
            {"no_service_owed", p.dscr_is_sentinel}
        });
    }

    return json{
        {"hurdle_rate", metrics.hurdle_rate},
        {"loan_maturity_period", metrics.loan_maturity_period},
        {"project_end_period", metrics.project_end_period},
        {"statistics", {
            {"dscr", stats_to_json(metrics.dscr_stats)},
            {"llcr", stats_to_json(metrics.llcr_stats)},
            {"plcr", stats_to_json(metrics.plcr_stats)}
        }},
        {"periods", periods}
    };
}

json compliance_to_json(const ComplianceReport& report) {
    json metrics = json::array();
    for (const auto& mc : report.metrics) {
        json periods = json::array();
        for (const auto& p : mc.periods) {
            periods.push_back(json{
                {"period", p.period},
                {"actual", number_or_null(p.actual)},
                {"buffer", number_or_null(p.buffer)},
                {"passed", p.passed},
                {"no_service_owed", p.sentinel},
                {"severity", severity_to_string(p.severity)}
            });
        }

        metrics.push_back(json{
            {"metric", metric_to_string(mc.threshold.metric)},
            {"name", mc.threshold.display_name()},
            {"minimum", mc.threshold.minimum_value},
            {"warning", mc.threshold.warning_value ? json(*mc.threshold.warning_value) : json(nullptr)},
            {"status", status_to_string(mc.status)},
            {"violation_count", mc.violation_count},
            {"warning_count", mc.warning_count},
            {"min_buffer", number_or_null(mc.min_buffer)},
            {"violating_periods", mc.violating_periods()},
            {"periods", periods}
        });
    }

    json violations = json::array();
    for (const auto& v : report.violations) {
        violations.push_back(json{
            {"metric", metric_to_string(v.metric)},
            {"covenant", v.covenant},
            {"period", v.period},
            {"actual", v.actual},
            {"minimum", v.minimum},
            {"shortfall", v.shortfall},
            {"severity", severity_to_string(v.severity)}
        });
    }

    return json{
        {"status", status_to_string(report.status)},
        {"violation_count", report.violations.size()},
        {"violations", violations},
        {"dropped_thresholds", report.dropped_thresholds},
        {"metrics", metrics}
    };
}

json balloons_to_json(const std::vector<BalloonAssessment>& balloons) {
    json out = json::array();
    for (const auto& b : balloons) {
        out.push_back(json{
            {"tranche_id", b.tranche_id},
            {"amount", b.amount},
            {"fraction", b.fraction},
            {"feasible", b.feasible},
            {"mitigation_required", b.mitigation_required},
            {"mitigation_options", b.mitigation_options},
            {"notes", b.notes}
        });
    }
    return out;
}

json refinancing_to_json(const RefinancingComparison& comparison) {
    return json{
        {"refinance_period", comparison.refinance_period},
        {"refinanced_balance", comparison.refinanced_balance},
        {"min_dscr_delta", number_or_null(comparison.min_dscr_delta)},
        {"min_llcr_delta", number_or_null(comparison.min_llcr_delta)},
        {"original_coverage", coverage_to_json(comparison.original_metrics)},
        {"alternative_schedule", schedule_to_json(comparison.alternative_schedule)},
        {"alternative_coverage", coverage_to_json(comparison.alternative_metrics)},
        {"original_balloons", balloons_to_json(comparison.original_balloons)},
        {"alternative_balloons", balloons_to_json(comparison.alternative_balloons)}
    };
}

json analysis_to_json(const AnalysisResult& result) {
    json j{
        {"run_id", result.run_id},
        {"schedule", schedule_to_json(result.schedule)},
        {"coverage", coverage_to_json(result.coverage)},
        {"compliance", compliance_to_json(result.compliance)},
        {"balloons", balloons_to_json(result.balloons)},
        {"execution_time_ms", result.execution_time_ms}
    };
    j["refinancing"] = result.refinancing ? refinancing_to_json(*result.refinancing) : json(nullptr);
    return j;
}

void write_analysis_json(std::ostream& os, const AnalysisResult& result, bool pretty_print) {
    os << analysis_to_json(result).dump(pretty_print ? 2 : -1) << "\n";
}

void write_analysis_json(const std::string& filepath, const AnalysisResult& result,
                         bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_analysis_json(file, result, pretty_print);
}

} // namespace io
} // namespace debtcalc
