#ifndef DEBTCALC_IO_JSON_WRITER_HPP
#define DEBTCALC_IO_JSON_WRITER_HPP

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include "../analysis.hpp"

namespace debtcalc {
namespace io {

// Non-finite values (DSCR sentinels, undefined deltas) become null
nlohmann::json number_or_null(double value);

nlohmann::json schedule_to_json(const DebtSchedule& schedule);
nlohmann::json coverage_to_json(const CoverageMetrics& metrics);
nlohmann::json compliance_to_json(const ComplianceReport& report);
nlohmann::json balloons_to_json(const std::vector<BalloonAssessment>& balloons);
nlohmann::json refinancing_to_json(const RefinancingComparison& comparison);

// Full run report: schedule, coverage, compliance, balloons and the
// refinancing comparison when one was evaluated
nlohmann::json analysis_to_json(const AnalysisResult& result);

void write_analysis_json(std::ostream& os, const AnalysisResult& result,
                         bool pretty_print = true);

void write_analysis_json(const std::string& filepath, const AnalysisResult& result,
                         bool pretty_print = true);

} // namespace io
} // namespace debtcalc

#endif // DEBTCALC_IO_JSON_WRITER_HPP
