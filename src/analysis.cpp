#include "analysis.hpp"
#include <chrono>

namespace debtcalc {

AnalysisResult::AnalysisResult() : execution_time_ms(0.0) {}

AnalysisResult run_analysis(const RunConfig& config,
                            const CfadsSeries& cfads,
                            const ExchangeRateSeries& fx) {
    auto start_time = std::chrono::high_resolution_clock::now();

    AnalysisResult result;
    result.run_id = config.run_id;

    DebtStructurer structurer(config.structuring);
    result.schedule = structurer.run(config.tranches, cfads, fx);

    CoverageAnalyzer analyzer(config.coverage);
    result.coverage = analyzer.analyze(result.schedule, cfads);

    CovenantValidator validator(config.covenants, config.validation_policy);
    result.compliance = validator.validate(result.coverage);

    result.balloons = assess_balloons(result.schedule, config.balloon);

    if (config.refinancing) {
        RefinancingEvaluator evaluator(config.structuring, config.coverage, config.balloon);
        result.refinancing = evaluator.evaluate(result.schedule, cfads, fx,
                                                config.refinancing->period,
                                                config.refinancing->tranches);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    return result;
}

} // namespace debtcalc
