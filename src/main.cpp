#include <iostream>
#include <fstream>
#include <string>
#include "analysis.hpp"
#include "config_parser.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "io/json_writer.hpp"

namespace {

struct CLIArgs {
    std::string config_path;
    std::string output_path;
    std::string log_level = "INFO";
    bool log_text = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "debtcalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --config <path> [options]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config <path>             JSON run configuration (tranches, CFADS, covenants)\n";
    std::cerr << "  --output <path>             JSON report file (default: stdout)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-text                  Plain-text log lines instead of JSON\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --config data/sample_config.json --output report.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-text") {
            args.log_text = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    if (args.config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        return false;
    }
    if (!file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        return false;
    }
    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: Invalid log level: " << args.log_level << "\n";
        return false;
    }
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\n";
        print_usage(argv[0]);
        return 1;
    }

    debtcalc::LoggerConfig log_config;
    log_config.min_level = debtcalc::string_to_level(args.log_level);
    log_config.enable_json = !args.log_text;
    debtcalc::Logger& logger = debtcalc::Logger::get_instance();
    logger.configure(log_config);

    debtcalc::LogContext ctx("cli");

    try {
        debtcalc::RunConfig config = debtcalc::parse_run_config_from_file(args.config_path);
        ctx.run_id = config.run_id;

        debtcalc::CfadsSeries cfads = debtcalc::load_cfads(config);
        debtcalc::ExchangeRateSeries fx = debtcalc::load_exchange_rates(config);

        logger.log_info(ctx, "Loaded " + std::to_string(config.tranches.size()) + " tranches and " +
                             std::to_string(cfads.size()) + " CFADS periods from " +
                             args.config_path);

        debtcalc::AnalysisResult result = debtcalc::run_analysis(config, cfads, fx);

        // Report summary to stderr
        const auto& cov = result.coverage;
        std::cerr << "\nResults:\n";
        std::cerr << "  Tranches:    " << result.schedule.tranches.size() << "\n";
        std::cerr << "  Periods:     " << result.schedule.first_period << ".."
                  << result.schedule.maturity_period << "\n";
        if (!cov.dscr_stats.empty()) {
            std::cerr << "  Min DSCR:    " << cov.dscr_stats.min << "x\n";
        }
        if (!cov.llcr_stats.empty()) {
            std::cerr << "  Min LLCR:    " << cov.llcr_stats.min << "x\n";
            std::cerr << "  Min PLCR:    " << cov.plcr_stats.min << "x\n";
        }
        std::cerr << "  Covenants:   " << debtcalc::status_to_string(result.compliance.status)
                  << " (" << result.compliance.violations.size() << " violations)\n";
        std::cerr << "  Execution:   " << result.execution_time_ms << " ms\n";

        if (args.output_path.empty()) {
            debtcalc::io::write_analysis_json(std::cout, result);
        } else {
            debtcalc::io::write_analysis_json(args.output_path, result);
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        }

        logger.flush();
        return 0;
    } catch (const debtcalc::InfeasibleSculptError& e) {
        ctx.tranche_id = e.tranche_id();
        ctx.period = e.period();
        logger.log_error(ctx, e.what());
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        std::cerr << "Error: " << e.what() << "\n";
    }

    logger.flush();
    return 1;
}
