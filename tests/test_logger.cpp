/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/logger.hpp"
#include "../src/amortization.hpp"
#include "../src/debt_structuring.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <string>
#include <vector>

using namespace debtcalc;

namespace {

std::map<std::string, std::string> parse_json_log(const std::string& line) {
    std::map<std::string, std::string> result;
    auto j = nlohmann::json::parse(line);
    for (auto it = j.begin(); it != j.end(); ++it) {
        result[it.key()] = it.value().get<std::string>();
    }
    return result;
}

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

// Routes the logger to a fresh file with the console off
void log_to_file(const std::string& path, LogLevel level = LogLevel::DEBUG, bool json = true) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    config.enable_json = json;
    Logger::get_instance().configure(config);
}

std::vector<std::map<std::string, std::string>> records_with_event(const std::string& path,
                                                                   const std::string& event) {
    std::vector<std::map<std::string, std::string>> out;
    for (const auto& line : read_lines(path)) {
        auto fields = parse_json_log(line);
        if (fields["event"] == event) out.push_back(fields);
    }
    return out;
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
    }

    SECTION("Level strings") {
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("WARN") == LogLevel::WARN);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
        REQUIRE(level_to_string(LogLevel::ERROR) == "ERROR");
    }

    SECTION("Log level filtering") {
        const std::string path = "test_level_filter.log";
        log_to_file(path, LogLevel::WARN);

        REQUIRE(logger.get_min_level() == LogLevel::WARN);

        logger.log_info(LogContext("test"), "dropped");
        logger.log_warning(LogContext("test"), "kept");
        logger.flush();

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 1);
        REQUIRE(parse_json_log(lines[0])["message"] == "kept");

        std::filesystem::remove(path);
    }
}

TEST_CASE("Logger carries the record context", "[logger]") {
    Logger& logger = Logger::get_instance();
    const std::string path = "test_context.log";
    log_to_file(path);

    LogContext ctx("structurer");
    ctx.run_id = "base_case";
    ctx.tranche_id = "senior_usd";
    ctx.period = 7;
    logger.log_sculpt_infeasible(ctx, 25400.0, true);
    logger.flush();

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    auto fields = parse_json_log(lines[0]);

    REQUIRE(fields["event"] == "sculpt_infeasible");
    REQUIRE(fields["component"] == "structurer");
    REQUIRE(fields["run_id"] == "base_case");
    REQUIRE(fields["tranche_id"] == "senior_usd");
    REQUIRE(fields["period"] == "7");
    REQUIRE(fields["shortfall"] == "25400");
    REQUIRE(fields["fallback"] == "annuity");
    REQUIRE(fields["level"] == "WARN");
    REQUIRE(fields.count("timestamp") == 1);

    std::filesystem::remove(path);
}

TEST_CASE("Logger event records", "[logger]") {
    Logger& logger = Logger::get_instance();
    const std::string path = "test_events.log";
    log_to_file(path);

    LogContext ctx("coverage");

    SECTION("Coverage summary with no finite DSCR") {
        logger.log_coverage_summary(ctx, 3, std::numeric_limits<double>::infinity(), 1.25, 1.5);
        logger.flush();

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "coverage_summary");
        REQUIRE(fields["periods"] == "3");
        REQUIRE(fields["min_dscr"] == "inf");
        REQUIRE(fields["min_llcr"] == "1.25");
        REQUIRE(fields.count("period") == 0);
    }

    SECTION("Covenant breach is a warning") {
        logger.log_covenant_result(LogContext("covenants"), "BREACH", 2, 1);
        logger.flush();

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "covenant_result");
        REQUIRE(fields["status"] == "BREACH");
        REQUIRE(fields["violation_count"] == "2");
        REQUIRE(fields["level"] == "WARN");
    }

    SECTION("Errors keep their message") {
        logger.log_error(LogContext("cli"), "Tranche \"x\" failed");
        logger.flush();

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "error");
        REQUIRE(fields["error_message"] == "Tranche \"x\" failed");
        REQUIRE(fields["level"] == "ERROR");
    }

    SECTION("Period detail respects the minimum level") {
        log_to_file(path, LogLevel::INFO);
        logger.log_period_detail(ctx, "hidden", {{"interest", 1.0}});
        logger.flush();
        REQUIRE(read_lines(path).empty());

        log_to_file(path, LogLevel::DEBUG);
        logger.log_period_detail(ctx, "shown", {{"interest", 1.5}});
        logger.flush();
        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "period_detail");
        REQUIRE(fields["interest"] == "1.5");
    }

    std::filesystem::remove(path);
}

TEST_CASE("Plain-text log lines", "[logger]") {
    Logger& logger = Logger::get_instance();
    const std::string path = "test_text.log";
    log_to_file(path, LogLevel::INFO, false);

    LogContext ctx("structurer");
    ctx.tranche_id = "junior";
    logger.log_info(ctx, "Structured 2 tranches");
    logger.flush();

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[INFO] Structured 2 tranches") != std::string::npos);
    REQUIRE(lines[0].find("tranche_id=junior") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("Structuring run emits its lifecycle events", "[logger][structuring]") {
    const std::string path = "test_structuring_events.log";
    log_to_file(path, LogLevel::INFO);

    Tranche t;
    t.id = "loan";
    t.currency = Currency::HardCurrency;
    t.principal = 1000.0;
    t.rate = 0.40;                  // above the default rate limit
    t.tenor_periods = 3;

    StructuringOptions options;
    options.run_id = "logging_run";
    options.allocator.validation_policy = ValidationPolicy::Permissive;
    options.allocator.limits = FinancingLimits();
    DebtStructurer(options).run({t}, CfadsSeries({1000.0, 1000.0, 1000.0}));
    Logger::get_instance().flush();

    auto findings = records_with_event(path, "validation_finding");
    REQUIRE(findings.size() == 1);
    REQUIRE(findings[0]["tranche_id"] == "loan");

    auto starts = records_with_event(path, "structuring_start");
    REQUIRE(starts.size() == 1);
    REQUIRE(starts[0]["run_id"] == "logging_run");
    REQUIRE(starts[0]["tranche_count"] == "1");
    REQUIRE(starts[0]["allocation_policy"] == "pro_rata");

    auto scheduled = records_with_event(path, "tranche_scheduled");
    REQUIRE(scheduled.size() == 1);
    REQUIRE(scheduled[0]["style"] == "annuity");

    // DEBUG records are suppressed at INFO
    REQUIRE(records_with_event(path, "period_detail").empty());

    std::filesystem::remove(path);
}

TEST_CASE("Scheduler period records follow the minimum level", "[logger][scheduler]") {
    Logger& logger = Logger::get_instance();
    const std::string path = "test_scheduler_detail.log";

    Tranche t;
    t.id = "stepper";
    t.currency = Currency::HardCurrency;
    t.principal = 1000.0;
    t.rate = 0.05;
    t.tenor_periods = 2;

    SECTION("Nothing at INFO") {
        log_to_file(path, LogLevel::INFO);
        TrancheScheduler scheduler(t);
        scheduler.step(0.0);
        scheduler.step(0.0);
        logger.flush();
        REQUIRE(records_with_event(path, "period_detail").empty());
    }

    SECTION("One record per period at DEBUG") {
        log_to_file(path, LogLevel::DEBUG);
        TrancheScheduler scheduler(t);
        scheduler.step(0.0);
        scheduler.step(0.0);
        logger.flush();

        auto details = records_with_event(path, "period_detail");
        REQUIRE(details.size() == 2);
        REQUIRE(details[0]["component"] == "scheduler");
        REQUIRE(details[0]["tranche_id"] == "stepper");
        REQUIRE(details[1]["period"] == "2");
    }

    SECTION("Level changes are seen without reconfiguring") {
        log_to_file(path, LogLevel::INFO);
        logger.set_min_level(LogLevel::DEBUG);
        REQUIRE(logger.get_min_level() == LogLevel::DEBUG);
        logger.set_min_level(LogLevel::ERROR);
        REQUIRE(logger.get_min_level() == LogLevel::ERROR);
    }

    std::filesystem::remove(path);
}
