/**
 * @file logger.hpp
 * @brief Structured logging for the debt structuring engine
 *
 * The Logger provides structured logging with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text lines
 * - Context tracking (component, run, tranche, period)
 * - Console (stderr) and file sinks
 *
 * Output is serialized with a mutex so engine invocations running on
 * different threads can share the instance. Nothing logged here feeds back
 * into any calculation.
 */

#ifndef DEBTCALC_LOGGER_HPP
#define DEBTCALC_LOGGER_HPP

#include <atomic>
#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace debtcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-period detail (allocations, solved principal)
    INFO,    ///< Run milestones (structuring start/end, coverage summary)
    WARN,    ///< Non-fatal issues (permissive validation findings, fallbacks)
    ERROR    ///< Failures surfaced to the caller
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Where a log record comes from
 */
struct LogContext {
    std::string component;    ///< Emitting component (structurer, coverage, covenants, ...)
    std::string run_id;       ///< Caller-supplied scenario/run label, may be empty
    std::string tranche_id;   ///< Tranche concerned, if any
    size_t period;            ///< 1-based period concerned, 0 if none

    LogContext() : period(0) {}
    explicit LogContext(const std::string& component_)
        : component(component_), period(0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("debtcalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   LogContext ctx("structurer");
 *   ctx.tranche_id = "senior_usd";
 *   Logger::get_instance().log_sculpt_infeasible(ctx, 25400.0, false);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a structuring run
     *
     * @param ctx Log context
     * @param tranche_count Number of tranches being scheduled
     * @param first_period First schedule period
     * @param maturity_period Latest tranche maturity
     * @param allocation_policy Allocation policy name
     */
    void log_structuring_start(
        const LogContext& ctx,
        size_t tranche_count,
        size_t first_period,
        size_t maturity_period,
        const std::string& allocation_policy
    );

    /**
     * @brief Log a completed tranche schedule
     */
    void log_tranche_scheduled(
        const LogContext& ctx,
        const std::string& style,
        double principal,
        double total_interest,
        double final_balance
    );

    /**
     * @brief Log a sculpt infeasibility, and whether the run falls back to annuity
     */
    void log_sculpt_infeasible(
        const LogContext& ctx,
        double shortfall,
        bool falling_back
    );

    /**
     * @brief Log an advisory validation finding (permissive mode)
     */
    void log_validation_finding(
        const LogContext& ctx,
        const std::string& finding
    );

    /**
     * @brief Log coverage ratio minima for a run
     */
    void log_coverage_summary(
        const LogContext& ctx,
        size_t periods,
        double min_dscr,
        double min_llcr,
        double min_plcr
    );

    /**
     * @brief Log covenant compliance outcome
     */
    void log_covenant_result(
        const LogContext& ctx,
        const std::string& status,
        size_t violation_count,
        size_t warning_count
    );

    /**
     * @brief Log a refinancing comparison
     */
    void log_refinancing(
        const LogContext& ctx,
        double refinanced_balance,
        double min_dscr_delta,
        double min_llcr_delta
    );

    /**
     * @brief Log a per-period detail record (DEBUG level)
     */
    void log_period_detail(
        const LogContext& ctx,
        const std::string& message,
        const std::map<std::string, double>& values
    );

    void log_info(const LogContext& ctx, const std::string& message);
    void log_warning(const LogContext& ctx, const std::string& warning_message);
    void log_error(const LogContext& ctx, const std::string& error_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    // Lock-free, so per-period callers can skip building DEBUG records
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::atomic<LogLevel> min_level_;
    std::unique_ptr<std::ofstream> file_stream_;

    // Helper methods
    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    void add_context(const LogContext& ctx, std::map<std::string, std::string>& fields) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    std::string format_number(double value) const;
    void write_output(const std::string& output);
};

} // namespace debtcalc

#endif // DEBTCALC_LOGGER_HPP
