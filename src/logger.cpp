/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace debtcalc {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : min_level_(LogLevel::INFO) {
    // Default configuration
    config_ = LoggerConfig();
    min_level_.store(config_.min_level);
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    min_level_.store(config.min_level);

    // Open log file if enabled
    file_stream_.reset();
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_structuring_start(
    const LogContext& ctx,
    size_t tranche_count,
    size_t first_period,
    size_t maturity_period,
    const std::string& allocation_policy
) {
    std::map<std::string, std::string> fields;
    add_context(ctx, fields);
    fields["event"] = "structuring_start";
    fields["tranche_count"] = std::to_string(tranche_count);
    fields["first_period"] = std::to_string(first_period);
    fields["maturity_period"] = std::to_string(maturity_period);
    fields["allocation_policy"] = allocation_policy;

    log(LogLevel::INFO, "Structuring debt", std::move(fields));
}

void Logger::log_tranche_scheduled(
    const LogContext& ctx,
    const std::string& style,
    double principal,
    double total_interest,
    double final_balance
) {
    std::map<std::string, std::string> fields;
    add_context(ctx, fields);
    fields["event"] = "tranche_scheduled";
    fields["style"] = style;
    fields["principal"] = format_number(principal);
    fields["total_interest"] = format_number(total_interest);
    fields["final_balance"] = format_number(final_balance);

    log(LogLevel::INFO, "Tranche scheduled", std::move(fields));
}

void Logger::log_sculpt_infeasible(
    const LogContext& ctx,
    double shortfall,
    bool falling_back
) {
    std::map<std::string, std::string> fields;
    add_context(ctx, fields);
    fields["event"] = "sculpt_infeasible";
    fields["shortfall"] = format_number(shortfall);
    fields["fallback"] = falling_back ? "annuity" : "none";

    log(falling_back ? LogLevel::WARN : LogLevel::ERROR,
        falling_back ? "Sculpt infeasible, rescheduling as annuity" : "Sculpt infeasible",
        std::move(fields));
}

void Logger::log_validation_finding(
    const LogContext& ctx,
    const std::string& finding
) {
    std::map<std::string, std::string> fields;
    add_context(ctx, fields);
    fields["event"] = "validation_finding";

    log(LogLevel::WARN, finding, std::move(fields));
}

void Logger::log_coverage_summary(
    const LogContext& ctx,
    size_t periods,
    double min_dscr,
    double min_llcr,
    double min_plcr
) {
    std::map<std::string, std::string> fields;
    add_context(ctx, fields);
    fields["event"] = "coverage_summary";
    fields["periods"] = std::to_string(periods);
    fields["min_dscr"] = format_number(min_dscr);
    fields["min_llcr"] = format_number(min_llcr);
    fields["min_plcr"] = format_number(min_plcr);

    log(LogLevel::INFO, "Coverage ratios computed", std::move(fields));
}

void Logger::log_covenant_result(
    const LogContext& ctx,
    const std::string& status,
    size_t violation_count,
    size_t warning_count
) {
    std::map<std::string, std::string> fields;
    add_context(ctx, fields);
    fields["event"] = "covenant_result";
    fields["status"] = status;
    fields["violation_count"] = std::to_string(violation_count);
    fields["warning_count"] = std::to_string(warning_count);

    log(violation_count > 0 ? LogLevel::WARN : LogLevel::INFO,
        "Covenant check " + status, std::move(fields));
}

void Logger::log_refinancing(
    const LogContext& ctx,
    double refinanced_balance,
    double min_dscr_delta,
    double min_llcr_delta
) {
    std::map<std::string, std::string> fields;
    add_context(ctx, fields);
    fields["event"] = "refinancing_evaluated";
    fields["refinanced_balance"] = format_number(refinanced_balance);
    fields["min_dscr_delta"] = format_number(min_dscr_delta);
    fields["min_llcr_delta"] = format_number(min_llcr_delta);

    log(LogLevel::INFO, "Refinancing case evaluated", std::move(fields));
}

void Logger::log_period_detail(
    const LogContext& ctx,
    const std::string& message,
    const std::map<std::string, double>& values
) {
    // Cheap exit: DEBUG records are built per period
    if (get_min_level() > LogLevel::DEBUG) {
        return;
    }

    std::map<std::string, std::string> fields;
    add_context(ctx, fields);
    fields["event"] = "period_detail";
    for (const auto& [key, value] : values) {
        fields[key] = format_number(value);
    }

    log(LogLevel::DEBUG, message, std::move(fields));
}

void Logger::log_info(const LogContext& ctx, const std::string& message) {
    std::map<std::string, std::string> fields;
    add_context(ctx, fields);
    fields["event"] = "info";

    log(LogLevel::INFO, message, std::move(fields));
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    add_context(ctx, fields);
    fields["event"] = "warning";

    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    add_context(ctx, fields);
    fields["event"] = "error";
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Engine error", std::move(fields));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
    min_level_.store(level);
}

LogLevel Logger::get_min_level() const {
    return min_level_.load(std::memory_order_relaxed);
}

void Logger::add_context(const LogContext& ctx, std::map<std::string, std::string>& fields) const {
    if (!ctx.component.empty()) fields["component"] = ctx.component;
    if (!ctx.run_id.empty()) fields["run_id"] = ctx.run_id;
    if (!ctx.tranche_id.empty()) fields["tranche_id"] = ctx.tranche_id;
    if (ctx.period > 0) fields["period"] = std::to_string(ctx.period);
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    std::map<std::string, std::string> fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
    } else {
        // Plain text format
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    // Escape control characters
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

std::string Logger::format_number(double value) const {
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    if (std::isnan(value)) {
        return "nan";
    }
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace debtcalc
