/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace optimach {

LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + level_str);
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
    config_ = LoggerConfig();
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
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
            file_stream_.reset();
            config_.enable_file = false;
        }
    }
}

void Logger::log_config_loaded(const AnalysisContext& ctx, const std::string& config_path) {
    std::map<std::string, std::string> fields;
    fields["event"] = "config_loaded";
    fields["run_id"] = ctx.run_id;
    fields["phase"] = ctx.phase;
    fields["config_path"] = config_path;

    log(LogLevel::INFO, "Loaded analysis config", fields);
}

void Logger::log_analysis_start(const AnalysisContext& ctx, const EconomicParameters& params) {
    const MachineProfile& existing = params.existing_machine();
    const MachineProfile& replacement = params.new_machine();

    std::map<std::string, std::string> fields;
    fields["event"] = "analysis_start";
    fields["run_id"] = ctx.run_id;
    fields["phase"] = ctx.phase;
    fields["interest_rate"] = std::to_string(params.interest_rate());
    fields["horizon_years"] = std::to_string(params.horizon_years());
    fields["strategy_count"] = std::to_string(params.strategy_count());
    fields["new_purchase_cost"] = std::to_string(replacement.purchase_cost());
    if (existing.max_service_years()) {
        fields["existing_max_service_years"] = std::to_string(*existing.max_service_years());
    }

    log(LogLevel::INFO, "Starting replacement analysis", fields);
}

void Logger::log_strategy_evaluated(const AnalysisContext& ctx, const StrategyResult& strategy) {
    std::map<std::string, std::string> fields;
    fields["event"] = "strategy_evaluated";
    fields["run_id"] = ctx.run_id;
    fields["k"] = std::to_string(strategy.k);
    fields["present_worth_cost"] = std::to_string(strategy.present_worth_cost);
    fields["present_worth_of_costs"] = std::to_string(strategy.present_worth_of_costs);
    fields["present_worth_of_salvage"] = std::to_string(strategy.present_worth_of_salvage);

    log(LogLevel::DEBUG, "Strategy evaluated", fields);
}

void Logger::log_analysis_complete(const AnalysisContext& ctx, const EvaluationResult& result) {
    std::map<std::string, std::string> fields;
    fields["event"] = "analysis_complete";
    fields["run_id"] = ctx.run_id;
    fields["phase"] = ctx.phase;
    fields["strategies_evaluated"] = std::to_string(result.size());
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);
    if (!result.ranked.empty()) {
        fields["recommended_k"] = std::to_string(result.best().k);
        fields["recommended_pwc"] = std::to_string(result.best().present_worth_cost);
    }
    if (!result.warnings.empty()) {
        fields["warning_count"] = std::to_string(result.warnings.size());
    }

    log(LogLevel::INFO, "Analysis completed", fields);
}

void Logger::log_output_written(const AnalysisContext& ctx, const std::string& kind,
                                const std::string& path) {
    std::map<std::string, std::string> fields;
    fields["event"] = "output_written";
    fields["run_id"] = ctx.run_id;
    fields["kind"] = kind;
    fields["path"] = path;

    log(LogLevel::INFO, "Output written", fields);
}

void Logger::log_error(const AnalysisContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["run_id"] = ctx.run_id;
    fields["phase"] = ctx.phase;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Analysis error", fields);
}

void Logger::log_warning(const AnalysisContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["run_id"] = ctx.run_id;
    fields["phase"] = ctx.phase;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
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
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
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
    nlohmann::json line(fields);
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace optimach
