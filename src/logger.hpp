/**
 * @file logger.hpp
 * @brief Structured logging for the replacement analysis CLI
 *
 * The Logger provides structured logging with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text lines
 * - Analysis context (run identifier, phase)
 * - Output to stderr and/or an append-mode log file
 *
 * Writes are serialised, so concurrent analyses may share the instance.
 */

#ifndef OPTIMACH_LOGGER_HPP
#define OPTIMACH_LOGGER_HPP

#include "economic_parameters.hpp"
#include "strategy_evaluator.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace optimach {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-strategy detail
    INFO,    ///< Analysis start/end, configuration loaded, output written
    WARN,    ///< Evaluation warnings, questionable inputs
    ERROR    ///< Rejected analyses and I/O failures
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
 *
 * @throws std::invalid_argument for an unknown level name
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Context attached to every analysis event
 */
struct AnalysisContext {
    std::string run_id;     ///< Identifier of the analysis run (config file name or "cli")
    std::string phase;      ///< Current phase (load, evaluate, report)

    AnalysisContext() : run_id("cli"), phase("") {}

    explicit AnalysisContext(const std::string& id) : run_id(id), phase("") {}
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
          log_file_path("optimach.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   AnalysisContext ctx("plant_a.json");
 *   logger.log_analysis_start(ctx, params);
 *   EvaluationResult result = evaluate_strategies(params);
 *   logger.log_analysis_complete(ctx, result);
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
     *
     * Opens the log file when file output is enabled. A file that cannot be
     * opened is reported on stderr and file output stays off.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log an analysis file that was loaded
     */
    void log_config_loaded(const AnalysisContext& ctx, const std::string& config_path);

    /**
     * @brief Log the parameters an analysis is about to evaluate
     */
    void log_analysis_start(const AnalysisContext& ctx, const EconomicParameters& params);

    /**
     * @brief Log one evaluated strategy (DEBUG)
     */
    void log_strategy_evaluated(const AnalysisContext& ctx, const StrategyResult& strategy);

    /**
     * @brief Log the recommendation and timing of a finished analysis
     */
    void log_analysis_complete(const AnalysisContext& ctx, const EvaluationResult& result);

    /**
     * @brief Log a report or export that was written
     *
     * @param kind Output kind ("json", "text", "parquet")
     * @param path Destination, or "stdout"
     */
    void log_output_written(const AnalysisContext& ctx, const std::string& kind,
                            const std::string& path);

    /**
     * @brief Log error with context
     */
    void log_error(const AnalysisContext& ctx, const std::string& error_message);

    /**
     * @brief Log warning message
     */
    void log_warning(const AnalysisContext& ctx, const std::string& warning_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    void write_output(const std::string& output);
};

} // namespace optimach

#endif // OPTIMACH_LOGGER_HPP
