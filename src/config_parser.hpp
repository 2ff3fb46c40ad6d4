#ifndef OPTIMACH_CONFIG_PARSER_HPP
#define OPTIMACH_CONFIG_PARSER_HPP

#include "economic_parameters.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace optimach {

/**
 * @brief A parsed analysis file: parameters plus report options
 */
struct AnalysisConfig {
    EconomicParameters parameters;
    bool all_strategies;            ///< Report cash flows of every strategy

    explicit AnalysisConfig(EconomicParameters params)
        : parameters(std::move(params)), all_strategies(false) {}
};

/**
 * @brief The sample replacement problem used when no analysis file is given
 *
 * 10% interest over 5 years. Existing machine worth 6000 now, losing 2000 a
 * year, operating cost 9000 rising 2000 a year, usable 3 more years. New
 * machine 22000 with depreciation 3000, 3000, then 4000 a year, operating
 * cost 6000 rising 1000 a year.
 */
nlohmann::json default_analysis_json();

/**
 * @brief Reads a JSON document from file
 *
 * @throws ConfigParseError if the file cannot be read or is not valid JSON
 */
nlohmann::json load_json_file(const std::string& file_path);

/**
 * @brief Builds an analysis from a JSON document
 *
 * Missing interest_rate and horizon_years take the EconomicParameters
 * defaults. Both machine sections are required. CSV schedule paths are
 * resolved against base_dir.
 *
 * @throws ConfigParseError for missing or mistyped fields and unreadable CSVs
 * @throws ConfigurationError if the resulting parameters are invalid
 */
AnalysisConfig parse_analysis_config(const nlohmann::json& document, const std::string& base_dir = "");

/**
 * @brief Parses an analysis file; CSV paths are relative to the file
 */
AnalysisConfig parse_analysis_config_from_file(const std::string& file_path);

/**
 * @brief Parses an analysis from a JSON string
 */
AnalysisConfig parse_analysis_config_from_string(const std::string& json_string,
                                                 const std::string& base_dir = "");

/**
 * @brief Resolves a path relative to a base directory
 *
 * Absolute paths and an empty base_dir return the path unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& base_dir);

} // namespace optimach

#endif // OPTIMACH_CONFIG_PARSER_HPP
