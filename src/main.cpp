#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "config_parser.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "strategy_evaluator.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/text_report.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace {

struct CLIArgs {
    std::string config_path;
    json overrides = json::object();    // Command-line values patched over the analysis file
    bool new_price_given = false;
    bool all_strategies = false;
    std::string format = "text";
    std::string output_path;
    std::string parquet_path;
    std::string log_level = "INFO";
    std::string log_file;
    bool log_text = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "OptiMach Machine Replacement Analyzer v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Compares keeping the existing machine for k years then replacing it\n";
    std::cerr << "(k = 0 .. horizon) by present worth cost. Without --config the sample\n";
    std::cerr << "problem below is analysed; flags override values from the config file.\n\n";
    std::cerr << "Analysis options:\n";
    std::cerr << "  --config <path>             JSON analysis file\n";
    std::cerr << "  --rate <i>                  Interest rate per year as a decimal (default: 0.10)\n";
    std::cerr << "  --horizon <years>           Planning horizon in years (default: 5)\n\n";
    std::cerr << "Existing machine:\n";
    std::cerr << "  --old-value <amount>        Current market value (default: 6000)\n";
    std::cerr << "  --old-depreciation <amount> Value lost per year (default: 2000)\n";
    std::cerr << "  --old-op-first <amount>     Operating cost in the first year (default: 9000)\n";
    std::cerr << "  --old-op-increase <amount>  Operating cost increase per year (default: 2000)\n";
    std::cerr << "  --old-max-years <years>     Years the machine can still be used (default: 3)\n\n";
    std::cerr << "New machine:\n";
    std::cerr << "  --new-price <amount>        Purchase price, also the starting salvage value\n";
    std::cerr << "                              (default: 22000)\n";
    std::cerr << "  --new-depreciation <list>   Depreciation per year, last value repeats\n";
    std::cerr << "                              (default: 3000,3000,4000)\n";
    std::cerr << "  --new-op-first <amount>     Operating cost in the first year (default: 6000)\n";
    std::cerr << "  --new-op-increase <amount>  Operating cost increase per year (default: 1000)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --format <text|json>        Report format (default: text)\n";
    std::cerr << "  --output <path>             Report file (default: stdout)\n";
    std::cerr << "  --all-strategies            Include cash flows of every strategy\n";
    std::cerr << "  --parquet <path>            Export all cash flows to Parquet\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log lines to a file\n";
    std::cerr << "  --log-text                  Plain-text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Sample problem at 8% with every strategy's cash flows:\n";
    std::cerr << "     " << program_name << " --rate 0.08 --all-strategies\n\n";
    std::cerr << "  2. Analysis file with JSON output:\n";
    std::cerr << "     " << program_name << " --config data/sample_analysis.json \\\n";
    std::cerr << "         --format json --output results.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

std::vector<double> parse_number_list(const std::string& text) {
    std::vector<double> values;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        values.push_back(std::stod(item));
    }
    if (values.empty()) {
        throw std::invalid_argument("empty list");
    }
    return values;
}

// Replace a schedule form in the overrides; null removes competing forms
// from the analysis file when the patch is merged
void set_schedule(json& schedule, const std::string& key, const json& value,
                  const std::vector<std::string>& competing) {
    schedule[key] = value;
    for (const std::string& other : competing) {
        if (!schedule.contains(other)) {
            schedule[other] = nullptr;
        }
    }
}

void set_operating_cost(json& machine, const std::string& key, double value) {
    set_schedule(machine["operating_cost"], key, value, {"constant", "values", "csv"});
}

void set_salvage(json& machine, const std::string& key, const json& value) {
    set_schedule(machine["salvage"], key, value, {"constant", "values", "csv"});
}

// Base value of the schedule the analysis file already gives: a plain number,
// the constant, or the first table entry. Empty for CSV schedules.
std::optional<double> schedule_base(const json& schedule) {
    if (schedule.is_number()) {
        return schedule.get<double>();
    }
    if (!schedule.is_object()) {
        return std::nullopt;
    }
    auto constant = schedule.find("constant");
    if (constant != schedule.end() && constant->is_number()) {
        return constant->get<double>();
    }
    auto values = schedule.find("values");
    if (values != schedule.end() && values->is_array() && !values->empty() &&
        values->front().is_number()) {
        return values->front().get<double>();
    }
    return std::nullopt;
}

// An increase or depreciation flag on its own keeps the file's base value,
// so --new-op-increase 50 over a constant 600 gives 600, 650, 700, ...
void complete_schedule_override(const json& document, json& overrides,
                                const std::string& machine, const std::string& schedule_key,
                                const std::string& step_key, const std::string& base_key,
                                const std::string& step_flag, const std::string& base_flag) {
    if (!overrides.contains(machine) || !overrides[machine].contains(schedule_key)) {
        return;
    }
    json& patch = overrides[machine][schedule_key];
    if (!patch.contains(step_key) || patch.contains(base_key)) {
        return;
    }

    auto section = document.find(machine);
    if (section == document.end() || !section->is_object()) {
        throw optimach::ConfigParseError(step_flag + " requires " + base_flag +
                                         ": the analysis has no " + machine + " section");
    }
    auto current = section->find(schedule_key);
    if (current == section->end()) {
        // An absent salvage schedule is worth nothing at every age
        if (schedule_key == "salvage") {
            patch[base_key] = 0.0;
            return;
        }
        throw optimach::ConfigParseError(step_flag + " requires " + base_flag +
                                         ": " + machine + " has no " + schedule_key);
    }
    if (current->is_object() && current->contains(base_key)) {
        return;
    }

    std::optional<double> base = schedule_base(*current);
    if (!base) {
        throw optimach::ConfigParseError(step_flag + " requires " + base_flag + ": " + machine +
                                         "." + schedule_key + " has no single starting value");
    }
    patch[base_key] = *base;
}

void complete_overrides(const json& document, json& overrides) {
    complete_schedule_override(document, overrides, "existing_machine", "operating_cost",
                               "annual_increase", "first_year", "--old-op-increase", "--old-op-first");
    complete_schedule_override(document, overrides, "new_machine", "operating_cost",
                               "annual_increase", "first_year", "--new-op-increase", "--new-op-first");
    complete_schedule_override(document, overrides, "existing_machine", "salvage",
                               "depreciation", "initial_value", "--old-depreciation", "--old-value");
    complete_schedule_override(document, overrides, "new_machine", "salvage",
                               "depreciation", "initial_value", "--new-depreciation", "--new-price");
}

bool apply_option(const std::string& arg, const std::string& value, CLIArgs& args) {
    // Machine sections are created only when a machine option is used, a
    // null section would delete the machine from the analysis file
    auto existing = [&args]() -> json& { return args.overrides["existing_machine"]; };
    auto replacement = [&args]() -> json& { return args.overrides["new_machine"]; };

    if (arg == "--rate") {
        args.overrides["interest_rate"] = std::stod(value);
    } else if (arg == "--horizon") {
        args.overrides["horizon_years"] = std::stoi(value);
    } else if (arg == "--old-value") {
        set_salvage(existing(), "initial_value", std::stod(value));
    } else if (arg == "--old-depreciation") {
        set_salvage(existing(), "depreciation", json::array({std::stod(value)}));
    } else if (arg == "--old-op-first") {
        set_operating_cost(existing(), "first_year", std::stod(value));
    } else if (arg == "--old-op-increase") {
        set_operating_cost(existing(), "annual_increase", std::stod(value));
    } else if (arg == "--old-max-years") {
        existing()["max_service_years"] = std::stoi(value);
    } else if (arg == "--new-price") {
        replacement()["purchase_cost"] = std::stod(value);
        args.new_price_given = true;
    } else if (arg == "--new-depreciation") {
        set_salvage(replacement(), "depreciation", parse_number_list(value));
    } else if (arg == "--new-op-first") {
        set_operating_cost(replacement(), "first_year", std::stod(value));
    } else if (arg == "--new-op-increase") {
        set_operating_cost(replacement(), "annual_increase", std::stod(value));
    } else {
        return false;
    }
    return true;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--all-strategies") {
            args.all_strategies = true;
        } else if (arg == "--log-text") {
            args.log_text = true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            args.format = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--parquet" && i + 1 < argc) {
            args.parquet_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (i + 1 < argc && arg.rfind("--", 0) == 0) {
            std::string value = argv[i + 1];
            bool known = false;
            try {
                known = apply_option(arg, value, args);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid value for " << arg << ": " << value << "\n\n";
                return false;
            }
            if (!known) {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
            ++i;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Analysis config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (args.format != "text" && args.format != "json") {
        std::cerr << "Error: --format must be text or json\n";
        valid = false;
    }

    try {
        optimach::string_to_level(args.log_level);
    } catch (const std::invalid_argument&) {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

std::string run_id_for(const CLIArgs& args) {
    if (args.config_path.empty()) {
        return "cli";
    }
    size_t slash = args.config_path.find_last_of("/\\");
    return slash == std::string::npos ? args.config_path : args.config_path.substr(slash + 1);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    optimach::LoggerConfig log_config;
    log_config.min_level = optimach::string_to_level(args.log_level);
    log_config.enable_json = !args.log_text;
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    optimach::Logger& logger = optimach::Logger::get_instance();
    logger.configure(log_config);

    optimach::AnalysisContext ctx(run_id_for(args));

    try {
        // --- Load ---
        ctx.phase = "load";
        json document;
        std::string base_dir;
        if (args.config_path.empty()) {
            document = optimach::default_analysis_json();
        } else {
            document = optimach::load_json_file(args.config_path);
            size_t slash = args.config_path.find_last_of("/\\");
            if (slash != std::string::npos) {
                base_dir = args.config_path.substr(0, slash);
            }
            logger.log_config_loaded(ctx, args.config_path);
        }

        if (!document.is_object()) {
            throw optimach::ConfigParseError("Analysis config must be a JSON object");
        }
        complete_overrides(document, args.overrides);
        document.merge_patch(args.overrides);

        // The new machine's declining salvage starts from its purchase price
        if (args.new_price_given && document.contains("new_machine") &&
            document["new_machine"].contains("salvage") &&
            document["new_machine"]["salvage"].is_object() &&
            document["new_machine"]["salvage"].contains("initial_value")) {
            document["new_machine"]["salvage"]["initial_value"] =
                document["new_machine"]["purchase_cost"];
        }

        optimach::AnalysisConfig analysis = optimach::parse_analysis_config(document, base_dir);
        const bool all_strategies = args.all_strategies || analysis.all_strategies;

        // --- Evaluate ---
        ctx.phase = "evaluate";
        logger.log_analysis_start(ctx, analysis.parameters);

        optimach::EvaluationConfig eval_config;
        eval_config.detailed_cashflows = all_strategies || !args.parquet_path.empty();
        optimach::EvaluationResult result =
            optimach::evaluate_strategies(analysis.parameters, eval_config);

        for (const optimach::StrategyResult* strategy : result.by_keep_years()) {
            logger.log_strategy_evaluated(ctx, *strategy);
        }
        for (const std::string& warning : result.warnings) {
            logger.log_warning(ctx, warning);
        }
        logger.log_analysis_complete(ctx, result);

        // --- Report ---
        ctx.phase = "report";
        if (args.format == "json") {
            if (args.output_path.empty()) {
                optimach::io::write_evaluation_json(std::cout, result, all_strategies);
            } else {
                optimach::io::write_evaluation_json(args.output_path, result, all_strategies);
            }
        } else {
            if (args.output_path.empty()) {
                optimach::io::write_text_report(std::cout, result, all_strategies);
            } else {
                optimach::io::write_text_report(args.output_path, result, all_strategies);
            }
        }
        logger.log_output_written(ctx, args.format,
                                  args.output_path.empty() ? "stdout" : args.output_path);

        if (!args.parquet_path.empty()) {
            optimach::io::ParquetWriter::write_cashflows(result, args.parquet_path);
            logger.log_output_written(ctx, "parquet", args.parquet_path);
        }

        logger.flush();
        return 0;
    } catch (const optimach::ConfigurationError& e) {
        logger.log_error(ctx, e.what());
        std::cerr << "Error: Invalid analysis: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
