#include "config_parser.hpp"
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace optimach {

namespace {

// Exactly one of the given keys must be present in node
std::string select_form(const json& node, const std::string& label,
                        std::initializer_list<const char*> keys) {
    std::string selected;
    std::string names;
    for (const char* key : keys) {
        if (!names.empty()) names += ", ";
        names += key;
        if (node.contains(key)) {
            if (!selected.empty()) {
                throw ConfigParseError(label + " sets both '" + selected + "' and '" + key + "'");
            }
            selected = key;
        }
    }
    if (selected.empty()) {
        throw ConfigParseError(label + " must set one of: " + names);
    }
    return selected;
}

std::vector<double> number_list(const json& node) {
    if (node.is_number()) {
        return {node.get<double>()};
    }
    return node.get<std::vector<double>>();
}

OperatingCostSchedule parse_operating_cost(const json& node, const std::string& label,
                                           const std::string& base_dir) {
    if (node.is_number()) {
        return OperatingCostSchedule::constant(node.get<double>());
    }
    if (!node.is_object()) {
        throw ConfigParseError(label + " must be a number or an object");
    }

    std::string form = select_form(node, label, {"constant", "first_year", "values", "csv"});
    if (form == "constant") {
        return OperatingCostSchedule::constant(node["constant"].get<double>());
    }
    if (form == "first_year") {
        double increase = node.value("annual_increase", 0.0);
        return OperatingCostSchedule::gradient(node["first_year"].get<double>(), increase);
    }
    if (form == "values") {
        return OperatingCostSchedule::from_values(node["values"].get<std::vector<double>>());
    }
    return OperatingCostSchedule::load_from_csv(
        resolve_relative_path(node["csv"].get<std::string>(), base_dir));
}

SalvageSchedule parse_salvage(const json& node, const std::string& label,
                              const std::string& base_dir) {
    if (node.is_number()) {
        return SalvageSchedule::constant(node.get<double>());
    }
    if (!node.is_object()) {
        throw ConfigParseError(label + " must be a number or an object");
    }

    std::string form = select_form(node, label, {"constant", "initial_value", "values", "csv"});
    if (form == "constant") {
        return SalvageSchedule::constant(node["constant"].get<double>());
    }
    if (form == "initial_value") {
        std::vector<double> depreciation;
        if (node.contains("depreciation")) {
            depreciation = number_list(node["depreciation"]);
        }
        return SalvageSchedule::declining(node["initial_value"].get<double>(), std::move(depreciation));
    }
    if (form == "values") {
        return SalvageSchedule::from_values(node["values"].get<std::vector<double>>());
    }
    return SalvageSchedule::load_from_csv(
        resolve_relative_path(node["csv"].get<std::string>(), base_dir));
}

MachineProfile parse_machine(const json& document, const std::string& key,
                             const std::string& base_dir) {
    if (!document.contains(key)) {
        throw ConfigParseError("Missing required field: " + key);
    }
    const json& node = document[key];
    if (!node.is_object()) {
        throw ConfigParseError("Field '" + key + "' must be an object");
    }
    if (!node.contains("operating_cost")) {
        throw ConfigParseError(key + " missing required field: operating_cost");
    }

    double purchase_cost = node.value("purchase_cost", 0.0);

    std::optional<int> max_service_years;
    if (node.contains("max_service_years") && !node["max_service_years"].is_null()) {
        if (!node["max_service_years"].is_number_integer()) {
            throw ConfigParseError(key + ".max_service_years must be an integer");
        }
        max_service_years = node["max_service_years"].get<int>();
    }

    OperatingCostSchedule operating_cost =
        parse_operating_cost(node["operating_cost"], key + ".operating_cost", base_dir);

    SalvageSchedule salvage;
    if (node.contains("salvage")) {
        salvage = parse_salvage(node["salvage"], key + ".salvage", base_dir);
    }

    return MachineProfile(purchase_cost, std::move(operating_cost), std::move(salvage),
                          max_service_years);
}

} // anonymous namespace

json default_analysis_json() {
    return json{
        {"interest_rate", EconomicParameters::DEFAULT_INTEREST_RATE},
        {"horizon_years", EconomicParameters::DEFAULT_HORIZON_YEARS},
        {"existing_machine", {
            {"purchase_cost", 0.0},
            {"max_service_years", 3},
            {"operating_cost", {{"first_year", 9000.0}, {"annual_increase", 2000.0}}},
            {"salvage", {{"initial_value", 6000.0}, {"depreciation", json::array({2000.0})}}}
        }},
        {"new_machine", {
            {"purchase_cost", 22000.0},
            {"operating_cost", {{"first_year", 6000.0}, {"annual_increase", 1000.0}}},
            {"salvage", {{"initial_value", 22000.0},
                         {"depreciation", json::array({3000.0, 3000.0, 4000.0})}}}
        }},
        {"report", {{"all_strategies", false}}}
    };
}

std::string resolve_relative_path(const std::string& path, const std::string& base_dir) {
    fs::path p(path);

    if (p.is_absolute() || base_dir.empty()) {
        return path;
    }

    fs::path resolved = fs::path(base_dir) / p;
    return resolved.string();
}

json load_json_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open analysis config: " + file_path);
    }

    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigParseError("Failed to parse JSON in " + file_path + ": " + std::string(e.what()));
    }
}

AnalysisConfig parse_analysis_config(const json& document, const std::string& base_dir) {
    if (!document.is_object()) {
        throw ConfigParseError("Analysis config must be a JSON object");
    }

    try {
        double interest_rate = document.value("interest_rate", EconomicParameters::DEFAULT_INTEREST_RATE);

        int horizon_years = EconomicParameters::DEFAULT_HORIZON_YEARS;
        if (document.contains("horizon_years")) {
            if (!document["horizon_years"].is_number_integer()) {
                throw ConfigParseError("horizon_years must be an integer");
            }
            horizon_years = document["horizon_years"].get<int>();
        }

        MachineProfile existing = parse_machine(document, "existing_machine", base_dir);
        MachineProfile replacement = parse_machine(document, "new_machine", base_dir);

        AnalysisConfig config(EconomicParameters(std::move(existing), std::move(replacement),
                                                 interest_rate, horizon_years));

        if (document.contains("report")) {
            config.all_strategies = document["report"].value("all_strategies", false);
        }

        config.parameters.validate();
        return config;
    } catch (const json::exception& e) {
        throw ConfigParseError("Invalid analysis config: " + std::string(e.what()));
    }
}

AnalysisConfig parse_analysis_config_from_file(const std::string& file_path) {
    json document = load_json_file(file_path);
    return parse_analysis_config(document, fs::path(file_path).parent_path().string());
}

AnalysisConfig parse_analysis_config_from_string(const std::string& json_string,
                                                 const std::string& base_dir) {
    json document;
    try {
        document = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError("Failed to parse JSON: " + std::string(e.what()));
    }
    return parse_analysis_config(document, base_dir);
}

} // namespace optimach
