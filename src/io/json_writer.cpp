#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace optimach {
namespace io {

namespace {

// Quoted JSON string literal
std::string quote(const std::string& str) {
    return nlohmann::json(str).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void write_cashflows(std::ostream& os, const StrategyResult& strategy,
                     const std::string& indent, const std::string& newline,
                     const std::string& space) {
    os << "[";
    for (size_t i = 0; i < strategy.cashflows.size(); ++i) {
        const CashFlowEntry& cf = strategy.cashflows[i];
        os << (i > 0 ? "," : "") << newline << indent;
        os << "{\"year\":" << space << cf.year
           << "," << space << "\"existing_operating_cost\":" << space << cf.existing_operating_cost
           << "," << space << "\"new_operating_cost\":" << space << cf.new_operating_cost
           << "," << space << "\"purchase_cost\":" << space << cf.purchase_cost
           << "," << space << "\"salvage_recovery\":" << space << cf.salvage_recovery
           << "," << space << "\"amount\":" << space << cf.amount
           << "," << space << "\"discount_factor\":" << space << cf.discount_factor
           << "," << space << "\"discounted_amount\":" << space << cf.discounted_amount << "}";
    }
    if (!strategy.cashflows.empty()) {
        os << newline << indent.substr(0, indent.size() >= 2 ? indent.size() - 2 : 0);
    }
    os << "]";
}

} // anonymous namespace

void write_evaluation_json(std::ostream& os, const EvaluationResult& result,
                           bool all_strategies, bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";

    const StrategyResult& best = result.best();

    os << std::fixed << std::setprecision(6);

    os << "{" << newline;
    os << indent << "\"interest_rate\":" << space << result.interest_rate << "," << newline;
    os << indent << "\"horizon_years\":" << space << result.horizon_years << "," << newline;

    // Recommendation
    os << indent << "\"recommended\":" << space << "{" << newline;
    os << indent << indent << "\"k\":" << space << best.k << "," << newline;
    os << indent << indent << "\"replaces_existing\":" << space
       << (best.replaces_existing ? "true" : "false") << "," << newline;
    os << indent << indent << "\"present_worth_cost\":" << space << best.present_worth_cost << "," << newline;
    os << indent << indent << "\"net_present_value\":" << space << best.net_present_value << newline;
    os << indent << "}," << newline;

    // Ranked summary
    os << indent << "\"summary\":" << space << "[";
    for (size_t i = 0; i < result.ranked.size(); ++i) {
        const StrategyResult& s = result.ranked[i];
        os << (i > 0 ? "," : "") << newline << indent << indent;
        os << "{\"rank\":" << space << (i + 1)
           << "," << space << "\"k\":" << space << s.k
           << "," << space << "\"present_worth_cost\":" << space << s.present_worth_cost
           << "," << space << "\"net_present_value\":" << space << s.net_present_value
           << "," << space << "\"present_worth_of_costs\":" << space << s.present_worth_of_costs
           << "," << space << "\"present_worth_of_salvage\":" << space << s.present_worth_of_salvage
           << "," << space << "\"undiscounted_total\":" << space << s.undiscounted_total << "}";
    }
    os << newline << indent << "]," << newline;

    // Cash flow detail
    os << indent << "\"strategies\":" << space << "[";
    std::vector<const StrategyResult*> detailed;
    if (all_strategies) {
        detailed = result.by_keep_years();
    } else {
        detailed.push_back(&best);
    }
    const std::string flow_indent = indent + indent + indent;
    for (size_t i = 0; i < detailed.size(); ++i) {
        os << (i > 0 ? "," : "") << newline << indent << indent;
        os << "{\"k\":" << space << detailed[i]->k << "," << space << "\"cashflows\":" << space;
        write_cashflows(os, *detailed[i], flow_indent, newline, space);
        os << "}";
    }
    os << newline << indent << "]," << newline;

    // Warnings
    os << indent << "\"warnings\":" << space << "[";
    for (size_t i = 0; i < result.warnings.size(); ++i) {
        os << (i > 0 ? "," + space : "") << quote(result.warnings[i]);
    }
    os << "]," << newline;

    os << indent << "\"execution_time_ms\":" << space << std::setprecision(3)
       << result.execution_time_ms << newline;
    os << "}" << newline;
}

void write_evaluation_json(const std::string& filepath, const EvaluationResult& result,
                           bool all_strategies, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_evaluation_json(file, result, all_strategies, pretty_print);
}

} // namespace io
} // namespace optimach
