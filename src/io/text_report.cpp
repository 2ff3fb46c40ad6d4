#include "text_report.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace optimach {
namespace io {

std::string format_currency(double amount) {
    long long cents = std::llround(std::fabs(amount) * 100.0);
    std::string digits = std::to_string(cents / 100);

    std::string grouped;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && (digits.size() - i) % 3 == 0) {
            grouped += ',';
        }
        grouped += digits[i];
    }

    std::ostringstream oss;
    if (cents != 0 && amount < 0.0) {
        oss << "-";
    }
    oss << "$" << grouped << "." << std::setw(2) << std::setfill('0') << (cents % 100);
    return oss.str();
}

std::string format_percent(double rate) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << rate * 100.0 << "%";
    return oss.str();
}

std::string describe_strategy(int k, int horizon_years) {
    if (k == 0) {
        return "replace immediately";
    }
    if (k >= horizon_years) {
        return "keep for the full horizon";
    }
    return "keep " + std::to_string(k) + " year(s), then replace";
}

std::string recommendation_statement(const EvaluationResult& result) {
    const StrategyResult& best = result.best();

    std::ostringstream oss;
    oss << "At an interest rate of " << format_percent(result.interest_rate) << ", ";
    if (best.k == 0) {
        oss << "sell the existing machine now and purchase a new one immediately.";
    } else if (!best.replaces_existing) {
        oss << "keep the existing machine for the full " << result.horizon_years
            << "-year horizon without replacement.";
    } else {
        oss << "keep the existing machine for " << best.k << " year(s) and purchase a new machine "
            << "at the beginning of year " << (best.k + 1) << ".";
    }
    oss << " (Present Worth Cost = " << format_currency(best.present_worth_cost) << ".)";
    return oss.str();
}

void write_summary_table(std::ostream& os, const EvaluationResult& result) {
    os << std::fixed << std::setprecision(2);
    os << std::setw(5) << "Rank" << std::setw(4) << "k"
       << std::setw(16) << "PWC" << std::setw(16) << "NPV"
       << std::setw(16) << "PW costs" << std::setw(16) << "PW salvage"
       << "  Strategy\n";

    for (size_t i = 0; i < result.ranked.size(); ++i) {
        const StrategyResult& s = result.ranked[i];
        os << std::setw(5) << (i + 1) << std::setw(4) << s.k
           << std::setw(16) << s.present_worth_cost
           << std::setw(16) << s.net_present_value
           << std::setw(16) << s.present_worth_of_costs
           << std::setw(16) << s.present_worth_of_salvage
           << "  " << describe_strategy(s.k, result.horizon_years) << "\n";
    }
}

void write_cashflow_table(std::ostream& os, const StrategyResult& strategy) {
    os << std::fixed << std::setprecision(2);
    os << std::setw(5) << "Year"
       << std::setw(14) << "Existing op" << std::setw(14) << "New op"
       << std::setw(14) << "Purchase" << std::setw(14) << "Salvage"
       << std::setw(14) << "Cash flow" << std::setw(10) << "Factor"
       << std::setw(14) << "Present value" << "\n";

    for (const CashFlowEntry& cf : strategy.cashflows) {
        os << std::setw(5) << cf.year
           << std::setw(14) << cf.existing_operating_cost
           << std::setw(14) << cf.new_operating_cost
           << std::setw(14) << cf.purchase_cost
           << std::setw(14) << cf.salvage_recovery
           << std::setw(14) << cf.amount
           << std::setw(10) << std::setprecision(4) << cf.discount_factor << std::setprecision(2)
           << std::setw(14) << cf.discounted_amount << "\n";
    }
    os << std::setw(5) << "Total" << std::setw(70) << strategy.undiscounted_total
       << std::setw(24) << strategy.present_worth_cost << "\n";
}

void write_text_report(std::ostream& os, const EvaluationResult& result, bool all_strategies) {
    const StrategyResult& best = result.best();

    os << "Machine Replacement Analysis\n";
    os << "Interest rate: " << format_percent(result.interest_rate)
       << "   Horizon: " << result.horizon_years << " years\n";
    os << "Costs are positive, salvage recovered is negative.\n\n";

    os << "Summary: Present Worth Cost by Strategy (lower is better)\n";
    write_summary_table(os, result);

    os << "\nDetailed Cash Flows: Best Strategy (k = " << best.k << ", "
       << describe_strategy(best.k, result.horizon_years) << ")\n";
    write_cashflow_table(os, best);

    if (all_strategies) {
        for (const StrategyResult* strategy : result.by_keep_years()) {
            if (strategy->cashflows.empty()) {
                continue;
            }
            os << "\nStrategy k = " << strategy->k << " ("
               << describe_strategy(strategy->k, result.horizon_years) << ")\n";
            write_cashflow_table(os, *strategy);
        }
    }

    if (!result.warnings.empty()) {
        os << "\nWarnings:\n";
        for (const std::string& warning : result.warnings) {
            os << "  - " << warning << "\n";
        }
    }

    os << "\nRecommendation: " << recommendation_statement(result) << "\n";
}

void write_text_report(const std::string& filepath, const EvaluationResult& result,
                       bool all_strategies) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_text_report(file, result, all_strategies);
}

} // namespace io
} // namespace optimach
