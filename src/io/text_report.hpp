#ifndef OPTIMACH_IO_TEXT_REPORT_HPP
#define OPTIMACH_IO_TEXT_REPORT_HPP

#include <ostream>
#include <string>
#include "../strategy_evaluator.hpp"

namespace optimach {
namespace io {

// "$40,606.95", "-$1,500.00"
std::string format_currency(double amount);

// 0.1 -> "10.0%"
std::string format_percent(double rate);

// Short label for strategy k, e.g. "keep 2 year(s), then replace"
std::string describe_strategy(int k, int horizon_years);

// Decision sentence for the top-ranked strategy
std::string recommendation_statement(const EvaluationResult& result);

// Ranked table: rank, k, PWC, NPV, discounted costs, discounted salvage
void write_summary_table(std::ostream& os, const EvaluationResult& result);

// Year-by-year table: components, net cash flow, discount factor, present value
void write_cashflow_table(std::ostream& os, const StrategyResult& strategy);

// Full report: summary, best strategy detail, optionally every strategy's
// detail, warnings and the recommendation
void write_text_report(std::ostream& os, const EvaluationResult& result, bool all_strategies = false);
void write_text_report(const std::string& filepath, const EvaluationResult& result,
                       bool all_strategies = false);

} // namespace io
} // namespace optimach

#endif // OPTIMACH_IO_TEXT_REPORT_HPP
