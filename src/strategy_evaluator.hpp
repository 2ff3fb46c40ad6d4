#ifndef OPTIMACH_STRATEGY_EVALUATOR_HPP
#define OPTIMACH_STRATEGY_EVALUATOR_HPP

#include "cash_flow_builder.hpp"
#include "economic_parameters.hpp"
#include <string>
#include <vector>

namespace optimach {

// Present-worth result of one keep-then-replace strategy
struct StrategyResult {
    int k;                                  // Years the existing machine is kept
    bool replaces_existing;                 // False when k == horizon
    std::vector<CashFlowEntry> cashflows;   // Discounted flows for years 0..horizon

    double present_worth_cost;              // PWC: discounted costs less discounted salvage
    double present_worth_of_costs;          // Discounted costs only
    double present_worth_of_salvage;        // Discounted salvage recovered (>= 0)
    double undiscounted_total;              // Plain sum of net cash flows
    double net_present_value;               // Signed, inflows positive: -PWC

    StrategyResult();
};

// Result of evaluating every feasible strategy for one parameter set
struct EvaluationResult {
    std::vector<StrategyResult> ranked;     // Ascending PWC, ties by smaller k
    double interest_rate;
    int horizon_years;
    std::vector<std::string> warnings;      // Unexpected outcomes worth a review
    double execution_time_ms;

    EvaluationResult();

    // Recommended strategy (first ranked); throws std::runtime_error if empty
    const StrategyResult& best() const;

    // Result for a given k; throws StrategyRangeError if k was not evaluated
    const StrategyResult& strategy(int k) const;

    // Results ordered by k, for per-strategy tables
    std::vector<const StrategyResult*> by_keep_years() const;

    size_t size() const { return ranked.size(); }
};

// Configuration options for evaluation
struct EvaluationConfig {
    bool detailed_cashflows;    // If false, only the best strategy keeps its cash flows

    EvaluationConfig();
};

// 1 / (1 + rate)^year
double discount_factor(double rate, int year);

// amount x discount_factor(rate, year)
double present_value(double amount, double rate, int year);

// Build and discount a single strategy
StrategyResult evaluate_strategy(const EconomicParameters& params, int k);

// Evaluate k = 0..max_keep_years() and rank by present worth cost.
// Parameters are validated first; a ConfigurationError means no strategy
// was built.
EvaluationResult evaluate_strategies(
    const EconomicParameters& params,
    const EvaluationConfig& config = EvaluationConfig()
);

} // namespace optimach

#endif // OPTIMACH_STRATEGY_EVALUATOR_HPP
