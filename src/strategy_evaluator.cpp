#include "strategy_evaluator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace optimach {

// ============================================================================
// StrategyResult / EvaluationResult Implementation
// ============================================================================

StrategyResult::StrategyResult()
    : k(0),
      replaces_existing(true),
      present_worth_cost(0.0),
      present_worth_of_costs(0.0),
      present_worth_of_salvage(0.0),
      undiscounted_total(0.0),
      net_present_value(0.0) {}

EvaluationResult::EvaluationResult()
    : interest_rate(EconomicParameters::DEFAULT_INTEREST_RATE),
      horizon_years(EconomicParameters::DEFAULT_HORIZON_YEARS),
      execution_time_ms(0.0) {}

const StrategyResult& EvaluationResult::best() const {
    if (ranked.empty()) {
        throw std::runtime_error("EvaluationResult has no strategies");
    }
    return ranked.front();
}

const StrategyResult& EvaluationResult::strategy(int k) const {
    for (const StrategyResult& result : ranked) {
        if (result.k == k) {
            return result;
        }
    }
    throw StrategyRangeError("No evaluated strategy with k=" + std::to_string(k));
}

std::vector<const StrategyResult*> EvaluationResult::by_keep_years() const {
    std::vector<const StrategyResult*> ordered;
    ordered.reserve(ranked.size());
    for (const StrategyResult& result : ranked) {
        ordered.push_back(&result);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const StrategyResult* a, const StrategyResult* b) { return a->k < b->k; });
    return ordered;
}

EvaluationConfig::EvaluationConfig() : detailed_cashflows(true) {}

// ============================================================================
// Discounting
// ============================================================================

double discount_factor(double rate, int year) {
    return 1.0 / std::pow(1.0 + rate, year);
}

double present_value(double amount, double rate, int year) {
    return amount * discount_factor(rate, year);
}

namespace {

StrategyResult discount_strategy(std::vector<CashFlowEntry>&& flows, double rate, int k, int horizon) {
    StrategyResult result;
    result.k = k;
    result.replaces_existing = k < horizon;

    for (CashFlowEntry& entry : flows) {
        entry.discount_factor = discount_factor(rate, entry.year);
        entry.discounted_amount = entry.amount * entry.discount_factor;

        result.present_worth_cost += entry.discounted_amount;
        result.present_worth_of_costs += entry.costs() * entry.discount_factor;
        result.present_worth_of_salvage -= entry.salvage_recovery * entry.discount_factor;
        result.undiscounted_total += entry.amount;
    }
    result.net_present_value = -result.present_worth_cost;
    result.cashflows = std::move(flows);
    return result;
}

// Ascending PWC; equal PWC prefers the smaller k
bool ranks_before(const StrategyResult& a, const StrategyResult& b) {
    if (a.present_worth_cost != b.present_worth_cost) {
        return a.present_worth_cost < b.present_worth_cost;
    }
    return a.k < b.k;
}

} // anonymous namespace

// ============================================================================
// Evaluation Implementation
// ============================================================================

StrategyResult evaluate_strategy(const EconomicParameters& params, int k) {
    return discount_strategy(build_cash_flows(params, k), params.interest_rate(), k,
                             params.horizon_years());
}

EvaluationResult evaluate_strategies(const EconomicParameters& params, const EvaluationConfig& config) {
    auto start_time = std::chrono::high_resolution_clock::now();

    // Reject the whole analysis before building any strategy
    params.validate();

    EvaluationResult result;
    result.interest_rate = params.interest_rate();
    result.horizon_years = params.horizon_years();

    const int max_k = params.max_keep_years();
    result.ranked.reserve(static_cast<size_t>(max_k) + 1);
    for (int k = 0; k <= max_k; ++k) {
        result.ranked.push_back(evaluate_strategy(params, k));
    }

    std::sort(result.ranked.begin(), result.ranked.end(), ranks_before);

    for (const StrategyResult& strategy : result.ranked) {
        if (strategy.present_worth_cost < 0.0) {
            std::ostringstream oss;
            oss << "Strategy k=" << strategy.k << " has a negative present worth cost ("
                << strategy.present_worth_cost
                << "); check salvage values against purchase and operating costs";
            result.warnings.push_back(oss.str());
        }
    }

    if (!config.detailed_cashflows) {
        for (size_t i = 1; i < result.ranked.size(); ++i) {
            result.ranked[i].cashflows.clear();
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    return result;
}

} // namespace optimach
