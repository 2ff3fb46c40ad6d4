#ifndef OPTIMACH_CASH_FLOW_BUILDER_HPP
#define OPTIMACH_CASH_FLOW_BUILDER_HPP

#include "economic_parameters.hpp"
#include <vector>

namespace optimach {

// Cash flows recognised at one point in time (t = year)
// Sign convention: costs positive, salvage recovery negative
struct CashFlowEntry {
    int year;                           // t, 0 = now
    double existing_operating_cost;     // Existing machine, service year t
    double new_operating_cost;          // New machine, service year t - k
    double purchase_cost;               // Purchase outlay
    double salvage_recovery;            // Salvage received (<= 0)
    double amount;                      // Net of all components
    double discount_factor;             // 1 / (1 + i)^t, 1.0 until discounted
    double discounted_amount;           // amount x discount_factor

    double costs() const { return existing_operating_cost + new_operating_cost + purchase_cost; }

    CashFlowEntry();
    explicit CashFlowEntry(int year_value);
};

// Build the cash flows of strategy k: keep the existing machine k years,
// then replace it for the rest of the horizon.
//
// Returns one entry per year 0..horizon, in year order.
//
// Timing (same for every k):
// - Service year y runs from t = y-1 to t = y; its operating cost is at t = y
// - Existing machine operating costs at t = 1..k
// - At t = k (k < horizon): existing salvage at age k, new purchase
// - New machine operating costs at t = k+1..horizon
// - At t = horizon: new salvage at age horizon-k, or the existing salvage at
//   age horizon when the machine is never replaced
// - A non-zero existing purchase cost is recognised at t = 0
//
// Throws ConfigurationError for invalid parameters and StrategyRangeError for
// k outside [0, max_keep_years()].
std::vector<CashFlowEntry> build_cash_flows(const EconomicParameters& params, int k);

} // namespace optimach

#endif // OPTIMACH_CASH_FLOW_BUILDER_HPP
