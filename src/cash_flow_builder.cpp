#include "cash_flow_builder.hpp"
#include "errors.hpp"

namespace optimach {

CashFlowEntry::CashFlowEntry() : CashFlowEntry(0) {}

CashFlowEntry::CashFlowEntry(int year_value)
    : year(year_value),
      existing_operating_cost(0.0),
      new_operating_cost(0.0),
      purchase_cost(0.0),
      salvage_recovery(0.0),
      amount(0.0),
      discount_factor(1.0),
      discounted_amount(0.0) {}

namespace {

void check_keep_years(const EconomicParameters& params, int k) {
    const int horizon = params.horizon_years();
    if (k < 0 || k > horizon) {
        throw StrategyRangeError("Keep duration k=" + std::to_string(k) +
                                 " outside [0, " + std::to_string(horizon) + "]");
    }
    if (k > params.max_keep_years()) {
        throw StrategyRangeError("Keep duration k=" + std::to_string(k) +
                                 " exceeds the existing machine's remaining service of " +
                                 std::to_string(params.max_keep_years()) + " years");
    }
}

void add_salvage(CashFlowEntry& entry, double value) {
    // Skip zero so a worthless machine does not leave -0.0 behind
    if (value > 0.0) {
        entry.salvage_recovery -= value;
    }
}

} // anonymous namespace

std::vector<CashFlowEntry> build_cash_flows(const EconomicParameters& params, int k) {
    params.validate();
    check_keep_years(params, k);

    const int horizon = params.horizon_years();
    const MachineProfile& existing = params.existing_machine();
    const MachineProfile& replacement = params.new_machine();

    std::vector<CashFlowEntry> flows;
    flows.reserve(static_cast<size_t>(horizon) + 1);
    for (int t = 0; t <= horizon; ++t) {
        flows.emplace_back(t);
    }

    flows[0].purchase_cost += existing.purchase_cost();

    // --- Existing machine in service for years 1..k ---
    for (int year = 1; year <= k; ++year) {
        flows[year].existing_operating_cost = existing.operating_cost(year);
    }

    if (k < horizon) {
        // Transition at t = k: sell the existing machine, buy the new one
        add_salvage(flows[k], existing.salvage_value(k));
        flows[k].purchase_cost += replacement.purchase_cost();

        for (int t = k + 1; t <= horizon; ++t) {
            flows[t].new_operating_cost = replacement.operating_cost(t - k);
        }

        add_salvage(flows[horizon], replacement.salvage_value(horizon - k));
    } else {
        // Never replaced: the existing machine is disposed of at the horizon
        add_salvage(flows[horizon], existing.salvage_value(horizon));
    }

    for (CashFlowEntry& entry : flows) {
        entry.amount = entry.costs() + entry.salvage_recovery;
        entry.discounted_amount = entry.amount;
    }

    return flows;
}

} // namespace optimach
