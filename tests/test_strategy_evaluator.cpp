#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>
#include "strategy_evaluator.hpp"
#include "errors.hpp"

using namespace optimach;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

EconomicParameters flat_parameters(double rate = 0.10, int horizon = 5) {
    MachineProfile existing(0.0, OperatingCostSchedule::constant(1000.0),
                            SalvageSchedule::from_values({2500.0, 2000.0, 1500.0, 1000.0, 500.0, 0.0}));
    MachineProfile replacement(4000.0, OperatingCostSchedule::constant(600.0),
                               SalvageSchedule::constant(1500.0));
    return EconomicParameters(existing, replacement, rate, horizon);
}

EconomicParameters gradient_parameters(double rate = 0.10) {
    MachineProfile existing(0.0, OperatingCostSchedule::gradient(9000.0, 2000.0),
                            SalvageSchedule::declining(6000.0, {2000.0}), 3);
    MachineProfile replacement(22000.0, OperatingCostSchedule::gradient(6000.0, 1000.0),
                               SalvageSchedule::declining(22000.0, {3000.0, 3000.0, 4000.0}));
    return EconomicParameters(existing, replacement, rate, 5);
}

// Both machines cost the same to run and are worth nothing
EconomicParameters indifferent_parameters() {
    MachineProfile existing(0.0, OperatingCostSchedule::constant(500.0), SalvageSchedule());
    MachineProfile replacement(0.0, OperatingCostSchedule::constant(500.0), SalvageSchedule());
    return EconomicParameters(existing, replacement, 0.10, 4);
}

// Salvage dwarfs every cost
EconomicParameters windfall_parameters() {
    MachineProfile existing(0.0, OperatingCostSchedule::constant(0.0),
                            SalvageSchedule::constant(10000.0));
    MachineProfile replacement(0.0, OperatingCostSchedule::constant(0.0), SalvageSchedule());
    return EconomicParameters(existing, replacement, 0.10, 3);
}

std::vector<int> ranked_keep_years(const EvaluationResult& result) {
    std::vector<int> ks;
    for (const auto& s : result.ranked) {
        ks.push_back(s.k);
    }
    return ks;
}

} // anonymous namespace

// ============================================================================
// Discounting Tests
// ============================================================================

TEST_CASE("discount_factor", "[discount]") {
    REQUIRE(discount_factor(0.10, 0) == 1.0);
    REQUIRE_THAT(discount_factor(0.10, 1), WithinRel(1.0 / 1.1, 1e-12));
    REQUIRE_THAT(discount_factor(0.10, 5), WithinRel(0.6209213230591549, 1e-12));
    REQUIRE(discount_factor(0.0, 7) == 1.0);
    REQUIRE(discount_factor(-0.05, 1) > 1.0);
}

TEST_CASE("present_value", "[discount]") {
    REQUIRE_THAT(present_value(1500.0, 0.10, 5), WithinAbs(931.3819845887323, 1e-9));
    REQUIRE(present_value(1500.0, 0.10, 0) == 1500.0);
}

// ============================================================================
// evaluate_strategy Tests
// ============================================================================

TEST_CASE("evaluate_strategy replace immediately", "[evaluator]") {
    auto result = evaluate_strategy(flat_parameters(), 0);

    REQUIRE(result.k == 0);
    REQUIRE(result.replaces_existing);
    REQUIRE(result.cashflows.size() == 6);

    double expected = 4000.0 - 2500.0 - 1500.0 / std::pow(1.1, 5);
    for (int t = 1; t <= 5; ++t) {
        expected += 600.0 / std::pow(1.1, t);
    }
    REQUIRE_THAT(result.present_worth_cost, WithinAbs(expected, 1e-6));
    REQUIRE_THAT(result.present_worth_cost, WithinAbs(2843.090077056336, 1e-6));
    REQUIRE(result.net_present_value == -result.present_worth_cost);
    REQUIRE(result.undiscounted_total == 3000.0);
}

TEST_CASE("evaluate_strategy components", "[evaluator]") {
    auto result = evaluate_strategy(flat_parameters(), 0);

    SECTION("PWC is discounted costs less discounted salvage") {
        REQUIRE_THAT(result.present_worth_cost,
                     WithinAbs(result.present_worth_of_costs - result.present_worth_of_salvage, 1e-9));
        REQUIRE_THAT(result.present_worth_of_salvage,
                     WithinAbs(2500.0 + 1500.0 / std::pow(1.1, 5), 1e-9));
    }

    SECTION("Entries carry their discount factors") {
        for (const auto& entry : result.cashflows) {
            REQUIRE_THAT(entry.discount_factor, WithinRel(discount_factor(0.10, entry.year), 1e-12));
            REQUIRE_THAT(entry.discounted_amount, WithinAbs(entry.amount * entry.discount_factor, 1e-9));
        }
    }
}

TEST_CASE("evaluate_strategy keep for the full horizon", "[evaluator]") {
    auto result = evaluate_strategy(flat_parameters(), 5);
    REQUIRE_FALSE(result.replaces_existing);
    REQUIRE_THAT(result.present_worth_cost, WithinAbs(3790.7867694084475, 1e-6));
}

TEST_CASE("evaluate_strategy rejects an out-of-range k", "[evaluator]") {
    REQUIRE_THROWS_AS(evaluate_strategy(flat_parameters(), 6), StrategyRangeError);
    REQUIRE_THROWS_AS(evaluate_strategy(gradient_parameters(), 4), StrategyRangeError);
}

// ============================================================================
// evaluate_strategies Tests
// ============================================================================

TEST_CASE("evaluate_strategies covers every keep duration", "[evaluator]") {
    auto result = evaluate_strategies(flat_parameters());

    REQUIRE(result.size() == 6);
    REQUIRE(result.interest_rate == 0.10);
    REQUIRE(result.horizon_years == 5);
    REQUIRE(result.execution_time_ms >= 0.0);

    auto ordered = result.by_keep_years();
    REQUIRE(ordered.size() == 6);
    for (int k = 0; k <= 5; ++k) {
        REQUIRE(ordered[k]->k == k);
        REQUIRE(result.strategy(k).k == k);
    }
}

TEST_CASE("evaluate_strategies ranking", "[evaluator]") {
    SECTION("Flat costs: replace immediately") {
        auto result = evaluate_strategies(flat_parameters());
        REQUIRE(result.best().k == 0);
        REQUIRE(ranked_keep_years(result) == std::vector<int>{0, 1, 5, 2, 3, 4});
        REQUIRE_THAT(result.strategy(1).present_worth_cost, WithinAbs(3524.9082588745177, 1e-6));
        REQUIRE_THAT(result.strategy(2).present_worth_cost, WithinAbs(4103.4206555687315, 1e-6));
        REQUIRE_THAT(result.strategy(3).present_worth_cost, WithinAbs(4591.775276154757, 1e-6));
        REQUIRE_THAT(result.strategy(4).present_worth_cost, WithinAbs(5001.5833493738, 1e-6));
    }

    SECTION("Rising costs: keep two years") {
        auto result = evaluate_strategies(gradient_parameters());
        REQUIRE(result.size() == 4);
        REQUIRE(result.best().k == 2);
        REQUIRE_THAT(result.best().present_worth_cost, WithinAbs(40606.95059329031, 1e-6));
        REQUIRE_THAT(result.strategy(0).present_worth_cost, WithinAbs(43122.83686534079, 1e-6));
        REQUIRE_THAT(result.strategy(1).present_worth_cost, WithinAbs(40848.364803695724, 1e-6));
        REQUIRE_THAT(result.strategy(3).present_worth_cost, WithinAbs(42078.53412894051, 1e-6));
        REQUIRE(ranked_keep_years(result) == std::vector<int>{2, 1, 3, 0});
    }

    SECTION("Ranked order is ascending PWC") {
        auto result = evaluate_strategies(gradient_parameters());
        for (size_t i = 1; i < result.ranked.size(); ++i) {
            REQUIRE(result.ranked[i - 1].present_worth_cost <= result.ranked[i].present_worth_cost);
        }
    }

    SECTION("Equal PWC prefers the smaller k") {
        auto result = evaluate_strategies(indifferent_parameters());
        REQUIRE(result.size() == 5);
        REQUIRE(ranked_keep_years(result) == std::vector<int>{0, 1, 2, 3, 4});
    }
}

TEST_CASE("evaluate_strategies with zero interest", "[evaluator]") {
    auto result = evaluate_strategies(flat_parameters(0.0));

    for (const auto& strategy : result.ranked) {
        REQUIRE(strategy.present_worth_cost == strategy.undiscounted_total);
    }
    REQUIRE(result.strategy(0).present_worth_cost == 3000.0);
    REQUIRE(result.strategy(5).present_worth_cost == 5000.0);
    REQUIRE(result.strategy(4).present_worth_cost == 6600.0);
}

TEST_CASE("evaluate_strategies is deterministic", "[evaluator]") {
    auto params = gradient_parameters();
    auto first = evaluate_strategies(params);
    auto second = evaluate_strategies(params);

    REQUIRE(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        REQUIRE(first.ranked[i].k == second.ranked[i].k);
        REQUIRE(first.ranked[i].present_worth_cost == second.ranked[i].present_worth_cost);
    }
}

TEST_CASE("evaluate_strategies warns about negative present worth cost", "[evaluator]") {
    auto result = evaluate_strategies(windfall_parameters());
    REQUIRE(result.best().present_worth_cost < 0.0);
    REQUIRE_FALSE(result.warnings.empty());
    REQUIRE(result.warnings.front().find("negative present worth cost") != std::string::npos);

    SECTION("No warnings for an ordinary analysis") {
        REQUIRE(evaluate_strategies(flat_parameters()).warnings.empty());
    }
}

TEST_CASE("evaluate_strategies without detailed cash flows", "[evaluator]") {
    EvaluationConfig config;
    config.detailed_cashflows = false;
    auto result = evaluate_strategies(gradient_parameters(), config);

    REQUIRE(result.best().cashflows.size() == 6);
    for (size_t i = 1; i < result.ranked.size(); ++i) {
        REQUIRE(result.ranked[i].cashflows.empty());
    }
    REQUIRE_THAT(result.best().present_worth_cost, WithinAbs(40606.95059329031, 1e-6));
}

TEST_CASE("evaluate_strategies rejects invalid parameters", "[evaluator]") {
    REQUIRE_THROWS_AS(evaluate_strategies(flat_parameters(0.10, 0)), ConfigurationError);
    REQUIRE_THROWS_AS(evaluate_strategies(flat_parameters(-1.0, 5)), ConfigurationError);
    // Existing salvage table only covers ages 0..5
    REQUIRE_THROWS_AS(evaluate_strategies(flat_parameters(0.10, 6)), ConfigurationError);
}

TEST_CASE("evaluate_strategies never ranks non-finite present worths", "[evaluator]") {
    MachineProfile existing(0.0, OperatingCostSchedule::constant(100.0), SalvageSchedule());
    MachineProfile replacement(0.0, OperatingCostSchedule::constant(0.0), SalvageSchedule::constant(1000.0));

    SECTION("Discount factor overflow is rejected before evaluation") {
        EconomicParameters params(existing, replacement, -0.9999, 100);
        REQUIRE_THROWS_AS(evaluate_strategies(params), ConfigurationError);
    }

    SECTION("Horizon beyond the cap is rejected") {
        EconomicParameters params(existing, replacement, -0.9, 400);
        REQUIRE_THROWS_AS(evaluate_strategies(params), ConfigurationError);
    }

    SECTION("Steep but representable discounting stays finite") {
        EconomicParameters params(existing, replacement, -0.9, 100);
        auto result = evaluate_strategies(params);
        REQUIRE(result.size() == 101);
        for (const auto& strategy : result.ranked) {
            REQUIRE(std::isfinite(strategy.present_worth_cost));
        }
        for (size_t i = 1; i < result.ranked.size(); ++i) {
            REQUIRE(result.ranked[i - 1].present_worth_cost <= result.ranked[i].present_worth_cost);
        }
    }
}

TEST_CASE("EvaluationResult accessors", "[evaluator]") {
    EvaluationResult empty;
    REQUIRE_THROWS_AS(empty.best(), std::runtime_error);

    auto result = evaluate_strategies(gradient_parameters());
    REQUIRE_THROWS_AS(result.strategy(4), StrategyRangeError);
}
