#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include "config_parser.hpp"
#include "strategy_evaluator.hpp"

using namespace optimach;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;
using json = nlohmann::json;

#ifndef OPTIMACH_DATA_DIR
#define OPTIMACH_DATA_DIR "data"
#endif

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

const std::string DATA_DIR = OPTIMACH_DATA_DIR;

json minimal_document() {
    return json::parse(R"({
        "existing_machine": { "operating_cost": 1000 },
        "new_machine": { "purchase_cost": 4000, "operating_cost": 600 }
    })");
}

} // anonymous namespace

// ============================================================================
// Default Analysis
// ============================================================================

TEST_CASE("Default analysis parses to the sample problem", "[config]") {
    auto config = parse_analysis_config(default_analysis_json());
    const auto& params = config.parameters;

    REQUIRE(params.interest_rate() == 0.10);
    REQUIRE(params.horizon_years() == 5);
    REQUIRE(params.max_keep_years() == 3);
    REQUIRE(params.existing_machine().operating_cost(2) == 11000.0);
    REQUIRE(params.existing_machine().salvage_value(1) == 4000.0);
    REQUIRE(params.new_machine().purchase_cost() == 22000.0);
    REQUIRE(params.new_machine().salvage_value(4) == 8000.0);
    REQUIRE_FALSE(config.all_strategies);

    auto result = evaluate_strategies(params);
    REQUIRE(result.best().k == 2);
    REQUIRE_THAT(result.best().present_worth_cost, WithinAbs(40606.95059329031, 1e-6));
}

// ============================================================================
// Field Parsing
// ============================================================================

TEST_CASE("Missing economic fields take defaults", "[config]") {
    auto config = parse_analysis_config(minimal_document());
    REQUIRE(config.parameters.interest_rate() == EconomicParameters::DEFAULT_INTEREST_RATE);
    REQUIRE(config.parameters.horizon_years() == EconomicParameters::DEFAULT_HORIZON_YEARS);
    REQUIRE(config.parameters.existing_machine().salvage_value(3) == 0.0);
    REQUIRE_FALSE(config.parameters.existing_machine().max_service_years().has_value());
}

TEST_CASE("Schedule forms", "[config]") {
    json doc = minimal_document();

    SECTION("Constant object") {
        doc["new_machine"]["operating_cost"] = {{"constant", 750}};
        auto config = parse_analysis_config(doc);
        REQUIRE(config.parameters.new_machine().operating_cost(4) == 750.0);
    }

    SECTION("Gradient without an increase stays flat") {
        doc["new_machine"]["operating_cost"] = {{"first_year", 750}};
        auto config = parse_analysis_config(doc);
        REQUIRE(config.parameters.new_machine().operating_cost().kind() ==
                OperatingCostSchedule::Kind::Gradient);
        REQUIRE(config.parameters.new_machine().operating_cost(5) == 750.0);
    }

    SECTION("Explicit values") {
        doc["existing_machine"]["operating_cost"] = {{"values", {1000, 1200, 1400, 1600, 1800}}};
        doc["existing_machine"]["salvage"] = {{"values", {2500, 2000, 1500, 1000, 500, 0}}};
        auto config = parse_analysis_config(doc);
        REQUIRE(config.parameters.existing_machine().operating_cost(3) == 1400.0);
        REQUIRE(config.parameters.existing_machine().salvage_value(2) == 1500.0);
    }

    SECTION("Single depreciation amount as a number") {
        doc["new_machine"]["salvage"] = {{"initial_value", 4000}, {"depreciation", 500}};
        auto config = parse_analysis_config(doc);
        REQUIRE(config.parameters.new_machine().salvage_value(3) == 2500.0);
    }

    SECTION("Two forms at once are rejected") {
        doc["new_machine"]["operating_cost"] = {{"constant", 750}, {"values", {1, 2, 3, 4, 5}}};
        REQUIRE_THROWS_AS(parse_analysis_config(doc), ConfigParseError);
    }

    SECTION("No recognised form is rejected") {
        doc["new_machine"]["salvage"] = {{"amount", 750}};
        REQUIRE_THROWS_AS(parse_analysis_config(doc), ConfigParseError);
    }

    SECTION("Wrong schedule type is rejected") {
        doc["new_machine"]["operating_cost"] = "cheap";
        REQUIRE_THROWS_AS(parse_analysis_config(doc), ConfigParseError);
    }
}

TEST_CASE("Structural errors", "[config]") {
    SECTION("Not an object") {
        REQUIRE_THROWS_AS(parse_analysis_config(json::array()), ConfigParseError);
    }

    SECTION("Missing machine section") {
        json doc = minimal_document();
        doc.erase("new_machine");
        try {
            parse_analysis_config(doc);
            FAIL("Expected ConfigParseError");
        } catch (const ConfigParseError& e) {
            REQUIRE_THAT(e.what(), ContainsSubstring("new_machine"));
        }
    }

    SECTION("Missing operating cost") {
        json doc = minimal_document();
        doc["existing_machine"].erase("operating_cost");
        REQUIRE_THROWS_AS(parse_analysis_config(doc), ConfigParseError);
    }

    SECTION("Fractional horizon") {
        json doc = minimal_document();
        doc["horizon_years"] = 4.5;
        REQUIRE_THROWS_AS(parse_analysis_config(doc), ConfigParseError);
    }

    SECTION("Mistyped interest rate") {
        json doc = minimal_document();
        doc["interest_rate"] = "ten percent";
        REQUIRE_THROWS_AS(parse_analysis_config(doc), ConfigParseError);
    }

    SECTION("Malformed JSON string") {
        REQUIRE_THROWS_AS(parse_analysis_config_from_string("{ \"interest_rate\": "), ConfigParseError);
    }
}

TEST_CASE("Invalid values surface as ConfigurationError", "[config]") {
    json doc = minimal_document();

    SECTION("Zero horizon") {
        doc["horizon_years"] = 0;
        REQUIRE_THROWS_AS(parse_analysis_config(doc), ConfigurationError);
    }

    SECTION("Rate at -100%") {
        doc["interest_rate"] = -1.0;
        REQUIRE_THROWS_AS(parse_analysis_config(doc), ConfigurationError);
    }

    SECTION("Negative purchase cost") {
        doc["new_machine"]["purchase_cost"] = -10;
        REQUIRE_THROWS_AS(parse_analysis_config(doc), ConfigurationError);
    }

    SECTION("Table shorter than the horizon") {
        doc["new_machine"]["operating_cost"] = {{"values", {600, 600}}};
        REQUIRE_THROWS_AS(parse_analysis_config(doc), ConfigurationError);
    }
}

TEST_CASE("Report options", "[config]") {
    json doc = minimal_document();
    doc["report"] = {{"all_strategies", true}};
    REQUIRE(parse_analysis_config(doc).all_strategies);
}

TEST_CASE("Service limit", "[config]") {
    json doc = minimal_document();

    SECTION("Integer limit") {
        doc["existing_machine"]["max_service_years"] = 2;
        auto config = parse_analysis_config(doc);
        REQUIRE(config.parameters.strategy_count() == 3);
    }

    SECTION("Null means unlimited") {
        doc["existing_machine"]["max_service_years"] = nullptr;
        REQUIRE(parse_analysis_config(doc).parameters.strategy_count() == 6);
    }

    SECTION("Non-integer limit is rejected") {
        doc["existing_machine"]["max_service_years"] = 2.5;
        REQUIRE_THROWS_AS(parse_analysis_config(doc), ConfigParseError);
    }
}

// ============================================================================
// Files
// ============================================================================

TEST_CASE("Sample analysis file", "[config][file]") {
    auto config = parse_analysis_config_from_file(DATA_DIR + "/sample_analysis.json");

    REQUIRE(config.all_strategies);
    REQUIRE(config.parameters.new_machine().operating_cost().kind() ==
            OperatingCostSchedule::Kind::Table);
    REQUIRE(config.parameters.new_machine().operating_cost(3) == 8000.0);

    // Same schedule as the built-in gradient, so the same answer
    auto result = evaluate_strategies(config.parameters);
    REQUIRE(result.best().k == 2);
    REQUIRE_THAT(result.best().present_worth_cost, WithinAbs(40606.95059329031, 1e-6));
}

TEST_CASE("Flat cost analysis file", "[config][file]") {
    auto config = parse_analysis_config_from_file(DATA_DIR + "/flat_cost_analysis.json");
    REQUIRE(config.parameters.existing_machine().salvage_value(0) == 2500.0);

    auto result = evaluate_strategies(config.parameters);
    REQUIRE(result.size() == 6);
    REQUIRE(result.best().k == 0);
    REQUIRE_THAT(result.best().present_worth_cost, WithinAbs(2843.090077056336, 1e-6));
}

TEST_CASE("File errors", "[config][file]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(parse_analysis_config_from_file("/nonexistent/analysis.json"),
                          ConfigParseError);
    }

    SECTION("Invalid JSON file") {
        std::string path = "/tmp/optimach_test_invalid.json";
        {
            std::ofstream out(path);
            out << "{ not json";
        }
        REQUIRE_THROWS_AS(load_json_file(path), ConfigParseError);
        std::remove(path.c_str());
    }

    SECTION("Missing CSV schedule") {
        json doc = minimal_document();
        doc["new_machine"]["salvage"] = {{"csv", "no_such_salvage.csv"}};
        REQUIRE_THROWS_AS(parse_analysis_config(doc, DATA_DIR), ConfigParseError);
    }
}

TEST_CASE("resolve_relative_path", "[config]") {
    REQUIRE(resolve_relative_path("costs.csv", "") == "costs.csv");
    REQUIRE(resolve_relative_path("/abs/costs.csv", "/base") == "/abs/costs.csv");
    REQUIRE(resolve_relative_path("costs.csv", "/base") == "/base/costs.csv");
}
