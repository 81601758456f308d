/**
 * @file test_scenario_table.cpp
 * @brief Tests for ScenarioTable parsing and validation
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/scenario_table.hpp"
#include "../../ecobatch-engine/src/engine_session.hpp"
#include "../../ecobatch-engine/tests/model_fixture.hpp"
#include <fstream>
#include <sstream>

using namespace ecobatch;
using namespace ecobatch::testing;

TEST_CASE("ScenarioTable: parsing CSV", "[scenario_table]") {
    SECTION("Header and rows") {
        std::istringstream csv("scenario,init_c_1_Baleen Whale,env_decay_r\n"
                               "1,0.1,0.2\n"
                               "2,0.3,0.4\n"
                               "5,0.5,0.6\n");
        ScenarioTable table = ScenarioTable::from_stream(csv);

        REQUIRE(table.n_scenarios() == 3);
        REQUIRE(table.n_columns() == 3);
        REQUIRE(table.parameter_names() == std::vector<std::string>{"init_c_1_Baleen Whale", "env_decay_r"});
        REQUIRE(table.scenario_ids() == std::vector<int64_t>{1, 2, 5});
        REQUIRE(table.column_index("env_decay_r") == 2);
        REQUIRE(table.value(1, "init_c_1_Baleen Whale") == 0.3);
    }

    SECTION("Table with only the scenario column") {
        std::istringstream csv("scenario\n1\n2\n");
        ScenarioTable table = ScenarioTable::from_stream(csv);
        REQUIRE(table.n_scenarios() == 2);
        REQUIRE(table.parameter_names().empty());
    }

    SECTION("Missing scenario column") {
        std::istringstream csv("id,env_decay_r\n1,0.2\n");
        REQUIRE_THROWS_AS(ScenarioTable::from_stream(csv), ConfigurationError);
    }

    SECTION("Scenario column not first") {
        std::istringstream csv("env_decay_r,scenario\n0.2,1\n");
        REQUIRE_THROWS_AS(ScenarioTable::from_stream(csv), ConfigurationError);
    }

    SECTION("Ragged row") {
        std::istringstream csv("scenario,env_decay_r\n1,0.2\n2\n");
        REQUIRE_THROWS_AS(ScenarioTable::from_stream(csv), ConfigurationError);
    }

    SECTION("Non-numeric cell") {
        std::istringstream csv("scenario,env_decay_r\n1,abc\n");
        REQUIRE_THROWS_AS(ScenarioTable::from_stream(csv), ConfigurationError);
    }

    SECTION("Non-integer id") {
        std::istringstream csv("scenario,env_decay_r\n1.5,0.2\n");
        REQUIRE_THROWS_AS(ScenarioTable::from_stream(csv), ConfigurationError);
    }

    SECTION("Ids outside the 64-bit range") {
        std::istringstream huge("scenario,env_decay_r\n1e19,0.2\n");
        REQUIRE_THROWS_AS(ScenarioTable::from_stream(huge), ConfigurationError);

        std::istringstream negative("scenario,env_decay_r\n-1e19,0.2\n");
        REQUIRE_THROWS_AS(ScenarioTable::from_stream(negative), ConfigurationError);

        REQUIRE_THROWS_AS(ScenarioTable({"scenario", "env_decay_r"}, {{9223372036854775808.0, 0.2}}),
                          ConfigurationError);
    }

    SECTION("Large ids inside the 64-bit range are kept exactly") {
        std::istringstream csv("scenario,env_decay_r\n1,0.2\n4503599627370496,0.3\n");
        ScenarioTable table = ScenarioTable::from_stream(csv);
        REQUIRE(table.scenario_id(1) == int64_t{4503599627370496});
    }

    SECTION("Ids must be strictly ascending") {
        std::istringstream repeated("scenario,env_decay_r\n1,0.2\n1,0.3\n");
        REQUIRE_THROWS_AS(ScenarioTable::from_stream(repeated), ConfigurationError);

        std::istringstream descending("scenario,env_decay_r\n2,0.2\n1,0.3\n");
        REQUIRE_THROWS_AS(ScenarioTable::from_stream(descending), ConfigurationError);
    }

    SECTION("Duplicate column") {
        std::istringstream csv("scenario,env_decay_r,env_decay_r\n1,0.2,0.3\n");
        REQUIRE_THROWS_AS(ScenarioTable::from_stream(csv), ConfigurationError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(ScenarioTable::from_csv("/nonexistent/scenarios.csv"), ConfigurationError);
    }
}

TEST_CASE("ScenarioTable: building and editing", "[scenario_table]") {
    SECTION("Empty table has ids 1..n and zero values") {
        ScenarioTable table = ScenarioTable::empty({"env_decay_r", "env_init_c"}, 3);
        REQUIRE(table.scenario_ids() == std::vector<int64_t>{1, 2, 3});
        REQUIRE(table.row(2) == std::vector<double>{3.0, 0.0, 0.0});
    }

    SECTION("set_value edits parameters but never ids") {
        ScenarioTable table = ScenarioTable::empty({"env_decay_r"}, 2);
        table.set_value(1, "env_decay_r", 0.7);
        REQUIRE(table.value(1, "env_decay_r") == 0.7);
        REQUIRE_THROWS_AS(table.set_value(0, "scenario", 9.0), ConfigurationError);
        REQUIRE_THROWS_AS(table.set_value(0, "missing", 1.0), LookupError);
    }

    SECTION("CSV round trip") {
        TempModelFile scratch;
        std::string path = scratch.directory() + "/scenarios.csv";

        ScenarioTable table = ScenarioTable::empty({"env_decay_r"}, 2);
        table.set_value(0, "env_decay_r", 0.25);
        table.write_csv(path);

        ScenarioTable loaded = ScenarioTable::from_csv(path);
        REQUIRE(loaded.columns() == table.columns());
        REQUIRE(loaded.rows() == table.rows());
    }
}
