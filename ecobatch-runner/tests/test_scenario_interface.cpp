/**
 * @file test_scenario_interface.cpp
 * @brief Tests for ScenarioInterface setup, baseline edits and sequential runs
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/scenario_interface.hpp"
#include "runner_fixture.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using namespace ecobatch;
using namespace ecobatch::testing;

namespace {

constexpr const char* RECORDING = "recording";

EngineFactory recording_factory() {
    EngineFactory factory;
    factory.register_engine(RECORDING, []() { return std::make_unique<RecordingEngine>(); });
    return factory;
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

} // anonymous namespace

TEST_CASE("ScenarioInterface: setup", "[scenario_interface]") {
    quiet_logging();
    TempModelFile model;

    SECTION("Temporary scenarios and working copy") {
        InterfaceConfig config;
        config.model_path = model.path();
        ScenarioInterface scenario_interface(config);

        REQUIRE(scenario_interface.dynamic_scenario_name() == ScenarioInterface::TEMP_DYNAMIC_SCENARIO);
        REQUIRE(scenario_interface.tracer_scenario_name() == ScenarioInterface::TEMP_TRACER_SCENARIO);
        EngineStateSnapshot state = scenario_interface.engine().state();
        REQUIRE(state.dynamic_scenario == "tmp_dynamic_scen");
        REQUIRE(state.tracer_scenario == "tmp_tracer_scen");

        const std::string working = scenario_interface.working_model_path();
        REQUIRE(working != model.path());
        REQUIRE(std::filesystem::path(working).filename() == std::filesystem::path(model.path()).filename());
        REQUIRE(std::filesystem::exists(working));

        const std::string source_before = read_file(model.path());
        scenario_interface.cleanup();
        REQUIRE_FALSE(std::filesystem::exists(std::filesystem::path(working).parent_path()));
        REQUIRE(read_file(model.path()) == source_before);
        scenario_interface.cleanup();
    }

    SECTION("Stopping before the tracer leaves tracer parameters out") {
        InterfaceConfig config;
        config.model_path = model.path();
        config.dynamic_scenario = "baseline";
        config.run_stage = Stage::DYNAMIC;
        ScenarioInterface scenario_interface(config);

        REQUIRE(scenario_interface.dynamic_scenario_name() == "baseline");
        REQUIRE(scenario_interface.tracer_scenario_name().empty());
        REQUIRE_FALSE(scenario_interface.compositor().has_parameter("env_decay_r"));
        REQUIRE(scenario_interface.compositor().has_parameter("max_rel_pb_3_Phytoplankton"));
    }

    SECTION("Constant dynamic leaves dynamic parameters out") {
        InterfaceConfig config;
        config.model_path = model.path();
        config.constant_dynamic = true;
        ScenarioInterface scenario_interface(config);
        REQUIRE_FALSE(scenario_interface.compositor().has_parameter("max_rel_pb_3_Phytoplankton"));
        REQUIRE(scenario_interface.available_parameter_names().size() == 6 * 4 + 5);
    }

    SECTION("Debug copy location is kept") {
        InterfaceConfig config;
        config.model_path = model.path();
        config.private_model_path = model.directory() + "/debug/working_model.json";
        {
            ScenarioInterface scenario_interface(config);
            REQUIRE(scenario_interface.working_model_path() == config.private_model_path);
        }
        REQUIRE(std::filesystem::exists(config.private_model_path));
    }

    SECTION("Bad model paths") {
        InterfaceConfig config;
        REQUIRE_THROWS_AS(ScenarioInterface(config), ConfigurationError);

        config.model_path = model.directory() + "/missing.json";
        REQUIRE_THROWS_AS(ScenarioInterface(config), InitializationError);
    }

    SECTION("Unknown dynamic scenario") {
        InterfaceConfig config;
        config.model_path = model.path();
        config.dynamic_scenario = "missing";
        REQUIRE_THROWS_AS(ScenarioInterface(config), EcoBatchError);
    }

    SECTION("Unknown engine type") {
        InterfaceConfig config;
        config.model_path = model.path();
        config.engine_type = "ewe";
        REQUIRE_THROWS_AS(ScenarioInterface(config), EcoBatchError);
    }
}

TEST_CASE("ScenarioInterface: parameters", "[scenario_interface]") {
    quiet_logging();
    TempModelFile model;
    InterfaceConfig config;
    config.model_path = model.path();
    ScenarioInterface scenario_interface(config);

    SECTION("Editor column names") {
        auto names = scenario_interface.format_parameter_names(
            {"Initial conc. (t/t)", "Max rel. P/B"}, {"Mackerel", "Phytoplankton"});
        REQUIRE(names == std::vector<std::string>{"init_c_2_Mackerel", "max_rel_pb_3_Phytoplankton"});

        REQUIRE_THROWS_AS(scenario_interface.format_parameter_names({"Salinity"}, {"Mackerel"}),
                          ConfigurationError);
        REQUIRE_THROWS_AS(scenario_interface.format_parameter_names({"Initial conc. (t/t)"}, {"Sardine"}),
                          LookupError);
        REQUIRE_THROWS_AS(scenario_interface.format_parameter_names({"Initial conc. (t/t)"}, {}),
                          ConfigurationError);
    }

    SECTION("Constants are written to the engine immediately") {
        scenario_interface.set_constant_parameters({"env_decay_r", "init_c_1_Baleen Whale"}, {0.3, 0.05});
        EngineSession& engine = scenario_interface.engine();
        REQUIRE(engine.get_scalar_property(ScalarProperty::ENV_DECAY_RATE) == 0.3);
        REQUIRE(engine.get_group_property(GroupProperty::INITIAL_CONCENTRATION)[0] == 0.05);

        REQUIRE_THROWS_AS(scenario_interface.set_constant_parameters({"bogus"}, {1.0}), ConfigurationError);

        scenario_interface.reset_parameters();
        REQUIRE(scenario_interface.compositor().unset_parameter_names().size() ==
                scenario_interface.available_parameter_names().size());
    }

    SECTION("Empty scenario table") {
        ScenarioTable table = scenario_interface.empty_scenario_table({"env_decay_r", "init_c_2_Mackerel"}, 4);
        REQUIRE(table.n_scenarios() == 4);
        REQUIRE(table.scenario_ids() == std::vector<int64_t>{1, 2, 3, 4});
        REQUIRE_THROWS_AS(scenario_interface.empty_scenario_table({"bogus"}, 2), ConfigurationError);
    }

    SECTION("Long scenario template") {
        FlatTable table = scenario_interface.long_scenario_template(2);
        REQUIRE(table.columns.size() == 4);
        REQUIRE(table.column_index("Scenario") == 0);
        REQUIRE(table.column_index("Group") == 1);
        REQUIRE(table.column_index("Parameter") == 2);
        REQUIRE(table.column_index("Value") == 3);

        // 5 environment rows, then 8 dynamic and 6 tracer prefixes for 4 groups
        const size_t per_scenario = 5 + 4 * (8 + 6);
        REQUIRE(table.n_rows() == 2 * per_scenario);

        const FlatColumn& scenario = table.columns[0];
        const FlatColumn& group = table.columns[1];
        const FlatColumn& parameter = table.columns[2];
        REQUIRE(scenario.ints.front() == 1);
        REQUIRE(scenario.ints[per_scenario - 1] == 1);
        REQUIRE(scenario.ints[per_scenario] == 2);
        REQUIRE(group.strings[0] == "Environment");
        REQUIRE(parameter.strings[0] == "base_vol_ex_loss");
        REQUIRE(group.strings[5] == "Baleen Whale");
        REQUIRE(group.strings[per_scenario - 1] == "Detritus");
        REQUIRE(std::count(parameter.strings.begin(), parameter.strings.begin() + per_scenario,
                           std::string("init_c")) == 4);
        for (double value : table.columns[3].doubles) {
            REQUIRE(std::isnan(value));
        }

        REQUIRE(scenario_interface.long_scenario_template(0).n_rows() == 0);
    }
}

TEST_CASE("ScenarioInterface: baseline edits", "[scenario_interface]") {
    quiet_logging();
    TempModelFile model;
    InterfaceConfig config;
    config.model_path = model.path();
    config.engine_type = RECORDING;
    ScenarioInterface scenario_interface(config, recording_factory());
    auto& engine = dynamic_cast<RecordingEngine&>(scenario_interface.engine());
    engine.clear_calls();

    SECTION("Vulnerabilities skip NaN entries") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        std::vector<std::vector<double>> matrix = {
            {1.5, 2.0},
            {3.0, nan},
            {4.0, 5.0},
            {6.0, 7.0}
        };
        scenario_interface.set_vulnerabilities(matrix);

        REQUIRE(engine.pair_calls.size() == 1);
        REQUIRE(engine.pair_calls[0].pairs.size() == 7);
        REQUIRE(engine.get_pair_property(PairProperty::VULNERABILITY, 2, 1) == 3.0);
        REQUIRE(engine.get_pair_property(PairProperty::VULNERABILITY, 3, 2) == 5.0);
    }

    SECTION("Vulnerability matrix shape is checked") {
        REQUIRE_THROWS_AS(scenario_interface.set_vulnerabilities({{1.0, 2.0}}), ConfigurationError);
        REQUIRE_THROWS_AS(scenario_interface.set_vulnerabilities({{1.0}, {1.0}, {1.0}, {1.0}}),
                          ConfigurationError);
        REQUIRE(engine.pair_calls.empty());
    }

    SECTION("Group info uses consumer and producer rows") {
        GroupInfoTable info;
        info["Max rel. feeding time"] = {2.0, 3.0, 99.0, 99.0};
        info["Max rel. P/B"] = {0.0, 0.0, 2.5, 0.0};
        info["Additive prop. of predation mortality [0, 1]"] = {1.0, 1.0, 1.0, 1.0};
        info["Unknown column"] = {1.0};
        scenario_interface.set_dynamic_group_info(info);

        REQUIRE(engine.group_calls.size() == 2);
        auto feeding = engine.get_group_property(GroupProperty::MAX_REL_FEEDING_TIME);
        REQUIRE(feeding[0] == 2.0);
        REQUIRE(feeding[1] == 3.0);
        REQUIRE(feeding[2] != 99.0);
        REQUIRE(engine.get_group_property(GroupProperty::MAX_REL_PB)[2] == 2.5);
    }

    SECTION("A short column writes nothing") {
        GroupInfoTable info;
        info["Max rel. feeding time"] = {2.0, 3.0};
        info["Switching power parameter [0,2]"] = {1.0};
        REQUIRE_THROWS_AS(scenario_interface.set_dynamic_group_info(info), ConfigurationError);
        REQUIRE(engine.group_calls.empty());
    }

    SECTION("Simulation duration") {
        REQUIRE_THROWS_AS(scenario_interface.set_simulation_duration(0), ConfigurationError);
        scenario_interface.set_simulation_duration(3);
        REQUIRE(engine.get_scalar_property(ScalarProperty::N_YEARS) == 3.0);
    }

    SECTION("Forcing functions") {
        int index = scenario_interface.add_forcing_function("pulse", {1.0, 2.0, 1.0});
        REQUIRE(index >= 1);
    }
}

TEST_CASE("ScenarioInterface: sequential runs", "[scenario_interface]") {
    quiet_logging();
    TempModelFile model;
    InterfaceConfig config;
    config.model_path = model.path();
    ScenarioInterface scenario_interface(config);
    scenario_interface.set_simulation_duration(1);

    SECTION("Results follow the scenario table") {
        ScenarioTable table = scenario_interface.empty_scenario_table({"env_base_inflow_r"}, 3);
        table.set_value(1, "env_base_inflow_r", 0.5);
        table.set_value(2, "env_base_inflow_r", 1.0);

        ResultSet results = scenario_interface.run_scenarios(table, {"Concentration", "Biomass"});
        REQUIRE(results.all_succeeded());
        REQUIRE(results.metadata().n_months == 12);
        REQUIRE(results.result("Concentration").shape == std::vector<size_t>{3, 5, 12});
        REQUIRE(results.n_varied_parameters() == 1);

        const ResultArray& conc = results.result("Concentration");
        REQUIRE(conc.at({2, 0, 11}) > conc.at({1, 0, 11}));
        REQUIRE(conc.at({1, 0, 11}) > conc.at({0, 0, 11}));
    }

    SECTION("Variables of a previous batch are not reapplied") {
        ScenarioTable first = scenario_interface.empty_scenario_table({"env_decay_r"}, 1);
        first.set_value(0, "env_decay_r", 0.7);
        scenario_interface.run_scenarios(first, {"FIB"});

        ScenarioTable second = scenario_interface.empty_scenario_table({"env_init_c"}, 1);
        scenario_interface.run_scenarios(second, {"FIB"});
        REQUIRE(scenario_interface.compositor().unset_parameter_names().size() ==
                scenario_interface.available_parameter_names().size() - 1);
    }

    SECTION("Bad batches are rejected before anything runs") {
        ScenarioTable unknown({"scenario", "salinity"}, {{1.0, 0.1}});
        REQUIRE_THROWS_AS(scenario_interface.run_scenarios(unknown, {"Biomass"}), ConfigurationError);

        ScenarioTable empty_table;
        REQUIRE_THROWS_AS(scenario_interface.run_scenarios(empty_table, {"Biomass"}), ConfigurationError);

        ScenarioTable table = scenario_interface.empty_scenario_table({"env_decay_r"}, 1);
        REQUIRE_THROWS_AS(scenario_interface.run_scenarios(table, {"Salinity"}), LookupError);

        REQUIRE_FALSE(scenario_interface.engine().state().mass_balance_ran);
    }

    SECTION("Closed interface") {
        scenario_interface.cleanup();
        REQUIRE_THROWS_AS(scenario_interface.engine(), EcoBatchError);
        REQUIRE_THROWS_AS(scenario_interface.set_simulation_duration(2), EcoBatchError);
        ScenarioTable table({"scenario"}, {{1.0}});
        REQUIRE_THROWS_AS(scenario_interface.run_scenarios(table, {"Biomass"}), EcoBatchError);
    }
}
