/**
 * @file test_parameter_compositor.cpp
 * @brief Tests for ParameterCompositor
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/parameter_compositor.hpp"
#include "runner_fixture.hpp"
#include <algorithm>

using namespace ecobatch;
using namespace ecobatch::testing;

TEST_CASE("ParameterCompositor: construction", "[parameter_compositor]") {
    TempModelFile model;
    ReferenceEngine engine;
    REQUIRE(load_demo_scenarios(engine, model));

    SECTION("Both subsystems") {
        auto compositor = ParameterCompositor::for_engine(engine, true, true);
        REQUIRE(compositor.managers().size() == 2);
        REQUIRE(compositor.has_parameter("max_rel_pb_3_Phytoplankton"));
        REQUIRE(compositor.has_parameter("init_c_2_Mackerel"));
        REQUIRE(compositor.available_parameter_names().size() == (8 * 4 + 16) + (6 * 4 + 5));
    }

    SECTION("Constant dynamic leaves dynamic parameters out") {
        auto compositor = ParameterCompositor::for_engine(engine, false, true);
        REQUIRE(compositor.managers().size() == 1);
        REQUIRE_FALSE(compositor.has_parameter("max_rel_pb_3_Phytoplankton"));
    }

    SECTION("Dynamic only") {
        auto compositor = ParameterCompositor::for_engine(engine, true, false);
        REQUIRE_FALSE(compositor.has_parameter("env_decay_r"));
    }
}

TEST_CASE("ParameterCompositor: discovery", "[parameter_compositor]") {
    TempModelFile model;
    ReferenceEngine engine;
    REQUIRE(load_demo_scenarios(engine, model));
    auto compositor = ParameterCompositor::for_engine(engine, true, true);

    SECTION("Environment names of the tracer subsystem") {
        ParameterQuery query;
        query.subsystems = {"tracer"};
        query.categories = {ParameterCategory::ENVIRONMENT};
        auto names = compositor.available_parameter_names(query);
        REQUIRE(names == std::vector<std::string>{
            "base_vol_ex_loss", "env_base_inflow_r", "env_decay_r", "env_inflow_forcing_idx", "env_init_c"});
    }

    SECTION("Group filter across subsystems") {
        ParameterQuery query;
        query.groups = {"Mackerel"};
        auto names = compositor.available_parameter_names(query);
        REQUIRE(names.size() == 8 + 6 + 5);
        REQUIRE(std::is_sorted(names.begin(), names.end()));
        REQUIRE(std::find(names.begin(), names.end(), "qbmax_qbio_2_Mackerel") != names.end());
        REQUIRE(std::find(names.begin(), names.end(), "env_decay_r") != names.end());
    }

    SECTION("Group filter keeps requested environment names") {
        ParameterQuery query;
        query.categories = {ParameterCategory::GROUP, ParameterCategory::ENVIRONMENT};
        query.groups = {"Mackerel"};
        auto names = compositor.available_parameter_names(query);
        REQUIRE(names.size() == 8 + 6 + 5);
        auto env = std::count_if(names.begin(), names.end(),
                                 [](const std::string& name) { return name.rfind("env_", 0) == 0; });
        REQUIRE(env == 4);
        REQUIRE(std::find(names.begin(), names.end(), "base_vol_ex_loss") != names.end());
    }

    SECTION("Group filter with explicitly requested pairs") {
        ParameterQuery query;
        query.categories = {ParameterCategory::GROUP, ParameterCategory::PAIR};
        query.group_indices = {2};
        auto names = compositor.available_parameter_names(query);
        REQUIRE(names.size() == 8 + 6 + 16);
    }

    SECTION("Prefix filter does not hide environment names") {
        ParameterQuery query;
        query.categories = {ParameterCategory::GROUP, ParameterCategory::ENVIRONMENT};
        query.prefixes = {"init_c"};
        auto names = compositor.available_parameter_names(query);
        REQUIRE(names.size() == 4 + 5);
    }

    SECTION("Prefix filter selects one manager") {
        ParameterQuery query;
        query.categories = {ParameterCategory::GROUP};
        query.prefixes = {"immig_c"};
        query.group_indices = {1, 2};
        auto names = compositor.available_parameter_names(query);
        REQUIRE(names == std::vector<std::string>{"immig_c_1_Baleen Whale", "immig_c_2_Mackerel"});
    }

    SECTION("Pair names") {
        ParameterQuery query;
        query.categories = {ParameterCategory::PAIR};
        REQUIRE(compositor.available_parameter_names(query).size() == 16);
    }

    SECTION("Unknown prefix or subsystem") {
        ParameterQuery bad_prefix;
        bad_prefix.prefixes = {"nope"};
        REQUIRE_THROWS_AS(compositor.available_parameter_names(bad_prefix), ConfigurationError);

        ParameterQuery bad_subsystem;
        bad_subsystem.subsystems = {"ecospace"};
        REQUIRE_THROWS_AS(compositor.available_parameter_names(bad_subsystem), ConfigurationError);
    }

    SECTION("Unknown group") {
        ParameterQuery query;
        query.groups = {"Sardine"};
        REQUIRE_THROWS_AS(compositor.available_parameter_names(query), LookupError);
    }
}

TEST_CASE("ParameterCompositor: assignment", "[parameter_compositor]") {
    TempModelFile model;
    RecordingEngine engine;
    REQUIRE(load_demo_scenarios(engine, model));
    auto compositor = ParameterCompositor::for_engine(engine, true, true);
    const size_t total = compositor.available_parameter_names().size();

    SECTION("Unknown name rejects the whole call") {
        REQUIRE_THROWS_AS(compositor.set_constant({"env_decay_r", "bogus"}, {0.2, 1.0}), ConfigurationError);
        REQUIRE(compositor.unset_parameter_names().size() == total);

        REQUIRE_THROWS_AS(compositor.set_variable({"bogus"}, {1}), ConfigurationError);
        REQUIRE(compositor.unset_parameter_names().size() == total);
    }

    SECTION("Names route to their own subsystem") {
        compositor.set_constant({"env_decay_r", "switching_power_1_Baleen Whale"}, {0.2, 1.5});
        REQUIRE(compositor.unset_parameter_names().size() == total - 2);

        compositor.apply_constants(engine);
        REQUIRE(engine.get_scalar_property(ScalarProperty::ENV_DECAY_RATE) == 0.2);
        REQUIRE(engine.get_group_property(GroupProperty::SWITCHING_POWER)[0] == 1.5);
    }

    SECTION("Variables are applied from a scenario row") {
        compositor.set_variable({"init_c_2_Mackerel", "max_rel_feeding_time_1_Baleen Whale"}, {1, 2});
        engine.clear_calls();
        compositor.apply_variables(engine, {1.0, 0.3, 4.0});
        REQUIRE(engine.group_calls.size() == 2);
        REQUIRE(engine.get_group_property(GroupProperty::INITIAL_CONCENTRATION)[1] == 0.3);
        REQUIRE(engine.get_group_property(GroupProperty::MAX_REL_FEEDING_TIME)[0] == 4.0);
    }

    SECTION("Copies are independent") {
        ParameterCompositor copy = compositor;
        copy.set_constant({"env_decay_r"}, {0.2});
        REQUIRE(copy.unset_parameter_names().size() == total - 1);
        REQUIRE(compositor.unset_parameter_names().size() == total);
    }

    SECTION("clear_variables and reset") {
        compositor.set_constant({"env_decay_r"}, {0.2});
        compositor.set_variable({"init_c_2_Mackerel"}, {1});
        compositor.clear_variables();
        REQUIRE(compositor.unset_parameter_names().size() == total - 1);

        compositor.reset();
        REQUIRE(compositor.unset_parameter_names().size() == total);
    }
}
