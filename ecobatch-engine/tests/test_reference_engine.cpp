/**
 * @file test_reference_engine.cpp
 * @brief Tests for the reference engine session
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/reference_engine.hpp"
#include "model_fixture.hpp"
#include <cmath>

using namespace ecobatch;
using namespace ecobatch::testing;
using Catch::Matchers::WithinAbs;

namespace {

void load_demo(ReferenceEngine& engine, const TempModelFile& model) {
    REQUIRE(engine.load_model(model.path()));
    engine.load_scenario(Subsystem::DYNAMIC, "baseline");
    engine.load_scenario(Subsystem::TRACER, "cesium");
}

} // anonymous namespace

TEST_CASE("ReferenceEngine: model loading", "[reference_engine]") {
    TempModelFile model;
    ReferenceEngine engine;

    SECTION("Loads groups, fleets and metadata") {
        REQUIRE(engine.load_model(model.path()));
        REQUIRE(engine.is_model_loaded());
        REQUIRE(engine.n_groups() == 4);
        REQUIRE(engine.n_consumers() == 2);
        REQUIRE(engine.n_producers() == 1);
        REQUIRE(engine.n_fleets() == 1);
        REQUIRE(engine.functional_group_names()[1] == "Mackerel");
        REQUIRE(engine.country() == "Norway");
        REQUIRE(engine.first_year() == 1990);
        REQUIRE(engine.scenario_count(Subsystem::DYNAMIC) == 1);
        REQUIRE(engine.scenario_count(Subsystem::TRACER) == 1);
    }

    SECTION("Missing file returns false") {
        REQUIRE_FALSE(engine.load_model(model.directory() + "/missing.json"));
        REQUIRE_FALSE(engine.is_model_loaded());
    }

    SECTION("Groups out of order are rejected") {
        auto json = demo_model_json();
        std::swap(json["groups"][0], json["groups"][3]);
        TempModelFile bad(json);
        REQUIRE_FALSE(engine.load_model(bad.path()));
    }

    SECTION("Close model clears state") {
        load_demo(engine, model);
        engine.close_model();
        REQUIRE_FALSE(engine.is_model_loaded());
        REQUIRE_FALSE(engine.state().dynamic_scenario_loaded);
        engine.close_model();  // idempotent
    }
}

TEST_CASE("ReferenceEngine: scenarios", "[reference_engine]") {
    TempModelFile model;
    ReferenceEngine engine;
    REQUIRE(engine.load_model(model.path()));

    SECTION("Load by name and by index") {
        engine.load_scenario(Subsystem::DYNAMIC, "baseline");
        REQUIRE(engine.state().dynamic_scenario == "baseline");

        engine.new_scenario(Subsystem::DYNAMIC, "alt", "Alternative");
        REQUIRE(engine.state().dynamic_scenario == "alt");

        engine.load_scenario(Subsystem::DYNAMIC, size_t(1));
        REQUIRE(engine.state().dynamic_scenario == "baseline");
    }

    SECTION("Unknown name raises LookupError") {
        REQUIRE_THROWS_AS(engine.load_scenario(Subsystem::DYNAMIC, "nope"), LookupError);
    }

    SECTION("Index out of range raises IndexError") {
        REQUIRE_THROWS_AS(engine.load_scenario(Subsystem::TRACER, size_t(0)), IndexError);
        REQUIRE_THROWS_AS(engine.load_scenario(Subsystem::TRACER, size_t(2)), IndexError);
    }

    SECTION("Duplicate scenario name is rejected") {
        REQUIRE_THROWS_AS(engine.new_scenario(Subsystem::DYNAMIC, "baseline", ""), InitializationError);
    }

    SECTION("Remove active scenario deactivates it") {
        engine.new_scenario(Subsystem::TRACER, "tmp", "");
        REQUIRE(engine.scenario_count(Subsystem::TRACER) == 2);
        engine.remove_scenario(Subsystem::TRACER, "tmp");
        REQUIRE(engine.scenario_count(Subsystem::TRACER) == 1);
        REQUIRE_FALSE(engine.state().tracer_scenario_loaded);
    }

    SECTION("Scenarios persist through save_model") {
        engine.new_scenario(Subsystem::DYNAMIC, "saved", "");
        engine.set_scalar_property(ScalarProperty::N_YEARS, 7);
        engine.set_group_property(GroupProperty::MAX_REL_PB, {3.5}, {3});
        engine.set_pair_property(PairProperty::VULNERABILITY, {4.0}, {{3, 2}});
        REQUIRE(engine.save_model());

        ReferenceEngine reloaded;
        REQUIRE(reloaded.load_model(model.path()));
        reloaded.load_scenario(Subsystem::DYNAMIC, "saved");
        REQUIRE(reloaded.get_scalar_property(ScalarProperty::N_YEARS) == 7.0);
        REQUIRE(reloaded.get_group_property(GroupProperty::MAX_REL_PB)[2] == 3.5);
        REQUIRE(reloaded.get_pair_property(PairProperty::VULNERABILITY, 3, 2) == 4.0);
    }
}

TEST_CASE("ReferenceEngine: property validation", "[reference_engine]") {
    TempModelFile model;
    ReferenceEngine engine;
    REQUIRE(engine.load_model(model.path()));

    SECTION("Property access without scenario raises ScenarioNotLoadedError") {
        REQUIRE_THROWS_AS(
            engine.set_group_property(GroupProperty::INITIAL_CONCENTRATION, {0.1}, {1}),
            ScenarioNotLoadedError);
        REQUIRE_THROWS_AS(engine.get_scalar_property(ScalarProperty::N_YEARS), ScenarioNotLoadedError);
    }

    load_demo(engine, model);

    SECTION("Batched group setter writes selected groups only") {
        engine.set_group_property(GroupProperty::INITIAL_CONCENTRATION, {0.1, 0.3}, {1, 3});
        auto values = engine.get_group_property(GroupProperty::INITIAL_CONCENTRATION);
        REQUIRE(values == std::vector<double>{0.1, 0.0, 0.3, 0.0});
    }

    SECTION("Group index 0 is invalid") {
        REQUIRE_THROWS_AS(
            engine.set_group_property(GroupProperty::MAX_REL_PB, {1.0}, {0}), IndexError);
        REQUIRE_THROWS_AS(
            engine.set_group_property(GroupProperty::MAX_REL_PB, {1.0}, {5}), IndexError);
    }

    SECTION("Length mismatch raises ConfigurationError") {
        REQUIRE_THROWS_AS(
            engine.set_group_property(GroupProperty::MAX_REL_PB, {1.0, 2.0}, {1}), ConfigurationError);
    }

    SECTION("Non-positive duration is rejected") {
        REQUIRE_THROWS_AS(engine.set_scalar_property(ScalarProperty::N_YEARS, 0), ConfigurationError);
    }

    SECTION("Forcing functions get a leading 1.0 and sequential indices") {
        int first = engine.add_forcing_function("inflow", {2.0, 3.0});
        int second = engine.add_forcing_function("other", {1.0});
        REQUIRE(first == 1);
        REQUIRE(second == 2);
    }
}

TEST_CASE("ReferenceEngine: running stages", "[reference_engine]") {
    TempModelFile model;
    ReferenceEngine engine;
    load_demo(engine, model);

    SECTION("Fresh scenario has not run") {
        auto state = engine.state();
        REQUIRE_FALSE(state.mass_balance_ran);
        REQUIRE_FALSE(state.dynamic_ran);
        REQUIRE_FALSE(state.tracer_ran);
        REQUIRE(engine.result_array(ResultSource::DYNAMIC_GROUP_STATS).empty());
    }

    SECTION("Dynamic run produces padded group statistics") {
        REQUIRE(engine.run(Stage::DYNAMIC));
        auto state = engine.state();
        REQUIRE(state.mass_balance_ran);
        REQUIRE(state.dynamic_ran);
        REQUIRE_FALSE(state.tracer_ran);

        auto stats = engine.result_array(ResultSource::DYNAMIC_GROUP_STATS);
        REQUIRE(stats.shape == std::vector<size_t>{GroupStat::COUNT, 5, 25});
        // Placeholder slots stay zero
        REQUIRE(stats.data[0] == 0.0);
        // Biomass of Mackerel (slot 2) in month 1 is positive
        REQUIRE(stats.data[(GroupStat::BIOMASS * 5 + 2) * 25 + 1] > 0.0);
        // Trophic level of Baleen Whale
        REQUIRE_THAT(stats.data[(GroupStat::TROPHIC_LEVEL * 5 + 1) * 25 + 24], WithinAbs(3.6, 1e-12));

        auto fleet = engine.result_array(ResultSource::DYNAMIC_FLEET_CATCH);
        REQUIRE(fleet.shape == std::vector<size_t>{2, 5, 25});
        auto shannon = engine.result_array(ResultSource::DYNAMIC_SHANNON_DIVERSITY);
        REQUIRE(shannon.shape == std::vector<size_t>{25});
        REQUIRE(shannon.data[12] > 0.0);
    }

    SECTION("Tracer run produces environment plus group concentrations") {
        REQUIRE(engine.run(Stage::TRACER));
        REQUIRE(engine.state().tracer_ran);

        auto conc = engine.result_array(ResultSource::TRACER_CONCENTRATION);
        REQUIRE(conc.shape == std::vector<size_t>{6, 25});
        // Environment decays from its initial concentration
        REQUIRE(conc.data[1] < 1.0);
        REQUIRE(conc.data[24] < conc.data[1]);
    }

    SECTION("Runs are deterministic") {
        REQUIRE(engine.run(Stage::TRACER));
        auto first = engine.result_array(ResultSource::DYNAMIC_GROUP_STATS);
        std::vector<double> copy(first.data, first.data + first.size());

        REQUIRE(engine.run(Stage::TRACER));
        auto second = engine.result_array(ResultSource::DYNAMIC_GROUP_STATS);
        REQUIRE(std::vector<double>(second.data, second.data + second.size()) == copy);
    }

    SECTION("Parameters change the outcome") {
        REQUIRE(engine.run(Stage::TRACER));
        auto before = engine.result_array(ResultSource::TRACER_CONCENTRATION);
        double mackerel_before = before.data[2 * 25 + 24];

        engine.set_group_property(GroupProperty::DIRECT_ABSORPTION_RATE, {0.5}, {2});
        REQUIRE(engine.run(Stage::TRACER));
        auto after = engine.result_array(ResultSource::TRACER_CONCENTRATION);
        REQUIRE(after.data[2 * 25 + 24] > mackerel_before);
    }

    SECTION("Tracer run requires a tracer scenario") {
        engine.close_scenario(Subsystem::TRACER);
        REQUIRE_THROWS_AS(engine.run(Stage::TRACER), ScenarioNotLoadedError);
    }

    SECTION("Diverging simulation reports failure") {
        engine.set_scalar_property(ScalarProperty::ENV_BASE_INFLOW_RATE, INFINITY);
        REQUIRE_FALSE(engine.run(Stage::TRACER));
        REQUIRE_FALSE(engine.state().tracer_ran);
    }

    SECTION("Loading a scenario resets stage flags") {
        REQUIRE(engine.run(Stage::TRACER));
        engine.load_scenario(Subsystem::DYNAMIC, "baseline");
        REQUIRE_FALSE(engine.state().dynamic_ran);
        REQUIRE_FALSE(engine.state().tracer_ran);
    }
}

TEST_CASE("EngineStateSnapshot: summary and errors", "[reference_engine]") {
    TempModelFile model;
    ReferenceEngine engine;
    load_demo(engine, model);

    auto snapshot = engine.state();
    std::string summary = snapshot.summary();
    REQUIRE(summary.find("baseline") != std::string::npos);
    REQUIRE(summary.find("dynamic ran:             no") != std::string::npos);

    try {
        throw_stage_not_ready(Stage::TRACER, snapshot);
        FAIL("Expected TracerNotRunError");
    } catch (const TracerNotRunError& e) {
        REQUIRE(e.stage() == Stage::TRACER);
        REQUIRE(std::string(e.what()).find("Tracer simulation has not been run") != std::string::npos);
        REQUIRE(e.state().dynamic_scenario == "baseline");
    }

    REQUIRE_THROWS_AS(throw_stage_not_ready(Stage::DYNAMIC, snapshot), DynamicNotRunError);
    REQUIRE_THROWS_AS(throw_stage_not_ready(Stage::MASS_BALANCE, snapshot), StageNotReadyError);
}
