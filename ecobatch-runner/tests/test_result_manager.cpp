/**
 * @file test_result_manager.cpp
 * @brief Tests for ResultManager stores and collection
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/result_manager.hpp"
#include "runner_fixture.hpp"
#include <cmath>
#include <vector>

using namespace ecobatch;
using namespace ecobatch::testing;

TEST_CASE("ResultManager: construction", "[result_manager]") {
    quiet_logging();
    TempModelFile model;
    ReferenceEngine engine;
    REQUIRE(load_demo_scenarios(engine, model));
    ScenarioTable table = ScenarioTable::empty({"env_decay_r"}, 2);

    SECTION("Store shapes follow the model and duration") {
        REQUIRE(ResultManager::store_shape(engine, find_result_variable("Biomass"), 2) ==
                std::vector<size_t>{2, 4, 24});
        REQUIRE(ResultManager::store_shape(engine, find_result_variable("Concentration"), 2) ==
                std::vector<size_t>{2, 5, 24});
        REQUIRE(ResultManager::store_shape(engine, find_result_variable("Fleet Catch"), 2) ==
                std::vector<size_t>{2, 1, 4, 24});
        REQUIRE(ResultManager::store_shape(engine, find_result_variable("FIB"), 2) ==
                std::vector<size_t>{2, 24});
    }

    SECTION("Packed statistics share one extractor") {
        ResultManager manager(engine, {"Biomass", "Catch", "Concentration"}, table);
        REQUIRE(manager.n_extractors() == 2);
        REQUIRE(manager.n_months() == 24);
        REQUIRE(manager.variable_names() == std::vector<std::string>{"Biomass", "Catch", "Concentration"});

        BufferInfo info = manager.store().get_buffer("Biomass");
        REQUIRE(info.mode == BufferMode::EXCLUSIVE);
        REQUIRE(std::isnan(info.data[0]));
    }

    SECTION("Bad variable lists") {
        REQUIRE_THROWS_AS(ResultManager(engine, {"Salinity"}, table), LookupError);
        REQUIRE_THROWS_AS(ResultManager(engine, {"Biomass", "Biomass"}, table), ConfigurationError);
    }

    SECTION("Empty scenario table") {
        ScenarioTable empty_table;
        REQUIRE_THROWS_AS(ResultManager(engine, {"Biomass"}, empty_table), ConfigurationError);
    }

    SECTION("Shared store must match") {
        auto store = ResultManager::allocate_shared_store(engine, {"Biomass"}, 3);
        REQUIRE(store->mode() == BufferMode::SHARED);
        REQUIRE_THROWS_AS(ResultManager(engine, {"Biomass"}, table, store.get()), ConfigurationError);
        REQUIRE_THROWS_AS(ResultManager(engine, {"FIB"}, table, store.get()), ConfigurationError);

        auto matching = ResultManager::allocate_shared_store(engine, {"Biomass"}, 2);
        ResultManager manager(engine, {"Biomass"}, table, matching.get());
        REQUIRE(&manager.store() == matching.get());
    }
}

TEST_CASE("ResultManager: collection", "[result_manager]") {
    quiet_logging();
    TempModelFile model;
    ReferenceEngine engine;
    REQUIRE(load_demo_scenarios(engine, model));
    ScenarioTable table = ScenarioTable::empty({"env_decay_r"}, 3);
    ResultManager manager(engine, {"Biomass", "Concentration", "FIB"}, table);

    SECTION("Nothing collected before the stage ran") {
        REQUIRE_THROWS_AS(manager.collect(0), StageNotReadyError);
        REQUIRE(std::isnan(manager.store().get_buffer("Biomass").data[0]));
    }

    SECTION("Collect writes only its own slot") {
        REQUIRE(engine.run(Stage::TRACER));
        manager.collect(1);

        const BufferInfo conc = manager.store().get_buffer("Concentration");
        const double* slot0 = conc.data;
        const double* slot1 = conc.data + conc.scenario_stride();
        const double* slot2 = conc.data + 2 * conc.scenario_stride();
        REQUIRE(std::isnan(slot0[0]));
        REQUIRE(std::isnan(slot2[0]));

        ResultExtractor extractor(engine, ResultSource::TRACER_CONCENTRATION);
        extractor.refresh();
        REQUIRE(slot1[0] == extractor.get_result().at({0, 0}));
        REQUIRE(slot1[2 * 24 + 23] == extractor.get_result().at({2, 23}));

        const BufferInfo fib = manager.store().get_buffer("FIB");
        REQUIRE_FALSE(std::isnan(fib.data[24]));
    }

    SECTION("A failed readiness check leaves every store untouched") {
        REQUIRE(engine.run(Stage::DYNAMIC));
        // Biomass is ready but Concentration is not
        REQUIRE_THROWS_AS(manager.collect(0), TracerNotRunError);
        REQUIRE(std::isnan(manager.store().get_buffer("Biomass").data[0]));
        REQUIRE(std::isnan(manager.store().get_buffer("FIB").data[0]));
    }

    SECTION("Collecting a later scenario leaves earlier slots unchanged") {
        REQUIRE(engine.run(Stage::TRACER));
        manager.collect(0);

        const BufferInfo conc = manager.store().get_buffer("Concentration");
        const size_t stride = conc.scenario_stride();
        std::vector<double> first(conc.data, conc.data + stride);

        engine.set_scalar_property(ScalarProperty::ENV_INITIAL_CONCENTRATION,
                                   engine.get_scalar_property(ScalarProperty::ENV_INITIAL_CONCENTRATION) + 5.0);
        REQUIRE(engine.run(Stage::TRACER));
        manager.collect(2);

        const double* slot2 = conc.data + 2 * stride;
        bool differs = false;
        for (size_t k = 0; k < stride; ++k) {
            REQUIRE(conc.data[k] == first[k]);
            differs = differs || slot2[k] != first[k];
        }
        REQUIRE(differs);
    }

    SECTION("A duration change after construction writes nothing") {
        engine.set_scalar_property(ScalarProperty::N_YEARS, 3);
        REQUIRE(engine.run(Stage::TRACER));
        REQUIRE_THROWS_AS(manager.collect(0), ConfigurationError);
        for (const char* name : {"Biomass", "Concentration", "FIB"}) {
            const BufferInfo info = manager.store().get_buffer(name);
            for (size_t k = 0; k < info.scenario_stride(); ++k) {
                REQUIRE(std::isnan(info.data[k]));
            }
        }
    }

    SECTION("mark_invalid fills the slot with NaN") {
        REQUIRE(engine.run(Stage::TRACER));
        manager.collect(0);
        manager.collect(2);
        manager.mark_invalid(2);

        const BufferInfo biomass = manager.store().get_buffer("Biomass");
        REQUIRE_FALSE(std::isnan(biomass.data[0]));
        for (size_t k = 0; k < biomass.scenario_stride(); ++k) {
            REQUIRE(std::isnan(biomass.data[2 * biomass.scenario_stride() + k]));
        }
    }

    SECTION("Freeze into a result set") {
        REQUIRE(engine.run(Stage::TRACER));
        for (size_t i = 0; i < 3; ++i) {
            manager.collect(i);
        }
        ResultSet results = manager.to_result_set(
            {ScenarioStatus::SUCCEEDED, ScenarioStatus::SUCCEEDED, ScenarioStatus::SUCCEEDED});

        REQUIRE(results.country() == "Norway");
        REQUIRE(results.first_year() == 1990);
        REQUIRE(results.metadata().n_months == 24);
        REQUIRE(results.metadata().group_names ==
                std::vector<std::string>{"Baleen Whale", "Mackerel", "Phytoplankton", "Detritus"});
        REQUIRE(results.metadata().fleet_names == std::vector<std::string>{"Purse seine"});
        REQUIRE(results.metadata().run_date.size() == 19);
        REQUIRE(results.result("Biomass").shape == std::vector<size_t>{3, 4, 24});
        REQUIRE(results.all_succeeded());

        REQUIRE_THROWS_AS(manager.to_result_set({ScenarioStatus::SUCCEEDED}), ConfigurationError);
    }
}
