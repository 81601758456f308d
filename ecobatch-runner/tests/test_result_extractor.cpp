/**
 * @file test_result_extractor.cpp
 * @brief Tests for ResultExtractor and the variable catalog
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/result_extractor.hpp"
#include "runner_fixture.hpp"
#include <set>

using namespace ecobatch;
using namespace ecobatch::testing;
using Catch::Matchers::WithinAbs;

TEST_CASE("Result catalog", "[result_config]") {
    SECTION("Names are unique and export names have no spaces") {
        std::set<std::string> names;
        for (const auto& variable : result_variables()) {
            REQUIRE(names.insert(variable.name).second);
            REQUIRE(variable.export_name.find(' ') == std::string::npos);
            REQUIRE(variable.dims.front() == Dim::SCENARIO);
            REQUIRE(variable.dims.back() == Dim::TIME);
        }
    }

    SECTION("Lookup") {
        const ResultVariable& variable = find_result_variable("Concentration Biomass");
        REQUIRE(variable.export_name == "Concentration_Biomass");
        REQUIRE(variable.stage() == Stage::TRACER);
        REQUIRE(variable.has_dim(Dim::ENV_GROUP));
        REQUIRE(find_result_variable("Biomass").stage() == Stage::DYNAMIC);
        REQUIRE_THROWS_AS(find_result_variable("Salinity"), LookupError);
    }

    SECTION("Category labels") {
        REQUIRE(category_to_string(VariableCategory::FISHING) == "FISHING_STATS");
        REQUIRE(category_dim_labels(VariableCategory::GROUP) ==
                std::vector<std::string>{"Scenario", "Group", "Time"});
    }
}

TEST_CASE("ResultExtractor: readiness", "[result_extractor]") {
    TempModelFile model;
    ReferenceEngine engine;
    REQUIRE(load_demo_scenarios(engine, model));

    SECTION("Nothing has run") {
        ResultExtractor extractor(engine, ResultSource::DYNAMIC_GROUP_STATS);
        REQUIRE_THROWS_AS(extractor.check_ready(), MassBalanceNotRunError);
        REQUIRE_THROWS_AS(extractor.refresh(), StageNotReadyError);
        REQUIRE_FALSE(extractor.has_buffer());
    }

    SECTION("Tracer source after a dynamic run") {
        REQUIRE(engine.run(Stage::DYNAMIC));
        ResultExtractor extractor(engine, ResultSource::TRACER_CONCENTRATION);
        REQUIRE_THROWS_AS(extractor.check_ready(), TracerNotRunError);
    }

    SECTION("Dynamic source after a mass balance only") {
        REQUIRE(engine.run(Stage::MASS_BALANCE));
        ResultExtractor extractor(engine, ResultSource::DYNAMIC_FIB);
        REQUIRE_THROWS_AS(extractor.check_ready(), DynamicNotRunError);
    }
}

TEST_CASE("ResultExtractor: trimmed views", "[result_extractor]") {
    TempModelFile model;
    ReferenceEngine engine;
    REQUIRE(load_demo_scenarios(engine, model));
    REQUIRE(engine.run(Stage::TRACER));

    SECTION("Packed group statistics drop the placeholder group and month") {
        ResultExtractor extractor(engine, ResultSource::DYNAMIC_GROUP_STATS);
        REQUIRE(extractor.is_packed());
        extractor.refresh();

        ArrayView trophic = extractor.get_result(GroupStat::TROPHIC_LEVEL);
        REQUIRE(trophic.shape == std::vector<size_t>{4, 24});
        REQUIRE_THAT(trophic.at({0, 23}), WithinAbs(3.6, 1e-12));
        REQUIRE(extractor.result_shape() == std::vector<size_t>{4, 24});

        REQUIRE_THROWS_AS(extractor.get_result(GroupStat::COUNT), IndexError);
    }

    SECTION("Concentrations drop the trailing group slot") {
        ResultExtractor extractor(engine, ResultSource::TRACER_CONCENTRATION);
        extractor.refresh();
        ArrayView conc = extractor.get_result();
        REQUIRE(conc.shape == std::vector<size_t>{5, 24});

        auto raw = engine.result_array(ResultSource::TRACER_CONCENTRATION);
        // Environment row, month 1 is the first kept month
        REQUIRE(conc.at({0, 0}) == raw.data[1]);
        REQUIRE(conc.at({2, 23}) == raw.data[2 * 25 + 24]);
    }

    SECTION("Fleet catch and ecosystem indicators") {
        ResultExtractor fleet(engine, ResultSource::DYNAMIC_FLEET_CATCH);
        fleet.refresh();
        REQUIRE(fleet.get_result().shape == std::vector<size_t>{1, 4, 24});

        ResultExtractor shannon(engine, ResultSource::DYNAMIC_SHANNON_DIVERSITY);
        shannon.refresh();
        REQUIRE(shannon.get_result().shape == std::vector<size_t>{24});
    }

    SECTION("Dense copy matches strided access") {
        ResultExtractor extractor(engine, ResultSource::TRACER_CONC_BIOMASS);
        extractor.refresh();
        ArrayView view = extractor.get_result();
        std::vector<double> dense(view.size());
        view.copy_to(dense.data());
        REQUIRE(dense[1 * 24 + 5] == view.at({1, 5}));
        REQUIRE(dense.back() == view.at({4, 23}));
    }

    SECTION("Extractor copy survives the next run") {
        ResultExtractor extractor(engine, ResultSource::TRACER_CONCENTRATION);
        extractor.refresh();
        double before = extractor.get_result().at({2, 23});

        engine.set_group_property(GroupProperty::DIRECT_ABSORPTION_RATE, {0.5}, {2});
        REQUIRE(engine.run(Stage::TRACER));
        REQUIRE(extractor.get_result().at({2, 23}) == before);

        extractor.refresh();
        REQUIRE(extractor.get_result().at({2, 23}) > before);
    }

    SECTION("A stage error leaves the buffer untouched") {
        ResultExtractor extractor(engine, ResultSource::DYNAMIC_GROUP_STATS);
        extractor.refresh();
        double before = extractor.get_result(GroupStat::BIOMASS).at({1, 10});

        engine.load_scenario(Subsystem::DYNAMIC, "baseline");  // resets stage flags
        REQUIRE_THROWS_AS(extractor.refresh(), StageNotReadyError);
        REQUIRE(extractor.has_buffer());
        REQUIRE(extractor.get_result(GroupStat::BIOMASS).at({1, 10}) == before);
    }

    SECTION("Changed duration is a shape change") {
        ResultExtractor extractor(engine, ResultSource::DYNAMIC_FIB);
        extractor.refresh();

        engine.set_scalar_property(ScalarProperty::N_YEARS, 3);
        REQUIRE(engine.run(Stage::DYNAMIC));
        REQUIRE_THROWS_AS(extractor.refresh(), ConfigurationError);
    }
}
