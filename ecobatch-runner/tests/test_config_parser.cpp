/**
 * @file test_config_parser.cpp
 * @brief Unit tests for batch configuration parsing
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/config_parser.hpp"
#include "runner_fixture.hpp"
#include <cstdlib>
#include <fstream>

using namespace ecobatch;
using namespace ecobatch::testing;

namespace {

const char* MINIMAL_CONFIG = R"({
    "model_path": "/models/bay.json",
    "scenarios": "/batches/scenarios.csv",
    "save_variables": ["Biomass", "Concentration"]
})";

} // anonymous namespace

TEST_CASE("ConfigParser: minimal configuration", "[config_parser]") {
    BatchConfig config = parse_batch_config_from_string(MINIMAL_CONFIG);

    REQUIRE(config.interface.model_path == "/models/bay.json");
    REQUIRE(config.scenarios_path == "/batches/scenarios.csv");
    REQUIRE(config.save_variables == std::vector<std::string>{"Biomass", "Concentration"});

    SECTION("Defaults") {
        REQUIRE(config.interface.engine_type == "reference");
        REQUIRE(config.interface.dynamic_scenario.empty());
        REQUIRE(config.interface.constant_dynamic == false);
        REQUIRE(config.interface.run_stage == Stage::TRACER);
        REQUIRE(config.interface.failure_policy == RunFailurePolicy::COLLECT_ANYWAY);
        REQUIRE(config.simulation_years == 0);
        REQUIRE(config.workers == 1);
        REQUIRE(config.constant_parameters.empty());
        REQUIRE(config.output.directory == "results");
        REQUIRE(config.output.formats == std::vector<OutputFormat>{OutputFormat::CSV});
        REQUIRE(config.interface.cleanup.max_attempts == 5);
        REQUIRE(config.logging.enable_file == false);
    }
}

TEST_CASE("ConfigParser: full configuration", "[config_parser]") {
    const char* json = R"({
        "model_path": "/models/bay.json",
        "engine": "reference",
        "private_model_path": "/tmp/debug/bay.json",
        "dynamic_scenario": "baseline",
        "constant_dynamic": true,
        "run_stage": "Dynamic",
        "failure_policy": "FAIL_FAST",
        "simulation_years": 5,
        "scenarios": "/batches/scenarios.parquet",
        "constant_parameters": {"env_decay_r": 0.1, "init_c_1_Baleen Whale": 0.0},
        "save_variables": ["FIB"],
        "workers": 0,
        "output": {"directory": "/out", "formats": ["parquet", "json"]},
        "logging": {"level": "DEBUG", "json": false, "console": false, "file": "/logs/batch.log"},
        "cleanup": {"max_attempts": 3, "retry_delay_ms": 10}
    })";

    BatchConfig config = parse_batch_config_from_string(json);

    REQUIRE(config.interface.private_model_path == "/tmp/debug/bay.json");
    REQUIRE(config.interface.dynamic_scenario == "baseline");
    REQUIRE(config.interface.constant_dynamic);
    REQUIRE(config.interface.run_stage == Stage::DYNAMIC);
    REQUIRE(config.interface.failure_policy == RunFailurePolicy::FAIL_FAST);
    REQUIRE(config.simulation_years == 5);
    REQUIRE(config.constant_parameters.size() == 2);
    REQUIRE(config.constant_parameters.at("env_decay_r") == 0.1);
    REQUIRE(config.workers == 0);
    REQUIRE(config.output.formats == std::vector<OutputFormat>{OutputFormat::PARQUET, OutputFormat::JSON});
    REQUIRE(config.logging.min_level == LogLevel::DEBUG);
    REQUIRE_FALSE(config.logging.enable_json);
    REQUIRE_FALSE(config.logging.enable_console);
    REQUIRE(config.logging.enable_file);
    REQUIRE(config.logging.log_file_path == "/logs/batch.log");
    REQUIRE(config.interface.cleanup.max_attempts == 3);
    REQUIRE(config.interface.cleanup.retry_delay_ms == 10);
}

TEST_CASE("ConfigParser: errors", "[config_parser]") {
    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(parse_batch_config_from_string("{ not json"), ConfigParseError);
    }

    SECTION("Missing required fields") {
        REQUIRE_THROWS_AS(parse_batch_config_from_string(R"({"scenarios": "s.csv", "save_variables": ["FIB"]})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_batch_config_from_string(R"({"model_path": "m.json", "save_variables": ["FIB"]})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_batch_config_from_string(R"({"model_path": "m.json", "scenarios": "s.csv"})"),
                          ConfigParseError);
    }

    SECTION("Wrong value types") {
        REQUIRE_THROWS_AS(parse_batch_config_from_string(
            R"({"model_path": 3, "scenarios": "s.csv", "save_variables": ["FIB"]})"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_batch_config_from_string(
            R"({"model_path": "m.json", "scenarios": "s.csv", "save_variables": ["FIB"], "workers": "four"})"),
            ConfigParseError);
    }

    SECTION("Negative worker count") {
        REQUIRE_THROWS_AS(parse_batch_config_from_string(
            R"({"model_path": "m.json", "scenarios": "s.csv", "save_variables": ["FIB"], "workers": -1})"),
            ConfigParseError);
    }

    SECTION("Unknown names") {
        REQUIRE_THROWS_AS(parse_batch_config_from_string(
            R"({"model_path": "m.json", "scenarios": "s.csv", "save_variables": ["FIB"], "run_stage": "ecospace"})"),
            ConfigurationError);
        REQUIRE_THROWS_AS(parse_batch_config_from_string(
            R"({"model_path": "m.json", "scenarios": "s.csv", "save_variables": ["FIB"], "failure_policy": "retry"})"),
            ConfigurationError);
        REQUIRE_THROWS_AS(parse_batch_config_from_string(
            R"({"model_path": "m.json", "scenarios": "s.csv", "save_variables": ["Salinity"]})"),
            ConfigurationError);
        REQUIRE_THROWS_AS(parse_batch_config_from_string(
            R"({"model_path": "m.json", "scenarios": "s.csv", "save_variables": ["FIB"], "output": {"formats": ["netcdf"]}})"),
            ConfigurationError);
    }

    SECTION("Invalid values") {
        REQUIRE_THROWS_AS(parse_batch_config_from_string(
            R"({"model_path": "m.json", "scenarios": "s.csv", "save_variables": []})"), ConfigurationError);
        REQUIRE_THROWS_AS(parse_batch_config_from_string(
            R"({"model_path": "m.json", "scenarios": "s.csv", "save_variables": ["FIB", "FIB"]})"),
            ConfigurationError);
        REQUIRE_THROWS_AS(parse_batch_config_from_string(
            R"({"model_path": "m.json", "scenarios": "s.csv", "save_variables": ["FIB"], "simulation_years": -2})"),
            ConfigurationError);
        REQUIRE_THROWS_AS(parse_batch_config_from_string(
            R"({"model_path": "m.json", "scenarios": "s.csv", "save_variables": ["FIB"], "output": {"formats": []}})"),
            ConfigurationError);
        REQUIRE_THROWS_AS(parse_batch_config_from_string(
            R"({"model_path": "m.json", "scenarios": "s.csv", "save_variables": ["FIB"], "cleanup": {"max_attempts": 0}})"),
            ConfigurationError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(parse_batch_config_from_file("/nonexistent/batch.json"), ConfigParseError);
    }
}

TEST_CASE("ConfigParser: stage and policy names", "[config_parser]") {
    REQUIRE(parse_run_stage("mass_balance") == Stage::MASS_BALANCE);
    REQUIRE(parse_run_stage("TRACER") == Stage::TRACER);
    REQUIRE(parse_failure_policy("Mark_Invalid") == RunFailurePolicy::MARK_INVALID);
    REQUIRE(parse_failure_policy("collect_anyway") == RunFailurePolicy::COLLECT_ANYWAY);
    REQUIRE_THROWS_AS(parse_run_stage(""), ConfigurationError);
}

TEST_CASE("ConfigParser: environment variables", "[config_parser]") {
    setenv("ECOBATCH_TEST_ROOT", "/data/eco", 1);
    unsetenv("ECOBATCH_TEST_UNSET");

    SECTION("Braced and bare references") {
        REQUIRE(expand_environment_variables("${ECOBATCH_TEST_ROOT}/bay.json") == "/data/eco/bay.json");
        REQUIRE(expand_environment_variables("$ECOBATCH_TEST_ROOT/bay.json") == "/data/eco/bay.json");
    }

    SECTION("Unset variables expand to nothing") {
        REQUIRE(expand_environment_variables("/x/${ECOBATCH_TEST_UNSET}/y") == "/x//y");
    }

    SECTION("A lone dollar sign is kept") {
        REQUIRE(expand_environment_variables("cost$ and $") == "cost$ and $");
    }

    SECTION("Paths in a configuration are expanded") {
        BatchConfig config = parse_batch_config_from_string(R"({
            "model_path": "${ECOBATCH_TEST_ROOT}/bay.json",
            "scenarios": "$ECOBATCH_TEST_ROOT/scenarios.csv",
            "save_variables": ["FIB"],
            "output": {"directory": "${ECOBATCH_TEST_ROOT}/out"}
        })");
        REQUIRE(config.interface.model_path == "/data/eco/bay.json");
        REQUIRE(config.scenarios_path == "/data/eco/scenarios.csv");
        REQUIRE(config.output.directory == "/data/eco/out");
    }

    unsetenv("ECOBATCH_TEST_ROOT");
}

TEST_CASE("ConfigParser: relative paths", "[config_parser]") {
    SECTION("resolve_relative_path") {
        REQUIRE(resolve_relative_path("bay.json", "/etc/ecobatch/batch.json") == "/etc/ecobatch/bay.json");
        REQUIRE(resolve_relative_path("/abs/bay.json", "/etc/ecobatch/batch.json") == "/abs/bay.json");
        REQUIRE(resolve_relative_path("", "/etc/ecobatch/batch.json").empty());
    }

    SECTION("Paths are resolved against the config file") {
        TempModelFile scratch;
        const std::string path = scratch.directory() + "/batch.json";
        std::ofstream(path) << R"({
            "model_path": "models/bay.json",
            "scenarios": "scenarios.csv",
            "save_variables": ["Biomass"],
            "output": {"directory": "out"},
            "logging": {"file": "logs/batch.log"}
        })";

        BatchConfig config = parse_batch_config_from_file(path);
        REQUIRE(config.interface.model_path == scratch.directory() + "/models/bay.json");
        REQUIRE(config.scenarios_path == scratch.directory() + "/scenarios.csv");
        REQUIRE(config.output.directory == scratch.directory() + "/out");
        REQUIRE(config.logging.log_file_path == scratch.directory() + "/logs/batch.log");
        REQUIRE(config.interface.private_model_path.empty());
    }
}
