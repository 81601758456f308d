/**
 * @file batch_example.cpp
 * @brief Runs one scenario batch described by a JSON config
 *
 * Example config:
 *   {
 *     "model_path": "models/bay.json",
 *     "run_stage": "tracer",
 *     "simulation_years": 10,
 *     "scenarios": "scenarios.csv",
 *     "constant_parameters": {"env_decay_r": 0.2},
 *     "save_variables": ["Biomass", "Concentration", "Kemptons Q"],
 *     "workers": 4,
 *     "output": {"directory": "results", "formats": ["csv", "json"]},
 *     "logging": {"level": "INFO", "json": false}
 *   }
 */

#include "../src/config_parser.hpp"
#include "../src/io/parquet_io.hpp"
#include "../src/result_writer.hpp"
#include "../src/scenario_interface.hpp"
#include <cctype>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace ecobatch;

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <config.json>\n\n";
    std::cerr << "Runs every scenario of the configured scenario table (.csv or .parquet)\n";
    std::cerr << "against the configured model and writes the saved variables to the\n";
    std::cerr << "output directory.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --help                      Show this help message\n";
}

ScenarioTable load_scenarios(const std::string& path) {
    std::string extension = std::filesystem::path(path).extension().string();
    for (auto& c : extension) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (extension == ".parquet") {
        ScenarioTable table;
        ParquetReader reader;
        if (!reader.read_scenario_table(path, table)) {
            throw ConfigurationError("Cannot read scenario table: " + reader.get_last_error());
        }
        return table;
    }
    return ScenarioTable::from_csv(path);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc != 2 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h") {
        print_usage(argv[0]);
        return argc == 2 ? 0 : 1;
    }

    try {
        BatchConfig config = parse_batch_config_from_file(argv[1]);
        Logger::get_instance().configure(config.logging);

        ScenarioTable scenarios = load_scenarios(config.scenarios_path);

        ScenarioInterface interface(config.interface);
        if (config.simulation_years > 0) {
            interface.set_simulation_duration(config.simulation_years);
        }
        if (!config.constant_parameters.empty()) {
            std::vector<std::string> names;
            std::vector<double> values;
            for (const auto& pair : config.constant_parameters) {
                names.push_back(pair.first);
                values.push_back(pair.second);
            }
            interface.set_constant_parameters(names, values);
        }

        ResultSet results = config.workers == 1
            ? interface.run_scenarios(scenarios, config.save_variables)
            : interface.run_scenarios_parallel(scenarios, config.save_variables, config.workers);

        std::cout << results.summary() << std::endl;

        ResultWriter writer(config.output.directory, config.output.formats);
        for (const auto& path : writer.write(results)) {
            std::cout << "Wrote " << path << std::endl;
        }

        interface.cleanup();
        Logger::get_instance().flush();
        return results.all_succeeded() ? 0 : 2;

    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
