/**
 * @file batch_config.hpp
 * @brief Description of one batch: model, baseline edits, scenarios and outputs
 */

#ifndef ECOBATCH_RUNNER_BATCH_CONFIG_HPP
#define ECOBATCH_RUNNER_BATCH_CONFIG_HPP

#include "logger.hpp"
#include "result_writer.hpp"
#include "scenario_interface.hpp"
#include <map>
#include <string>
#include <vector>

namespace ecobatch {

/**
 * @brief Where and how results are written
 */
struct OutputSettings {
    std::string directory;               // Output directory
    std::vector<OutputFormat> formats;   // At least one format

    OutputSettings() : directory("results"), formats{OutputFormat::CSV} {}
};

/**
 * @brief Complete batch configuration
 */
struct BatchConfig {
    InterfaceConfig interface;                           // Model, scenarios, stage, policy, cleanup
    int simulation_years;                                // 0 keeps the model's duration
    std::string scenarios_path;                          // .csv or .parquet scenario table
    std::map<std::string, double> constant_parameters;   // Baseline values, applied before the batch
    std::vector<std::string> save_variables;             // Result variables to collect
    size_t workers;                                      // 1 runs in-process, 0 uses the hardware concurrency
    OutputSettings output;
    LoggerConfig logging;

    BatchConfig() : simulation_years(0), workers(1) {}
};

/**
 * @brief Parse a run stage name: "mass_balance", "dynamic" or "tracer" (any case)
 *
 * @throws ConfigurationError For any other name
 */
Stage parse_run_stage(const std::string& name);

/**
 * @brief Parse a failure policy name: "collect_anyway", "mark_invalid" or "fail_fast" (any case)
 *
 * @throws ConfigurationError For any other name
 */
RunFailurePolicy parse_failure_policy(const std::string& name);

/**
 * @brief Check a parsed configuration
 *
 * @throws ConfigurationError If a required field is missing or a value is out of range
 */
void validate_batch_config(const BatchConfig& config);

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_BATCH_CONFIG_HPP
