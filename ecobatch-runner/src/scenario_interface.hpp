/**
 * @file scenario_interface.hpp
 * @brief Top-level facade for batch scenario runs
 *
 * A ScenarioInterface owns the parent process' engine session, bound to a
 * private copy of the model file, and the parameter catalog built for it.
 * Baseline edits (constants, durations, group info, vulnerabilities, forcing
 * functions) go to that session; run_scenarios() and run_scenarios_parallel()
 * then execute a scenario table on top of the baseline and return a ResultSet.
 *
 * Usage Example:
 *   @code
 *   InterfaceConfig config;
 *   config.model_path = "bay.json";
 *   ScenarioInterface interface(config);
 *
 *   interface.set_constant_parameters({"env_decay_r"}, {0.2});
 *   ScenarioTable scenarios = ScenarioTable::from_csv("scenarios.csv");
 *   ResultSet results = interface.run_scenarios_parallel(scenarios, {"Biomass", "Concentration"}, 4);
 *   ResultWriter("out", {OutputFormat::CSV}).write(results);
 *   @endcode
 */

#ifndef ECOBATCH_RUNNER_SCENARIO_INTERFACE_HPP
#define ECOBATCH_RUNNER_SCENARIO_INTERFACE_HPP

#include "../../ecobatch-engine/src/engine_factory.hpp"
#include "batch_types.hpp"
#include "io/flat_table.hpp"
#include "logger.hpp"
#include "parameter_compositor.hpp"
#include "result_set.hpp"
#include "scenario_table.hpp"
#include "worker_lifecycle.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ecobatch {

/**
 * @brief Setup of a ScenarioInterface
 */
struct InterfaceConfig {
    std::string model_path;            ///< Source model, never modified
    std::string engine_type;           ///< EngineFactory type (default: "reference")
    std::string private_model_path;    ///< Debug copy location, left in place on cleanup
    std::string dynamic_scenario;      ///< Baseline dynamic scenario; empty creates a temporary one
    bool constant_dynamic;             ///< Leave dynamic parameters out of the catalog
    Stage run_stage;                   ///< Stage every scenario runs to (default: TRACER)
    RunFailurePolicy failure_policy;   ///< Handling of failed runs (default: COLLECT_ANYWAY)
    CleanupPolicy cleanup;

    InterfaceConfig()
        : engine_type(EngineType::REFERENCE),
          constant_dynamic(false),
          run_stage(Stage::TRACER),
          failure_policy(RunFailurePolicy::COLLECT_ANYWAY) {}
};

/**
 * @brief Group info table as shown in the model editor: column name -> one value per group
 */
using GroupInfoTable = std::map<std::string, std::vector<double>>;

class ScenarioInterface {
public:
    static constexpr const char* TEMP_DYNAMIC_SCENARIO = "tmp_dynamic_scen";
    static constexpr const char* TEMP_TRACER_SCENARIO = "tmp_tracer_scen";

    /**
     * @brief Copy the model, open it and prepare the baseline scenarios
     *
     * @throws InitializationError If the model cannot be copied or loaded, or a
     *         scenario cannot be created
     * @throws LookupError If the named dynamic scenario does not exist
     * @throws ConfigurationError If the engine type is unknown
     */
    explicit ScenarioInterface(const InterfaceConfig& config,
                               EngineFactory factory = EngineFactory(),
                               Logger* logger = nullptr);

    ~ScenarioInterface();

    ScenarioInterface(const ScenarioInterface&) = delete;
    ScenarioInterface& operator=(const ScenarioInterface&) = delete;

    // ------------------------------------------------------------------
    // Parameters
    // ------------------------------------------------------------------

    /**
     * @brief Forget all constant and variable parameter assignments
     */
    void reset_parameters();

    std::vector<std::string> available_parameter_names(const ParameterQuery& query = ParameterQuery()) const;

    /**
     * @brief Map editor column names and group names to parameter names
     *
     * full_names[k] pairs with groups[k], e.g. ("Initial conc. (t/t)", "Mackerel")
     * becomes "init_c_2_Mackerel".
     *
     * @throws ConfigurationError If the lists differ in length or a column name is unknown
     * @throws LookupError If a group name is unknown
     */
    std::vector<std::string> format_parameter_names(const std::vector<std::string>& full_names,
                                                    const std::vector<std::string>& groups) const;

    /**
     * @brief Mark parameters constant and write them to the baseline
     *
     * @throws ConfigurationError If a name is unknown or the lists differ in length
     */
    void set_constant_parameters(const std::vector<std::string>& names, const std::vector<double>& values);

    /**
     * @brief Scenario table with ids 1..n_scenarios and zero values
     *
     * @throws ConfigurationError If a name is not a parameter
     */
    ScenarioTable empty_scenario_table(const std::vector<std::string>& names, size_t n_scenarios) const;

    /**
     * @brief Long-format template with columns Scenario, Group, Parameter and Value
     *
     * Each scenario 1..n_scenarios lists the environment parameters under the
     * group "Environment", then every group prefix for every functional group.
     * Values are NaN.
     */
    FlatTable long_scenario_template(size_t n_scenarios) const;

    // ------------------------------------------------------------------
    // Baseline edits
    // ------------------------------------------------------------------

    /**
     * @throws ConfigurationError If n_years < 1
     */
    void set_simulation_duration(int n_years);

    /**
     * @brief Apply the dynamic group info table
     *
     * Consumer columns are read for the first n_consumers rows, "Max rel. P/B"
     * for the producer rows. Unsupported and unknown columns are skipped with a
     * warning.
     *
     * @throws ConfigurationError If a column has fewer rows than it needs
     */
    void set_dynamic_group_info(const GroupInfoTable& group_info);

    /**
     * @brief Set prey x predator vulnerabilities
     *
     * matrix[prey][predator] for all groups as prey and consumers as predators.
     * NaN entries are left unchanged.
     *
     * @throws ConfigurationError If the shape is not (n_groups, n_consumers)
     */
    void set_vulnerabilities(const std::vector<std::vector<double>>& matrix);

    /**
     * @return 1-based forcing function index
     */
    int add_forcing_function(const std::string& name, const std::vector<double>& values);

    // ------------------------------------------------------------------
    // Runs
    // ------------------------------------------------------------------

    /**
     * @brief Run every scenario in this process
     *
     * @throws ConfigurationError If a column is not a parameter (before any engine call)
     * @throws LookupError If a variable name is unknown
     * @throws EngineRunFailure Under FAIL_FAST
     */
    ResultSet run_scenarios(const ScenarioTable& scenarios, const std::vector<std::string>& variables);

    /**
     * @brief Run scenarios across worker processes
     *
     * @param n_workers Worker count, 0 selects the hardware concurrency
     */
    ResultSet run_scenarios_parallel(const ScenarioTable& scenarios,
                                     const std::vector<std::string>& variables,
                                     size_t n_workers);

    // ------------------------------------------------------------------
    // Teardown
    // ------------------------------------------------------------------

    /**
     * @brief Close the engine and remove the temporary model directory. Idempotent.
     */
    void cleanup() noexcept;

    // ------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------

    EngineSession& engine();
    const ParameterCompositor& compositor() const { return compositor_; }
    const InterfaceConfig& config() const { return config_; }
    const std::string& working_model_path() const { return working_model_path_; }
    const std::string& dynamic_scenario_name() const { return dynamic_scenario_; }
    const std::string& tracer_scenario_name() const { return tracer_scenario_; }

private:
    InterfaceConfig config_;
    EngineFactory factory_;
    Logger* logger_;
    ExecutionContext ctx_;
    std::string temp_dir_;              ///< Empty when a debug path is used
    std::string working_model_path_;
    std::string dynamic_scenario_;
    std::string tracer_scenario_;
    std::unique_ptr<EngineSession> engine_;
    ParameterCompositor compositor_;
    bool closed_;

    void setup();
    void prepare_working_copy();
    void reopen_model();

    void require_open() const;
    void prepare_batch(const ScenarioTable& scenarios);
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_SCENARIO_INTERFACE_HPP
