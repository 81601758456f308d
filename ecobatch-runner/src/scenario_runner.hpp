/**
 * @file scenario_runner.hpp
 * @brief Per-scenario execution protocol and the sequential batch runner
 *
 * Every scenario, whether run in the parent or in a worker process, goes
 * through run_single_scenario():
 *   apply_variables(row) -> run(stage) -> collect(i)
 *
 * A false run() is logged and handled according to the RunFailurePolicy.
 * Any other exception while applying, running or collecting marks the
 * scenario ERRORED and NaN-fills its slot, except EngineRunFailure, which
 * ends the batch.
 */

#ifndef ECOBATCH_RUNNER_SCENARIO_RUNNER_HPP
#define ECOBATCH_RUNNER_SCENARIO_RUNNER_HPP

#include "batch_types.hpp"
#include "logger.hpp"
#include "parameter_compositor.hpp"
#include "result_manager.hpp"
#include "scenario_table.hpp"
#include <vector>

namespace ecobatch {

/**
 * @brief Everything one scenario run touches
 */
struct ScenarioStep {
    EngineSession& engine;
    ParameterCompositor& compositor;
    ResultManager& results;
    const ScenarioTable& scenarios;
    Stage run_stage;
    RunFailurePolicy policy;
    Logger& logger;
};

/**
 * @brief Run scenario i and record its results
 *
 * @throws EngineRunFailure If run() fails under FAIL_FAST (the slot is NaN-filled first)
 */
ScenarioStatus run_single_scenario(const ScenarioStep& step, size_t scenario_index,
                                   const ExecutionContext& ctx);

/**
 * @brief Count statuses for the batch completion event
 */
BatchMetrics summarize_statuses(const std::vector<ScenarioStatus>& statuses,
                                size_t n_workers, double elapsed_ms);

/**
 * @brief Runs every scenario of a table in the calling process
 */
class ScenarioRunner {
public:
    ScenarioRunner(EngineSession& engine,
                   ParameterCompositor& compositor,
                   Stage run_stage,
                   RunFailurePolicy policy,
                   Logger* logger = nullptr);

    /**
     * @brief Run all rows in table order
     *
     * @return One status per row
     * @throws EngineRunFailure Under FAIL_FAST, at the first failed run
     */
    std::vector<ScenarioStatus> run(const ScenarioTable& scenarios, ResultManager& results);

private:
    EngineSession& engine_;
    ParameterCompositor& compositor_;
    Stage run_stage_;
    RunFailurePolicy policy_;
    Logger* logger_;
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_SCENARIO_RUNNER_HPP
