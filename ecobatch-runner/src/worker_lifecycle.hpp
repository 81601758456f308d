/**
 * @file worker_lifecycle.hpp
 * @brief Per-process worker state built from a recipe
 *
 * A worker never receives a live engine handle. It gets a WorkerRecipe (model
 * path, engine type, scenario names, parameter state, shared stores) and builds
 * its own engine on a private copy of the model file:
 *
 *   UNINITIALIZED -> INITIALIZING -> READY -> RUNNING -> READY -> ... -> SHUTDOWN
 *                                 \-> ERROR
 *
 * Teardown (engine close, private copy removal) happens in shutdown(), which
 * the destructor calls.
 */

#ifndef ECOBATCH_RUNNER_WORKER_LIFECYCLE_HPP
#define ECOBATCH_RUNNER_WORKER_LIFECYCLE_HPP

#include "../../ecobatch-engine/src/engine_factory.hpp"
#include "batch_types.hpp"
#include "buffer_manager.hpp"
#include "logger.hpp"
#include "parameter_compositor.hpp"
#include "result_manager.hpp"
#include "scenario_table.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ecobatch {

/**
 * @brief Bounded retry for removing temporary files
 */
struct CleanupPolicy {
    size_t max_attempts;     ///< Attempts before giving up (default: 5)
    size_t retry_delay_ms;   ///< Base delay, doubled after every failed attempt (default: 50ms)

    CleanupPolicy() : max_attempts(5), retry_delay_ms(50) {}
};

/**
 * @brief Remove a file or directory tree, retrying with exponential backoff
 *
 * A path that does not exist counts as removed. The outcome is logged; a final
 * failure is not an error.
 *
 * @return true if the path is gone
 */
bool remove_with_retry(const std::string& path,
                       const CleanupPolicy& policy,
                       Logger& logger,
                       const ExecutionContext& ctx) noexcept;

/**
 * @brief Private model copy of a process: <dir>/<stem>_tmp_<pid><ext>
 */
std::string private_model_path(const std::string& model_path, long pid);

/**
 * @brief Everything a worker needs to rebuild the parent's engine setup
 */
struct WorkerRecipe {
    std::string model_path;          ///< Saved model, copied by every worker
    std::string engine_type;
    std::string dynamic_scenario;    ///< Activated by name
    std::string tracer_scenario;     ///< Empty when the run stops before TRACER
    ParameterCompositor compositor;  ///< Value copy, variables already bound to columns
    BufferManager* shared_store;     ///< Shared stores allocated by the parent
    std::vector<std::string> variables;
    ScenarioTable scenarios;
    Stage run_stage;
    RunFailurePolicy failure_policy;
    CleanupPolicy cleanup;

    WorkerRecipe()
        : engine_type(EngineType::REFERENCE),
          shared_store(nullptr),
          run_stage(Stage::TRACER),
          failure_policy(RunFailurePolicy::COLLECT_ANYWAY) {}
};

/**
 * @brief Worker statistics
 */
struct WorkerStats {
    size_t scenarios_run;
    size_t succeeded;
    size_t failed;
    double total_execution_time_ms;

    WorkerStats()
        : scenarios_run(0), succeeded(0), failed(0), total_execution_time_ms(0.0) {}
};

class WorkerContext {
public:
    /**
     * @param recipe Setup to reproduce
     * @param factory Factory providing the recipe's engine type
     * @param logger Logger, defaults to the singleton
     */
    WorkerContext(WorkerRecipe recipe,
                  const EngineFactory& factory,
                  Logger* logger = nullptr);

    ~WorkerContext();

    WorkerContext(const WorkerContext&) = delete;
    WorkerContext& operator=(const WorkerContext&) = delete;

    /**
     * @brief Copy the model, open the engine, activate scenarios, apply constants
     *        and bind a ResultManager to the shared stores
     *
     * @throws InitializationError If any step fails (state becomes ERROR)
     * @throws std::runtime_error If not UNINITIALIZED
     */
    void initialize();

    /**
     * @brief Run one scenario through the shared per-scenario protocol
     *
     * @throws std::runtime_error If not READY
     * @throws EngineRunFailure Under FAIL_FAST
     */
    ScenarioStatus run_scenario(size_t scenario_index);

    /**
     * @brief Close the engine and remove the private model copy. Idempotent.
     */
    void shutdown() noexcept;

    WorkerState get_state() const { return state_; }
    WorkerStats get_stats() const { return stats_; }
    const std::string& private_path() const { return private_path_; }

    /**
     * @throws std::runtime_error If no engine exists yet
     */
    EngineSession& engine();

private:
    WorkerRecipe recipe_;
    const EngineFactory& factory_;
    Logger* logger_;
    ExecutionContext ctx_;
    WorkerState state_;
    WorkerStats stats_;
    std::string private_path_;
    std::unique_ptr<EngineSession> engine_;
    std::unique_ptr<ResultManager> results_;

    void transition_state(WorkerState new_state);
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_WORKER_LIFECYCLE_HPP
