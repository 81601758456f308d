/**
 * @file batch_types.hpp
 * @brief Small enums shared by the runner, the worker pool and the logger
 */

#ifndef ECOBATCH_RUNNER_BATCH_TYPES_HPP
#define ECOBATCH_RUNNER_BATCH_TYPES_HPP

#include <cstdint>
#include <string>

namespace ecobatch {

/**
 * @brief Outcome of one scenario, stored in shared memory by the worker that ran it
 */
enum class ScenarioStatus : int32_t {
    PENDING = 0,      ///< Not dispatched or worker died before finishing
    SUCCEEDED = 1,    ///< Run returned true and results were collected
    RUN_FAILED = 2,   ///< Run returned false (handled per RunFailurePolicy)
    ERRORED = 3       ///< An exception was raised while applying, running or collecting
};

inline std::string status_to_string(ScenarioStatus status) {
    switch (status) {
        case ScenarioStatus::PENDING: return "PENDING";
        case ScenarioStatus::SUCCEEDED: return "SUCCEEDED";
        case ScenarioStatus::RUN_FAILED: return "RUN_FAILED";
        case ScenarioStatus::ERRORED: return "ERRORED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief What to do when the engine reports a failed run
 */
enum class RunFailurePolicy {
    COLLECT_ANYWAY,   ///< Log, then extract whatever the engine holds
    MARK_INVALID,     ///< Log, skip extraction and leave the scenario NaN
    FAIL_FAST         ///< Stop the batch and raise EngineRunFailure
};

inline std::string policy_to_string(RunFailurePolicy policy) {
    switch (policy) {
        case RunFailurePolicy::COLLECT_ANYWAY: return "collect_anyway";
        case RunFailurePolicy::MARK_INVALID: return "mark_invalid";
        case RunFailurePolicy::FAIL_FAST: return "fail_fast";
        default: return "unknown";
    }
}

/**
 * @brief Worker lifecycle state
 */
enum class WorkerState {
    UNINITIALIZED,  ///< Recipe received, nothing opened
    INITIALIZING,   ///< Copying model, loading engine and scenarios
    READY,          ///< Waiting for the next scenario index
    RUNNING,        ///< Applying, running and collecting one scenario
    ERROR,          ///< Initialization failed
    SHUTDOWN        ///< Engine closed, private model copy removed
};

inline std::string state_to_string(WorkerState state) {
    switch (state) {
        case WorkerState::UNINITIALIZED: return "UNINITIALIZED";
        case WorkerState::INITIALIZING: return "INITIALIZING";
        case WorkerState::READY: return "READY";
        case WorkerState::RUNNING: return "RUNNING";
        case WorkerState::ERROR: return "ERROR";
        case WorkerState::SHUTDOWN: return "SHUTDOWN";
        default: return "UNKNOWN";
    }
}

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_BATCH_TYPES_HPP
