#include "scenario_runner.hpp"
#include <algorithm>
#include <chrono>

namespace ecobatch {

namespace {

double elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    auto end = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

} // anonymous namespace

ScenarioStatus run_single_scenario(const ScenarioStep& step, size_t scenario_index,
                                   const ExecutionContext& parent_ctx) {
    ExecutionContext ctx = parent_ctx;
    ctx.scenario_index = static_cast<long>(scenario_index);

    const int64_t scenario_id = step.scenarios.scenario_id(scenario_index);
    const auto start_time = std::chrono::steady_clock::now();
    ScenarioStatus status = ScenarioStatus::SUCCEEDED;

    try {
        ctx.phase = "apply";
        step.compositor.apply_variables(step.engine, step.scenarios.row(scenario_index));

        ctx.phase = "run";
        if (step.engine.run(step.run_stage)) {
            ctx.phase = "collect";
            step.results.collect(scenario_index);
        } else {
            status = ScenarioStatus::RUN_FAILED;
            EngineStateSnapshot state = step.engine.state();
            step.logger.log_run_failure(ctx, scenario_id, stage_to_string(step.run_stage), state.summary());

            switch (step.policy) {
                case RunFailurePolicy::FAIL_FAST:
                    step.results.mark_invalid(scenario_index);
                    throw EngineRunFailure(step.run_stage, "scenario " + std::to_string(scenario_id), state);

                case RunFailurePolicy::MARK_INVALID:
                    step.results.mark_invalid(scenario_index);
                    break;

                case RunFailurePolicy::COLLECT_ANYWAY:
                    ctx.phase = "collect";
                    try {
                        step.results.collect(scenario_index);
                    } catch (const StageNotReadyError& e) {
                        step.logger.log_warning(ctx, "No results to collect after failed run of scenario " +
                                                std::to_string(scenario_id) + ": " + e.what());
                        step.results.mark_invalid(scenario_index);
                    }
                    break;
            }
        }
    } catch (const EngineRunFailure&) {
        throw;
    } catch (const std::exception& e) {
        status = ScenarioStatus::ERRORED;
        step.logger.log_error(ctx, "Scenario " + std::to_string(scenario_id) + " failed during " +
                              ctx.phase + ": " + e.what());
        step.results.mark_invalid(scenario_index);
    }

    step.logger.log_scenario_complete(ctx, scenario_id, status, elapsed_ms_since(start_time));
    return status;
}

BatchMetrics summarize_statuses(const std::vector<ScenarioStatus>& statuses,
                                size_t n_workers, double elapsed_ms) {
    BatchMetrics metrics;
    metrics.n_scenarios = statuses.size();
    metrics.n_workers = n_workers;
    metrics.elapsed_ms = elapsed_ms;
    for (ScenarioStatus status : statuses) {
        switch (status) {
            case ScenarioStatus::SUCCEEDED: metrics.succeeded++; break;
            case ScenarioStatus::RUN_FAILED: metrics.run_failed++; break;
            case ScenarioStatus::ERRORED: metrics.errored++; break;
            case ScenarioStatus::PENDING: metrics.pending++; break;
        }
    }
    return metrics;
}

// ============================================================================
// ScenarioRunner
// ============================================================================

ScenarioRunner::ScenarioRunner(EngineSession& engine,
                               ParameterCompositor& compositor,
                               Stage run_stage,
                               RunFailurePolicy policy,
                               Logger* logger)
    : engine_(engine),
      compositor_(compositor),
      run_stage_(run_stage),
      policy_(policy),
      logger_(logger != nullptr ? logger : &Logger::get_instance()) {}

std::vector<ScenarioStatus> ScenarioRunner::run(const ScenarioTable& scenarios, ResultManager& results) {
    ExecutionContext ctx("runner");
    const size_t n_scenarios = scenarios.n_scenarios();
    logger_->log_batch_start(ctx, n_scenarios, 1, results.variable_names());

    ScenarioStep step{engine_, compositor_, results, scenarios, run_stage_, policy_, *logger_};
    std::vector<ScenarioStatus> statuses(n_scenarios, ScenarioStatus::PENDING);

    const auto start_time = std::chrono::steady_clock::now();
    const size_t progress_step = std::max<size_t>(1, n_scenarios / 10);

    for (size_t i = 0; i < n_scenarios; ++i) {
        statuses[i] = run_single_scenario(step, i, ctx);
        if ((i + 1) % progress_step == 0 || i + 1 == n_scenarios) {
            logger_->log_progress(ctx, i + 1, n_scenarios, elapsed_ms_since(start_time));
        }
    }

    logger_->log_batch_complete(ctx, summarize_statuses(statuses, 1, elapsed_ms_since(start_time)));
    return statuses;
}

} // namespace ecobatch
