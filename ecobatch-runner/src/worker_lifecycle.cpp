/**
 * @file worker_lifecycle.cpp
 * @brief Implementation of WorkerContext
 */

#include "worker_lifecycle.hpp"
#include "scenario_runner.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace ecobatch {

bool remove_with_retry(const std::string& path,
                       const CleanupPolicy& policy,
                       Logger& logger,
                       const ExecutionContext& ctx) noexcept {
    try {
        const size_t max_attempts = std::max<size_t>(1, policy.max_attempts);
        std::string last_error;

        for (size_t attempt = 0; attempt < max_attempts; ++attempt) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
            if (!ec && !std::filesystem::exists(path, ec)) {
                logger.log_cleanup(ctx, path, true, attempt + 1);
                return true;
            }
            last_error = ec ? ec.message() : "path still exists";

            if (attempt + 1 < max_attempts) {
                size_t delay_ms = policy.retry_delay_ms * (static_cast<size_t>(1) << attempt);  // 50ms, 100ms, 200ms, ...
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            }
        }

        logger.log_cleanup(ctx, path, false, max_attempts);
        logger.log_error(ctx, "Could not remove " + path + ": " + last_error);
        return false;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception while removing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

std::string private_model_path(const std::string& model_path, long pid) {
    std::filesystem::path source(model_path);
    std::string filename = source.stem().string() + "_tmp_" + std::to_string(pid) +
                           source.extension().string();
    return (source.parent_path() / filename).string();
}

// ============================================================================
// WorkerContext
// ============================================================================

WorkerContext::WorkerContext(WorkerRecipe recipe,
                             const EngineFactory& factory,
                             Logger* logger)
    : recipe_(std::move(recipe)),
      factory_(factory),
      logger_(logger != nullptr ? logger : &Logger::get_instance()),
      ctx_("worker", static_cast<long>(::getpid())),
      state_(WorkerState::UNINITIALIZED) {}

WorkerContext::~WorkerContext() {
    shutdown();
}

void WorkerContext::initialize() {
    if (state_ != WorkerState::UNINITIALIZED) {
        throw std::runtime_error("Worker already initialized. Current state: " +
                                 state_to_string(state_));
    }

    transition_state(WorkerState::INITIALIZING);
    ctx_.phase = "init";

    try {
        private_path_ = private_model_path(recipe_.model_path, ctx_.worker_id);

        std::error_code ec;
        std::filesystem::copy_file(recipe_.model_path, private_path_,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            throw InitializationError("Cannot copy model " + recipe_.model_path + " to " +
                                      private_path_ + ": " + ec.message());
        }

        engine_ = factory_.create_engine(recipe_.engine_type);
        if (!engine_->load_model(private_path_)) {
            throw InitializationError("Cannot load model " + private_path_);
        }

        engine_->load_scenario(Subsystem::DYNAMIC, recipe_.dynamic_scenario);
        if (!recipe_.tracer_scenario.empty()) {
            engine_->load_scenario(Subsystem::TRACER, recipe_.tracer_scenario);
        }

        recipe_.compositor.apply_constants(*engine_);

        results_ = std::make_unique<ResultManager>(*engine_, recipe_.variables, recipe_.scenarios,
                                                   recipe_.shared_store, logger_);
        transition_state(WorkerState::READY);
    } catch (const InitializationError&) {
        transition_state(WorkerState::ERROR);
        throw;
    } catch (const std::exception& e) {
        transition_state(WorkerState::ERROR);
        throw InitializationError(std::string("Unexpected error during worker initialization: ") + e.what());
    }
}

ScenarioStatus WorkerContext::run_scenario(size_t scenario_index) {
    if (state_ != WorkerState::READY) {
        throw std::runtime_error("Worker not ready. Current state: " + state_to_string(state_));
    }

    transition_state(WorkerState::RUNNING);
    auto start_time = std::chrono::steady_clock::now();

    ScenarioStep step{*engine_, recipe_.compositor, *results_, recipe_.scenarios,
                      recipe_.run_stage, recipe_.failure_policy, *logger_};
    ScenarioStatus status;
    try {
        status = run_single_scenario(step, scenario_index, ctx_);
    } catch (const EngineRunFailure&) {
        stats_.scenarios_run++;
        stats_.failed++;
        transition_state(WorkerState::READY);
        throw;
    }

    auto end_time = std::chrono::steady_clock::now();
    stats_.scenarios_run++;
    stats_.total_execution_time_ms += std::chrono::duration<double, std::milli>(end_time - start_time).count();
    if (status == ScenarioStatus::SUCCEEDED) {
        stats_.succeeded++;
    } else {
        stats_.failed++;
    }

    transition_state(WorkerState::READY);
    return status;
}

void WorkerContext::shutdown() noexcept {
    if (state_ == WorkerState::SHUTDOWN) {
        return;  // Already shut down
    }

    ctx_.phase = "cleanup";
    results_.reset();
    if (engine_) {
        engine_->close_model();
        engine_.reset();
    }
    if (!private_path_.empty()) {
        remove_with_retry(private_path_, recipe_.cleanup, *logger_, ctx_);
    }

    transition_state(WorkerState::SHUTDOWN);
}

EngineSession& WorkerContext::engine() {
    if (!engine_) {
        throw std::runtime_error("Worker has no engine. Current state: " + state_to_string(state_));
    }
    return *engine_;
}

void WorkerContext::transition_state(WorkerState new_state) {
    if (new_state != state_) {
        logger_->log_state_transition(ctx_, state_, new_state);
    }
    state_ = new_state;
}

} // namespace ecobatch
