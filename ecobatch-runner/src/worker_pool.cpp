/**
 * @file worker_pool.cpp
 * @brief Implementation of SharedDispatch and WorkerPool
 */

#include "worker_pool.hpp"
#include "scenario_runner.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <new>
#include <system_error>
#include <thread>
#include <sys/mman.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ecobatch {

// ============================================================================
// SharedDispatch
// ============================================================================

SharedDispatch::SharedDispatch(size_t n_scenarios)
    : n_scenarios_(n_scenarios),
      mapping_size_(sizeof(Header) + std::max<size_t>(1, n_scenarios) * sizeof(std::atomic<int32_t>)),
      mapping_(nullptr),
      header_(nullptr),
      statuses_(nullptr) {

    mapping_ = mmap(nullptr, mapping_size_, PROT_READ | PROT_WRITE, MAP_SHARED | MAP_ANONYMOUS, -1, 0);
    if (mapping_ == MAP_FAILED) {
        mapping_ = nullptr;
        throw EcoBatchError(std::string("Failed to map shared dispatch queue: ") + std::strerror(errno));
    }

    header_ = new (mapping_) Header();
    header_->next.store(0);
    header_->completed.store(0);
    header_->abort_index.store(-1);

    statuses_ = reinterpret_cast<std::atomic<int32_t>*>(static_cast<char*>(mapping_) + sizeof(Header));
    for (size_t i = 0; i < n_scenarios_; ++i) {
        new (&statuses_[i]) std::atomic<int32_t>(static_cast<int32_t>(ScenarioStatus::PENDING));
    }
}

SharedDispatch::~SharedDispatch() {
    if (mapping_ != nullptr) {
        munmap(mapping_, mapping_size_);
    }
}

bool SharedDispatch::claim(size_t& scenario_index) {
    if (aborted()) {
        return false;
    }
    uint64_t next = header_->next.fetch_add(1);
    if (next >= n_scenarios_) {
        return false;
    }
    scenario_index = static_cast<size_t>(next);
    return true;
}

void SharedDispatch::complete(size_t scenario_index, ScenarioStatus status) {
    statuses_[scenario_index].store(static_cast<int32_t>(status));
    header_->completed.fetch_add(1);
}

void SharedDispatch::abort(size_t scenario_index) {
    int64_t expected = -1;
    header_->abort_index.compare_exchange_strong(expected, static_cast<int64_t>(scenario_index));
}

bool SharedDispatch::aborted() const {
    return header_->abort_index.load() >= 0;
}

int64_t SharedDispatch::abort_index() const {
    return header_->abort_index.load();
}

size_t SharedDispatch::completed() const {
    return static_cast<size_t>(header_->completed.load());
}

ScenarioStatus SharedDispatch::status(size_t scenario_index) const {
    return static_cast<ScenarioStatus>(statuses_[scenario_index].load());
}

std::vector<ScenarioStatus> SharedDispatch::statuses() const {
    std::vector<ScenarioStatus> result;
    result.reserve(n_scenarios_);
    for (size_t i = 0; i < n_scenarios_; ++i) {
        result.push_back(status(i));
    }
    return result;
}

// ============================================================================
// WorkerPool
// ============================================================================

WorkerPool::WorkerPool(WorkerRecipe recipe,
                       size_t n_workers,
                       const EngineFactory& factory,
                       Logger* logger)
    : recipe_(std::move(recipe)),
      n_workers_(clamp_workers(n_workers, recipe_.scenarios.n_scenarios())),
      factory_(factory),
      logger_(logger != nullptr ? logger : &Logger::get_instance()) {

    if (recipe_.shared_store == nullptr || recipe_.shared_store->mode() != BufferMode::SHARED) {
        throw ConfigurationError("Worker pool requires a shared result store");
    }
}

size_t WorkerPool::clamp_workers(size_t requested, size_t n_scenarios) {
    return std::max<size_t>(1, std::min(requested, n_scenarios));
}

PoolResult WorkerPool::run() {
    ExecutionContext ctx("pool");
    const size_t n_scenarios = recipe_.scenarios.n_scenarios();
    SharedDispatch dispatch(n_scenarios);

    logger_->log_batch_start(ctx, n_scenarios, n_workers_, recipe_.variables);
    logger_->flush();

    std::vector<pid_t> pids;
    for (size_t w = 0; w < n_workers_; ++w) {
        pid_t pid = fork();
        if (pid < 0) {
            logger_->log_error(ctx, std::string("fork failed: ") + std::strerror(errno));
            break;
        }
        if (pid == 0) {
            worker_main(dispatch);
        }
        pids.push_back(pid);
    }
    if (pids.empty()) {
        throw EcoBatchError("Could not start any worker process");
    }

    const auto start_time = std::chrono::steady_clock::now();
    auto elapsed_ms = [&start_time]() {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_time).count();
    };
    const size_t progress_step = std::max<size_t>(1, n_scenarios / 10);
    size_t next_progress = progress_step;

    PoolResult result;
    std::vector<bool> reaped(pids.size(), false);
    size_t alive = pids.size();

    while (alive > 0) {
        bool reaped_any = false;
        for (size_t k = 0; k < pids.size(); ++k) {
            if (reaped[k]) {
                continue;
            }
            int wait_status = 0;
            pid_t r = waitpid(pids[k], &wait_status, WNOHANG);
            if (r == 0 || (r < 0 && errno == EINTR)) {
                continue;
            }
            reaped[k] = true;
            reaped_any = true;
            alive--;

            ExecutionContext worker_ctx("pool", static_cast<long>(pids[k]));
            if (r < 0) {
                logger_->log_warning(worker_ctx, std::string("Lost track of worker: ") + std::strerror(errno));
            } else if (WIFSIGNALED(wait_status)) {
                result.failed_workers++;
                logger_->log_error(worker_ctx, "Worker terminated by signal " +
                                   std::to_string(WTERMSIG(wait_status)));
            } else if (WIFEXITED(wait_status)) {
                int code = WEXITSTATUS(wait_status);
                if (code == EXIT_INIT_FAILED || code == EXIT_UNEXPECTED) {
                    result.failed_workers++;
                    logger_->log_error(worker_ctx, "Worker exited with code " + std::to_string(code));
                }
            }

            // Remove the private copy of a worker that did not get to clean up
            std::string orphan = private_model_path(recipe_.model_path, static_cast<long>(pids[k]));
            std::error_code ec;
            if (std::filesystem::exists(orphan, ec)) {
                worker_ctx.phase = "cleanup";
                logger_->log_warning(worker_ctx, "Removing orphaned model copy " + orphan);
                remove_with_retry(orphan, recipe_.cleanup, *logger_, worker_ctx);
            }
        }

        size_t done = dispatch.completed();
        if (done >= next_progress) {
            logger_->log_progress(ctx, done, n_scenarios, elapsed_ms());
            next_progress = (done / progress_step + 1) * progress_step;
        }

        if (!reaped_any && alive > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    result.statuses = dispatch.statuses();
    result.aborted = dispatch.aborted();
    result.abort_index = dispatch.abort_index();

    logger_->log_batch_complete(ctx, summarize_statuses(result.statuses, pids.size(), elapsed_ms()));

    if (result.failed_workers == pids.size() && dispatch.completed() == 0) {
        throw InitializationError("No worker process could run a scenario");
    }
    return result;
}

void WorkerPool::worker_main(SharedDispatch& dispatch) {
    int exit_code = EXIT_OK;
    ExecutionContext ctx("worker", static_cast<long>(::getpid()));

    try {
        WorkerContext context(recipe_, factory_, logger_);
        try {
            context.initialize();
        } catch (const std::exception& e) {
            logger_->log_error(ctx, e.what());
            exit_code = EXIT_INIT_FAILED;
        }

        size_t index = 0;
        while (exit_code == EXIT_OK && dispatch.claim(index)) {
            try {
                dispatch.complete(index, context.run_scenario(index));
            } catch (const EngineRunFailure&) {
                dispatch.complete(index, ScenarioStatus::RUN_FAILED);
                dispatch.abort(index);
                exit_code = EXIT_ABORTED;
            }
        }
    } catch (const std::exception& e) {
        logger_->log_error(ctx, std::string("Unexpected worker error: ") + e.what());
        exit_code = EXIT_UNEXPECTED;
    }

    logger_->flush();
    _exit(exit_code);
}

} // namespace ecobatch
