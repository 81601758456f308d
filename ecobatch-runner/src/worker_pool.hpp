/**
 * @file worker_pool.hpp
 * @brief Multi-process scenario execution
 *
 * The pool forks W worker processes. Each one builds a WorkerContext from the
 * shared recipe and then claims scenario indices from a counter in an anonymous
 * shared mapping until none are left. Results go straight into the shared
 * stores (each index is claimed exactly once, so slices never overlap), and the
 * outcome of every scenario goes into a shared status array.
 *
 * The parent only waits: it reaps children, logs progress and removes the
 * private model copy of every child it reaps, so a worker killed mid-run leaves
 * nothing behind. Scenarios a dead worker had claimed stay PENDING.
 */

#ifndef ECOBATCH_RUNNER_WORKER_POOL_HPP
#define ECOBATCH_RUNNER_WORKER_POOL_HPP

#include "worker_lifecycle.hpp"
#include <atomic>
#include <cstdint>
#include <vector>

namespace ecobatch {

/**
 * @brief Dispatch counter, abort flag and status array in one shared mapping
 *
 * Created by the parent before fork. Every member is a lock-free atomic, so the
 * mapping is safe to use from any process that inherited it.
 */
class SharedDispatch {
public:
    explicit SharedDispatch(size_t n_scenarios);
    ~SharedDispatch();

    SharedDispatch(const SharedDispatch&) = delete;
    SharedDispatch& operator=(const SharedDispatch&) = delete;

    size_t n_scenarios() const { return n_scenarios_; }

    /**
     * @brief Hand out the next unclaimed index
     *
     * @return false once every index is claimed or the batch was aborted
     */
    bool claim(size_t& scenario_index);

    void complete(size_t scenario_index, ScenarioStatus status);

    /**
     * @brief Stop further dispatch, remembering the first failing index
     */
    void abort(size_t scenario_index);

    bool aborted() const;

    /**
     * @return Index passed to the first abort(), or -1
     */
    int64_t abort_index() const;

    size_t completed() const;
    ScenarioStatus status(size_t scenario_index) const;
    std::vector<ScenarioStatus> statuses() const;

private:
    struct Header {
        std::atomic<uint64_t> next;
        std::atomic<uint64_t> completed;
        std::atomic<int64_t> abort_index;
    };

    static_assert(std::atomic<uint64_t>::is_always_lock_free,
                  "Shared dispatch counter must be lock-free");
    static_assert(std::atomic<int64_t>::is_always_lock_free,
                  "Shared abort index must be lock-free");
    static_assert(std::atomic<int32_t>::is_always_lock_free,
                  "Shared status slots must be lock-free");

    size_t n_scenarios_;
    size_t mapping_size_;
    void* mapping_;
    Header* header_;
    std::atomic<int32_t>* statuses_;
};

/**
 * @brief Outcome of a pool run
 */
struct PoolResult {
    std::vector<ScenarioStatus> statuses;
    bool aborted;              ///< A worker hit a failed run under FAIL_FAST
    int64_t abort_index;       ///< Scenario index that caused the abort, -1 otherwise
    size_t failed_workers;     ///< Workers that failed to initialize or exited abnormally

    PoolResult() : aborted(false), abort_index(-1), failed_workers(0) {}
};

class WorkerPool {
public:
    /// Exit codes of worker processes
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_INIT_FAILED = 1;
    static constexpr int EXIT_ABORTED = 2;
    static constexpr int EXIT_UNEXPECTED = 3;

    /**
     * @param recipe Shared stores in the recipe must already be allocated
     * @param n_workers Requested worker count, clamped to 1..n_scenarios
     * @param factory Factory for the recipe's engine type, copied into every child
     */
    WorkerPool(WorkerRecipe recipe,
               size_t n_workers,
               const EngineFactory& factory,
               Logger* logger = nullptr);

    /**
     * @brief Clamp a worker count to 1..n_scenarios
     */
    static size_t clamp_workers(size_t requested, size_t n_scenarios);

    size_t n_workers() const { return n_workers_; }

    /**
     * @brief Fork the workers and wait for all of them
     *
     * @throws EcoBatchError If no worker could be forked
     */
    PoolResult run();

private:
    WorkerRecipe recipe_;
    size_t n_workers_;
    const EngineFactory& factory_;
    Logger* logger_;

    [[noreturn]] void worker_main(SharedDispatch& dispatch);
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_WORKER_POOL_HPP
