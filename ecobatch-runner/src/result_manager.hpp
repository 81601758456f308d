/**
 * @file result_manager.hpp
 * @brief Scenario-indexed collection of result variables
 *
 * A ResultManager binds a set of result variables to one engine session. After
 * every run it copies the engine arrays through shared extractors into dense
 * stores addressed by scenario index, and at the end of a batch it freezes the
 * stores into a ResultSet.
 *
 * Stores either belong to the manager (sequential runs) or live in a shared
 * BufferManager allocated by the parent before workers are forked. In the shared
 * case every worker owns a manager of its own and writes only the scenario
 * slices it was dispatched, so no locking is needed.
 */

#ifndef ECOBATCH_RUNNER_RESULT_MANAGER_HPP
#define ECOBATCH_RUNNER_RESULT_MANAGER_HPP

#include "buffer_manager.hpp"
#include "logger.hpp"
#include "result_config.hpp"
#include "result_extractor.hpp"
#include "result_set.hpp"
#include "scenario_table.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ecobatch {

class ResultManager {
public:
    /**
     * @param engine Session the extractors read from
     * @param variable_names Catalog names to collect
     * @param scenarios Table of the batch, fixes the scenario axis
     * @param shared_store Pre-allocated stores, or nullptr to allocate private ones
     * @param logger Logger for buffer dumps, defaults to the singleton
     *
     * @throws LookupError If a variable name is not in the catalog
     * @throws ConfigurationError If a name repeats, the table is empty, or a shared
     *         store does not match the engine's result shapes
     */
    ResultManager(EngineSession& engine,
                  const std::vector<std::string>& variable_names,
                  const ScenarioTable& scenarios,
                  BufferManager* shared_store = nullptr,
                  Logger* logger = nullptr);

    ResultManager(const ResultManager&) = delete;
    ResultManager& operator=(const ResultManager&) = delete;

    /**
     * @brief Store shape of a variable for the engine's current model and duration
     */
    static std::vector<size_t> store_shape(const EngineSession& engine,
                                           const ResultVariable& variable,
                                           size_t n_scenarios);

    /**
     * @brief Shared stores for a batch, to be created before forking workers
     */
    static std::unique_ptr<BufferManager> allocate_shared_store(const EngineSession& engine,
                                                                const std::vector<std::string>& variable_names,
                                                                size_t n_scenarios);

    /**
     * @brief Copy the engine's current results into scenario slot i
     *
     * Every extractor is checked before any is refreshed, so a missing stage
     * leaves all stores untouched.
     *
     * @throws StageNotReadyError If a producing stage has not run
     * @throws ConfigurationError If an extracted shape differs from the store
     */
    void collect(size_t scenario_index);

    /**
     * @brief NaN-fill scenario slot i in every store
     */
    void mark_invalid(size_t scenario_index);

    /**
     * @brief Freeze the stores into an immutable ResultSet
     *
     * @param statuses One status per scenario row
     */
    ResultSet to_result_set(const std::vector<ScenarioStatus>& statuses) const;

    const std::vector<ResultVariable>& variables() const { return variables_; }
    std::vector<std::string> variable_names() const;
    const ScenarioTable& scenarios() const { return scenarios_; }
    size_t n_extractors() const { return extractors_.size(); }
    size_t n_months() const { return n_months_; }

    const BufferManager& store() const { return *store_; }

private:
    EngineSession& engine_;
    ScenarioTable scenarios_;
    std::vector<ResultVariable> variables_;
    std::vector<std::unique_ptr<ResultExtractor>> extractors_;
    std::vector<size_t> extractor_of_;            ///< Extractor index per variable
    std::unique_ptr<BufferManager> owned_store_;
    BufferManager* store_;
    Logger* logger_;
    size_t n_months_;

    RunMetadata metadata() const;
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_RESULT_MANAGER_HPP
