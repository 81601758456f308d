/**
 * @file result_set.hpp
 * @brief Immutable results of one batch
 */

#ifndef ECOBATCH_RUNNER_RESULT_SET_HPP
#define ECOBATCH_RUNNER_RESULT_SET_HPP

#include "batch_types.hpp"
#include "io/flat_table.hpp"
#include "result_config.hpp"
#include "scenario_table.hpp"
#include <map>
#include <string>
#include <vector>

namespace ecobatch {

/**
 * @brief Model and run information attached to every result set
 */
struct RunMetadata {
    std::string country;
    int first_year;
    std::string run_date;                    ///< "YYYY-MM-DD HH:MM:SS", local time
    std::vector<std::string> group_names;
    std::vector<std::string> fleet_names;
    size_t n_months;

    RunMetadata() : first_year(0), n_months(0) {}
};

/**
 * @brief One collected variable, dims (scenario, ...) row-major
 */
struct ResultArray {
    ResultVariable variable;
    std::vector<size_t> shape;
    std::vector<double> data;

    double at(const std::vector<size_t>& index) const;
};

class ResultSet {
public:
    ResultSet(ScenarioTable scenarios,
              RunMetadata metadata,
              std::vector<ResultArray> results,
              std::vector<ScenarioStatus> statuses);

    const ScenarioTable& scenarios() const { return scenarios_; }
    const RunMetadata& metadata() const { return metadata_; }

    const std::string& country() const { return metadata_.country; }
    int first_year() const { return metadata_.first_year; }
    size_t n_scenarios() const { return scenarios_.n_scenarios(); }
    size_t n_varied_parameters() const { return scenarios_.n_columns() - 1; }

    std::vector<std::string> variable_names() const;
    bool has_variable(const std::string& name) const;

    /**
     * @throws LookupError If the variable was not collected
     */
    const ResultArray& result(const std::string& name) const;
    const ResultArray& operator[](const std::string& name) const { return result(name); }

    const std::vector<ScenarioStatus>& statuses() const { return statuses_; }
    ScenarioStatus status(size_t scenario_index) const { return statuses_.at(scenario_index); }

    /**
     * @brief Ids of scenarios that did not succeed
     */
    std::vector<int64_t> failed_scenarios() const;
    bool all_succeeded() const { return failed_scenarios().empty(); }

    /**
     * @brief Coordinate labels along a non-scenario dim
     */
    std::vector<std::string> coordinates(Dim dim) const;

    /**
     * @brief Categories present among the collected variables, in catalog order
     */
    std::vector<VariableCategory> categories() const;

    /**
     * @brief Variables of one category outer-joined on the category dims
     *
     * Key columns are Scenario (id), [Fleet], [Group], Time (month index), then
     * one column per variable. Cells a variable does not cover are NaN.
     *
     * @throws LookupError If no collected variable has this category
     */
    FlatTable to_flat_table(VariableCategory category) const;

    /**
     * @brief Multi-line overview: country, scenario count, first year, varied
     *        parameters and stored variables
     */
    std::string summary() const;

private:
    ScenarioTable scenarios_;
    RunMetadata metadata_;
    std::vector<ResultArray> results_;
    std::vector<ScenarioStatus> statuses_;
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_RESULT_SET_HPP
