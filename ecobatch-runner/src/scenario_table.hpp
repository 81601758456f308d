/**
 * @file scenario_table.hpp
 * @brief Validated table of scenario rows
 *
 * Column 0 is named "scenario" and holds strictly ascending integer ids. Every
 * other column names a parameter. Rows keep the id in position 0, so a column
 * index in the table is the index used by ParameterManager::set_variable.
 */

#ifndef ECOBATCH_RUNNER_SCENARIO_TABLE_HPP
#define ECOBATCH_RUNNER_SCENARIO_TABLE_HPP

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace ecobatch {

class ScenarioTable {
public:
    static constexpr const char* SCENARIO_COLUMN = "scenario";

    ScenarioTable() : columns_{SCENARIO_COLUMN} {}

    /**
     * @throws ConfigurationError If column 0 is not "scenario", a column name repeats,
     *         a row is ragged, or ids are not strictly ascending integers
     */
    ScenarioTable(std::vector<std::string> columns, std::vector<std::vector<double>> rows);

    static ScenarioTable from_csv(const std::string& filepath);
    static ScenarioTable from_stream(std::istream& is, const std::string& source_name = "<stream>");

    /**
     * @brief Table with ids 1..n_scenarios and every parameter set to 0
     */
    static ScenarioTable empty(const std::vector<std::string>& parameter_names, size_t n_scenarios);

    const std::vector<std::string>& columns() const { return columns_; }
    std::vector<std::string> parameter_names() const;

    size_t n_scenarios() const { return rows_.size(); }
    size_t n_columns() const { return columns_.size(); }
    bool is_empty() const { return rows_.empty(); }

    const std::vector<double>& row(size_t index) const { return rows_.at(index); }
    const std::vector<std::vector<double>>& rows() const { return rows_; }

    int64_t scenario_id(size_t index) const { return static_cast<int64_t>(rows_.at(index)[0]); }
    std::vector<int64_t> scenario_ids() const;

    /**
     * @return Column index of a parameter
     * @throws LookupError If the column does not exist
     */
    int column_index(const std::string& name) const;

    double value(size_t row_index, const std::string& column) const;

    /**
     * @brief Overwrite one parameter cell
     *
     * @throws ConfigurationError If column is "scenario"
     */
    void set_value(size_t row_index, const std::string& column, double value);

    void write_csv(const std::string& filepath) const;

private:
    std::vector<std::string> columns_;
    std::vector<std::vector<double>> rows_;

    void validate() const;
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_SCENARIO_TABLE_HPP
