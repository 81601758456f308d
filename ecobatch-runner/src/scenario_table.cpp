#include "scenario_table.hpp"
#include "io/csv_reader.hpp"
#include "io/csv_writer.hpp"
#include "../../ecobatch-engine/src/engine_session.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <set>

namespace ecobatch {

namespace {

double parse_cell(const std::string& cell, const std::string& source, size_t line, size_t column) {
    const char* begin = cell.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (cell.empty() || end == begin || *end != '\0' || errno == ERANGE) {
        throw ConfigurationError(source + ":" + std::to_string(line) + ": column " +
                                 std::to_string(column) + " is not a number: '" + cell + "'");
    }
    return value;
}

} // anonymous namespace

ScenarioTable::ScenarioTable(std::vector<std::string> columns, std::vector<std::vector<double>> rows)
    : columns_(std::move(columns)), rows_(std::move(rows)) {
    validate();
}

void ScenarioTable::validate() const {
    if (columns_.empty() || columns_[0] != SCENARIO_COLUMN) {
        std::string found = columns_.empty() ? "no columns" : "'" + columns_[0] + "'";
        throw ConfigurationError("Scenario table must start with a '" + std::string(SCENARIO_COLUMN) +
                                 "' column, found " + found);
    }

    std::set<std::string> seen;
    for (const auto& column : columns_) {
        if (!seen.insert(column).second) {
            throw ConfigurationError("Duplicate scenario table column: " + column);
        }
    }

    for (size_t r = 0; r < rows_.size(); ++r) {
        const auto& row = rows_[r];
        if (row.size() != columns_.size()) {
            throw ConfigurationError("Scenario table row " + std::to_string(r) + " has " +
                                     std::to_string(row.size()) + " values, expected " +
                                     std::to_string(columns_.size()));
        }
        double id = row[0];
        if (!std::isfinite(id) || std::floor(id) != id) {
            throw ConfigurationError("Scenario id in row " + std::to_string(r) + " is not an integer");
        }
        // 2^63 is exactly representable, int64 ids lie in [-2^63, 2^63)
        if (id < -9223372036854775808.0 || id >= 9223372036854775808.0) {
            throw ConfigurationError("Scenario id in row " + std::to_string(r) +
                                     " is outside the 64-bit integer range");
        }
        if (r > 0 && !(id > rows_[r - 1][0])) {
            throw ConfigurationError("Scenario ids must be strictly ascending, row " +
                                     std::to_string(r) + " breaks the order");
        }
    }
}

ScenarioTable ScenarioTable::from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw ConfigurationError("Cannot open scenario table: " + filepath);
    }
    return from_stream(file, filepath);
}

ScenarioTable ScenarioTable::from_stream(std::istream& is, const std::string& source_name) {
    CsvReader reader(is);

    std::vector<std::string> header = reader.read_row();
    if (header.empty()) {
        throw ConfigurationError("Scenario table " + source_name + " is empty");
    }

    std::vector<std::vector<double>> rows;
    while (true) {
        std::vector<std::string> cells = reader.read_row();
        if (cells.empty()) {
            break;
        }
        if (cells.size() != header.size()) {
            throw ConfigurationError(source_name + ":" + std::to_string(reader.line_number()) +
                                     ": expected " + std::to_string(header.size()) +
                                     " cells, got " + std::to_string(cells.size()));
        }
        std::vector<double> row;
        row.reserve(cells.size());
        for (size_t c = 0; c < cells.size(); ++c) {
            row.push_back(parse_cell(cells[c], source_name, reader.line_number(), c));
        }
        rows.push_back(std::move(row));
    }

    return ScenarioTable(std::move(header), std::move(rows));
}

ScenarioTable ScenarioTable::empty(const std::vector<std::string>& parameter_names, size_t n_scenarios) {
    std::vector<std::string> columns;
    columns.reserve(parameter_names.size() + 1);
    columns.push_back(SCENARIO_COLUMN);
    columns.insert(columns.end(), parameter_names.begin(), parameter_names.end());

    std::vector<std::vector<double>> rows(n_scenarios, std::vector<double>(columns.size(), 0.0));
    for (size_t i = 0; i < n_scenarios; ++i) {
        rows[i][0] = static_cast<double>(i + 1);
    }
    return ScenarioTable(std::move(columns), std::move(rows));
}

std::vector<std::string> ScenarioTable::parameter_names() const {
    return std::vector<std::string>(columns_.begin() + 1, columns_.end());
}

std::vector<int64_t> ScenarioTable::scenario_ids() const {
    std::vector<int64_t> ids;
    ids.reserve(rows_.size());
    for (const auto& row : rows_) {
        ids.push_back(static_cast<int64_t>(row[0]));
    }
    return ids;
}

int ScenarioTable::column_index(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i] == name) {
            return static_cast<int>(i);
        }
    }
    throw LookupError("Scenario table has no column '" + name + "'");
}

double ScenarioTable::value(size_t row_index, const std::string& column) const {
    return rows_.at(row_index)[column_index(column)];
}

void ScenarioTable::set_value(size_t row_index, const std::string& column, double value) {
    int index = column_index(column);
    if (index == 0) {
        throw ConfigurationError("Scenario ids cannot be modified");
    }
    rows_.at(row_index)[index] = value;
}

void ScenarioTable::write_csv(const std::string& filepath) const {
    io::write_numeric_csv(filepath, columns_, rows_);
}

} // namespace ecobatch
