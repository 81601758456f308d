#ifndef ECOBATCH_RUNNER_CSV_WRITER_HPP
#define ECOBATCH_RUNNER_CSV_WRITER_HPP

#include "flat_table.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace ecobatch {
namespace io {

// Quote a cell if it contains the delimiter, a quote or a line break
std::string escape_csv_cell(const std::string& cell, char delimiter = ',');

// Write a header row followed by one line per table row. NaN doubles become empty cells.
void write_flat_table_csv(std::ostream& os, const FlatTable& table, char delimiter = ',');

// Write a FlatTable to a CSV file
void write_flat_table_csv(const std::string& filepath, const FlatTable& table, char delimiter = ',');

// Write a header and numeric rows, used for scenario tables
void write_numeric_csv(const std::string& filepath,
                       const std::vector<std::string>& header,
                       const std::vector<std::vector<double>>& rows);

} // namespace io
} // namespace ecobatch

#endif // ECOBATCH_RUNNER_CSV_WRITER_HPP
