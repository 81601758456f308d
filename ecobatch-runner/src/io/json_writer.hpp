#ifndef ECOBATCH_RUNNER_JSON_WRITER_HPP
#define ECOBATCH_RUNNER_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../result_set.hpp"

namespace ecobatch {
namespace io {

// Write one collected variable as a labeled dense array: name, unit, run date,
// first year, dims, coordinates per dim, shape and row-major data (NaN as null)
void write_result_array_json(std::ostream& os, const ResultSet& results,
                             const std::string& variable_name, bool pretty_print = true);

// Write a labeled array to a JSON file
void write_result_array_json(const std::string& filepath, const ResultSet& results,
                             const std::string& variable_name, bool pretty_print = true);

// Write run metadata and per-scenario statuses
void write_run_metadata_json(std::ostream& os, const ResultSet& results, bool pretty_print = true);

void write_run_metadata_json(const std::string& filepath, const ResultSet& results,
                             bool pretty_print = true);

} // namespace io
} // namespace ecobatch

#endif // ECOBATCH_RUNNER_JSON_WRITER_HPP
