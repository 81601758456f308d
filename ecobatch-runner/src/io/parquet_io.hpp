#ifndef ECOBATCH_RUNNER_PARQUET_IO_HPP
#define ECOBATCH_RUNNER_PARQUET_IO_HPP

#include "flat_table.hpp"
#include "../scenario_table.hpp"
#include <string>

namespace ecobatch {

/**
 * ParquetReader - Reads scenario tables from Parquet files
 *
 * Every column must be numeric (float64, float32, int64 or int32); nulls become
 * NaN. The first column must be "scenario", which ScenarioTable validates.
 */
class ParquetReader {
public:
    ParquetReader() = default;
    ~ParquetReader() = default;

    // Prevent copying
    ParquetReader(const ParquetReader&) = delete;
    ParquetReader& operator=(const ParquetReader&) = delete;

    /**
     * Read a scenario table
     *
     * @param filepath Path to Parquet file
     * @param table Output table, untouched on failure
     * @return true on success, false on error (see get_last_error())
     */
    bool read_scenario_table(const std::string& filepath, ScenarioTable& table);

    /**
     * Get row count from Parquet file without loading data
     */
    size_t get_row_count(const std::string& filepath);

    const std::string& get_last_error() const { return last_error_; }

private:
    std::string last_error_;

    bool validate_file_exists(const std::string& filepath);
    void set_error(const std::string& error);
};

/**
 * ParquetWriter - Writes flattened result tables to Parquet files
 *
 * INT64 columns map to int64, STRING to utf8, DOUBLE to float64 with NaN kept as NaN.
 */
class ParquetWriter {
public:
    ParquetWriter() = default;
    ~ParquetWriter() = default;

    // Prevent copying
    ParquetWriter(const ParquetWriter&) = delete;
    ParquetWriter& operator=(const ParquetWriter&) = delete;

    bool write_table(const std::string& filepath, const FlatTable& table);

    const std::string& get_last_error() const { return last_error_; }

private:
    std::string last_error_;

    void set_error(const std::string& error);
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_PARQUET_IO_HPP
