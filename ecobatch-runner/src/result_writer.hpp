/**
 * @file result_writer.hpp
 * @brief Export of a ResultSet to disk
 *
 * Output layout under the target directory:
 *   <CATEGORY>.csv / <CATEGORY>.parquet   one flattened table per shape category
 *   <save_filename>.json                  one labeled dense array per variable
 *   run_metadata.json                     run metadata and per-scenario status
 */

#ifndef ECOBATCH_RUNNER_RESULT_WRITER_HPP
#define ECOBATCH_RUNNER_RESULT_WRITER_HPP

#include "logger.hpp"
#include "result_set.hpp"
#include <string>
#include <vector>

namespace ecobatch {

enum class OutputFormat {
    CSV,       ///< Flattened tables as CSV
    PARQUET,   ///< Flattened tables as Parquet
    JSON       ///< Labeled dense arrays
};

std::string format_to_string(OutputFormat format);

/**
 * @throws ConfigurationError For anything but "csv", "parquet" or "json"
 */
OutputFormat parse_output_format(const std::string& format);

class ResultWriter {
public:
    static constexpr const char* METADATA_FILENAME = "run_metadata.json";

    /**
     * @param directory Output directory, created on write if missing
     * @param formats Formats to write; the metadata file is always written
     */
    ResultWriter(std::string directory,
                 std::vector<OutputFormat> formats,
                 Logger* logger = nullptr);

    /**
     * @brief Write every requested format
     *
     * @return Paths of the files written
     * @throws EcoBatchError If a file cannot be created or a Parquet write fails
     */
    std::vector<std::string> write(const ResultSet& results) const;

    const std::string& directory() const { return directory_; }
    const std::vector<OutputFormat>& formats() const { return formats_; }

private:
    std::string directory_;
    std::vector<OutputFormat> formats_;
    Logger* logger_;

    std::string path_for(const std::string& filename) const;
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_RESULT_WRITER_HPP
