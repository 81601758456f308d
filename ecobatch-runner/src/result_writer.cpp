#include "result_writer.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_io.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace ecobatch {

std::string format_to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::CSV: return "csv";
        case OutputFormat::PARQUET: return "parquet";
        case OutputFormat::JSON: return "json";
        default: return "unknown";
    }
}

OutputFormat parse_output_format(const std::string& format) {
    std::string lower = format;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "csv") return OutputFormat::CSV;
    if (lower == "parquet") return OutputFormat::PARQUET;
    if (lower == "json") return OutputFormat::JSON;
    throw ConfigurationError("Unknown output format: " + format + " (expected csv, parquet or json)");
}

ResultWriter::ResultWriter(std::string directory,
                           std::vector<OutputFormat> formats,
                           Logger* logger)
    : directory_(std::move(directory)),
      formats_(std::move(formats)),
      logger_(logger != nullptr ? logger : &Logger::get_instance()) {}

std::string ResultWriter::path_for(const std::string& filename) const {
    return (std::filesystem::path(directory_) / filename).string();
}

std::vector<std::string> ResultWriter::write(const ResultSet& results) const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw EcoBatchError("Failed to create output directory " + directory_ + ": " + ec.message());
    }

    std::vector<std::string> written;
    const std::vector<VariableCategory> categories = results.categories();

    for (OutputFormat format : formats_) {
        switch (format) {
            case OutputFormat::CSV:
                for (VariableCategory category : categories) {
                    std::string path = path_for(category_to_string(category) + ".csv");
                    io::write_flat_table_csv(path, results.to_flat_table(category));
                    written.push_back(path);
                }
                break;

            case OutputFormat::PARQUET:
                for (VariableCategory category : categories) {
                    std::string path = path_for(category_to_string(category) + ".parquet");
                    ParquetWriter writer;
                    if (!writer.write_table(path, results.to_flat_table(category))) {
                        throw EcoBatchError("Failed to write " + path + ": " + writer.get_last_error());
                    }
                    written.push_back(path);
                }
                break;

            case OutputFormat::JSON:
                for (const auto& name : results.variable_names()) {
                    const ResultArray& array = results.result(name);
                    std::string path = path_for(array.variable.save_filename + ".json");
                    io::write_result_array_json(path, results, name);
                    written.push_back(path);
                }
                break;
        }
    }

    std::string metadata_path = path_for(METADATA_FILENAME);
    io::write_run_metadata_json(metadata_path, results);
    written.push_back(metadata_path);

    ExecutionContext ctx("writer");
    ctx.phase = "export";
    if (results.variable_names().empty()) {
        logger_->log_warning(ctx, "No result variables collected, only run metadata was written");
    }

    return written;
}

} // namespace ecobatch
