#include "parquet_io.hpp"
#include "../../../ecobatch-engine/src/engine_session.hpp"
#include <fstream>
#include <limits>
#include <memory>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>

namespace ecobatch {

namespace {

// Append one chunk of a numeric column, nulls as NaN
bool append_numeric_chunk(const std::shared_ptr<arrow::Array>& chunk, std::vector<double>& out) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    switch (chunk->type_id()) {
        case arrow::Type::DOUBLE: {
            auto array = std::static_pointer_cast<arrow::DoubleArray>(chunk);
            for (int64_t i = 0; i < array->length(); ++i) {
                out.push_back(array->IsNull(i) ? nan : array->Value(i));
            }
            return true;
        }
        case arrow::Type::FLOAT: {
            auto array = std::static_pointer_cast<arrow::FloatArray>(chunk);
            for (int64_t i = 0; i < array->length(); ++i) {
                out.push_back(array->IsNull(i) ? nan : static_cast<double>(array->Value(i)));
            }
            return true;
        }
        case arrow::Type::INT64: {
            auto array = std::static_pointer_cast<arrow::Int64Array>(chunk);
            for (int64_t i = 0; i < array->length(); ++i) {
                out.push_back(array->IsNull(i) ? nan : static_cast<double>(array->Value(i)));
            }
            return true;
        }
        case arrow::Type::INT32: {
            auto array = std::static_pointer_cast<arrow::Int32Array>(chunk);
            for (int64_t i = 0; i < array->length(); ++i) {
                out.push_back(array->IsNull(i) ? nan : static_cast<double>(array->Value(i)));
            }
            return true;
        }
        default:
            return false;
    }
}

} // anonymous namespace

// ============================================================================
// ParquetReader implementation
// ============================================================================

bool ParquetReader::validate_file_exists(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.good()) {
        set_error("File not found: " + filepath);
        return false;
    }
    return true;
}

void ParquetReader::set_error(const std::string& error) {
    last_error_ = error;
}

size_t ParquetReader::get_row_count(const std::string& filepath) {
    if (!validate_file_exists(filepath)) {
        return 0;
    }

    try {
        auto file_reader = parquet::ParquetFileReader::OpenFile(filepath);
        auto metadata = file_reader->metadata();
        return static_cast<size_t>(metadata->num_rows());
    } catch (const std::exception& e) {
        set_error(std::string("Failed to read row count: ") + e.what());
        return 0;
    }
}

bool ParquetReader::read_scenario_table(const std::string& filepath, ScenarioTable& table) {
    if (!validate_file_exists(filepath)) {
        return false;
    }

    try {
        // Open Parquet file
        auto infile_result = arrow::io::ReadableFile::Open(filepath);
        if (!infile_result.ok()) {
            set_error("Failed to open file: " + infile_result.status().ToString());
            return false;
        }
        std::shared_ptr<arrow::io::ReadableFile> infile = *infile_result;

        // Create Parquet reader
        std::unique_ptr<parquet::arrow::FileReader> arrow_reader;
        auto status = parquet::arrow::OpenFile(infile, arrow::default_memory_pool(), &arrow_reader);
        if (!status.ok()) {
            set_error("Failed to open Parquet file: " + status.ToString());
            return false;
        }

        // Read table
        std::shared_ptr<arrow::Table> arrow_table;
        status = arrow_reader->ReadTable(&arrow_table);
        if (!status.ok()) {
            set_error("Failed to read table: " + status.ToString());
            return false;
        }

        const int n_columns = arrow_table->num_columns();
        const int64_t n_rows = arrow_table->num_rows();

        std::vector<std::string> column_names;
        std::vector<std::vector<double>> columns(static_cast<size_t>(n_columns));
        for (int c = 0; c < n_columns; ++c) {
            column_names.push_back(arrow_table->schema()->field(c)->name());
            columns[c].reserve(static_cast<size_t>(n_rows));
            for (const auto& chunk : arrow_table->column(c)->chunks()) {
                if (!append_numeric_chunk(chunk, columns[c])) {
                    set_error("Column '" + column_names.back() + "' has non-numeric type " +
                              chunk->type()->ToString());
                    return false;
                }
            }
        }

        std::vector<std::vector<double>> rows(static_cast<size_t>(n_rows),
                                              std::vector<double>(static_cast<size_t>(n_columns)));
        for (int c = 0; c < n_columns; ++c) {
            for (int64_t r = 0; r < n_rows; ++r) {
                rows[r][c] = columns[c][r];
            }
        }

        table = ScenarioTable(std::move(column_names), std::move(rows));
        return true;

    } catch (const ConfigurationError& e) {
        set_error(e.what());
        return false;
    } catch (const parquet::ParquetException& e) {
        set_error(std::string("Parquet read error: ") + e.what());
        return false;
    }
}

// ============================================================================
// ParquetWriter implementation
// ============================================================================

void ParquetWriter::set_error(const std::string& error) {
    last_error_ = error;
}

bool ParquetWriter::write_table(const std::string& filepath, const FlatTable& table) {
    try {
        std::vector<std::shared_ptr<arrow::Field>> fields;
        std::vector<std::shared_ptr<arrow::Array>> arrays;

        for (const auto& column : table.columns) {
            std::shared_ptr<arrow::Array> array;
            arrow::Status status;

            switch (column.type) {
                case FlatColumn::Type::INT64: {
                    arrow::Int64Builder builder;
                    status = builder.AppendValues(column.ints);
                    if (status.ok()) status = builder.Finish(&array);
                    fields.push_back(arrow::field(column.name, arrow::int64()));
                    break;
                }
                case FlatColumn::Type::STRING: {
                    arrow::StringBuilder builder;
                    status = builder.AppendValues(column.strings);
                    if (status.ok()) status = builder.Finish(&array);
                    fields.push_back(arrow::field(column.name, arrow::utf8()));
                    break;
                }
                case FlatColumn::Type::DOUBLE: {
                    arrow::DoubleBuilder builder;
                    status = builder.AppendValues(column.doubles);
                    if (status.ok()) status = builder.Finish(&array);
                    fields.push_back(arrow::field(column.name, arrow::float64()));
                    break;
                }
            }

            if (!status.ok()) {
                set_error("Failed to build column '" + column.name + "': " + status.ToString());
                return false;
            }
            arrays.push_back(array);
        }

        auto arrow_table = arrow::Table::Make(arrow::schema(fields), arrays,
                                              static_cast<int64_t>(table.n_rows()));

        // Open output file
        auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
        if (!outfile_result.ok()) {
            set_error("Failed to open output file: " + outfile_result.status().ToString());
            return false;
        }
        std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

        // Write Parquet file
        auto status = parquet::arrow::WriteTable(
            *arrow_table,
            arrow::default_memory_pool(),
            outfile,
            1024 * 1024  // 1MB row group size
        );
        if (!status.ok()) {
            set_error("Failed to write Parquet file: " + status.ToString());
            return false;
        }

        status = outfile->Close();
        if (!status.ok()) {
            set_error("Failed to close Parquet file: " + status.ToString());
            return false;
        }

        return true;

    } catch (const parquet::ParquetException& e) {
        set_error(std::string("Parquet write error: ") + e.what());
        return false;
    }
}

} // namespace ecobatch
