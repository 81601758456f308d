#include "csv_writer.hpp"
#include "../../../ecobatch-engine/src/engine_session.hpp"
#include <fstream>

namespace ecobatch {
namespace io {

std::string escape_csv_cell(const std::string& cell, char delimiter) {
    if (cell.find(delimiter) == std::string::npos &&
        cell.find('"') == std::string::npos &&
        cell.find('\n') == std::string::npos) {
        return cell;
    }

    std::string quoted = "\"";
    for (char c : cell) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted += c;
        }
    }
    quoted += "\"";
    return quoted;
}

void write_flat_table_csv(std::ostream& os, const FlatTable& table, char delimiter) {
    for (size_t c = 0; c < table.columns.size(); ++c) {
        if (c > 0) os << delimiter;
        os << escape_csv_cell(table.columns[c].name, delimiter);
    }
    os << "\n";

    const size_t n_rows = table.n_rows();
    for (size_t r = 0; r < n_rows; ++r) {
        for (size_t c = 0; c < table.columns.size(); ++c) {
            if (c > 0) os << delimiter;
            os << escape_csv_cell(table.columns[c].cell(r), delimiter);
        }
        os << "\n";
    }
}

void write_flat_table_csv(const std::string& filepath, const FlatTable& table, char delimiter) {
    std::ofstream file(filepath);
    if (!file) {
        throw EcoBatchError("Failed to open output file: " + filepath);
    }
    write_flat_table_csv(file, table, delimiter);
}

void write_numeric_csv(const std::string& filepath,
                       const std::vector<std::string>& header,
                       const std::vector<std::vector<double>>& rows) {
    std::ofstream file(filepath);
    if (!file) {
        throw EcoBatchError("Failed to open output file: " + filepath);
    }
    file.precision(17);

    for (size_t c = 0; c < header.size(); ++c) {
        if (c > 0) file << ",";
        file << escape_csv_cell(header[c]);
    }
    file << "\n";

    for (const auto& row : rows) {
        for (size_t c = 0; c < row.size(); ++c) {
            if (c > 0) file << ",";
            file << row[c];
        }
        file << "\n";
    }
}

} // namespace io
} // namespace ecobatch
