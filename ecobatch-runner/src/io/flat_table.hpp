/**
 * @file flat_table.hpp
 * @brief Column-oriented table used for CSV and Parquet export
 */

#ifndef ECOBATCH_RUNNER_FLAT_TABLE_HPP
#define ECOBATCH_RUNNER_FLAT_TABLE_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ecobatch {

struct FlatColumn {
    enum class Type {
        INT64,
        STRING,
        DOUBLE
    };

    std::string name;
    Type type;
    std::vector<int64_t> ints;          ///< Populated iff type == INT64
    std::vector<std::string> strings;   ///< Populated iff type == STRING
    std::vector<double> doubles;        ///< Populated iff type == DOUBLE

    FlatColumn() : type(Type::DOUBLE) {}
    FlatColumn(std::string name_, Type type_) : name(std::move(name_)), type(type_) {}

    size_t size() const {
        switch (type) {
            case Type::INT64: return ints.size();
            case Type::STRING: return strings.size();
            case Type::DOUBLE: return doubles.size();
        }
        return 0;
    }

    /// Cell rendered for text output
    std::string cell(size_t row) const;
};

struct FlatTable {
    std::string name;
    std::vector<FlatColumn> columns;

    size_t n_rows() const { return columns.empty() ? 0 : columns.front().size(); }

    /**
     * @return Column index, or -1 if absent
     */
    int column_index(const std::string& column_name) const;
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_FLAT_TABLE_HPP
