#include "flat_table.hpp"
#include <cmath>
#include <sstream>

namespace ecobatch {

std::string FlatColumn::cell(size_t row) const {
    switch (type) {
        case Type::INT64:
            return std::to_string(ints[row]);
        case Type::STRING:
            return strings[row];
        case Type::DOUBLE: {
            double value = doubles[row];
            if (std::isnan(value)) {
                return "";
            }
            std::ostringstream oss;
            oss.precision(17);
            oss << value;
            return oss.str();
        }
    }
    return "";
}

int FlatTable::column_index(const std::string& column_name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].name == column_name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace ecobatch
