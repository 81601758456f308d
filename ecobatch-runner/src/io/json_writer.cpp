#include "json_writer.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>

namespace ecobatch {
namespace io {

namespace {

nlohmann::json to_json_value(double value) {
    if (std::isnan(value) || std::isinf(value)) {
        return nullptr;
    }
    return value;
}

void dump(std::ostream& os, const nlohmann::json& j, bool pretty_print) {
    os << (pretty_print ? j.dump(2) : j.dump()) << "\n";
}

std::ofstream open_output(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw EcoBatchError("Failed to open output file: " + filepath);
    }
    return file;
}

} // anonymous namespace

void write_result_array_json(std::ostream& os, const ResultSet& results,
                             const std::string& variable_name, bool pretty_print) {
    const ResultArray& array = results.result(variable_name);

    nlohmann::json j;
    j["name"] = array.variable.export_name;
    j["long_name"] = array.variable.name;
    j["unit"] = array.variable.unit;
    j["category"] = category_to_string(array.variable.category);
    j["run_date"] = results.metadata().run_date;
    j["first_year"] = results.first_year();
    j["country"] = results.country();

    nlohmann::json dims = nlohmann::json::array();
    nlohmann::json coords = nlohmann::json::object();
    for (Dim dim : array.variable.dims) {
        std::string label = dim_label(dim);
        dims.push_back(label);
        if (dim == Dim::SCENARIO) {
            coords[label] = results.scenarios().scenario_ids();
        } else if (dim == Dim::TIME) {
            coords[label] = nlohmann::json::array();
            for (size_t m = 0; m < results.metadata().n_months; ++m) {
                coords[label].push_back(m);
            }
        } else {
            coords[label] = results.coordinates(dim);
        }
    }
    j["dims"] = dims;
    j["coords"] = coords;
    j["shape"] = array.shape;

    nlohmann::json data = nlohmann::json::array();
    for (double value : array.data) {
        data.push_back(to_json_value(value));
    }
    j["data"] = std::move(data);

    dump(os, j, pretty_print);
}

void write_result_array_json(const std::string& filepath, const ResultSet& results,
                             const std::string& variable_name, bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_result_array_json(file, results, variable_name, pretty_print);
}

void write_run_metadata_json(std::ostream& os, const ResultSet& results, bool pretty_print) {
    const RunMetadata& metadata = results.metadata();

    nlohmann::json j;
    j["country"] = metadata.country;
    j["first_year"] = metadata.first_year;
    j["run_date"] = metadata.run_date;
    j["groups"] = metadata.group_names;
    j["fleets"] = metadata.fleet_names;
    j["n_months"] = metadata.n_months;
    j["variables"] = results.variable_names();
    j["varied_parameters"] = results.scenarios().parameter_names();

    nlohmann::json scenarios = nlohmann::json::array();
    for (size_t i = 0; i < results.n_scenarios(); ++i) {
        nlohmann::json entry;
        entry["scenario"] = results.scenarios().scenario_id(i);
        entry["status"] = status_to_string(results.status(i));
        scenarios.push_back(std::move(entry));
    }
    j["scenarios"] = scenarios;
    j["failed_scenarios"] = results.failed_scenarios();

    dump(os, j, pretty_print);
}

void write_run_metadata_json(const std::string& filepath, const ResultSet& results,
                             bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_run_metadata_json(file, results, pretty_print);
}

} // namespace io
} // namespace ecobatch
