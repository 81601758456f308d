#include "result_set.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace ecobatch {

namespace {

constexpr const char* ENVIRONMENT_LABEL = "Environment";

} // anonymous namespace

double ResultArray::at(const std::vector<size_t>& index) const {
    size_t offset = 0;
    for (size_t axis = 0; axis < shape.size(); ++axis) {
        offset = offset * shape[axis] + index.at(axis);
    }
    return data.at(offset);
}

ResultSet::ResultSet(ScenarioTable scenarios,
                     RunMetadata metadata,
                     std::vector<ResultArray> results,
                     std::vector<ScenarioStatus> statuses)
    : scenarios_(std::move(scenarios)),
      metadata_(std::move(metadata)),
      results_(std::move(results)),
      statuses_(std::move(statuses)) {
    if (statuses_.size() != scenarios_.n_scenarios()) {
        throw ConfigurationError("Got " + std::to_string(statuses_.size()) + " statuses for " +
                                 std::to_string(scenarios_.n_scenarios()) + " scenarios");
    }
}

std::vector<std::string> ResultSet::variable_names() const {
    std::vector<std::string> names;
    for (const auto& result : results_) {
        names.push_back(result.variable.name);
    }
    return names;
}

bool ResultSet::has_variable(const std::string& name) const {
    return std::any_of(results_.begin(), results_.end(),
                       [&](const ResultArray& r) { return r.variable.name == name; });
}

const ResultArray& ResultSet::result(const std::string& name) const {
    for (const auto& result : results_) {
        if (result.variable.name == name) {
            return result;
        }
    }
    throw LookupError("Result variable was not collected: " + name);
}

std::vector<int64_t> ResultSet::failed_scenarios() const {
    std::vector<int64_t> ids;
    for (size_t i = 0; i < statuses_.size(); ++i) {
        if (statuses_[i] != ScenarioStatus::SUCCEEDED) {
            ids.push_back(scenarios_.scenario_id(i));
        }
    }
    return ids;
}

std::vector<std::string> ResultSet::coordinates(Dim dim) const {
    switch (dim) {
        case Dim::SCENARIO: {
            std::vector<std::string> ids;
            for (int64_t id : scenarios_.scenario_ids()) {
                ids.push_back(std::to_string(id));
            }
            return ids;
        }
        case Dim::FLEET:
            return metadata_.fleet_names;
        case Dim::GROUP:
            return metadata_.group_names;
        case Dim::ENV_GROUP: {
            std::vector<std::string> labels = {ENVIRONMENT_LABEL};
            labels.insert(labels.end(), metadata_.group_names.begin(), metadata_.group_names.end());
            return labels;
        }
        case Dim::TIME: {
            std::vector<std::string> months;
            for (size_t m = 0; m < metadata_.n_months; ++m) {
                months.push_back(std::to_string(m));
            }
            return months;
        }
    }
    return {};
}

std::vector<VariableCategory> ResultSet::categories() const {
    std::vector<VariableCategory> found;
    for (VariableCategory category : {VariableCategory::ECOSYSTEM, VariableCategory::GROUP,
                                      VariableCategory::FISHING}) {
        bool present = std::any_of(results_.begin(), results_.end(),
                                   [&](const ResultArray& r) { return r.variable.category == category; });
        if (present) {
            found.push_back(category);
        }
    }
    return found;
}

FlatTable ResultSet::to_flat_table(VariableCategory category) const {
    std::vector<const ResultArray*> members;
    for (const auto& result : results_) {
        if (result.variable.category == category) {
            members.push_back(&result);
        }
    }
    if (members.empty()) {
        throw LookupError("No collected variable in category " + category_to_string(category));
    }

    const bool has_fleet = category == VariableCategory::FISHING;
    const bool has_group = category != VariableCategory::ECOSYSTEM;
    const bool has_environment = std::any_of(members.begin(), members.end(),
        [](const ResultArray* r) { return r->variable.has_dim(Dim::ENV_GROUP); });

    std::vector<std::string> group_labels;
    if (has_group) {
        group_labels = coordinates(has_environment ? Dim::ENV_GROUP : Dim::GROUP);
    } else {
        group_labels = {""};
    }
    std::vector<std::string> fleet_labels = has_fleet ? metadata_.fleet_names : std::vector<std::string>{""};

    size_t n_months = 0;
    for (const ResultArray* member : members) {
        n_months = std::max(n_months, member->shape.back());
    }

    FlatTable table;
    table.name = category_to_string(category);
    table.columns.emplace_back("Scenario", FlatColumn::Type::INT64);
    if (has_fleet) table.columns.emplace_back("Fleet", FlatColumn::Type::STRING);
    if (has_group) table.columns.emplace_back("Group", FlatColumn::Type::STRING);
    table.columns.emplace_back("Time", FlatColumn::Type::INT64);
    const size_t first_value_column = table.columns.size();
    for (const ResultArray* member : members) {
        table.columns.emplace_back(member->variable.export_name, FlatColumn::Type::DOUBLE);
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const size_t n_rows = n_scenarios() * fleet_labels.size() * group_labels.size() * n_months;
    for (auto& column : table.columns) {
        switch (column.type) {
            case FlatColumn::Type::INT64: column.ints.reserve(n_rows); break;
            case FlatColumn::Type::STRING: column.strings.reserve(n_rows); break;
            case FlatColumn::Type::DOUBLE: column.doubles.reserve(n_rows); break;
        }
    }

    for (size_t s = 0; s < n_scenarios(); ++s) {
        const int64_t id = scenarios_.scenario_id(s);
        for (size_t f = 0; f < fleet_labels.size(); ++f) {
            for (size_t g = 0; g < group_labels.size(); ++g) {
                for (size_t t = 0; t < n_months; ++t) {
                    size_t c = 0;
                    table.columns[c++].ints.push_back(id);
                    if (has_fleet) table.columns[c++].strings.push_back(fleet_labels[f]);
                    if (has_group) table.columns[c++].strings.push_back(group_labels[g]);
                    table.columns[c++].ints.push_back(static_cast<int64_t>(t));

                    for (size_t v = 0; v < members.size(); ++v) {
                        const ResultArray& member = *members[v];
                        double value = nan;
                        if (t < member.shape.back()) {
                            std::vector<size_t> index = {s};
                            bool covered = true;
                            if (has_fleet) {
                                index.push_back(f);
                            }
                            if (has_group) {
                                if (member.variable.has_dim(Dim::ENV_GROUP)) {
                                    index.push_back(g);
                                } else if (has_environment) {
                                    covered = g > 0;
                                    index.push_back(covered ? g - 1 : 0);
                                } else {
                                    index.push_back(g);
                                }
                            }
                            index.push_back(t);
                            if (covered) {
                                value = member.at(index);
                            }
                        }
                        table.columns[first_value_column + v].doubles.push_back(value);
                    }
                }
            }
        }
    }

    return table;
}

std::string ResultSet::summary() const {
    std::ostringstream oss;
    oss << "Country: " << metadata_.country << "\n"
        << "Scenarios Run: " << n_scenarios() << "\n"
        << "First Year: " << metadata_.first_year << "\n"
        << "# Varied Parameters: " << n_varied_parameters() << "\n"
        << "Stored Results: [";
    std::vector<std::string> names = variable_names();
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << names[i];
    }
    oss << "]\n";

    std::vector<int64_t> failed = failed_scenarios();
    if (!failed.empty()) {
        oss << "Failed Scenarios: " << failed.size() << "\n";
    }
    return oss.str();
}

} // namespace ecobatch
