#include "parameter_compositor.hpp"
#include <algorithm>
#include <iterator>
#include <set>

namespace ecobatch {

ParameterCompositor::ParameterCompositor(std::vector<ParameterManager> managers)
    : managers_(std::move(managers)) {}

ParameterCompositor ParameterCompositor::for_engine(const EngineSession& engine,
                                                    bool include_dynamic,
                                                    bool include_tracer) {
    std::vector<std::string> groups = engine.functional_group_names();
    std::vector<ParameterManager> managers;
    if (include_dynamic) {
        managers.push_back(ParameterManager::dynamic_manager(groups));
    }
    if (include_tracer) {
        managers.push_back(ParameterManager::tracer_manager(groups));
    }
    return ParameterCompositor(std::move(managers));
}

void ParameterCompositor::validate_names(const std::vector<std::string>& names) const {
    std::vector<std::string> unknown;
    for (const auto& name : names) {
        if (!has_parameter(name)) {
            unknown.push_back(name);
        }
    }
    if (unknown.empty()) {
        return;
    }

    std::string joined;
    for (const auto& name : unknown) {
        if (!joined.empty()) joined += ", ";
        joined += name;
    }
    throw ConfigurationError("Unknown parameter name(s): " + joined);
}

void ParameterCompositor::set_constant(const std::vector<std::string>& names,
                                       const std::vector<double>& values) {
    if (names.size() != values.size()) {
        throw ConfigurationError("Got " + std::to_string(names.size()) + " parameter names but " +
                                 std::to_string(values.size()) + " values");
    }
    validate_names(names);

    std::set<std::string> unrecognized(names.begin(), names.end());
    for (auto& manager : managers_) {
        std::set<std::string> missed = manager.set_constant(names, values);
        std::set<std::string> both;
        std::set_intersection(unrecognized.begin(), unrecognized.end(),
                              missed.begin(), missed.end(),
                              std::inserter(both, both.begin()));
        unrecognized.swap(both);
    }
    if (!unrecognized.empty()) {
        throw ConfigurationError("Parameter " + *unrecognized.begin() + " was not accepted by any subsystem");
    }
}

void ParameterCompositor::set_variable(const std::vector<std::string>& names,
                                       const std::vector<int>& column_indices) {
    if (names.size() != column_indices.size()) {
        throw ConfigurationError("Got " + std::to_string(names.size()) + " parameter names but " +
                                 std::to_string(column_indices.size()) + " column indices");
    }
    validate_names(names);
    for (size_t i = 0; i < column_indices.size(); ++i) {
        if (column_indices[i] < 0) {
            throw ConfigurationError("Negative column index for parameter " + names[i]);
        }
    }

    for (auto& manager : managers_) {
        manager.set_variable(names, column_indices);
    }
}

void ParameterCompositor::apply_constants(EngineSession& engine) const {
    for (const auto& manager : managers_) {
        manager.apply_constants(engine);
    }
}

void ParameterCompositor::apply_variables(EngineSession& engine, const std::vector<double>& row) {
    for (auto& manager : managers_) {
        manager.apply_variables(engine, row);
    }
}

void ParameterCompositor::reset() {
    for (auto& manager : managers_) {
        manager.reset();
    }
}

void ParameterCompositor::clear_variables() {
    for (auto& manager : managers_) {
        manager.clear_variables();
    }
}

bool ParameterCompositor::has_parameter(const std::string& name) const {
    for (const auto& manager : managers_) {
        if (manager.has_parameter(name)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> ParameterCompositor::unset_parameter_names() const {
    std::set<std::string> names;
    for (const auto& manager : managers_) {
        for (const auto& name : manager.unset_parameter_names()) {
            names.insert(name);
        }
    }
    return std::vector<std::string>(names.begin(), names.end());
}

std::vector<std::string> ParameterCompositor::available_parameter_names(const ParameterQuery& query) const {
    for (const auto& subsystem : query.subsystems) {
        bool known = std::any_of(managers_.begin(), managers_.end(),
                                 [&](const ParameterManager& m) { return m.subsystem() == subsystem; });
        if (!known) {
            throw ConfigurationError("Unknown or inactive subsystem: " + subsystem);
        }
    }
    for (const auto& prefix : query.prefixes) {
        bool known = std::any_of(managers_.begin(), managers_.end(),
                                 [&](const ParameterManager& m) { return m.has_prefix(prefix); });
        if (!known) {
            throw ConfigurationError("Unknown parameter prefix: " + prefix);
        }
    }

    auto requested = [&](ParameterCategory category) {
        return std::find(query.categories.begin(), query.categories.end(), category) != query.categories.end();
    };
    auto wants = [&](ParameterCategory category) {
        return query.categories.empty() || requested(category);
    };
    const bool group_filtered = !query.prefixes.empty() || !query.groups.empty() || !query.group_indices.empty();

    std::set<std::string> names;
    for (const auto& manager : managers_) {
        if (!query.subsystems.empty() &&
            std::find(query.subsystems.begin(), query.subsystems.end(), manager.subsystem()) ==
                query.subsystems.end()) {
            continue;
        }

        if (wants(ParameterCategory::GROUP)) {
            std::vector<std::string> prefixes;
            for (const auto& prefix : query.prefixes) {
                if (manager.has_prefix(prefix)) {
                    prefixes.push_back(prefix);
                }
            }
            // Skip managers owning none of the requested prefixes
            if (query.prefixes.empty() || !prefixes.empty()) {
                for (const auto& name : manager.group_parameter_names(prefixes, query.groups,
                                                                      query.group_indices)) {
                    names.insert(name);
                }
            }
        }
        if (wants(ParameterCategory::ENVIRONMENT)) {
            for (const auto& name : manager.environment_parameter_names()) {
                names.insert(name);
            }
        }
        // Pair names only follow a group filter when asked for explicitly
        if (group_filtered ? requested(ParameterCategory::PAIR) : wants(ParameterCategory::PAIR)) {
            for (const auto& name : manager.pair_parameter_names()) {
                names.insert(name);
            }
        }
    }

    return std::vector<std::string>(names.begin(), names.end());
}

} // namespace ecobatch
