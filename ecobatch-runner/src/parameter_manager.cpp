#include "parameter_manager.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace ecobatch {

ParameterManager::ParameterManager(std::string subsystem,
                                   std::vector<std::string> group_names,
                                   std::vector<GroupCategory> group_categories,
                                   std::vector<EnvironmentCategory> environment_categories,
                                   std::vector<PairCategory> pair_categories)
    : subsystem_(std::move(subsystem)),
      group_names_(std::move(group_names)),
      group_categories_(std::move(group_categories)),
      environment_categories_(std::move(environment_categories)),
      pair_categories_(std::move(pair_categories)),
      variables_processed_(false) {
    build_catalog();
}

ParameterManager ParameterManager::tracer_manager(const std::vector<std::string>& group_names) {
    return ParameterManager(
        subsystem_to_string(Subsystem::TRACER),
        group_names,
        {
            {"init_c", GroupProperty::INITIAL_CONCENTRATION},
            {"immig_c", GroupProperty::IMMIGRATION_CONCENTRATION},
            {"direct_abs_r", GroupProperty::DIRECT_ABSORPTION_RATE},
            {"phys_decay_r", GroupProperty::PHYSICAL_DECAY_RATE},
            {"meta_decay_r", GroupProperty::METABOLIC_DECAY_RATE},
            {"excretion_r", GroupProperty::EXCRETION_RATE},
        },
        {
            {"env_init_c", ScalarProperty::ENV_INITIAL_CONCENTRATION},
            {"env_base_inflow_r", ScalarProperty::ENV_BASE_INFLOW_RATE},
            {"env_decay_r", ScalarProperty::ENV_DECAY_RATE},
            {"base_vol_ex_loss", ScalarProperty::ENV_VOLUME_EXCHANGE_LOSS},
            {"env_inflow_forcing_idx", ScalarProperty::CONTAMINANT_FORCING_NUMBER},
        });
}

ParameterManager ParameterManager::dynamic_manager(const std::vector<std::string>& group_names) {
    return ParameterManager(
        subsystem_to_string(Subsystem::DYNAMIC),
        group_names,
        {
            {"density_dep_catchability", GroupProperty::DENSITY_DEP_CATCHABILITY},
            {"feeding_time_adj_rate", GroupProperty::FEEDING_TIME_ADJ_RATE},
            {"max_rel_feeding_time", GroupProperty::MAX_REL_FEEDING_TIME},
            {"max_rel_pb", GroupProperty::MAX_REL_PB},
            {"pred_effect_feeding_time", GroupProperty::PRED_EFFECT_FEEDING_TIME},
            {"other_mort_feeding_time", GroupProperty::OTHER_MORT_FEEDING_TIME},
            {"qbmax_qbio", GroupProperty::QBMAX_QBIO},
            {"switching_power", GroupProperty::SWITCHING_POWER},
        },
        {},
        {
            {"vuln", PairProperty::VULNERABILITY},
        });
}

size_t ParameterManager::index_width(size_t n_groups) {
    return std::to_string(n_groups).size();
}

std::string ParameterManager::format_group_name(const std::string& prefix, int index, size_t width,
                                                const std::string& group_name) {
    std::ostringstream oss;
    oss << prefix << "_" << std::setw(static_cast<int>(width)) << std::setfill('0') << index
        << "_" << group_name;
    return oss.str();
}

void ParameterManager::build_catalog() {
    params_.clear();
    const size_t width = index_width(group_names_.size());

    for (size_t c = 0; c < group_categories_.size(); ++c) {
        for (size_t g = 0; g < group_names_.size(); ++g) {
            Parameter param;
            param.name = format_group_name(group_categories_[c].prefix, static_cast<int>(g + 1),
                                           width, group_names_[g]);
            param.category_index = c;
            param.kind = ParameterKind::GROUP;
            param.group_index = static_cast<int>(g + 1);
            params_[param.name] = param;
        }
    }

    for (size_t c = 0; c < pair_categories_.size(); ++c) {
        for (size_t prey = 0; prey < group_names_.size(); ++prey) {
            std::string prey_part = format_group_name(pair_categories_[c].prefix,
                                                      static_cast<int>(prey + 1),
                                                      width, group_names_[prey]);
            for (size_t pred = 0; pred < group_names_.size(); ++pred) {
                Parameter param;
                param.name = format_group_name(prey_part, static_cast<int>(pred + 1),
                                               width, group_names_[pred]);
                param.category_index = c;
                param.kind = ParameterKind::PAIR;
                param.pair = {static_cast<int>(prey + 1), static_cast<int>(pred + 1)};
                params_[param.name] = param;
            }
        }
    }

    for (size_t c = 0; c < environment_categories_.size(); ++c) {
        Parameter param;
        param.name = environment_categories_[c].name;
        param.category_index = c;
        param.kind = ParameterKind::ENVIRONMENT;
        params_[param.name] = param;
    }
}

// ============================================================================
// Assignment
// ============================================================================

std::set<std::string> ParameterManager::set_constant(const std::vector<std::string>& names,
                                                     const std::vector<double>& values) {
    if (names.size() != values.size()) {
        throw ConfigurationError("Got " + std::to_string(names.size()) + " parameter names but " +
                                 std::to_string(values.size()) + " values");
    }

    std::set<std::string> unknown;
    for (size_t i = 0; i < names.size(); ++i) {
        auto it = params_.find(names[i]);
        if (it == params_.end()) {
            unknown.insert(names[i]);
            continue;
        }
        if (it->second.mode == ParameterMode::VARIABLE) {
            variables_processed_ = false;
        }
        it->second.set_constant(values[i]);
    }
    return unknown;
}

std::set<std::string> ParameterManager::set_variable(const std::vector<std::string>& names,
                                                     const std::vector<int>& column_indices) {
    if (names.size() != column_indices.size()) {
        throw ConfigurationError("Got " + std::to_string(names.size()) + " parameter names but " +
                                 std::to_string(column_indices.size()) + " column indices");
    }

    std::set<std::string> unknown;
    for (size_t i = 0; i < names.size(); ++i) {
        auto it = params_.find(names[i]);
        if (it == params_.end()) {
            unknown.insert(names[i]);
            continue;
        }
        if (column_indices[i] < 0) {
            throw ConfigurationError("Negative column index for parameter " + names[i]);
        }
        it->second.set_variable(column_indices[i]);
    }
    variables_processed_ = false;
    return unknown;
}

void ParameterManager::reset() {
    for (auto& [name, param] : params_) {
        param.reset();
    }
    variables_processed_ = false;
    plan_ = VariablePlan();
}

void ParameterManager::clear_variables() {
    for (auto& [name, param] : params_) {
        if (param.mode == ParameterMode::VARIABLE) {
            param.reset();
        }
    }
    variables_processed_ = false;
    plan_ = VariablePlan();
}

void ParameterManager::apply_constants(EngineSession& engine) const {
    std::vector<std::vector<double>> group_values(group_categories_.size());
    std::vector<std::vector<int>> group_indices(group_categories_.size());
    std::vector<std::vector<double>> pair_values(pair_categories_.size());
    std::vector<std::vector<std::pair<int, int>>> pairs(pair_categories_.size());

    for (const auto& [name, param] : params_) {
        if (param.mode != ParameterMode::CONSTANT) {
            continue;
        }
        switch (param.kind) {
            case ParameterKind::GROUP:
                group_values[param.category_index].push_back(param.value);
                group_indices[param.category_index].push_back(param.group_index);
                break;
            case ParameterKind::PAIR:
                pair_values[param.category_index].push_back(param.value);
                pairs[param.category_index].push_back(param.pair);
                break;
            case ParameterKind::ENVIRONMENT:
                engine.set_scalar_property(environment_categories_[param.category_index].property,
                                           param.value);
                break;
        }
    }

    for (size_t c = 0; c < group_categories_.size(); ++c) {
        if (!group_indices[c].empty()) {
            engine.set_group_property(group_categories_[c].property, group_values[c], group_indices[c]);
        }
    }
    for (size_t c = 0; c < pair_categories_.size(); ++c) {
        if (!pairs[c].empty()) {
            engine.set_pair_property(pair_categories_[c].property, pair_values[c], pairs[c]);
        }
    }
}

void ParameterManager::process_variables() {
    plan_ = VariablePlan();
    plan_.group_indices.resize(group_categories_.size());
    plan_.group_columns.resize(group_categories_.size());
    plan_.pairs.resize(pair_categories_.size());
    plan_.pair_columns.resize(pair_categories_.size());

    for (const auto& [name, param] : params_) {
        if (param.mode != ParameterMode::VARIABLE) {
            continue;
        }
        switch (param.kind) {
            case ParameterKind::GROUP:
                plan_.group_indices[param.category_index].push_back(param.group_index);
                plan_.group_columns[param.category_index].push_back(param.column_index);
                break;
            case ParameterKind::PAIR:
                plan_.pairs[param.category_index].push_back(param.pair);
                plan_.pair_columns[param.category_index].push_back(param.column_index);
                break;
            case ParameterKind::ENVIRONMENT:
                plan_.environment.emplace_back(param.category_index, param.column_index);
                break;
        }
        plan_.max_column = std::max(plan_.max_column, param.column_index);
    }

    variables_processed_ = true;
}

void ParameterManager::apply_variables(EngineSession& engine, const std::vector<double>& row) {
    if (!variables_processed_) {
        process_variables();
    }

    if (plan_.max_column >= 0 && row.size() <= static_cast<size_t>(plan_.max_column)) {
        throw ConfigurationError("Scenario row has " + std::to_string(row.size()) +
                                 " values but column " + std::to_string(plan_.max_column) +
                                 " is referenced");
    }

    for (size_t c = 0; c < group_categories_.size(); ++c) {
        const auto& columns = plan_.group_columns[c];
        if (columns.empty()) {
            continue;
        }
        scratch_.resize(columns.size());
        for (size_t k = 0; k < columns.size(); ++k) {
            scratch_[k] = row[columns[k]];
        }
        engine.set_group_property(group_categories_[c].property, scratch_, plan_.group_indices[c]);
    }

    for (size_t c = 0; c < pair_categories_.size(); ++c) {
        const auto& columns = plan_.pair_columns[c];
        if (columns.empty()) {
            continue;
        }
        scratch_.resize(columns.size());
        for (size_t k = 0; k < columns.size(); ++k) {
            scratch_[k] = row[columns[k]];
        }
        engine.set_pair_property(pair_categories_[c].property, scratch_, plan_.pairs[c]);
    }

    for (const auto& [category, column] : plan_.environment) {
        engine.set_scalar_property(environment_categories_[category].property, row[column]);
    }
}

// ============================================================================
// Discovery
// ============================================================================

bool ParameterManager::has_parameter(const std::string& name) const {
    return params_.count(name) > 0;
}

const Parameter& ParameterManager::parameter(const std::string& name) const {
    auto it = params_.find(name);
    if (it == params_.end()) {
        throw LookupError("Unknown " + subsystem_ + " parameter: " + name);
    }
    return it->second;
}

std::vector<std::string> ParameterManager::all_parameter_names() const {
    std::vector<std::string> names;
    names.reserve(params_.size());
    for (const auto& [name, param] : params_) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> ParameterManager::environment_parameter_names() const {
    std::vector<std::string> names;
    for (const auto& [name, param] : params_) {
        if (param.is_env()) {
            names.push_back(name);
        }
    }
    return names;
}

std::vector<std::string> ParameterManager::pair_parameter_names() const {
    std::vector<std::string> names;
    for (const auto& [name, param] : params_) {
        if (param.kind == ParameterKind::PAIR) {
            names.push_back(name);
        }
    }
    return names;
}

std::vector<std::string> ParameterManager::unset_parameter_names() const {
    std::vector<std::string> names;
    for (const auto& [name, param] : params_) {
        if (param.mode == ParameterMode::UNSET) {
            names.push_back(name);
        }
    }
    return names;
}

std::vector<std::string> ParameterManager::group_prefixes() const {
    std::vector<std::string> prefixes;
    for (const auto& category : group_categories_) {
        prefixes.push_back(category.prefix);
    }
    return prefixes;
}

bool ParameterManager::has_prefix(const std::string& prefix) const {
    for (const auto& category : group_categories_) {
        if (category.prefix == prefix) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> ParameterManager::group_parameter_names(
    const std::vector<std::string>& prefixes,
    const std::vector<std::string>& groups,
    const std::vector<int>& group_indices) const {

    std::set<int> targets;
    for (const auto& group : groups) {
        auto it = std::find(group_names_.begin(), group_names_.end(), group);
        if (it == group_names_.end()) {
            throw LookupError("Unknown functional group: " + group);
        }
        targets.insert(static_cast<int>(it - group_names_.begin()) + 1);
    }
    for (int index : group_indices) {
        if (index < 1 || static_cast<size_t>(index) > group_names_.size()) {
            throw IndexError("Functional group index " + std::to_string(index) +
                             " outside 1.." + std::to_string(group_names_.size()));
        }
        targets.insert(index);
    }
    bool all_groups = groups.empty() && group_indices.empty();

    std::vector<std::string> names;
    for (const auto& [name, param] : params_) {
        if (param.kind != ParameterKind::GROUP) {
            continue;
        }
        if (!all_groups && targets.count(param.group_index) == 0) {
            continue;
        }
        if (!prefixes.empty() &&
            std::find(prefixes.begin(), prefixes.end(),
                      group_categories_[param.category_index].prefix) == prefixes.end()) {
            continue;
        }
        names.push_back(name);
    }
    return names;
}

} // namespace ecobatch
