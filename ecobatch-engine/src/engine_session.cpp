/**
 * @file engine_session.cpp
 * @brief Validation wrappers and string helpers for EngineSession
 */

#include "engine_session.hpp"
#include <sstream>

namespace ecobatch {

std::string group_property_to_string(GroupProperty property) {
    switch (property) {
        case GroupProperty::DENSITY_DEP_CATCHABILITY: return "DENSITY_DEP_CATCHABILITY";
        case GroupProperty::FEEDING_TIME_ADJ_RATE: return "FEEDING_TIME_ADJ_RATE";
        case GroupProperty::MAX_REL_FEEDING_TIME: return "MAX_REL_FEEDING_TIME";
        case GroupProperty::MAX_REL_PB: return "MAX_REL_PB";
        case GroupProperty::PRED_EFFECT_FEEDING_TIME: return "PRED_EFFECT_FEEDING_TIME";
        case GroupProperty::OTHER_MORT_FEEDING_TIME: return "OTHER_MORT_FEEDING_TIME";
        case GroupProperty::QBMAX_QBIO: return "QBMAX_QBIO";
        case GroupProperty::SWITCHING_POWER: return "SWITCHING_POWER";
        case GroupProperty::INITIAL_CONCENTRATION: return "INITIAL_CONCENTRATION";
        case GroupProperty::IMMIGRATION_CONCENTRATION: return "IMMIGRATION_CONCENTRATION";
        case GroupProperty::DIRECT_ABSORPTION_RATE: return "DIRECT_ABSORPTION_RATE";
        case GroupProperty::PHYSICAL_DECAY_RATE: return "PHYSICAL_DECAY_RATE";
        case GroupProperty::METABOLIC_DECAY_RATE: return "METABOLIC_DECAY_RATE";
        case GroupProperty::EXCRETION_RATE: return "EXCRETION_RATE";
        default: return "UNKNOWN";
    }
}

Subsystem subsystem_of(GroupProperty property) {
    switch (property) {
        case GroupProperty::INITIAL_CONCENTRATION:
        case GroupProperty::IMMIGRATION_CONCENTRATION:
        case GroupProperty::DIRECT_ABSORPTION_RATE:
        case GroupProperty::PHYSICAL_DECAY_RATE:
        case GroupProperty::METABOLIC_DECAY_RATE:
        case GroupProperty::EXCRETION_RATE:
            return Subsystem::TRACER;
        default:
            return Subsystem::DYNAMIC;
    }
}

std::string scalar_property_to_string(ScalarProperty property) {
    switch (property) {
        case ScalarProperty::N_YEARS: return "N_YEARS";
        case ScalarProperty::ENV_INITIAL_CONCENTRATION: return "ENV_INITIAL_CONCENTRATION";
        case ScalarProperty::ENV_BASE_INFLOW_RATE: return "ENV_BASE_INFLOW_RATE";
        case ScalarProperty::ENV_DECAY_RATE: return "ENV_DECAY_RATE";
        case ScalarProperty::ENV_VOLUME_EXCHANGE_LOSS: return "ENV_VOLUME_EXCHANGE_LOSS";
        case ScalarProperty::CONTAMINANT_FORCING_NUMBER: return "CONTAMINANT_FORCING_NUMBER";
        default: return "UNKNOWN";
    }
}

Subsystem subsystem_of(ScalarProperty property) {
    return property == ScalarProperty::N_YEARS ? Subsystem::DYNAMIC : Subsystem::TRACER;
}

std::string pair_property_to_string(PairProperty property) {
    switch (property) {
        case PairProperty::VULNERABILITY: return "VULNERABILITY";
        default: return "UNKNOWN";
    }
}

Subsystem subsystem_of(PairProperty) {
    return Subsystem::DYNAMIC;
}

std::string result_source_to_string(ResultSource source) {
    switch (source) {
        case ResultSource::DYNAMIC_GROUP_STATS: return "DYNAMIC_GROUP_STATS";
        case ResultSource::DYNAMIC_FLEET_CATCH: return "DYNAMIC_FLEET_CATCH";
        case ResultSource::DYNAMIC_TL_CATCH: return "DYNAMIC_TL_CATCH";
        case ResultSource::DYNAMIC_FIB: return "DYNAMIC_FIB";
        case ResultSource::DYNAMIC_KEMPTONS_Q: return "DYNAMIC_KEMPTONS_Q";
        case ResultSource::DYNAMIC_SHANNON_DIVERSITY: return "DYNAMIC_SHANNON_DIVERSITY";
        case ResultSource::TRACER_CONCENTRATION: return "TRACER_CONCENTRATION";
        case ResultSource::TRACER_CONC_BIOMASS: return "TRACER_CONC_BIOMASS";
        default: return "UNKNOWN";
    }
}

Stage stage_of(ResultSource source) {
    switch (source) {
        case ResultSource::TRACER_CONCENTRATION:
        case ResultSource::TRACER_CONC_BIOMASS:
            return Stage::TRACER;
        default:
            return Stage::DYNAMIC;
    }
}

// ============================================================================
// EngineStateSnapshot / ResultArrayView
// ============================================================================

bool EngineStateSnapshot::has_run(Stage stage) const {
    switch (stage) {
        case Stage::MASS_BALANCE: return mass_balance_ran;
        case Stage::DYNAMIC: return dynamic_ran;
        case Stage::TRACER: return tracer_ran;
        default: return false;
    }
}

std::string EngineStateSnapshot::summary() const {
    auto flag = [](bool value) { return value ? "yes" : "no"; };

    std::ostringstream oss;
    oss << "Engine state:\n"
        << "  model loaded:            " << flag(model_loaded);
    if (model_loaded && !model_path.empty()) {
        oss << " (" << model_path << ")";
    }
    oss << "\n"
        << "  model balanced:          " << flag(model_balanced) << "\n"
        << "  dynamic scenario loaded: " << flag(dynamic_scenario_loaded);
    if (dynamic_scenario_loaded) {
        oss << " (" << dynamic_scenario << ")";
    }
    oss << "\n"
        << "  tracer scenario loaded:  " << flag(tracer_scenario_loaded);
    if (tracer_scenario_loaded) {
        oss << " (" << tracer_scenario << ")";
    }
    oss << "\n"
        << "  mass balance ran:        " << flag(mass_balance_ran) << "\n"
        << "  dynamic ran:             " << flag(dynamic_ran) << "\n"
        << "  tracer ran:              " << flag(tracer_ran);
    return oss.str();
}

size_t ResultArrayView::size() const {
    if (shape.empty()) {
        return 0;
    }
    size_t total = 1;
    for (size_t extent : shape) {
        total *= extent;
    }
    return total;
}

void throw_stage_not_ready(Stage stage, const EngineStateSnapshot& state) {
    switch (stage) {
        case Stage::MASS_BALANCE: throw MassBalanceNotRunError(state);
        case Stage::DYNAMIC: throw DynamicNotRunError(state);
        case Stage::TRACER: throw TracerNotRunError(state);
    }
    throw StageNotReadyError(stage, "Stage has not been run", state);
}

// ============================================================================
// EngineSession wrappers
// ============================================================================

std::string EngineSession::scenario_name(Subsystem subsystem, size_t index) const {
    require_model("scenario_name");
    check_scenario_index(subsystem, index);
    return do_scenario_name(subsystem, index);
}

std::vector<std::string> EngineSession::scenario_names(Subsystem subsystem) const {
    require_model("scenario_names");
    std::vector<std::string> names;
    size_t count = scenario_count(subsystem);
    names.reserve(count);
    for (size_t i = 1; i <= count; ++i) {
        names.push_back(do_scenario_name(subsystem, i));
    }
    return names;
}

void EngineSession::new_scenario(Subsystem subsystem, const std::string& name,
                                 const std::string& description) {
    require_model("new_scenario");
    if (!do_new_scenario(subsystem, name, description)) {
        throw InitializationError("Failed to create " + subsystem_to_string(subsystem) +
                                  " scenario '" + name + "'");
    }
}

void EngineSession::load_scenario(Subsystem subsystem, const std::string& name) {
    require_model("load_scenario");
    size_t index = find_scenario(subsystem, name);
    if (!do_activate_scenario(subsystem, index)) {
        throw InitializationError("Failed to load " + subsystem_to_string(subsystem) +
                                  " scenario '" + name + "'");
    }
}

void EngineSession::load_scenario(Subsystem subsystem, size_t index) {
    require_model("load_scenario");
    check_scenario_index(subsystem, index);
    if (!do_activate_scenario(subsystem, index)) {
        throw InitializationError("Failed to load " + subsystem_to_string(subsystem) +
                                  " scenario " + std::to_string(index));
    }
}

void EngineSession::remove_scenario(Subsystem subsystem, const std::string& name) {
    require_model("remove_scenario");
    size_t index = find_scenario(subsystem, name);
    if (!do_remove_scenario(subsystem, index)) {
        throw EcoBatchError("Failed to remove " + subsystem_to_string(subsystem) +
                            " scenario '" + name + "'");
    }
}

void EngineSession::remove_scenario(Subsystem subsystem, size_t index) {
    require_model("remove_scenario");
    check_scenario_index(subsystem, index);
    if (!do_remove_scenario(subsystem, index)) {
        throw EcoBatchError("Failed to remove " + subsystem_to_string(subsystem) +
                            " scenario " + std::to_string(index));
    }
}

void EngineSession::set_group_property(GroupProperty property,
                                       const std::vector<double>& values,
                                       const std::vector<int>& group_indices) {
    require_scenario(subsystem_of(property));
    if (values.size() != group_indices.size()) {
        throw ConfigurationError("set_group_property(" + group_property_to_string(property) +
                                 "): " + std::to_string(values.size()) + " values for " +
                                 std::to_string(group_indices.size()) + " groups");
    }
    for (int index : group_indices) {
        check_group_index(index);
    }
    do_set_group_property(property, values, group_indices);
}

std::vector<double> EngineSession::get_group_property(GroupProperty property) const {
    require_scenario(subsystem_of(property));
    return do_get_group_property(property);
}

void EngineSession::set_scalar_property(ScalarProperty property, double value) {
    require_scenario(subsystem_of(property));
    do_set_scalar_property(property, value);
}

double EngineSession::get_scalar_property(ScalarProperty property) const {
    require_scenario(subsystem_of(property));
    return do_get_scalar_property(property);
}

void EngineSession::set_pair_property(PairProperty property,
                                      const std::vector<double>& values,
                                      const std::vector<std::pair<int, int>>& pairs) {
    require_scenario(subsystem_of(property));
    if (values.size() != pairs.size()) {
        throw ConfigurationError("set_pair_property(" + pair_property_to_string(property) +
                                 "): " + std::to_string(values.size()) + " values for " +
                                 std::to_string(pairs.size()) + " pairs");
    }
    for (const auto& [prey, predator] : pairs) {
        check_group_index(prey);
        check_group_index(predator);
    }
    do_set_pair_property(property, values, pairs);
}

double EngineSession::get_pair_property(PairProperty property, int prey, int predator) const {
    require_scenario(subsystem_of(property));
    check_group_index(prey);
    check_group_index(predator);
    return do_get_pair_property(property, prey, predator);
}

int EngineSession::add_forcing_function(const std::string& name, const std::vector<double>& values) {
    require_model("add_forcing_function");
    if (values.empty()) {
        throw ConfigurationError("Forcing function '" + name + "' has no values");
    }
    std::vector<double> padded;
    padded.reserve(values.size() + 1);
    padded.push_back(1.0);
    padded.insert(padded.end(), values.begin(), values.end());
    return do_add_forcing_function(name, padded);
}

bool EngineSession::run(Stage stage) {
    require_model("run");
    if (stage != Stage::MASS_BALANCE) {
        require_scenario(Subsystem::DYNAMIC);
    }
    if (stage == Stage::TRACER) {
        require_scenario(Subsystem::TRACER);
    }
    return do_run(stage);
}

// Private helpers

void EngineSession::require_model(const std::string& operation) const {
    if (!is_model_loaded()) {
        throw EngineError(operation + " requires a loaded model", state());
    }
}

void EngineSession::require_scenario(Subsystem subsystem) const {
    EngineStateSnapshot snapshot = state();
    bool loaded = subsystem == Subsystem::DYNAMIC ? snapshot.dynamic_scenario_loaded
                                                  : snapshot.tracer_scenario_loaded;
    if (!loaded) {
        throw ScenarioNotLoadedError(subsystem, snapshot);
    }
}

void EngineSession::check_group_index(int index) const {
    int n = static_cast<int>(n_groups());
    if (index < 1 || index > n) {
        throw IndexError("Group index " + std::to_string(index) +
                         " outside 1.." + std::to_string(n));
    }
}

size_t EngineSession::find_scenario(Subsystem subsystem, const std::string& name) const {
    size_t count = scenario_count(subsystem);
    for (size_t i = 1; i <= count; ++i) {
        if (do_scenario_name(subsystem, i) == name) {
            return i;
        }
    }
    throw LookupError("No " + subsystem_to_string(subsystem) + " scenario named '" + name + "'");
}

void EngineSession::check_scenario_index(Subsystem subsystem, size_t index) const {
    size_t count = scenario_count(subsystem);
    if (index < 1 || index > count) {
        throw IndexError(subsystem_to_string(subsystem) + " scenario index " +
                         std::to_string(index) + " outside 1.." + std::to_string(count));
    }
}

} // namespace ecobatch
