#include "result_config.hpp"
#include <algorithm>

namespace ecobatch {

std::string dim_label(Dim dim) {
    switch (dim) {
        case Dim::SCENARIO: return "Scenario";
        case Dim::FLEET: return "Fleet";
        case Dim::GROUP: return "Group";
        case Dim::ENV_GROUP: return "Group";
        case Dim::TIME: return "Time";
    }
    return "Unknown";
}

std::string category_to_string(VariableCategory category) {
    switch (category) {
        case VariableCategory::ECOSYSTEM: return "ECOSYSTEM_STATS";
        case VariableCategory::GROUP: return "GROUP_STATS";
        case VariableCategory::FISHING: return "FISHING_STATS";
    }
    return "UNKNOWN";
}

std::vector<std::string> category_dim_labels(VariableCategory category) {
    switch (category) {
        case VariableCategory::ECOSYSTEM: return {"Scenario", "Time"};
        case VariableCategory::GROUP: return {"Scenario", "Group", "Time"};
        case VariableCategory::FISHING: return {"Scenario", "Fleet", "Group", "Time"};
    }
    return {};
}

std::vector<DropFlag> source_drop_flags(ResultSource source) {
    switch (source) {
        case ResultSource::DYNAMIC_GROUP_STATS:
            return {DropFlag::DROP_FIRST, DropFlag::DROP_FIRST};
        case ResultSource::DYNAMIC_FLEET_CATCH:
            return {DropFlag::DROP_FIRST, DropFlag::DROP_FIRST, DropFlag::DROP_FIRST};
        case ResultSource::DYNAMIC_TL_CATCH:
        case ResultSource::DYNAMIC_FIB:
        case ResultSource::DYNAMIC_KEMPTONS_Q:
        case ResultSource::DYNAMIC_SHANNON_DIVERSITY:
            return {DropFlag::DROP_FIRST};
        case ResultSource::TRACER_CONCENTRATION:
        case ResultSource::TRACER_CONC_BIOMASS:
            return {DropFlag::DROP_LAST, DropFlag::DROP_FIRST};
    }
    return {};
}

bool source_is_packed(ResultSource source) {
    return source == ResultSource::DYNAMIC_GROUP_STATS;
}

bool ResultVariable::has_dim(Dim dim) const {
    return std::find(dims.begin(), dims.end(), dim) != dims.end();
}

namespace {

ResultVariable group_stat(const std::string& name, const std::string& unit, size_t key) {
    ResultVariable v;
    v.name = name;
    v.export_name = name;
    std::replace(v.export_name.begin(), v.export_name.end(), ' ', '_');
    v.dims = {Dim::SCENARIO, Dim::GROUP, Dim::TIME};
    v.category = VariableCategory::GROUP;
    v.unit = unit;
    v.source = ResultSource::DYNAMIC_GROUP_STATS;
    v.packed_key = static_cast<int>(key);
    v.save_filename = v.export_name;
    return v;
}

ResultVariable single(const std::string& name, const std::string& unit, ResultSource source,
                      std::vector<Dim> dims, VariableCategory category) {
    ResultVariable v;
    v.name = name;
    v.export_name = name;
    std::replace(v.export_name.begin(), v.export_name.end(), ' ', '_');
    v.dims = std::move(dims);
    v.category = category;
    v.unit = unit;
    v.source = source;
    v.packed_key = -1;
    v.save_filename = v.export_name;
    return v;
}

std::vector<ResultVariable> build_catalog() {
    const std::vector<Dim> env_group_dims = {Dim::SCENARIO, Dim::ENV_GROUP, Dim::TIME};
    const std::vector<Dim> ecosystem_dims = {Dim::SCENARIO, Dim::TIME};

    return {
        // Tracer
        single("Concentration", "t/t", ResultSource::TRACER_CONCENTRATION,
               env_group_dims, VariableCategory::GROUP),
        single("Concentration Biomass", "unknown", ResultSource::TRACER_CONC_BIOMASS,
               env_group_dims, VariableCategory::GROUP),

        // Dynamic group statistics
        group_stat("Biomass", "t/km2", GroupStat::BIOMASS),
        group_stat("Biomass Relative", "unitless", GroupStat::BIOMASS_REL),
        group_stat("Catch", "t/km2/year", GroupStat::YIELD),
        group_stat("Catch Relative", "unitless", GroupStat::YIELD_REL),
        group_stat("Feeding Time", "unitless", GroupStat::FEEDING_TIME),
        group_stat("Consumption Biomass", "year^-1", GroupStat::CONSUMPTION_BIOMASS),
        group_stat("Total Mortality", "year^-1", GroupStat::TOTAL_MORTALITY),
        group_stat("Predation Mortality", "year^-1", GroupStat::PREDATION_MORTALITY),
        group_stat("Fishing Mortality", "year^-1", GroupStat::FISHING_MORTALITY),
        group_stat("Production Consumption", "unitless", GroupStat::PROD_CONSUMPTION),
        group_stat("Average Weight", "unknown", GroupStat::AVERAGE_WEIGHT),
        group_stat("Mortality Predation Ratio", "unitless", GroupStat::MORTALITY_VS_PREDATION),
        group_stat("Mortality Fishing Ratio", "unitless", GroupStat::MORTALITY_VS_FISHING),
        group_stat("Ecosystem Structure", "unitless", GroupStat::ECOSYSTEM_STRUCTURE),
        group_stat("Trophic Level", "unitless", GroupStat::TROPHIC_LEVEL),

        // Ecosystem indicators
        single("Trophic Level Catch", "unitless", ResultSource::DYNAMIC_TL_CATCH,
               ecosystem_dims, VariableCategory::ECOSYSTEM),
        single("FIB", "unitless", ResultSource::DYNAMIC_FIB,
               ecosystem_dims, VariableCategory::ECOSYSTEM),
        single("Kemptons Q", "unitless", ResultSource::DYNAMIC_KEMPTONS_Q,
               ecosystem_dims, VariableCategory::ECOSYSTEM),
        single("Shannon Diversity", "unitless", ResultSource::DYNAMIC_SHANNON_DIVERSITY,
               ecosystem_dims, VariableCategory::ECOSYSTEM),

        // Fishing
        single("Fleet Catch", "t/km2/year", ResultSource::DYNAMIC_FLEET_CATCH,
               {Dim::SCENARIO, Dim::FLEET, Dim::GROUP, Dim::TIME}, VariableCategory::FISHING),
    };
}

} // anonymous namespace

const std::vector<ResultVariable>& result_variables() {
    static const std::vector<ResultVariable> catalog = build_catalog();
    return catalog;
}

std::vector<std::string> result_variable_names() {
    std::vector<std::string> names;
    for (const auto& variable : result_variables()) {
        names.push_back(variable.name);
    }
    return names;
}

const ResultVariable& find_result_variable(const std::string& name) {
    for (const auto& variable : result_variables()) {
        if (variable.name == name) {
            return variable;
        }
    }
    throw LookupError("Unknown result variable: " + name);
}

} // namespace ecobatch
