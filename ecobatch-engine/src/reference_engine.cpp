/**
 * @file reference_engine.cpp
 * @brief Implementation of ReferenceEngine
 */

#include "reference_engine.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace ecobatch {

namespace {

const GroupProperty kDynamicGroupProperties[] = {
    GroupProperty::DENSITY_DEP_CATCHABILITY,
    GroupProperty::FEEDING_TIME_ADJ_RATE,
    GroupProperty::MAX_REL_FEEDING_TIME,
    GroupProperty::MAX_REL_PB,
    GroupProperty::PRED_EFFECT_FEEDING_TIME,
    GroupProperty::OTHER_MORT_FEEDING_TIME,
    GroupProperty::QBMAX_QBIO,
    GroupProperty::SWITCHING_POWER
};

const GroupProperty kTracerGroupProperties[] = {
    GroupProperty::INITIAL_CONCENTRATION,
    GroupProperty::IMMIGRATION_CONCENTRATION,
    GroupProperty::DIRECT_ABSORPTION_RATE,
    GroupProperty::PHYSICAL_DECAY_RATE,
    GroupProperty::METABOLIC_DECAY_RATE,
    GroupProperty::EXCRETION_RATE
};

const ScalarProperty kTracerScalarProperties[] = {
    ScalarProperty::ENV_INITIAL_CONCENTRATION,
    ScalarProperty::ENV_BASE_INFLOW_RATE,
    ScalarProperty::ENV_DECAY_RATE,
    ScalarProperty::ENV_VOLUME_EXCHANGE_LOSS,
    ScalarProperty::CONTAMINANT_FORCING_NUMBER
};

double default_group_value(GroupProperty property) {
    switch (property) {
        case GroupProperty::DENSITY_DEP_CATCHABILITY: return 1.0;
        case GroupProperty::FEEDING_TIME_ADJ_RATE: return 0.5;
        case GroupProperty::MAX_REL_FEEDING_TIME: return 2.0;
        case GroupProperty::MAX_REL_PB: return 2.0;
        case GroupProperty::QBMAX_QBIO: return 1000.0;
        default: return 0.0;
    }
}

// Contaminant carried in by immigrating biomass, per year
constexpr double kImmigrationRate = 0.1;

constexpr double kMonth = 1.0 / 12.0;

class ModelFormatError : public std::runtime_error {
public:
    explicit ModelFormatError(const std::string& message) : std::runtime_error(message) {}
};

GroupType parse_group_type(const std::string& type) {
    if (type == "consumer") return GroupType::CONSUMER;
    if (type == "producer") return GroupType::PRODUCER;
    if (type == "detritus") return GroupType::DETRITUS;
    throw ModelFormatError("unknown group type '" + type + "'");
}

std::string group_type_to_string(GroupType type) {
    switch (type) {
        case GroupType::CONSUMER: return "consumer";
        case GroupType::PRODUCER: return "producer";
        case GroupType::DETRITUS: return "detritus";
        default: return "unknown";
    }
}

void read_properties(const json& j, size_t n_groups,
                     std::map<GroupProperty, std::vector<double>>& properties) {
    if (!j.contains("properties")) {
        return;
    }
    for (auto& [key, stored] : properties) {
        const std::string name = group_property_to_string(key);
        if (!j["properties"].contains(name)) {
            continue;
        }
        std::vector<double> values = j["properties"][name].get<std::vector<double>>();
        if (values.size() != n_groups) {
            throw ModelFormatError("property " + name + " has " + std::to_string(values.size()) +
                                   " values for " + std::to_string(n_groups) + " groups");
        }
        stored = std::move(values);
    }
}

json write_properties(const std::map<GroupProperty, std::vector<double>>& properties) {
    json j = json::object();
    for (const auto& [key, values] : properties) {
        j[group_property_to_string(key)] = values;
    }
    return j;
}

} // anonymous namespace

ReferenceEngine::ReferenceEngine()
    : model_loaded_(false),
      model_balanced_(false),
      first_year_(0),
      active_dynamic_(0),
      active_tracer_(0),
      mass_balance_ran_(false),
      dynamic_ran_(false),
      tracer_ran_(false),
      n_months_(0) {}

ReferenceEngine::~ReferenceEngine() {
    close_model();
}

// ============================================================================
// Model
// ============================================================================

bool ReferenceEngine::load_model(const std::string& path) {
    close_model();

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    try {
        json j = json::parse(file);

        model_name_ = j.value("name", std::string());
        country_ = j.value("country", std::string());
        first_year_ = j.value("first_year", 0);
        model_balanced_ = j.value("balanced", true);

        GroupType previous = GroupType::CONSUMER;
        for (const auto& g : j.at("groups")) {
            GroupData group;
            group.name = g.at("name").get<std::string>();
            group.type = parse_group_type(g.at("type").get<std::string>());
            group.biomass = g.at("biomass").get<double>();
            group.pb = g.value("pb", 0.0);
            group.qb = g.value("qb", 0.0);
            group.trophic_level = g.value("trophic_level",
                                          group.type == GroupType::CONSUMER ? 2.0 : 1.0);
            group.other_mortality = g.value("other_mortality", 0.2 * group.pb);

            // consumers, then producers, then detritus
            if (static_cast<int>(group.type) < static_cast<int>(previous)) {
                throw ModelFormatError("group '" + group.name + "' out of order");
            }
            previous = group.type;
            groups_.push_back(group);
        }
        if (groups_.empty()) {
            throw ModelFormatError("model has no groups");
        }
        const size_t n = groups_.size();

        if (j.contains("fleets")) {
            for (const auto& f : j["fleets"]) {
                FleetData fleet;
                fleet.name = f.at("name").get<std::string>();
                fleet.effort = f.value("effort", 1.0);
                fleet.catchability = f.value("catchability", std::vector<double>(n, 0.0));
                if (fleet.catchability.size() != n) {
                    throw ModelFormatError("fleet '" + fleet.name + "' catchability size mismatch");
                }
                fleets_.push_back(fleet);
            }
        }

        if (j.contains("forcing_functions")) {
            for (const auto& f : j["forcing_functions"]) {
                ForcingFunction forcing;
                forcing.name = f.at("name").get<std::string>();
                forcing.values = f.at("values").get<std::vector<double>>();
                forcing_functions_.push_back(forcing);
            }
        }

        if (j.contains("dynamic_scenarios")) {
            for (const auto& s : j["dynamic_scenarios"]) {
                DynamicScenario scenario = default_dynamic_scenario(
                    s.at("name").get<std::string>(), s.value("description", std::string()));
                scenario.n_years = s.value("n_years", DEFAULT_N_YEARS);
                read_properties(s, n, scenario.properties);
                if (s.contains("vulnerabilities")) {
                    auto matrix = s["vulnerabilities"].get<std::vector<std::vector<double>>>();
                    if (matrix.size() != n) {
                        throw ModelFormatError("vulnerability matrix size mismatch");
                    }
                    for (size_t prey = 0; prey < n; ++prey) {
                        if (matrix[prey].size() != n) {
                            throw ModelFormatError("vulnerability matrix size mismatch");
                        }
                        std::copy(matrix[prey].begin(), matrix[prey].end(),
                                  scenario.vulnerabilities.begin() + prey * n);
                    }
                }
                dynamic_scenarios_.push_back(scenario);
            }
        }

        if (j.contains("tracer_scenarios")) {
            for (const auto& s : j["tracer_scenarios"]) {
                TracerScenario scenario = default_tracer_scenario(
                    s.at("name").get<std::string>(), s.value("description", std::string()));
                read_properties(s, n, scenario.properties);
                if (s.contains("scalars")) {
                    for (auto& [key, value] : scenario.scalars) {
                        value = s["scalars"].value(scalar_property_to_string(key), value);
                    }
                }
                tracer_scenarios_.push_back(scenario);
            }
        }
    } catch (const json::exception&) {
        reset_model();
        return false;
    } catch (const ModelFormatError&) {
        reset_model();
        return false;
    }

    model_path_ = path;
    model_loaded_ = true;
    return true;
}

bool ReferenceEngine::save_model() {
    if (!model_loaded_) {
        return false;
    }

    const size_t n = groups_.size();
    json j;
    j["name"] = model_name_;
    j["country"] = country_;
    j["first_year"] = first_year_;
    j["balanced"] = model_balanced_;

    j["groups"] = json::array();
    for (const auto& group : groups_) {
        j["groups"].push_back({
            {"name", group.name},
            {"type", group_type_to_string(group.type)},
            {"biomass", group.biomass},
            {"pb", group.pb},
            {"qb", group.qb},
            {"trophic_level", group.trophic_level},
            {"other_mortality", group.other_mortality}
        });
    }

    j["fleets"] = json::array();
    for (const auto& fleet : fleets_) {
        j["fleets"].push_back({
            {"name", fleet.name},
            {"effort", fleet.effort},
            {"catchability", fleet.catchability}
        });
    }

    j["forcing_functions"] = json::array();
    for (const auto& forcing : forcing_functions_) {
        j["forcing_functions"].push_back({{"name", forcing.name}, {"values", forcing.values}});
    }

    j["dynamic_scenarios"] = json::array();
    for (const auto& scenario : dynamic_scenarios_) {
        std::vector<std::vector<double>> matrix(n);
        for (size_t prey = 0; prey < n; ++prey) {
            matrix[prey].assign(scenario.vulnerabilities.begin() + prey * n,
                                scenario.vulnerabilities.begin() + (prey + 1) * n);
        }
        j["dynamic_scenarios"].push_back({
            {"name", scenario.name},
            {"description", scenario.description},
            {"n_years", scenario.n_years},
            {"properties", write_properties(scenario.properties)},
            {"vulnerabilities", matrix}
        });
    }

    j["tracer_scenarios"] = json::array();
    for (const auto& scenario : tracer_scenarios_) {
        json scalars = json::object();
        for (const auto& [key, value] : scenario.scalars) {
            scalars[scalar_property_to_string(key)] = value;
        }
        j["tracer_scenarios"].push_back({
            {"name", scenario.name},
            {"description", scenario.description},
            {"properties", write_properties(scenario.properties)},
            {"scalars", scalars}
        });
    }

    std::ofstream file(model_path_, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << j.dump(2);
    file.close();
    return !file.fail();
}

void ReferenceEngine::close_model() noexcept {
    reset_model();
}

void ReferenceEngine::reset_model() noexcept {
    model_loaded_ = false;
    model_balanced_ = false;
    model_path_.clear();
    model_name_.clear();
    country_.clear();
    first_year_ = 0;
    groups_.clear();
    fleets_.clear();
    forcing_functions_.clear();
    dynamic_scenarios_.clear();
    tracer_scenarios_.clear();
    active_dynamic_ = 0;
    active_tracer_ = 0;
    mass_balance_ran_ = false;
    dynamic_ran_ = false;
    tracer_ran_ = false;
    n_months_ = 0;
}

std::vector<std::string> ReferenceEngine::functional_group_names() const {
    std::vector<std::string> names;
    names.reserve(groups_.size());
    for (const auto& group : groups_) {
        names.push_back(group.name);
    }
    return names;
}

std::vector<std::string> ReferenceEngine::fleet_names() const {
    std::vector<std::string> names;
    names.reserve(fleets_.size());
    for (const auto& fleet : fleets_) {
        names.push_back(fleet.name);
    }
    return names;
}

size_t ReferenceEngine::n_consumers() const {
    return static_cast<size_t>(std::count_if(groups_.begin(), groups_.end(), [](const GroupData& g) {
        return g.type == GroupType::CONSUMER;
    }));
}

size_t ReferenceEngine::n_producers() const {
    return static_cast<size_t>(std::count_if(groups_.begin(), groups_.end(), [](const GroupData& g) {
        return g.type == GroupType::PRODUCER;
    }));
}

// ============================================================================
// Scenarios
// ============================================================================

ReferenceEngine::DynamicScenario ReferenceEngine::default_dynamic_scenario(
    const std::string& name, const std::string& description) const {
    const size_t n = groups_.size();
    DynamicScenario scenario;
    scenario.name = name;
    scenario.description = description;
    scenario.n_years = DEFAULT_N_YEARS;
    for (GroupProperty property : kDynamicGroupProperties) {
        scenario.properties[property] = std::vector<double>(n, default_group_value(property));
    }
    scenario.vulnerabilities.assign(n * n, DEFAULT_VULNERABILITY);
    return scenario;
}

ReferenceEngine::TracerScenario ReferenceEngine::default_tracer_scenario(
    const std::string& name, const std::string& description) const {
    const size_t n = groups_.size();
    TracerScenario scenario;
    scenario.name = name;
    scenario.description = description;
    for (GroupProperty property : kTracerGroupProperties) {
        scenario.properties[property] = std::vector<double>(n, default_group_value(property));
    }
    for (ScalarProperty property : kTracerScalarProperties) {
        scenario.scalars[property] = 0.0;
    }
    return scenario;
}

size_t ReferenceEngine::scenario_count(Subsystem subsystem) const {
    return subsystem == Subsystem::DYNAMIC ? dynamic_scenarios_.size() : tracer_scenarios_.size();
}

std::string ReferenceEngine::do_scenario_name(Subsystem subsystem, size_t index) const {
    return subsystem == Subsystem::DYNAMIC ? dynamic_scenarios_.at(index - 1).name
                                           : tracer_scenarios_.at(index - 1).name;
}

bool ReferenceEngine::do_new_scenario(Subsystem subsystem, const std::string& name,
                                      const std::string& description) {
    if (name.empty()) {
        return false;
    }
    auto names = scenario_names(subsystem);
    if (std::find(names.begin(), names.end(), name) != names.end()) {
        return false;
    }

    if (subsystem == Subsystem::DYNAMIC) {
        dynamic_scenarios_.push_back(default_dynamic_scenario(name, description));
        return do_activate_scenario(subsystem, dynamic_scenarios_.size());
    }
    tracer_scenarios_.push_back(default_tracer_scenario(name, description));
    return do_activate_scenario(subsystem, tracer_scenarios_.size());
}

bool ReferenceEngine::do_activate_scenario(Subsystem subsystem, size_t index) {
    if (subsystem == Subsystem::DYNAMIC) {
        active_dynamic_ = index;
        dynamic_ran_ = false;
        tracer_ran_ = false;
    } else {
        active_tracer_ = index;
        tracer_ran_ = false;
    }
    return true;
}

bool ReferenceEngine::do_remove_scenario(Subsystem subsystem, size_t index) {
    size_t& active = subsystem == Subsystem::DYNAMIC ? active_dynamic_ : active_tracer_;
    if (subsystem == Subsystem::DYNAMIC) {
        dynamic_scenarios_.erase(dynamic_scenarios_.begin() + static_cast<long>(index - 1));
    } else {
        tracer_scenarios_.erase(tracer_scenarios_.begin() + static_cast<long>(index - 1));
    }

    if (active == index) {
        close_scenario(subsystem);
    } else if (active > index) {
        --active;
    }
    return true;
}

void ReferenceEngine::close_scenario(Subsystem subsystem) {
    if (subsystem == Subsystem::DYNAMIC) {
        active_dynamic_ = 0;
        dynamic_ran_ = false;
    } else {
        active_tracer_ = 0;
    }
    tracer_ran_ = false;
}

ReferenceEngine::DynamicScenario& ReferenceEngine::active_dynamic() {
    return dynamic_scenarios_.at(active_dynamic_ - 1);
}

const ReferenceEngine::DynamicScenario& ReferenceEngine::active_dynamic() const {
    return dynamic_scenarios_.at(active_dynamic_ - 1);
}

ReferenceEngine::TracerScenario& ReferenceEngine::active_tracer() {
    return tracer_scenarios_.at(active_tracer_ - 1);
}

const ReferenceEngine::TracerScenario& ReferenceEngine::active_tracer() const {
    return tracer_scenarios_.at(active_tracer_ - 1);
}

// ============================================================================
// Properties
// ============================================================================

void ReferenceEngine::do_set_group_property(GroupProperty property,
                                            const std::vector<double>& values,
                                            const std::vector<int>& group_indices) {
    std::vector<double>& stored = subsystem_of(property) == Subsystem::DYNAMIC
        ? active_dynamic().properties.at(property)
        : active_tracer().properties.at(property);
    for (size_t k = 0; k < values.size(); ++k) {
        stored[static_cast<size_t>(group_indices[k] - 1)] = values[k];
    }
}

std::vector<double> ReferenceEngine::do_get_group_property(GroupProperty property) const {
    return subsystem_of(property) == Subsystem::DYNAMIC
        ? active_dynamic().properties.at(property)
        : active_tracer().properties.at(property);
}

void ReferenceEngine::do_set_scalar_property(ScalarProperty property, double value) {
    if (property == ScalarProperty::N_YEARS) {
        if (!std::isfinite(value) || std::lround(value) < 1) {
            throw ConfigurationError("Simulation duration must be at least one year, got " +
                                     std::to_string(value));
        }
        active_dynamic().n_years = static_cast<int>(std::lround(value));
        return;
    }
    active_tracer().scalars[property] = value;
}

double ReferenceEngine::do_get_scalar_property(ScalarProperty property) const {
    if (property == ScalarProperty::N_YEARS) {
        return static_cast<double>(active_dynamic().n_years);
    }
    return active_tracer().scalars.at(property);
}

void ReferenceEngine::do_set_pair_property(PairProperty,
                                           const std::vector<double>& values,
                                           const std::vector<std::pair<int, int>>& pairs) {
    const size_t n = groups_.size();
    std::vector<double>& matrix = active_dynamic().vulnerabilities;
    for (size_t k = 0; k < values.size(); ++k) {
        size_t prey = static_cast<size_t>(pairs[k].first - 1);
        size_t predator = static_cast<size_t>(pairs[k].second - 1);
        matrix[prey * n + predator] = values[k];
    }
}

double ReferenceEngine::do_get_pair_property(PairProperty, int prey, int predator) const {
    const size_t n = groups_.size();
    return active_dynamic().vulnerabilities[static_cast<size_t>(prey - 1) * n +
                                            static_cast<size_t>(predator - 1)];
}

int ReferenceEngine::do_add_forcing_function(const std::string& name, const std::vector<double>& values) {
    forcing_functions_.push_back(ForcingFunction{name, values});
    return static_cast<int>(forcing_functions_.size());
}

double ReferenceEngine::forcing_value(int forcing_number, size_t month) const {
    if (forcing_number < 1 || static_cast<size_t>(forcing_number) > forcing_functions_.size()) {
        return 1.0;
    }
    const std::vector<double>& values = forcing_functions_[static_cast<size_t>(forcing_number - 1)].values;
    if (values.empty()) {
        return 1.0;
    }
    return values[std::min(month, values.size() - 1)];
}

// ============================================================================
// Execution
// ============================================================================

EngineStateSnapshot ReferenceEngine::state() const {
    EngineStateSnapshot snapshot;
    snapshot.model_loaded = model_loaded_;
    snapshot.model_balanced = model_loaded_ && model_balanced_;
    snapshot.dynamic_scenario_loaded = active_dynamic_ > 0;
    snapshot.tracer_scenario_loaded = active_tracer_ > 0;
    snapshot.mass_balance_ran = mass_balance_ran_;
    snapshot.dynamic_ran = dynamic_ran_;
    snapshot.tracer_ran = tracer_ran_;
    snapshot.model_path = model_path_;
    if (active_dynamic_ > 0) {
        snapshot.dynamic_scenario = active_dynamic().name;
    }
    if (active_tracer_ > 0) {
        snapshot.tracer_scenario = active_tracer().name;
    }
    return snapshot;
}

bool ReferenceEngine::do_run(Stage stage) {
    if (!run_mass_balance()) {
        return false;
    }
    if (stage == Stage::MASS_BALANCE) {
        return true;
    }

    const bool with_tracer = stage == Stage::TRACER;
    if (!run_simulation(with_tracer)) {
        return false;
    }
    dynamic_ran_ = true;
    tracer_ran_ = with_tracer;
    return true;
}

bool ReferenceEngine::run_mass_balance() {
    for (const auto& group : groups_) {
        if (!(group.biomass > 0.0) || group.pb < 0.0) {
            return false;
        }
        if (group.type == GroupType::CONSUMER && !(group.qb > 0.0)) {
            return false;
        }
    }
    mass_balance_ran_ = true;
    return true;
}

void ReferenceEngine::resize_results(size_t n_months, bool with_tracer) {
    const size_t group_slots = groups_.size() + 1;
    const size_t month_slots = n_months + 1;

    n_months_ = n_months;
    group_stats_.assign(GroupStat::COUNT * group_slots * month_slots, 0.0);
    fleet_catch_.assign((fleets_.size() + 1) * group_slots * month_slots, 0.0);
    tl_catch_.assign(month_slots, 0.0);
    fib_.assign(month_slots, 0.0);
    kemptons_q_.assign(month_slots, 0.0);
    shannon_.assign(month_slots, 0.0);
    if (with_tracer) {
        concentration_.assign((groups_.size() + 2) * month_slots, 0.0);
        conc_biomass_.assign((groups_.size() + 2) * month_slots, 0.0);
    }
}

bool ReferenceEngine::run_simulation(bool with_tracer) {
    const DynamicScenario& dyn = active_dynamic();
    const size_t n = groups_.size();
    const size_t n_months = static_cast<size_t>(std::max(dyn.n_years, 0)) * 12;
    if (n_months == 0) {
        return false;
    }
    resize_results(n_months, with_tracer);

    const size_t group_slots = n + 1;
    const size_t month_slots = n_months + 1;
    auto prop = [&dyn](GroupProperty property, size_t group) {
        return dyn.properties.at(property)[group];
    };
    auto vulnerability = [&dyn, n](size_t prey, size_t predator) {
        return std::max(dyn.vulnerabilities[prey * n + predator], 1.0 + 1e-6);
    };
    auto stat = [this, group_slots, month_slots](size_t s, size_t group, size_t month) -> double& {
        return group_stats_[(s * group_slots + group + 1) * month_slots + month];
    };
    auto is_prey = [this](size_t prey, size_t predator) {
        return prey != predator && groups_[prey].type != GroupType::DETRITUS;
    };

    std::vector<double> biomass(n), relative(n), feeding(n), cons_rate(n), consumption(n);
    std::vector<double> pred_mort(n), food_conc(n), next_biomass(n), first_yield(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        biomass[i] = groups_[i].biomass;
    }

    double env_conc = 0.0;
    std::vector<double> conc(n, 0.0), next_conc(n, 0.0);
    int forcing_number = 0;
    if (with_tracer) {
        const TracerScenario& tracer = active_tracer();
        env_conc = tracer.scalars.at(ScalarProperty::ENV_INITIAL_CONCENTRATION);
        conc = tracer.properties.at(GroupProperty::INITIAL_CONCENTRATION);
        forcing_number = static_cast<int>(
            std::lround(tracer.scalars.at(ScalarProperty::CONTAMINANT_FORCING_NUMBER)));
    }

    double first_fib_base = 0.0;
    bool fib_base_set = false;

    for (size_t month = 1; month <= n_months; ++month) {
        for (size_t i = 0; i < n; ++i) {
            relative[i] = biomass[i] / groups_[i].biomass;
        }

        // Feeding, consumption and the predation it causes
        std::fill(pred_mort.begin(), pred_mort.end(), 0.0);
        for (size_t g = 0; g < n; ++g) {
            feeding[g] = 1.0;
            cons_rate[g] = 0.0;
            consumption[g] = 0.0;
            food_conc[g] = 0.0;
            if (groups_[g].type != GroupType::CONSUMER) {
                continue;
            }

            const double switching = prop(GroupProperty::SWITCHING_POWER, g);
            double availability = 0.0;
            double weight_sum = 0.0;
            size_t n_prey = 0;
            for (size_t j = 0; j < n; ++j) {
                if (!is_prey(j, g)) continue;
                double v = vulnerability(j, g);
                availability += v * relative[j] / (v - 1.0 + relative[j]);
                weight_sum += v * std::pow(relative[j], switching);
                ++n_prey;
            }

            double food = n_prey > 0 ? availability / static_cast<double>(n_prey) : 1.0;
            double feeding_time = 1.0 + prop(GroupProperty::FEEDING_TIME_ADJ_RATE, g) * (food - 1.0);
            feeding[g] = std::min(std::max(feeding_time, 0.0), prop(GroupProperty::MAX_REL_FEEDING_TIME, g));
            cons_rate[g] = std::min(groups_[g].qb * feeding[g] * food,
                                    groups_[g].qb * prop(GroupProperty::QBMAX_QBIO, g));
            consumption[g] = cons_rate[g] * biomass[g];

            if (weight_sum <= 0.0) continue;
            for (size_t j = 0; j < n; ++j) {
                if (!is_prey(j, g)) continue;
                double share = vulnerability(j, g) * std::pow(relative[j], switching) / weight_sum;
                pred_mort[j] += consumption[g] * share / biomass[j];
                food_conc[g] += share * conc[j];
            }
        }

        double total_yield = 0.0;
        double yield_tl = 0.0;
        for (size_t j = 0; j < n; ++j) {
            const GroupData& group = groups_[j];
            if (group.type == GroupType::DETRITUS) {
                next_biomass[j] = biomass[j];
                stat(GroupStat::BIOMASS, j, month) = biomass[j];
                stat(GroupStat::BIOMASS_REL, j, month) = relative[j];
                stat(GroupStat::TROPHIC_LEVEL, j, month) = group.trophic_level;
                continue;
            }

            double predation = pred_mort[j] / (1.0 + prop(GroupProperty::PRED_EFFECT_FEEDING_TIME, j));
            double dd = std::max(0.0, 1.0 + (prop(GroupProperty::DENSITY_DEP_CATCHABILITY, j) - 1.0) *
                                           (1.0 - relative[j]));
            double fishing = 0.0;
            for (const auto& fleet : fleets_) {
                fishing += fleet.effort * fleet.catchability[j] * dd;
            }
            double other = group.other_mortality *
                std::max(0.0, 1.0 + prop(GroupProperty::OTHER_MORT_FEEDING_TIME, j) * (feeding[j] - 1.0));

            double production = 0.0;
            if (group.type == GroupType::PRODUCER) {
                production = group.pb * biomass[j] *
                    std::min(std::max(2.0 - relative[j], 0.0), prop(GroupProperty::MAX_REL_PB, j));
            } else {
                production = group.pb / group.qb * consumption[j];
            }

            double total_mort = predation + fishing + other;
            next_biomass[j] = std::max((biomass[j] + kMonth * production) / (1.0 + kMonth * total_mort),
                                       1e-8 * group.biomass);

            double yield = fishing * next_biomass[j];
            if (month == 1) {
                first_yield[j] = yield;
            }
            total_yield += yield;
            yield_tl += yield * group.trophic_level;

            stat(GroupStat::BIOMASS, j, month) = next_biomass[j];
            stat(GroupStat::BIOMASS_REL, j, month) = next_biomass[j] / group.biomass;
            stat(GroupStat::YIELD, j, month) = yield;
            stat(GroupStat::YIELD_REL, j, month) = first_yield[j] > 0.0 ? yield / first_yield[j] : 0.0;
            stat(GroupStat::FEEDING_TIME, j, month) = feeding[j];
            stat(GroupStat::CONSUMPTION_BIOMASS, j, month) = cons_rate[j];
            stat(GroupStat::TOTAL_MORTALITY, j, month) = total_mort;
            stat(GroupStat::PREDATION_MORTALITY, j, month) = predation;
            stat(GroupStat::FISHING_MORTALITY, j, month) = fishing;
            stat(GroupStat::PROD_CONSUMPTION, j, month) =
                consumption[j] > 0.0 ? production / consumption[j] : 0.0;
            stat(GroupStat::AVERAGE_WEIGHT, j, month) = 1.0;
            stat(GroupStat::MORTALITY_VS_PREDATION, j, month) = total_mort > 0.0 ? predation / total_mort : 0.0;
            stat(GroupStat::MORTALITY_VS_FISHING, j, month) = total_mort > 0.0 ? fishing / total_mort : 0.0;
            stat(GroupStat::TROPHIC_LEVEL, j, month) = group.trophic_level;

            for (size_t f = 0; f < fleets_.size(); ++f) {
                fleet_catch_[((f + 1) * group_slots + j + 1) * month_slots + month] =
                    fleets_[f].effort * fleets_[f].catchability[j] * dd * next_biomass[j];
            }
        }

        // Contaminant flows use this month's consumption and the updated biomass
        if (with_tracer) {
            const TracerScenario& tracer = active_tracer();
            auto tprop = [&tracer](GroupProperty property, size_t group) {
                return tracer.properties.at(property)[group];
            };
            double inflow = tracer.scalars.at(ScalarProperty::ENV_BASE_INFLOW_RATE) *
                            forcing_value(forcing_number, month);
            double env_loss = tracer.scalars.at(ScalarProperty::ENV_DECAY_RATE) +
                              tracer.scalars.at(ScalarProperty::ENV_VOLUME_EXCHANGE_LOSS);
            env_conc = std::max(0.0, (env_conc + kMonth * inflow) / (1.0 + kMonth * env_loss));

            for (size_t j = 0; j < n; ++j) {
                double inputs = tprop(GroupProperty::DIRECT_ABSORPTION_RATE, j) * env_conc +
                                tprop(GroupProperty::IMMIGRATION_CONCENTRATION, j) * kImmigrationRate +
                                cons_rate[j] * food_conc[j];
                double losses = tprop(GroupProperty::PHYSICAL_DECAY_RATE, j) +
                                tprop(GroupProperty::METABOLIC_DECAY_RATE, j) +
                                tprop(GroupProperty::EXCRETION_RATE, j);
                next_conc[j] = std::max(0.0, (conc[j] + kMonth * inputs) / (1.0 + kMonth * losses));
            }
            conc.swap(next_conc);

            concentration_[month] = env_conc;
            conc_biomass_[month] = env_conc;
            for (size_t j = 0; j < n; ++j) {
                concentration_[(j + 1) * month_slots + month] = conc[j];
                conc_biomass_[(j + 1) * month_slots + month] = conc[j] * next_biomass[j];
            }
        }

        biomass.swap(next_biomass);

        // Ecosystem indicators
        double living = 0.0;
        double min_high_tl = 0.0;
        double max_high_tl = 0.0;
        size_t n_high_tl = 0;
        for (size_t j = 0; j < n; ++j) {
            if (groups_[j].type == GroupType::DETRITUS) continue;
            living += biomass[j];
            if (groups_[j].trophic_level >= 3.0) {
                min_high_tl = n_high_tl == 0 ? biomass[j] : std::min(min_high_tl, biomass[j]);
                max_high_tl = n_high_tl == 0 ? biomass[j] : std::max(max_high_tl, biomass[j]);
                ++n_high_tl;
            }
        }

        double shannon = 0.0;
        for (size_t j = 0; j < n; ++j) {
            if (groups_[j].type == GroupType::DETRITUS || living <= 0.0) continue;
            double p = biomass[j] / living;
            stat(GroupStat::ECOSYSTEM_STRUCTURE, j, month) = p;
            if (p > 0.0) {
                shannon -= p * std::log(p);
            }
        }

        double tlc = total_yield > 0.0 ? yield_tl / total_yield : 0.0;
        double fib = 0.0;
        if (total_yield > 0.0) {
            double base = std::log10(total_yield) + tlc;
            if (!fib_base_set) {
                first_fib_base = base;
                fib_base_set = true;
            }
            fib = base - first_fib_base;
        }

        tl_catch_[month] = tlc;
        fib_[month] = fib;
        kemptons_q_[month] = n_high_tl > 0
            ? static_cast<double>(n_high_tl) / std::log(1.0 + max_high_tl / min_high_tl)
            : 0.0;
        shannon_[month] = shannon;

        for (size_t j = 0; j < n; ++j) {
            if (!std::isfinite(biomass[j]) || !std::isfinite(conc[j])) {
                return false;
            }
        }
        if (!std::isfinite(env_conc) || !std::isfinite(total_yield)) {
            return false;
        }
    }

    return true;
}

ResultArrayView ReferenceEngine::result_array(ResultSource source) const {
    if (n_months_ == 0) {
        return ResultArrayView();
    }

    const size_t group_slots = groups_.size() + 1;
    const size_t month_slots = n_months_ + 1;

    switch (source) {
        case ResultSource::DYNAMIC_GROUP_STATS:
            return ResultArrayView(group_stats_.data(), {GroupStat::COUNT, group_slots, month_slots});
        case ResultSource::DYNAMIC_FLEET_CATCH:
            return ResultArrayView(fleet_catch_.data(), {fleets_.size() + 1, group_slots, month_slots});
        case ResultSource::DYNAMIC_TL_CATCH:
            return ResultArrayView(tl_catch_.data(), {month_slots});
        case ResultSource::DYNAMIC_FIB:
            return ResultArrayView(fib_.data(), {month_slots});
        case ResultSource::DYNAMIC_KEMPTONS_Q:
            return ResultArrayView(kemptons_q_.data(), {month_slots});
        case ResultSource::DYNAMIC_SHANNON_DIVERSITY:
            return ResultArrayView(shannon_.data(), {month_slots});
        case ResultSource::TRACER_CONCENTRATION:
            if (concentration_.empty()) return ResultArrayView();
            return ResultArrayView(concentration_.data(), {groups_.size() + 2, month_slots});
        case ResultSource::TRACER_CONC_BIOMASS:
            if (conc_biomass_.empty()) return ResultArrayView();
            return ResultArrayView(conc_biomass_.data(), {groups_.size() + 2, month_slots});
    }
    return ResultArrayView();
}

} // namespace ecobatch
