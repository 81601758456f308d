/**
 * @file scenario_interface.cpp
 * @brief Implementation of ScenarioInterface
 */

#include "scenario_interface.hpp"
#include "result_manager.hpp"
#include "scenario_runner.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <sstream>
#include <system_error>
#include <thread>

namespace ecobatch {

namespace {

/**
 * @brief Editor column name -> parameter prefix (and dynamic property, if any)
 */
struct EditorColumn {
    const char* column;
    const char* prefix;
    bool dynamic;
    GroupProperty property;
    bool producers;   ///< Read from producer rows instead of consumer rows
};

const std::vector<EditorColumn>& editor_columns() {
    static const std::vector<EditorColumn> columns = {
        // Tracer group table
        {"Initial conc. (t/t)", "init_c", false, GroupProperty::INITIAL_CONCENTRATION, false},
        {"Conc. in immigrating biomass (t/t)", "immig_c", false, GroupProperty::IMMIGRATION_CONCENTRATION, false},
        {"Direct absorption rate", "direct_abs_r", false, GroupProperty::DIRECT_ABSORPTION_RATE, false},
        {"Physical decay rate", "phys_decay_r", false, GroupProperty::PHYSICAL_DECAY_RATE, false},
        {"Prop. of contaminant excreted", "excretion_r", false, GroupProperty::EXCRETION_RATE, false},
        {"Metabolic decay rate", "meta_decay_r", false, GroupProperty::METABOLIC_DECAY_RATE, false},
        // Dynamic group info table
        {"Density-dep. catchability: Qmax/Qo [>=1]", "density_dep_catchability", true,
         GroupProperty::DENSITY_DEP_CATCHABILITY, false},
        {"Feeding time adjust rate [0,1]", "feeding_time_adj_rate", true,
         GroupProperty::FEEDING_TIME_ADJ_RATE, false},
        {"Max rel. feeding time", "max_rel_feeding_time", true,
         GroupProperty::MAX_REL_FEEDING_TIME, false},
        {"Predator effect on feeding time [0,1]", "pred_effect_feeding_time", true,
         GroupProperty::PRED_EFFECT_FEEDING_TIME, false},
        {"Fraction of other mortality sens. to changes in feeding time", "other_mort_feeding_time", true,
         GroupProperty::OTHER_MORT_FEEDING_TIME, false},
        {"QBmax/QBo (for handling time) [>1]", "qbmax_qbio", true,
         GroupProperty::QBMAX_QBIO, false},
        {"Switching power parameter [0,2]", "switching_power", true,
         GroupProperty::SWITCHING_POWER, false},
        {"Max rel. P/B", "max_rel_pb", true, GroupProperty::MAX_REL_PB, true},
    };
    return columns;
}

const EditorColumn* find_editor_column(const std::string& column) {
    for (const auto& entry : editor_columns()) {
        if (column == entry.column) {
            return &entry;
        }
    }
    return nullptr;
}

constexpr const char* ADDITIVE_PREDATION_COLUMN = "Additive prop. of predation mortality [0, 1]";

std::string join(const std::vector<std::string>& items, size_t limit = 10) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size() && i < limit; ++i) {
        if (i > 0) oss << ", ";
        oss << items[i];
    }
    if (items.size() > limit) {
        oss << ", ... (" << items.size() - limit << " more)";
    }
    return oss.str();
}

void replace_scenario(EngineSession& engine, Subsystem subsystem,
                      const std::string& name, const std::string& description) {
    std::vector<std::string> existing = engine.scenario_names(subsystem);
    if (std::find(existing.begin(), existing.end(), name) != existing.end()) {
        engine.remove_scenario(subsystem, name);
    }
    engine.new_scenario(subsystem, name, description);
}

} // anonymous namespace

// ============================================================================
// Setup and teardown
// ============================================================================

ScenarioInterface::ScenarioInterface(const InterfaceConfig& config,
                                     EngineFactory factory,
                                     Logger* logger)
    : config_(config),
      factory_(std::move(factory)),
      logger_(logger != nullptr ? logger : &Logger::get_instance()),
      ctx_("interface"),
      closed_(false) {
    try {
        setup();
    } catch (const std::exception&) {
        cleanup();
        throw;
    }
}

ScenarioInterface::~ScenarioInterface() {
    cleanup();
}

void ScenarioInterface::setup() {
    ctx_.phase = "init";
    if (config_.model_path.empty()) {
        throw ConfigurationError("No model path given");
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_.model_path, ec)) {
        throw InitializationError("Model file not found: " + config_.model_path);
    }

    prepare_working_copy();

    engine_ = factory_.create_engine(config_.engine_type);
    if (!engine_->load_model(working_model_path_)) {
        throw InitializationError("Cannot load model " + working_model_path_);
    }

    if (config_.dynamic_scenario.empty()) {
        dynamic_scenario_ = TEMP_DYNAMIC_SCENARIO;
        replace_scenario(*engine_, Subsystem::DYNAMIC, dynamic_scenario_, "Temporary dynamic scenario");
    } else {
        dynamic_scenario_ = config_.dynamic_scenario;
        engine_->load_scenario(Subsystem::DYNAMIC, dynamic_scenario_);
    }

    if (config_.run_stage == Stage::TRACER) {
        tracer_scenario_ = TEMP_TRACER_SCENARIO;
        replace_scenario(*engine_, Subsystem::TRACER, tracer_scenario_, "Temporary tracer scenario");
    }

    if (!engine_->state().model_balanced) {
        logger_->log_warning(ctx_, "Baseline model is not balanced, results may not be meaningful");
    }

    compositor_ = ParameterCompositor::for_engine(*engine_, !config_.constant_dynamic,
                                                  config_.run_stage == Stage::TRACER);

    std::map<std::string, std::string> settings;
    settings["working_model_path"] = working_model_path_;
    settings["dynamic_scenario"] = dynamic_scenario_;
    settings["tracer_scenario"] = tracer_scenario_.empty() ? "none" : tracer_scenario_;
    settings["run_stage"] = stage_to_string(config_.run_stage);
    settings["failure_policy"] = policy_to_string(config_.failure_policy);
    settings["constant_dynamic"] = config_.constant_dynamic ? "true" : "false";
    logger_->log_interface_init(ctx_, config_.model_path, config_.engine_type,
                                engine_->n_groups(), settings);
}

void ScenarioInterface::prepare_working_copy() {
    std::filesystem::path source(config_.model_path);
    std::error_code ec;

    if (!config_.private_model_path.empty()) {
        working_model_path_ = config_.private_model_path;
        std::filesystem::path parent = std::filesystem::path(working_model_path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
    } else {
        std::string pattern = (std::filesystem::temp_directory_path(ec) / "ecobatch_XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (mkdtemp(buffer.data()) == nullptr) {
            throw InitializationError("Cannot create temporary directory from " + pattern);
        }
        temp_dir_ = buffer.data();
        working_model_path_ = (std::filesystem::path(temp_dir_) / source.filename()).string();
    }

    ec.clear();
    std::filesystem::copy_file(source, working_model_path_,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw InitializationError("Cannot copy model to " + working_model_path_ + ": " + ec.message());
    }
}

void ScenarioInterface::reopen_model() {
    if (!engine_->load_model(working_model_path_)) {
        throw InitializationError("Cannot reload model " + working_model_path_);
    }
    engine_->load_scenario(Subsystem::DYNAMIC, dynamic_scenario_);
    if (!tracer_scenario_.empty()) {
        engine_->load_scenario(Subsystem::TRACER, tracer_scenario_);
    }
    compositor_.apply_constants(*engine_);
}

void ScenarioInterface::cleanup() noexcept {
    if (closed_) {
        return;
    }
    closed_ = true;

    ExecutionContext ctx = ctx_;
    ctx.phase = "cleanup";
    if (engine_) {
        engine_->close_model();
        engine_.reset();
    }
    if (!temp_dir_.empty()) {
        remove_with_retry(temp_dir_, config_.cleanup, *logger_, ctx);
    }
}

void ScenarioInterface::require_open() const {
    if (closed_ || !engine_) {
        throw EcoBatchError("Scenario interface has been cleaned up");
    }
}

EngineSession& ScenarioInterface::engine() {
    require_open();
    return *engine_;
}

// ============================================================================
// Parameters
// ============================================================================

void ScenarioInterface::reset_parameters() {
    compositor_.reset();
}

std::vector<std::string> ScenarioInterface::available_parameter_names(const ParameterQuery& query) const {
    return compositor_.available_parameter_names(query);
}

std::vector<std::string> ScenarioInterface::format_parameter_names(const std::vector<std::string>& full_names,
                                                                   const std::vector<std::string>& groups) const {
    require_open();
    if (full_names.size() != groups.size()) {
        throw ConfigurationError("Got " + std::to_string(full_names.size()) + " column names for " +
                                 std::to_string(groups.size()) + " groups");
    }

    const std::vector<std::string> group_names = engine_->functional_group_names();
    const size_t width = ParameterManager::index_width(group_names.size());

    std::vector<std::string> names;
    for (size_t k = 0; k < full_names.size(); ++k) {
        const EditorColumn* column = find_editor_column(full_names[k]);
        if (column == nullptr) {
            throw ConfigurationError("Unknown parameter column: " + full_names[k]);
        }
        auto it = std::find(group_names.begin(), group_names.end(), groups[k]);
        if (it == group_names.end()) {
            throw LookupError("Unknown functional group: " + groups[k]);
        }
        int index = static_cast<int>(it - group_names.begin()) + 1;
        names.push_back(ParameterManager::format_group_name(column->prefix, index, width, groups[k]));
    }
    return names;
}

void ScenarioInterface::set_constant_parameters(const std::vector<std::string>& names,
                                                const std::vector<double>& values) {
    require_open();
    compositor_.set_constant(names, values);
    compositor_.apply_constants(*engine_);
}

ScenarioTable ScenarioInterface::empty_scenario_table(const std::vector<std::string>& names,
                                                      size_t n_scenarios) const {
    std::vector<std::string> unknown;
    for (const auto& name : names) {
        if (!compositor_.has_parameter(name)) {
            unknown.push_back(name);
        }
    }
    if (!unknown.empty()) {
        throw ConfigurationError("Unknown parameters: " + join(unknown));
    }
    return ScenarioTable::empty(names, n_scenarios);
}

FlatTable ScenarioInterface::long_scenario_template(size_t n_scenarios) const {
    std::vector<std::string> environment;
    std::vector<std::string> prefixes;
    std::vector<std::string> groups;
    for (const auto& manager : compositor_.managers()) {
        for (const auto& name : manager.environment_parameter_names()) {
            environment.push_back(name);
        }
        for (const auto& prefix : manager.group_prefixes()) {
            prefixes.push_back(prefix);
        }
        if (groups.empty()) {
            groups = manager.group_names();
        }
    }

    FlatTable table;
    table.name = "scenarios";
    table.columns.emplace_back("Scenario", FlatColumn::Type::INT64);
    table.columns.emplace_back("Group", FlatColumn::Type::STRING);
    table.columns.emplace_back("Parameter", FlatColumn::Type::STRING);
    table.columns.emplace_back("Value", FlatColumn::Type::DOUBLE);

    auto add_row = [&table](int64_t scenario, const std::string& group, const std::string& parameter) {
        table.columns[0].ints.push_back(scenario);
        table.columns[1].strings.push_back(group);
        table.columns[2].strings.push_back(parameter);
        table.columns[3].doubles.push_back(std::numeric_limits<double>::quiet_NaN());
    };

    for (size_t i = 1; i <= n_scenarios; ++i) {
        const int64_t scenario = static_cast<int64_t>(i);
        for (const auto& name : environment) {
            add_row(scenario, "Environment", name);
        }
        for (const auto& group : groups) {
            for (const auto& prefix : prefixes) {
                add_row(scenario, group, prefix);
            }
        }
    }
    return table;
}

// ============================================================================
// Baseline edits
// ============================================================================

void ScenarioInterface::set_simulation_duration(int n_years) {
    require_open();
    if (n_years < 1) {
        throw ConfigurationError("Simulation duration must be at least one year, got " +
                                 std::to_string(n_years));
    }
    engine_->set_scalar_property(ScalarProperty::N_YEARS, static_cast<double>(n_years));
}

void ScenarioInterface::set_dynamic_group_info(const GroupInfoTable& group_info) {
    require_open();
    const size_t n_consumers = engine_->n_consumers();
    const size_t n_producers = engine_->n_producers();

    struct Write {
        GroupProperty property;
        std::vector<double> values;
        std::vector<int> indices;
    };
    std::vector<Write> writes;

    for (const auto& [column, values] : group_info) {
        if (column == ADDITIVE_PREDATION_COLUMN) {
            logger_->log_warning(ctx_, std::string(ADDITIVE_PREDATION_COLUMN) + " is not supported, column skipped");
            continue;
        }
        const EditorColumn* entry = find_editor_column(column);
        if (entry == nullptr || !entry->dynamic) {
            logger_->log_warning(ctx_, "Unknown group info column skipped: " + column);
            continue;
        }

        const size_t first = entry->producers ? n_consumers : 0;
        const size_t count = entry->producers ? n_producers : n_consumers;
        if (values.size() < first + count) {
            throw ConfigurationError("Group info column '" + column + "' has " +
                                     std::to_string(values.size()) + " rows, expected at least " +
                                     std::to_string(first + count));
        }

        Write write;
        write.property = entry->property;
        for (size_t k = first; k < first + count; ++k) {
            write.values.push_back(values[k]);
            write.indices.push_back(static_cast<int>(k + 1));
        }
        if (!write.indices.empty()) {
            writes.push_back(std::move(write));
        }
    }

    for (const auto& write : writes) {
        engine_->set_group_property(write.property, write.values, write.indices);
    }
}

void ScenarioInterface::set_vulnerabilities(const std::vector<std::vector<double>>& matrix) {
    require_open();
    const size_t n_groups = engine_->n_groups();
    const size_t n_consumers = engine_->n_consumers();

    bool shape_ok = matrix.size() == n_groups;
    for (const auto& row : matrix) {
        shape_ok = shape_ok && row.size() == n_consumers;
    }
    if (!shape_ok) {
        throw ConfigurationError("Expected vulnerability matrix of shape (" + std::to_string(n_groups) +
                                 ", " + std::to_string(n_consumers) + ")");
    }

    std::vector<double> values;
    std::vector<std::pair<int, int>> pairs;
    for (size_t prey = 0; prey < n_groups; ++prey) {
        for (size_t predator = 0; predator < n_consumers; ++predator) {
            double value = matrix[prey][predator];
            if (std::isnan(value)) {
                continue;
            }
            values.push_back(value);
            pairs.emplace_back(static_cast<int>(prey + 1), static_cast<int>(predator + 1));
        }
    }
    if (!values.empty()) {
        engine_->set_pair_property(PairProperty::VULNERABILITY, values, pairs);
    }
}

int ScenarioInterface::add_forcing_function(const std::string& name, const std::vector<double>& values) {
    require_open();
    return engine_->add_forcing_function(name, values);
}

// ============================================================================
// Runs
// ============================================================================

void ScenarioInterface::prepare_batch(const ScenarioTable& scenarios) {
    require_open();
    if (scenarios.is_empty()) {
        throw ConfigurationError("Scenario table has no rows");
    }

    std::vector<std::string> names = scenarios.parameter_names();
    std::vector<std::string> unknown;
    for (const auto& name : names) {
        if (!compositor_.has_parameter(name)) {
            unknown.push_back(name);
        }
    }
    if (!unknown.empty()) {
        throw ConfigurationError("Scenario table columns are not parameters: " + join(unknown));
    }

    compositor_.clear_variables();
    if (!names.empty()) {
        std::vector<int> columns;
        for (const auto& name : names) {
            columns.push_back(scenarios.column_index(name));
        }
        compositor_.set_variable(names, columns);
    }

    std::vector<std::string> unset = compositor_.unset_parameter_names();
    if (!unset.empty()) {
        logger_->log_warning(ctx_, std::to_string(unset.size()) +
                             " parameters are neither constant nor variable and keep engine defaults: " +
                             join(unset, 5));
    }
}

ResultSet ScenarioInterface::run_scenarios(const ScenarioTable& scenarios,
                                           const std::vector<std::string>& variables) {
    for (const auto& name : variables) {
        find_result_variable(name);
    }
    prepare_batch(scenarios);
    compositor_.apply_constants(*engine_);

    ResultManager results(*engine_, variables, scenarios, nullptr, logger_);
    ScenarioRunner runner(*engine_, compositor_, config_.run_stage, config_.failure_policy, logger_);
    std::vector<ScenarioStatus> statuses = runner.run(scenarios, results);
    return results.to_result_set(statuses);
}

ResultSet ScenarioInterface::run_scenarios_parallel(const ScenarioTable& scenarios,
                                                    const std::vector<std::string>& variables,
                                                    size_t n_workers) {
    for (const auto& name : variables) {
        find_result_variable(name);
    }
    prepare_batch(scenarios);

    if (n_workers == 0) {
        n_workers = std::max(1u, std::thread::hardware_concurrency());
        logger_->log_warning(ctx_, "Worker count not given, using " + std::to_string(n_workers) +
                             " (hardware concurrency)");
    }
    n_workers = WorkerPool::clamp_workers(n_workers, scenarios.n_scenarios());

    compositor_.apply_constants(*engine_);
    if (!engine_->save_model()) {
        throw EngineError("Cannot save working model before starting workers", engine_->state());
    }

    std::unique_ptr<BufferManager> store =
        ResultManager::allocate_shared_store(*engine_, variables, scenarios.n_scenarios());

    WorkerRecipe recipe;
    recipe.model_path = working_model_path_;
    recipe.engine_type = config_.engine_type;
    recipe.dynamic_scenario = dynamic_scenario_;
    recipe.tracer_scenario = tracer_scenario_;
    recipe.compositor = compositor_;
    recipe.shared_store = store.get();
    recipe.variables = variables;
    recipe.scenarios = scenarios;
    recipe.run_stage = config_.run_stage;
    recipe.failure_policy = config_.failure_policy;
    recipe.cleanup = config_.cleanup;

    engine_->close_model();

    PoolResult outcome;
    try {
        WorkerPool pool(std::move(recipe), n_workers, factory_, logger_);
        outcome = pool.run();
    } catch (const std::exception&) {
        reopen_model();
        throw;
    }
    reopen_model();

    if (outcome.aborted) {
        std::string detail = "scenario " +
            std::to_string(scenarios.scenario_id(static_cast<size_t>(outcome.abort_index))) +
            " in a worker process";
        throw EngineRunFailure(config_.run_stage, detail, engine_->state());
    }

    ResultManager results(*engine_, variables, scenarios, store.get(), logger_);
    return results.to_result_set(outcome.statuses);
}

} // namespace ecobatch
