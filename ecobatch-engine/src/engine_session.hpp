/**
 * @file engine_session.hpp
 * @brief Boundary between the batch layer and an ecological simulation engine
 *
 * An EngineSession wraps one stateful, non-reentrant simulation engine instance.
 * Exactly one session exists per process: the scenario interface owns one in the
 * parent, every worker process creates its own from a recipe. Sessions are passed
 * by reference to the components that need them and never shared across processes.
 *
 * Stages:
 *   MASS_BALANCE -> DYNAMIC -> TRACER
 * Each stage must complete before its result arrays can be read. Running a later
 * stage runs the earlier ones first.
 *
 * Validation (loaded scenario, index ranges, value counts) lives in the public
 * non-virtual wrappers. Engine implementations override the protected do_* hooks.
 */

#ifndef ECOBATCH_ENGINE_SESSION_HPP
#define ECOBATCH_ENGINE_SESSION_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ecobatch {

// ============================================================================
// Stages, subsystems and property identifiers
// ============================================================================

/**
 * @brief Phases of a simulation run
 */
enum class Stage {
    MASS_BALANCE,   ///< Static baseline (mass-balance) solve
    DYNAMIC,        ///< Time-dynamic simulation over the configured years
    TRACER          ///< Contaminant tracer simulation on top of the dynamic run
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::MASS_BALANCE: return "MASS_BALANCE";
        case Stage::DYNAMIC: return "DYNAMIC";
        case Stage::TRACER: return "TRACER";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Scenario-bearing subsystems of the engine
 */
enum class Subsystem {
    DYNAMIC,
    TRACER
};

inline std::string subsystem_to_string(Subsystem subsystem) {
    switch (subsystem) {
        case Subsystem::DYNAMIC: return "dynamic";
        case Subsystem::TRACER: return "tracer";
        default: return "unknown";
    }
}

/**
 * @brief Per functional group settable fields
 */
enum class GroupProperty {
    // Dynamic subsystem
    DENSITY_DEP_CATCHABILITY,
    FEEDING_TIME_ADJ_RATE,
    MAX_REL_FEEDING_TIME,
    MAX_REL_PB,
    PRED_EFFECT_FEEDING_TIME,
    OTHER_MORT_FEEDING_TIME,
    QBMAX_QBIO,
    SWITCHING_POWER,
    // Tracer subsystem
    INITIAL_CONCENTRATION,
    IMMIGRATION_CONCENTRATION,
    DIRECT_ABSORPTION_RATE,
    PHYSICAL_DECAY_RATE,
    METABOLIC_DECAY_RATE,
    EXCRETION_RATE
};

std::string group_property_to_string(GroupProperty property);
Subsystem subsystem_of(GroupProperty property);

/**
 * @brief Scalar (non-group) settable fields
 */
enum class ScalarProperty {
    N_YEARS,                     ///< Dynamic simulation length in years
    ENV_INITIAL_CONCENTRATION,
    ENV_BASE_INFLOW_RATE,
    ENV_DECAY_RATE,
    ENV_VOLUME_EXCHANGE_LOSS,
    CONTAMINANT_FORCING_NUMBER   ///< Forcing function index driving environmental inflow (0 = none)
};

std::string scalar_property_to_string(ScalarProperty property);
Subsystem subsystem_of(ScalarProperty property);

/**
 * @brief Settable fields indexed by a (prey, predator) group pair
 */
enum class PairProperty {
    VULNERABILITY
};

std::string pair_property_to_string(PairProperty property);
Subsystem subsystem_of(PairProperty property);

/**
 * @brief Engine-internal result arrays
 *
 * Layouts (leading slot of every axis marked "slot" is an unused placeholder):
 *   DYNAMIC_GROUP_STATS  [stat, group slot 0..n, month slot 0..m]
 *   DYNAMIC_FLEET_CATCH  [fleet slot 0..f, group slot 0..n, month slot 0..m]
 *   DYNAMIC_TL_CATCH, DYNAMIC_FIB, DYNAMIC_KEMPTONS_Q, DYNAMIC_SHANNON_DIVERSITY
 *                        [month slot 0..m]
 *   TRACER_CONCENTRATION, TRACER_CONC_BIOMASS
 *                        [environment + n groups + trailing slot, month slot 0..m]
 */
enum class ResultSource {
    DYNAMIC_GROUP_STATS,
    DYNAMIC_FLEET_CATCH,
    DYNAMIC_TL_CATCH,
    DYNAMIC_FIB,
    DYNAMIC_KEMPTONS_Q,
    DYNAMIC_SHANNON_DIVERSITY,
    TRACER_CONCENTRATION,
    TRACER_CONC_BIOMASS
};

std::string result_source_to_string(ResultSource source);
Stage stage_of(ResultSource source);

/**
 * @brief Leading index of the packed DYNAMIC_GROUP_STATS array
 */
namespace GroupStat {
    constexpr size_t BIOMASS = 0;
    constexpr size_t BIOMASS_REL = 1;
    constexpr size_t YIELD = 2;
    constexpr size_t YIELD_REL = 3;
    constexpr size_t FEEDING_TIME = 4;
    constexpr size_t CONSUMPTION_BIOMASS = 5;
    constexpr size_t TOTAL_MORTALITY = 6;
    constexpr size_t PREDATION_MORTALITY = 7;
    constexpr size_t FISHING_MORTALITY = 8;
    constexpr size_t PROD_CONSUMPTION = 9;
    constexpr size_t AVERAGE_WEIGHT = 10;
    constexpr size_t MORTALITY_VS_PREDATION = 11;
    constexpr size_t MORTALITY_VS_FISHING = 12;
    constexpr size_t ECOSYSTEM_STRUCTURE = 13;
    constexpr size_t TROPHIC_LEVEL = 14;
    constexpr size_t COUNT = 15;
}

// ============================================================================
// Engine state
// ============================================================================

/**
 * @brief Point-in-time view of engine flags, attached to engine errors
 */
struct EngineStateSnapshot {
    bool model_loaded;
    bool model_balanced;
    bool dynamic_scenario_loaded;
    bool tracer_scenario_loaded;
    bool mass_balance_ran;
    bool dynamic_ran;
    bool tracer_ran;
    std::string model_path;
    std::string dynamic_scenario;
    std::string tracer_scenario;

    EngineStateSnapshot()
        : model_loaded(false), model_balanced(false),
          dynamic_scenario_loaded(false), tracer_scenario_loaded(false),
          mass_balance_ran(false), dynamic_ran(false), tracer_ran(false) {}

    bool has_run(Stage stage) const;

    /**
     * @brief Multi-line human readable rendering used in error messages
     */
    std::string summary() const;
};

/**
 * @brief Read-only view over an engine-internal result array
 *
 * Row-major, contiguous. Valid only until the next run() or model change.
 */
struct ResultArrayView {
    const double* data;
    std::vector<size_t> shape;

    ResultArrayView() : data(nullptr) {}
    ResultArrayView(const double* data_, std::vector<size_t> shape_)
        : data(data_), shape(std::move(shape_)) {}

    size_t size() const;
    bool empty() const { return data == nullptr || size() == 0; }
};

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Base exception for all batch engine errors
 */
class EcoBatchError : public std::runtime_error {
public:
    explicit EcoBatchError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when the model or a scenario cannot be loaded or created
 */
class InitializationError : public EcoBatchError {
public:
    explicit InitializationError(const std::string& message)
        : EcoBatchError("Initialization failed: " + message) {}
};

/**
 * @brief Raised for invalid caller input (unknown names, malformed tables, bad shapes)
 */
class ConfigurationError : public EcoBatchError {
public:
    explicit ConfigurationError(const std::string& message)
        : EcoBatchError("Configuration error: " + message) {}
};

/**
 * @brief Raised when a named scenario, parameter, variable or group does not exist
 */
class LookupError : public EcoBatchError {
public:
    explicit LookupError(const std::string& message)
        : EcoBatchError("Lookup error: " + message) {}
};

/**
 * @brief Raised when a 1-based index is out of range
 */
class IndexError : public EcoBatchError {
public:
    explicit IndexError(const std::string& message)
        : EcoBatchError("Index error: " + message) {}
};

/**
 * @brief Engine error carrying a snapshot of the engine state
 */
class EngineError : public EcoBatchError {
public:
    EngineError(const std::string& message, const EngineStateSnapshot& state)
        : EcoBatchError(message + "\n\n" + state.summary()), state_(state) {}

    const EngineStateSnapshot& state() const { return state_; }

private:
    EngineStateSnapshot state_;
};

/**
 * @brief A stage's results were requested before the stage ran
 */
class StageNotReadyError : public EngineError {
public:
    StageNotReadyError(Stage stage, const std::string& message, const EngineStateSnapshot& state)
        : EngineError(message, state), stage_(stage) {}

    Stage stage() const { return stage_; }

private:
    Stage stage_;
};

class MassBalanceNotRunError : public StageNotReadyError {
public:
    explicit MassBalanceNotRunError(const EngineStateSnapshot& state)
        : StageNotReadyError(Stage::MASS_BALANCE, "Mass balance has not been run", state) {}
};

class DynamicNotRunError : public StageNotReadyError {
public:
    explicit DynamicNotRunError(const EngineStateSnapshot& state)
        : StageNotReadyError(Stage::DYNAMIC, "Dynamic simulation has not been run", state) {}
};

class TracerNotRunError : public StageNotReadyError {
public:
    explicit TracerNotRunError(const EngineStateSnapshot& state)
        : StageNotReadyError(Stage::TRACER, "Tracer simulation has not been run", state) {}
};

/**
 * @brief Throw the stage-specific StageNotReadyError
 */
[[noreturn]] void throw_stage_not_ready(Stage stage, const EngineStateSnapshot& state);

/**
 * @brief A subsystem scenario was required but none is active
 */
class ScenarioNotLoadedError : public EngineError {
public:
    ScenarioNotLoadedError(Subsystem subsystem, const EngineStateSnapshot& state)
        : EngineError("No " + subsystem_to_string(subsystem) + " scenario loaded", state),
          subsystem_(subsystem) {}

    Subsystem subsystem() const { return subsystem_; }

private:
    Subsystem subsystem_;
};

/**
 * @brief run() reported failure
 *
 * Only raised when the caller asks for fail-fast handling; by default run
 * failures are logged and recorded per scenario.
 */
class EngineRunFailure : public EngineError {
public:
    EngineRunFailure(Stage stage, const std::string& detail, const EngineStateSnapshot& state)
        : EngineError("Engine run failed at stage " + stage_to_string(stage) +
                      (detail.empty() ? std::string() : ": " + detail), state),
          stage_(stage) {}

    Stage stage() const { return stage_; }

private:
    Stage stage_;
};

// ============================================================================
// EngineSession
// ============================================================================

/**
 * @brief Abstract engine session
 *
 * Group, fleet and scenario indices are 1-based throughout.
 *
 * Usage Example:
 *   @code
 *   EngineFactory factory;
 *   auto engine = factory.create_engine("reference");
 *   engine->load_model("model.json");
 *   engine->load_scenario(Subsystem::DYNAMIC, "baseline");
 *   engine->load_scenario(Subsystem::TRACER, 1);
 *   engine->set_group_property(GroupProperty::INITIAL_CONCENTRATION, {0.1, 0.3}, {1, 3});
 *   if (!engine->run(Stage::TRACER)) { ... }
 *   ResultArrayView conc = engine->result_array(ResultSource::TRACER_CONCENTRATION);
 *   @endcode
 */
class EngineSession {
public:
    virtual ~EngineSession() = default;

    // ------------------------------------------------------------------
    // Model
    // ------------------------------------------------------------------

    /**
     * @brief Load a model file, closing any model already open
     *
     * @return false if the file could not be loaded
     */
    virtual bool load_model(const std::string& path) = 0;

    /**
     * @brief Persist the model (including all scenarios) to the file it was loaded from
     */
    virtual bool save_model() = 0;

    /**
     * @brief Close the model and all scenarios. Safe to call repeatedly.
     */
    virtual void close_model() noexcept = 0;

    virtual bool is_model_loaded() const = 0;

    virtual std::vector<std::string> functional_group_names() const = 0;
    virtual std::vector<std::string> fleet_names() const = 0;

    /// Consumers come first in group order, producers follow, detritus last.
    virtual size_t n_consumers() const = 0;
    virtual size_t n_producers() const = 0;

    virtual int first_year() const = 0;
    virtual std::string country() const = 0;

    size_t n_groups() const { return functional_group_names().size(); }
    size_t n_fleets() const { return fleet_names().size(); }

    // ------------------------------------------------------------------
    // Scenarios
    // ------------------------------------------------------------------

    virtual size_t scenario_count(Subsystem subsystem) const = 0;

    /**
     * @brief Name of the scenario at a 1-based index
     * @throws IndexError If index is out of range
     */
    std::string scenario_name(Subsystem subsystem, size_t index) const;

    std::vector<std::string> scenario_names(Subsystem subsystem) const;

    /**
     * @brief Create a new scenario and make it active
     * @throws InitializationError If the engine rejects the scenario
     */
    void new_scenario(Subsystem subsystem, const std::string& name, const std::string& description);

    /**
     * @brief Activate a scenario by name
     * @throws LookupError If no scenario has this name
     */
    void load_scenario(Subsystem subsystem, const std::string& name);

    /**
     * @brief Activate a scenario by 1-based index
     * @throws IndexError If index is out of range
     */
    void load_scenario(Subsystem subsystem, size_t index);

    void remove_scenario(Subsystem subsystem, const std::string& name);
    void remove_scenario(Subsystem subsystem, size_t index);

    /**
     * @brief Deactivate the current scenario of a subsystem
     */
    virtual void close_scenario(Subsystem subsystem) = 0;

    // ------------------------------------------------------------------
    // Properties
    // ------------------------------------------------------------------

    /**
     * @brief Batched group property setter
     *
     * values[k] is written to group group_indices[k] (1-based).
     *
     * @throws ScenarioNotLoadedError If the owning subsystem has no active scenario
     * @throws ConfigurationError If the array lengths differ
     * @throws IndexError If any index is outside 1..n_groups
     */
    void set_group_property(GroupProperty property,
                            const std::vector<double>& values,
                            const std::vector<int>& group_indices);

    /**
     * @brief Current values for every group, in group order
     */
    std::vector<double> get_group_property(GroupProperty property) const;

    void set_scalar_property(ScalarProperty property, double value);
    double get_scalar_property(ScalarProperty property) const;

    /**
     * @brief Batched pair property setter, pairs are (prey, predator) 1-based
     */
    void set_pair_property(PairProperty property,
                           const std::vector<double>& values,
                           const std::vector<std::pair<int, int>>& pairs);
    double get_pair_property(PairProperty property, int prey, int predator) const;

    /**
     * @brief Register a forcing function; a leading 1.0 is prepended to the values
     *
     * @return 1-based forcing function index
     */
    int add_forcing_function(const std::string& name, const std::vector<double>& values);

    // ------------------------------------------------------------------
    // Execution
    // ------------------------------------------------------------------

    /**
     * @brief Run up to and including the given stage
     *
     * @return false if the engine reports failure
     * @throws ScenarioNotLoadedError If a required scenario is not active
     */
    bool run(Stage stage);

    virtual EngineStateSnapshot state() const = 0;

    /**
     * @brief View of an engine-internal result array, valid until the next run
     */
    virtual ResultArrayView result_array(ResultSource source) const = 0;

protected:
    virtual std::string do_scenario_name(Subsystem subsystem, size_t index) const = 0;
    virtual bool do_new_scenario(Subsystem subsystem, const std::string& name,
                                 const std::string& description) = 0;
    virtual bool do_activate_scenario(Subsystem subsystem, size_t index) = 0;
    virtual bool do_remove_scenario(Subsystem subsystem, size_t index) = 0;

    virtual void do_set_group_property(GroupProperty property,
                                       const std::vector<double>& values,
                                       const std::vector<int>& group_indices) = 0;
    virtual std::vector<double> do_get_group_property(GroupProperty property) const = 0;
    virtual void do_set_scalar_property(ScalarProperty property, double value) = 0;
    virtual double do_get_scalar_property(ScalarProperty property) const = 0;
    virtual void do_set_pair_property(PairProperty property,
                                      const std::vector<double>& values,
                                      const std::vector<std::pair<int, int>>& pairs) = 0;
    virtual double do_get_pair_property(PairProperty property, int prey, int predator) const = 0;
    virtual int do_add_forcing_function(const std::string& name, const std::vector<double>& values) = 0;

    virtual bool do_run(Stage stage) = 0;

private:
    void require_model(const std::string& operation) const;
    void require_scenario(Subsystem subsystem) const;
    void check_group_index(int index) const;
    size_t find_scenario(Subsystem subsystem, const std::string& name) const;
    void check_scenario_index(Subsystem subsystem, size_t index) const;
};

} // namespace ecobatch

#endif // ECOBATCH_ENGINE_SESSION_HPP
