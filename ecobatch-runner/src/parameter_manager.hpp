/**
 * @file parameter_manager.hpp
 * @brief Per-subsystem parameter catalog with batched application
 *
 * A ParameterManager owns one Parameter per (prefix, group), per (pair prefix,
 * prey, predator) and per environment name. Names follow
 *   {prefix}_{zero-padded index}_{group name}                      group parameters
 *   {prefix}_{prey index}_{prey}_{predator index}_{predator}       pair parameters
 *   {literal}                                                      environment parameters
 * where the index width is the number of digits of the group count, so lexical
 * order equals index order.
 *
 * Application is table driven: every category maps to one engine property and is
 * written with a single batched call.
 */

#ifndef ECOBATCH_RUNNER_PARAMETER_MANAGER_HPP
#define ECOBATCH_RUNNER_PARAMETER_MANAGER_HPP

#include "../../ecobatch-engine/src/engine_session.hpp"
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ecobatch {

enum class ParameterMode {
    UNSET,      ///< Engine default is kept
    CONSTANT,   ///< Same value for every scenario
    VARIABLE    ///< Read from a scenario table column
};

inline std::string mode_to_string(ParameterMode mode) {
    switch (mode) {
        case ParameterMode::UNSET: return "UNSET";
        case ParameterMode::CONSTANT: return "CONSTANT";
        case ParameterMode::VARIABLE: return "VARIABLE";
        default: return "UNKNOWN";
    }
}

enum class ParameterKind {
    GROUP,         ///< Per functional group
    ENVIRONMENT,   ///< Scalar, not tied to a group
    PAIR           ///< Per (prey, predator) group pair
};

inline std::string kind_to_string(ParameterKind kind) {
    switch (kind) {
        case ParameterKind::GROUP: return "fg";
        case ParameterKind::ENVIRONMENT: return "env";
        case ParameterKind::PAIR: return "pair";
        default: return "unknown";
    }
}

/**
 * @brief Atomic named assignment unit
 *
 * Setting one mode clears the other mode's field.
 */
struct Parameter {
    std::string name;
    size_t category_index;      ///< Index into the manager's table for this kind
    ParameterKind kind;
    int group_index;            ///< 1-based, GROUP only
    std::pair<int, int> pair;   ///< (prey, predator) 1-based, PAIR only
    ParameterMode mode;
    double value;               ///< Meaningful iff CONSTANT
    int column_index;           ///< Meaningful iff VARIABLE

    Parameter()
        : category_index(0), kind(ParameterKind::GROUP), group_index(-1), pair(-1, -1),
          mode(ParameterMode::UNSET), value(std::numeric_limits<double>::quiet_NaN()),
          column_index(-1) {}

    bool is_env() const { return kind == ParameterKind::ENVIRONMENT; }

    void set_constant(double v) {
        mode = ParameterMode::CONSTANT;
        value = v;
        column_index = -1;
    }

    void set_variable(int column) {
        mode = ParameterMode::VARIABLE;
        column_index = column;
        value = std::numeric_limits<double>::quiet_NaN();
    }

    void reset() {
        mode = ParameterMode::UNSET;
        value = std::numeric_limits<double>::quiet_NaN();
        column_index = -1;
    }
};

struct GroupCategory {
    std::string prefix;
    GroupProperty property;
};

struct EnvironmentCategory {
    std::string name;
    ScalarProperty property;
};

struct PairCategory {
    std::string prefix;
    PairProperty property;
};

class ParameterManager {
public:
    /**
     * @param subsystem Subsystem name used by discovery filters ("dynamic", "tracer")
     * @param group_names Functional group names in model order
     */
    ParameterManager(std::string subsystem,
                     std::vector<std::string> group_names,
                     std::vector<GroupCategory> group_categories,
                     std::vector<EnvironmentCategory> environment_categories,
                     std::vector<PairCategory> pair_categories = {});

    static ParameterManager tracer_manager(const std::vector<std::string>& group_names);
    static ParameterManager dynamic_manager(const std::vector<std::string>& group_names);

    static size_t index_width(size_t n_groups);
    static std::string format_group_name(const std::string& prefix, int index, size_t width,
                                         const std::string& group_name);

    const std::string& subsystem() const { return subsystem_; }
    const std::vector<std::string>& group_names() const { return group_names_; }
    size_t size() const { return params_.size(); }

    // ------------------------------------------------------------------
    // Assignment
    // ------------------------------------------------------------------

    /**
     * @brief Mark parameters constant
     *
     * @return Names this manager does not know
     * @throws ConfigurationError If names and values differ in length
     */
    std::set<std::string> set_constant(const std::vector<std::string>& names,
                                       const std::vector<double>& values);

    /**
     * @brief Mark parameters variable, bound to scenario table columns
     *
     * @return Names this manager does not know
     * @throws ConfigurationError If names and columns differ in length
     */
    std::set<std::string> set_variable(const std::vector<std::string>& names,
                                       const std::vector<int>& column_indices);

    void reset();

    /**
     * @brief Return variable parameters to UNSET, constants are kept
     */
    void clear_variables();

    /**
     * @brief One batched engine call per category holding constants
     */
    void apply_constants(EngineSession& engine) const;

    /**
     * @brief Write variable parameters from one scenario row
     *
     * @throws ConfigurationError If the row is shorter than a referenced column
     */
    void apply_variables(EngineSession& engine, const std::vector<double>& row);

    // ------------------------------------------------------------------
    // Discovery
    // ------------------------------------------------------------------

    bool has_parameter(const std::string& name) const;

    /**
     * @throws LookupError If the parameter does not exist
     */
    const Parameter& parameter(const std::string& name) const;

    std::vector<std::string> all_parameter_names() const;
    std::vector<std::string> environment_parameter_names() const;
    std::vector<std::string> pair_parameter_names() const;
    std::vector<std::string> unset_parameter_names() const;
    std::vector<std::string> group_prefixes() const;
    bool has_prefix(const std::string& prefix) const;

    /**
     * @brief Group parameter names filtered by prefix and group
     *
     * Prefixes this manager does not own are ignored. Empty filters match all.
     *
     * @throws LookupError If a group name is unknown
     * @throws IndexError If a group index is outside 1..n
     */
    std::vector<std::string> group_parameter_names(const std::vector<std::string>& prefixes,
                                                   const std::vector<std::string>& groups,
                                                   const std::vector<int>& group_indices) const;

private:
    struct VariablePlan {
        std::vector<std::vector<int>> group_indices;     ///< per group category
        std::vector<std::vector<int>> group_columns;
        std::vector<std::vector<std::pair<int, int>>> pairs;   ///< per pair category
        std::vector<std::vector<int>> pair_columns;
        std::vector<std::pair<size_t, int>> environment;  ///< (category, column)
        int max_column;

        VariablePlan() : max_column(-1) {}
    };

    std::string subsystem_;
    std::vector<std::string> group_names_;
    std::vector<GroupCategory> group_categories_;
    std::vector<EnvironmentCategory> environment_categories_;
    std::vector<PairCategory> pair_categories_;
    std::map<std::string, Parameter> params_;

    bool variables_processed_;
    VariablePlan plan_;
    std::vector<double> scratch_;

    void build_catalog();
    void process_variables();
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_PARAMETER_MANAGER_HPP
