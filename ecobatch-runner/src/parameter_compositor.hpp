/**
 * @file parameter_compositor.hpp
 * @brief Combines per-subsystem ParameterManagers behind one name space
 */

#ifndef ECOBATCH_RUNNER_PARAMETER_COMPOSITOR_HPP
#define ECOBATCH_RUNNER_PARAMETER_COMPOSITOR_HPP

#include "parameter_manager.hpp"
#include <string>
#include <vector>

namespace ecobatch {

enum class ParameterCategory {
    GROUP,
    ENVIRONMENT,
    PAIR
};

/**
 * @brief Filter for parameter discovery
 *
 * Empty members match everything. prefixes, groups and group_indices only narrow
 * GROUP parameters; ENVIRONMENT names are listed whenever their category is
 * selected. While any of those filters is set, PAIR names are listed only if
 * PAIR is named in categories.
 */
struct ParameterQuery {
    std::vector<std::string> subsystems;          ///< "dynamic", "tracer"
    std::vector<ParameterCategory> categories;
    std::vector<std::string> prefixes;
    std::vector<std::string> groups;
    std::vector<int> group_indices;               ///< 1-based
};

/**
 * @brief Value-semantic collection of ParameterManagers
 *
 * Copies are independent, which is how workers receive their parameter state.
 */
class ParameterCompositor {
public:
    ParameterCompositor() = default;
    explicit ParameterCompositor(std::vector<ParameterManager> managers);

    /**
     * @brief Managers for an engine's group list
     *
     * @param include_dynamic Add the dynamic subsystem manager
     * @param include_tracer Add the tracer subsystem manager
     */
    static ParameterCompositor for_engine(const EngineSession& engine,
                                          bool include_dynamic,
                                          bool include_tracer);

    /**
     * @throws ConfigurationError If a name is unknown to every manager, before any
     *         manager is modified
     */
    void set_constant(const std::vector<std::string>& names, const std::vector<double>& values);
    void set_variable(const std::vector<std::string>& names, const std::vector<int>& column_indices);

    void apply_constants(EngineSession& engine) const;
    void apply_variables(EngineSession& engine, const std::vector<double>& row);

    void reset();
    void clear_variables();

    /**
     * @brief Sorted unique parameter names matching the query
     *
     * @throws ConfigurationError If a prefix or subsystem is unknown
     * @throws LookupError If a group name is unknown
     * @throws IndexError If a group index is out of range
     */
    std::vector<std::string> available_parameter_names(const ParameterQuery& query = ParameterQuery()) const;

    std::vector<std::string> unset_parameter_names() const;

    bool has_parameter(const std::string& name) const;
    const std::vector<ParameterManager>& managers() const { return managers_; }

private:
    std::vector<ParameterManager> managers_;

    void validate_names(const std::vector<std::string>& names) const;
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_PARAMETER_COMPOSITOR_HPP
