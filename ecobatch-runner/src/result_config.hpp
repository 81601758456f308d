/**
 * @file result_config.hpp
 * @brief Catalog of collectable result variables
 *
 * Each variable is bound to one engine result source (optionally a packed index
 * inside it), a shape category used for flattened export, and a list of dims.
 * The dims always start with SCENARIO; the remaining dims are the trimmed
 * shape of the engine array.
 */

#ifndef ECOBATCH_RUNNER_RESULT_CONFIG_HPP
#define ECOBATCH_RUNNER_RESULT_CONFIG_HPP

#include "../../ecobatch-engine/src/engine_session.hpp"
#include <string>
#include <vector>

namespace ecobatch {

enum class Dim {
    SCENARIO,
    FLEET,
    GROUP,       ///< Functional groups
    ENV_GROUP,   ///< Environment followed by functional groups
    TIME         ///< Simulated month, 0-based
};

/// Label used in exported tables ("Scenario", "Fleet", "Group", "Time")
std::string dim_label(Dim dim);

enum class VariableCategory {
    ECOSYSTEM,   ///< (scenario, time)
    GROUP,       ///< (scenario, group, time)
    FISHING      ///< (scenario, fleet, group, time)
};

/// "ECOSYSTEM_STATS", "GROUP_STATS", "FISHING_STATS"
std::string category_to_string(VariableCategory category);

/// Dimension labels a category is joined on
std::vector<std::string> category_dim_labels(VariableCategory category);

/**
 * @brief Per-axis trim applied to engine arrays
 */
enum class DropFlag {
    NO_DROP,
    DROP_FIRST,   ///< Leading placeholder slot
    DROP_LAST     ///< Trailing placeholder slot
};

/**
 * @brief Fixed trim flags for an engine result source
 *
 * For packed sources the flags cover the axes after the packed index.
 */
std::vector<DropFlag> source_drop_flags(ResultSource source);

/// True if the leading axis of the source multiplexes several variables
bool source_is_packed(ResultSource source);

struct ResultVariable {
    std::string name;            ///< Catalog key, e.g. "Concentration Biomass"
    std::string export_name;     ///< Column and attribute name, e.g. "Concentration_Biomass"
    std::vector<Dim> dims;
    VariableCategory category;
    std::string unit;
    ResultSource source;
    int packed_key;              ///< Leading index for packed sources, -1 otherwise
    std::string save_filename;   ///< Labeled array file stem

    Stage stage() const { return stage_of(source); }
    bool has_dim(Dim dim) const;
};

const std::vector<ResultVariable>& result_variables();
std::vector<std::string> result_variable_names();

/**
 * @throws LookupError If no variable has this name
 */
const ResultVariable& find_result_variable(const std::string& name);

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_RESULT_CONFIG_HPP
