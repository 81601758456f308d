#include "batch_config.hpp"
#include "result_config.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace ecobatch {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // anonymous namespace

Stage parse_run_stage(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "mass_balance") return Stage::MASS_BALANCE;
    if (lower == "dynamic") return Stage::DYNAMIC;
    if (lower == "tracer") return Stage::TRACER;
    throw ConfigurationError("Unknown run stage: " + name +
                             " (expected mass_balance, dynamic or tracer)");
}

RunFailurePolicy parse_failure_policy(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "collect_anyway") return RunFailurePolicy::COLLECT_ANYWAY;
    if (lower == "mark_invalid") return RunFailurePolicy::MARK_INVALID;
    if (lower == "fail_fast") return RunFailurePolicy::FAIL_FAST;
    throw ConfigurationError("Unknown failure policy: " + name +
                             " (expected collect_anyway, mark_invalid or fail_fast)");
}

void validate_batch_config(const BatchConfig& config) {
    if (config.interface.model_path.empty()) {
        throw ConfigurationError("Batch configuration is missing model_path");
    }
    if (config.scenarios_path.empty()) {
        throw ConfigurationError("Batch configuration is missing scenarios");
    }
    if (config.simulation_years < 0) {
        throw ConfigurationError("simulation_years cannot be negative, got " +
                                 std::to_string(config.simulation_years));
    }

    if (config.save_variables.empty()) {
        throw ConfigurationError("Batch configuration must name at least one save variable");
    }
    std::set<std::string> seen;
    for (const auto& name : config.save_variables) {
        if (!seen.insert(name).second) {
            throw ConfigurationError("Duplicate save variable: " + name);
        }
        try {
            find_result_variable(name);
        } catch (const LookupError& e) {
            throw ConfigurationError(e.what());
        }
    }

    if (config.output.directory.empty()) {
        throw ConfigurationError("Output directory cannot be empty");
    }
    if (config.output.formats.empty()) {
        throw ConfigurationError("At least one output format is required");
    }
    if (config.interface.cleanup.max_attempts == 0) {
        throw ConfigurationError("cleanup.max_attempts must be at least 1");
    }
}

} // namespace ecobatch
