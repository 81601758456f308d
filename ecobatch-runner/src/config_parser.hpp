#ifndef ECOBATCH_RUNNER_CONFIG_PARSER_HPP
#define ECOBATCH_RUNNER_CONFIG_PARSER_HPP

#include "batch_config.hpp"
#include <string>

namespace ecobatch {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public ConfigurationError {
public:
    explicit ConfigParseError(const std::string& message)
        : ConfigurationError(message) {}
};

/**
 * @brief Parses a batch configuration from a JSON file
 *
 * Relative paths (model, private model, scenarios, output directory, log file)
 * are resolved against the directory of the config file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed batch configuration
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 * @throws ConfigurationError if configuration is invalid
 */
BatchConfig parse_batch_config_from_file(const std::string& file_path);

/**
 * @brief Parses a batch configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @return Parsed batch configuration, paths left as written
 * @throws ConfigParseError if JSON is invalid
 * @throws ConfigurationError if configuration is invalid
 */
BatchConfig parse_batch_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute and empty paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_CONFIG_PARSER_HPP
