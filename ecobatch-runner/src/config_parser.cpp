#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ecobatch {

namespace {

std::string get_path(const json& j, const char* key) {
    return expand_environment_variables(j.at(key).get<std::string>());
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++;
        }

        // A lone '$' stays as written
        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (path.empty()) {
        return path;
    }
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

BatchConfig parse_batch_config_from_string(const std::string& json_string) {
    BatchConfig config;

    try {
        json j = json::parse(json_string);

        // Model and engine
        if (!j.contains("model_path")) {
            throw ConfigParseError("Missing required field: model_path");
        }
        config.interface.model_path = get_path(j, "model_path");

        if (j.contains("engine")) {
            config.interface.engine_type = j["engine"].get<std::string>();
        }
        if (j.contains("private_model_path")) {
            config.interface.private_model_path = get_path(j, "private_model_path");
        }
        if (j.contains("dynamic_scenario")) {
            config.interface.dynamic_scenario = j["dynamic_scenario"].get<std::string>();
        }
        if (j.contains("constant_dynamic")) {
            config.interface.constant_dynamic = j["constant_dynamic"].get<bool>();
        }
        if (j.contains("run_stage")) {
            config.interface.run_stage = parse_run_stage(j["run_stage"].get<std::string>());
        }
        if (j.contains("failure_policy")) {
            config.interface.failure_policy = parse_failure_policy(j["failure_policy"].get<std::string>());
        }
        if (j.contains("simulation_years")) {
            config.simulation_years = j["simulation_years"].get<int>();
        }

        // Batch
        if (!j.contains("scenarios")) {
            throw ConfigParseError("Missing required field: scenarios");
        }
        config.scenarios_path = get_path(j, "scenarios");

        if (j.contains("constant_parameters")) {
            for (auto it = j["constant_parameters"].begin(); it != j["constant_parameters"].end(); ++it) {
                config.constant_parameters[it.key()] = it.value().get<double>();
            }
        }

        if (!j.contains("save_variables")) {
            throw ConfigParseError("Missing required field: save_variables");
        }
        for (const auto& variable : j["save_variables"]) {
            config.save_variables.push_back(variable.get<std::string>());
        }

        if (j.contains("workers")) {
            int workers = j["workers"].get<int>();
            if (workers < 0) {
                throw ConfigParseError("workers cannot be negative");
            }
            config.workers = static_cast<size_t>(workers);
        }

        // Output (optional)
        if (j.contains("output")) {
            const json& output = j["output"];
            if (output.contains("directory")) {
                config.output.directory = get_path(output, "directory");
            }
            if (output.contains("formats")) {
                config.output.formats.clear();
                for (const auto& format : output["formats"]) {
                    config.output.formats.push_back(parse_output_format(format.get<std::string>()));
                }
            }
        }

        // Logging (optional)
        if (j.contains("logging")) {
            const json& logging = j["logging"];
            if (logging.contains("level")) {
                config.logging.min_level = string_to_level(logging["level"].get<std::string>());
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
            if (logging.contains("file")) {
                config.logging.enable_file = true;
                config.logging.log_file_path = get_path(logging, "file");
            }
        }

        // Cleanup (optional)
        if (j.contains("cleanup")) {
            const json& cleanup = j["cleanup"];
            if (cleanup.contains("max_attempts")) {
                config.interface.cleanup.max_attempts = cleanup["max_attempts"].get<size_t>();
            }
            if (cleanup.contains("retry_delay_ms")) {
                config.interface.cleanup.retry_delay_ms = cleanup["retry_delay_ms"].get<size_t>();
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON range error: ") + e.what());
    }

    validate_batch_config(config);

    return config;
}

BatchConfig parse_batch_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    BatchConfig config = parse_batch_config_from_string(buffer.str());

    // Resolve relative paths
    config.interface.model_path = resolve_relative_path(config.interface.model_path, file_path);
    config.interface.private_model_path = resolve_relative_path(config.interface.private_model_path, file_path);
    config.scenarios_path = resolve_relative_path(config.scenarios_path, file_path);
    config.output.directory = resolve_relative_path(config.output.directory, file_path);
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace ecobatch
