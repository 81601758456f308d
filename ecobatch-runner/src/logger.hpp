/**
 * @file logger.hpp
 * @brief Structured logging for batch runs with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (component, worker pid, scenario index, phase)
 * - Batch progress and per-scenario outcome events
 * - Debug mode with result buffer dumps
 *
 * Worker processes inherit the configured logger through fork(). The parent
 * flushes before forking and every child flushes before it exits.
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef ECOBATCH_RUNNER_LOGGER_HPP
#define ECOBATCH_RUNNER_LOGGER_HPP

#include "batch_types.hpp"
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ecobatch {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (buffer contents, state transitions)
    INFO,    ///< Informational messages (model load, batch start/end)
    WARN,    ///< Warning messages (unbalanced model, defaulted parameters)
    ERROR    ///< Error messages (run failures, worker crashes)
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Execution context for logging
 */
struct ExecutionContext {
    std::string component;       ///< Emitting component (interface, runner, pool, worker)
    long worker_id;              ///< Process id of the worker, 0 in the parent
    long scenario_index;         ///< 0-based scenario index, -1 when not scenario specific
    std::string phase;           ///< Current phase (init, apply, run, collect, cleanup)

    ExecutionContext()
        : component(""), worker_id(0), scenario_index(-1), phase("") {}

    explicit ExecutionContext(const std::string& component_, long worker_id_ = 0)
        : component(component_), worker_id(worker_id_), scenario_index(-1), phase("") {}
};

/**
 * @brief Aggregate outcome of a batch, for the completion event
 */
struct BatchMetrics {
    size_t n_scenarios;
    size_t n_workers;
    size_t succeeded;
    size_t run_failed;
    size_t errored;
    size_t pending;
    double elapsed_ms;

    BatchMetrics()
        : n_scenarios(0), n_workers(0), succeeded(0), run_failed(0),
          errored(0), pending(0), elapsed_ms(0.0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)
    bool enable_buffer_dump;         ///< Dump result buffers in debug mode (large output)
    size_t max_buffer_dump_values;   ///< Maximum values to dump per buffer

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("ecobatch.log"),
          enable_json(true),
          enable_buffer_dump(false),
          max_buffer_dump_values(64) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "batch.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   ExecutionContext ctx("interface");
 *   logger.log_batch_start(ctx, 100, 4, {"Biomass", "Concentration"});
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    void configure(const LoggerConfig& config);
    const LoggerConfig& get_config() const { return config_; }

    /**
     * @brief Log model load by the scenario interface
     */
    void log_interface_init(
        const ExecutionContext& ctx,
        const std::string& model_path,
        const std::string& engine_type,
        size_t n_groups,
        const std::map<std::string, std::string>& settings
    );

    void log_batch_start(
        const ExecutionContext& ctx,
        size_t n_scenarios,
        size_t n_workers,
        const std::vector<std::string>& variables
    );

    void log_scenario_complete(
        const ExecutionContext& ctx,
        int64_t scenario_id,
        ScenarioStatus status,
        double execution_time_ms
    );

    /**
     * @brief Log a run() call that returned false
     *
     * @param state_summary Engine state snapshot rendering
     */
    void log_run_failure(
        const ExecutionContext& ctx,
        int64_t scenario_id,
        const std::string& stage,
        const std::string& state_summary
    );

    void log_progress(
        const ExecutionContext& ctx,
        size_t completed,
        size_t total,
        double elapsed_ms
    );

    void log_batch_complete(
        const ExecutionContext& ctx,
        const BatchMetrics& metrics
    );

    /**
     * @brief Log the outcome of removing a temporary model file or directory
     */
    void log_cleanup(
        const ExecutionContext& ctx,
        const std::string& path,
        bool success,
        size_t attempts
    );

    void log_error(
        const ExecutionContext& ctx,
        const std::string& error_message
    );

    void log_warning(
        const ExecutionContext& ctx,
        const std::string& warning_message
    );

    /**
     * @brief Log result buffer content (debug mode only)
     */
    void log_buffer_content(
        const ExecutionContext& ctx,
        const std::string& buffer_name,
        const double* buffer,
        size_t size
    );

    void log_state_transition(
        const ExecutionContext& ctx,
        WorkerState old_state,
        WorkerState new_state
    );

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    void add_context(const ExecutionContext& ctx, std::map<std::string, std::string>& fields) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    std::string values_to_string(const double* buffer, size_t count) const;
    void write_output(const std::string& output);
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_LOGGER_HPP
