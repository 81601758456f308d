/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ecobatch {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    flush();
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_interface_init(
    const ExecutionContext& ctx,
    const std::string& model_path,
    const std::string& engine_type,
    size_t n_groups,
    const std::map<std::string, std::string>& settings
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "interface_init";
    add_context(ctx, fields);
    fields["model_path"] = model_path;
    fields["engine_type"] = engine_type;
    fields["n_groups"] = std::to_string(n_groups);

    size_t count = 0;
    for (const auto& [key, value] : settings) {
        if (count < 10) {  // Limit to first 10 settings
            fields["setting." + key] = value;
            count++;
        }
    }
    if (settings.size() > 10) {
        fields["settings_truncated"] = "true";
    }

    log(LogLevel::INFO, "Model loaded", fields);
}

void Logger::log_batch_start(
    const ExecutionContext& ctx,
    size_t n_scenarios,
    size_t n_workers,
    const std::vector<std::string>& variables
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "batch_start";
    add_context(ctx, fields);
    fields["n_scenarios"] = std::to_string(n_scenarios);
    fields["n_workers"] = std::to_string(n_workers);

    std::string joined;
    for (const auto& variable : variables) {
        if (!joined.empty()) joined += ",";
        joined += variable;
    }
    fields["variables"] = joined;

    log(LogLevel::INFO, "Starting batch", fields);
}

void Logger::log_scenario_complete(
    const ExecutionContext& ctx,
    int64_t scenario_id,
    ScenarioStatus status,
    double execution_time_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "scenario_complete";
    add_context(ctx, fields);
    fields["scenario_id"] = std::to_string(scenario_id);
    fields["status"] = status_to_string(status);
    fields["execution_time_ms"] = std::to_string(execution_time_ms);

    log(LogLevel::DEBUG, "Scenario completed", fields);
}

void Logger::log_run_failure(
    const ExecutionContext& ctx,
    int64_t scenario_id,
    const std::string& stage,
    const std::string& state_summary
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_failure";
    add_context(ctx, fields);
    fields["scenario_id"] = std::to_string(scenario_id);
    fields["stage"] = stage;
    fields["engine_state"] = state_summary;

    log(LogLevel::ERROR, "Engine run failed", fields);
}

void Logger::log_progress(
    const ExecutionContext& ctx,
    size_t completed,
    size_t total,
    double elapsed_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "progress";
    add_context(ctx, fields);
    fields["completed"] = std::to_string(completed);
    fields["total"] = std::to_string(total);
    fields["percent"] = std::to_string(total > 0 ? completed * 100.0 / total : 100.0);
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    log(LogLevel::INFO, "Batch progress", fields);
}

void Logger::log_batch_complete(
    const ExecutionContext& ctx,
    const BatchMetrics& metrics
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "batch_complete";
    add_context(ctx, fields);
    fields["n_scenarios"] = std::to_string(metrics.n_scenarios);
    fields["n_workers"] = std::to_string(metrics.n_workers);
    fields["succeeded"] = std::to_string(metrics.succeeded);
    fields["run_failed"] = std::to_string(metrics.run_failed);
    fields["errored"] = std::to_string(metrics.errored);
    fields["pending"] = std::to_string(metrics.pending);
    fields["elapsed_ms"] = std::to_string(metrics.elapsed_ms);
    fields["throughput_scenarios_per_sec"] = std::to_string(
        metrics.elapsed_ms > 0 ? (metrics.n_scenarios * 1000.0 / metrics.elapsed_ms) : 0
    );

    bool clean = metrics.run_failed == 0 && metrics.errored == 0 && metrics.pending == 0;
    log(clean ? LogLevel::INFO : LogLevel::WARN, "Batch completed", fields);
}

void Logger::log_cleanup(
    const ExecutionContext& ctx,
    const std::string& path,
    bool success,
    size_t attempts
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "cleanup";
    add_context(ctx, fields);
    fields["path"] = path;
    fields["success"] = success ? "true" : "false";
    fields["attempts"] = std::to_string(attempts);

    if (success) {
        log(LogLevel::DEBUG, "Removed temporary model", fields);
    } else {
        log(LogLevel::ERROR, "Failed to remove temporary model", fields);
    }
}

void Logger::log_error(
    const ExecutionContext& ctx,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(ctx, fields);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Batch error", fields);
}

void Logger::log_warning(
    const ExecutionContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(ctx, fields);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_buffer_content(
    const ExecutionContext& ctx,
    const std::string& buffer_name,
    const double* buffer,
    size_t size
) {
    if (!config_.enable_buffer_dump) {
        return;
    }

    std::map<std::string, std::string> fields;
    fields["event"] = "buffer_dump";
    add_context(ctx, fields);
    fields["buffer_name"] = buffer_name;
    fields["buffer_size"] = std::to_string(size);

    size_t dump_count = std::min(size, config_.max_buffer_dump_values);
    fields["values"] = values_to_string(buffer, dump_count);
    fields["dumped_values"] = std::to_string(dump_count);

    if (dump_count < size) {
        fields["truncated"] = "true";
    }

    log(LogLevel::DEBUG, "Buffer content dump", fields);
}

void Logger::log_state_transition(
    const ExecutionContext& ctx,
    WorkerState old_state,
    WorkerState new_state
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "state_transition";
    add_context(ctx, fields);
    fields["old_state"] = state_to_string(old_state);
    fields["new_state"] = state_to_string(new_state);

    log(LogLevel::DEBUG, "State transition", fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

void Logger::add_context(const ExecutionContext& ctx, std::map<std::string, std::string>& fields) const {
    fields["component"] = ctx.component;
    if (ctx.worker_id != 0) {
        fields["worker_id"] = std::to_string(ctx.worker_id);
    }
    if (ctx.scenario_index >= 0) {
        fields["scenario_index"] = std::to_string(ctx.scenario_index);
    }
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

std::string Logger::values_to_string(const double* buffer, size_t count) const {
    std::ostringstream oss;
    oss << std::setprecision(6);
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) oss << " ";
        oss << buffer[i];
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace ecobatch
