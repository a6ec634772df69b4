/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace regcalc {

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
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_calculation_start(const ExecutionContext& ctx, size_t item_count) {
    auto fields = context_fields(ctx, "calculation_start");
    fields["item_count"] = std::to_string(item_count);

    log(LogLevel::INFO, "Starting calculation", std::move(fields));
}

void Logger::log_calculation_complete(const ExecutionContext& ctx, const CalculationMetrics& metrics) {
    auto fields = context_fields(ctx, "calculation_complete");
    fields["execution_time_ms"] = std::to_string(metrics.execution_time_ms);
    fields["items_processed"] = std::to_string(metrics.items_processed);
    fields["items_failed"] = std::to_string(metrics.items_failed);

    log(metrics.items_failed > 0 ? LogLevel::WARN : LogLevel::INFO,
        "Calculation completed", std::move(fields));
}

void Logger::log_validation_error(
    const ExecutionContext& ctx,
    const std::string& field,
    const std::string& message
) {
    auto fields = context_fields(ctx, "validation_error");
    fields["field"] = field;
    fields["error_message"] = message;

    log(LogLevel::ERROR, "Input rejected", std::move(fields));
}

void Logger::log_item_failed(
    const ExecutionContext& ctx,
    const std::string& item_id,
    const std::string& message
) {
    auto fields = context_fields(ctx, "item_failed");
    fields["item_id"] = item_id;
    fields["error_message"] = message;

    log(LogLevel::WARN, "Portfolio item failed", std::move(fields));
}

void Logger::log_audit_appended(
    const ExecutionContext& ctx,
    const std::string& input_digest,
    const std::string& result_digest
) {
    auto fields = context_fields(ctx, "audit_appended");
    fields["input_digest"] = input_digest;
    fields["result_digest"] = result_digest;

    log(LogLevel::DEBUG, "Audit record appended", std::move(fields));
}

void Logger::log_warning(const ExecutionContext& ctx, const std::string& warning_message) {
    auto fields = context_fields(ctx, "warning");
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::log_error(const ExecutionContext& ctx, const std::string& error_message) {
    auto fields = context_fields(ctx, "error");
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Engine error", std::move(fields));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

std::map<std::string, std::string> Logger::context_fields(
    const ExecutionContext& ctx,
    const std::string& event
) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    fields["engine"] = ctx.engine;
    fields["operation"] = ctx.operation;
    if (!ctx.item_id.empty()) {
        fields["item_id"] = ctx.item_id;
    }
    return fields;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    std::map<std::string, std::string> fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
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

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

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

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace regcalc
