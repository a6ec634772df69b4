/**
 * @file logger.hpp
 * @brief Structured logging for the calculation engines with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (engine, operation, item identifier)
 * - Calculation metrics (execution time, items processed/failed)
 *
 * Logging is a side channel: nothing an engine computes depends on it.
 * Calls are serialized internally so portfolio workers may log concurrently.
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef REGCALC_LOGGER_HPP
#define REGCALC_LOGGER_HPP

#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace regcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (audit appends, intermediate values)
    INFO,    ///< Informational messages (calculation start/end)
    WARN,    ///< Warning messages (clamped inputs, model fallbacks)
    ERROR    ///< Error messages (failures, exceptions)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
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
    std::string engine;              ///< Engine name (credit, liability, solvency)
    std::string operation;           ///< Top-level operation being run
    std::string item_id;             ///< Exposure / contract group id, if any

    ExecutionContext()
        : engine(""), operation(""), item_id("") {}

    ExecutionContext(const std::string& eng, const std::string& op)
        : engine(eng), operation(op), item_id("") {}
};

/**
 * @brief Calculation metrics for logging
 */
struct CalculationMetrics {
    double execution_time_ms;        ///< Wall-clock time of the calculation
    size_t items_processed;          ///< Items computed successfully
    size_t items_failed;             ///< Items isolated as failures

    CalculationMetrics()
        : execution_time_ms(0.0), items_processed(0), items_failed(0) {}
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

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("regcalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   ExecutionContext ctx("credit", "quantify_portfolio");
 *   Logger::get_instance().log_calculation_start(ctx, exposures.size());
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log start of a top-level calculation
     *
     * @param ctx Execution context
     * @param item_count Number of items (exposures, cash-flow periods, groups)
     */
    void log_calculation_start(const ExecutionContext& ctx, size_t item_count);

    /**
     * @brief Log completion of a top-level calculation
     */
    void log_calculation_complete(const ExecutionContext& ctx, const CalculationMetrics& metrics);

    /**
     * @brief Log a rejected input
     *
     * @param ctx Execution context
     * @param field First invalid input
     * @param message Reason for rejection
     */
    void log_validation_error(
        const ExecutionContext& ctx,
        const std::string& field,
        const std::string& message
    );

    /**
     * @brief Log an isolated batch-item failure
     */
    void log_item_failed(
        const ExecutionContext& ctx,
        const std::string& item_id,
        const std::string& message
    );

    /**
     * @brief Log an appended audit record (DEBUG)
     */
    void log_audit_appended(
        const ExecutionContext& ctx,
        const std::string& input_digest,
        const std::string& result_digest
    );

    void log_warning(const ExecutionContext& ctx, const std::string& warning_message);

    void log_error(const ExecutionContext& ctx, const std::string& error_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    std::map<std::string, std::string> context_fields(const ExecutionContext& ctx, const std::string& event) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace regcalc

#endif // REGCALC_LOGGER_HPP
