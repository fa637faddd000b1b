#ifndef BIZ_DEDUP_INTEGRATION_LOGGER_ADAPTER_H
#define BIZ_DEDUP_INTEGRATION_LOGGER_ADAPTER_H

/**
 * @file logger_adapter.h
 * @brief Integration Module - Logger system adapter
 *
 * Structured logging for deduplication operations. The default logger
 * writes timestamped lines to the console; a common_system ILogger can
 * be installed as the process-wide default instead.
 */

#include <memory>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace biz::dedup::integration {

/**
 * @brief Log levels
 */
enum class log_level {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

/**
 * @brief Get log level name ("TRACE", "DEBUG", ...)
 */
[[nodiscard]] const char* to_string(log_level level) noexcept;

/**
 * @brief Parse a log level name, case-insensitive ("warn" is accepted)
 * @return true on success, with @p out set
 */
[[nodiscard]] bool parse_log_level(std::string_view name, log_level& out);

/**
 * @brief Logger adapter interface
 */
class logger_adapter {
public:
    virtual ~logger_adapter() = default;

    /**
     * @brief Log a message at specified level
     * @param level Log level
     * @param message Log message
     */
    virtual void log(log_level level, std::string_view message) = 0;

    void trace(std::string_view message) { log(log_level::trace, message); }
    void debug(std::string_view message) { log(log_level::debug, message); }
    void info(std::string_view message) { log(log_level::info, message); }
    void warning(std::string_view message) { log(log_level::warning, message); }
    void error(std::string_view message) { log(log_level::error, message); }
    void critical(std::string_view message) {
        log(log_level::critical, message);
    }

    /**
     * @brief Set minimum log level
     */
    virtual void set_level(log_level level) = 0;

    /**
     * @brief Get current log level
     */
    [[nodiscard]] virtual log_level get_level() const noexcept = 0;

    /**
     * @brief Check whether a message at @p level would be emitted
     */
    [[nodiscard]] bool is_enabled(log_level level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(get_level());
    }

    /**
     * @brief Flush pending log entries
     */
    virtual void flush() = 0;
};

/**
 * @brief Get the global logger instance
 *
 * Defaults to a console logger named "business_dedup".
 */
[[nodiscard]] logger_adapter& get_logger();

/**
 * @brief Replace the global logger
 *
 * An empty pointer restores the console default on next get_logger().
 */
void set_default_logger(std::unique_ptr<logger_adapter> logger);

/**
 * @brief Restore the console default logger
 */
void reset_default_logger();

/**
 * @brief Route all library logging into a common_system ILogger
 */
void set_default_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

}  // namespace biz::dedup::integration

#endif  // BIZ_DEDUP_INTEGRATION_LOGGER_ADAPTER_H
