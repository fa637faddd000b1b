/**
 * @file logger_adapter.cpp
 * @brief Implementation of logger adapter for business_dedup
 *
 * Provides two implementations:
 *   - console_logger_adapter: timestamped console output (default)
 *   - ilogger_adapter: wraps common_system's ILogger
 *
 * @see include/biz/dedup/integration/logger_adapter.h
 */

#include "biz/dedup/integration/logger_adapter.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace biz::dedup::integration {

// =============================================================================
// Log Level Names
// =============================================================================

const char* to_string(log_level level) noexcept {
    switch (level) {
        case log_level::trace:
            return "TRACE";
        case log_level::debug:
            return "DEBUG";
        case log_level::info:
            return "INFO";
        case log_level::warning:
            return "WARN";
        case log_level::error:
            return "ERROR";
        case log_level::critical:
            return "CRIT";
        default:
            return "UNKNOWN";
    }
}

bool parse_log_level(std::string_view name, log_level& out) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "trace") {
        out = log_level::trace;
    } else if (lower == "debug") {
        out = log_level::debug;
    } else if (lower == "info") {
        out = log_level::info;
    } else if (lower == "warn" || lower == "warning") {
        out = log_level::warning;
    } else if (lower == "error") {
        out = log_level::error;
    } else if (lower == "critical" || lower == "crit" || lower == "fatal") {
        out = log_level::critical;
    } else {
        return false;
    }
    return true;
}

namespace {

kcenon::common::interfaces::log_level to_kcenon_level(log_level level) {
    switch (level) {
        case log_level::trace:
            return kcenon::common::interfaces::log_level::trace;
        case log_level::debug:
            return kcenon::common::interfaces::log_level::debug;
        case log_level::info:
            return kcenon::common::interfaces::log_level::info;
        case log_level::warning:
            return kcenon::common::interfaces::log_level::warning;
        case log_level::error:
            return kcenon::common::interfaces::log_level::error;
        case log_level::critical:
            return kcenon::common::interfaces::log_level::critical;
        default:
            return kcenon::common::interfaces::log_level::info;
    }
}

log_level from_kcenon_level(kcenon::common::interfaces::log_level level) {
    switch (level) {
        case kcenon::common::interfaces::log_level::trace:
            return log_level::trace;
        case kcenon::common::interfaces::log_level::debug:
            return log_level::debug;
        case kcenon::common::interfaces::log_level::info:
            return log_level::info;
        case kcenon::common::interfaces::log_level::warning:
            return log_level::warning;
        case kcenon::common::interfaces::log_level::error:
            return log_level::error;
        case kcenon::common::interfaces::log_level::critical:
        case kcenon::common::interfaces::log_level::off:
            return log_level::critical;
        default:
            return log_level::info;
    }
}

}  // namespace

// =============================================================================
// ilogger_adapter - Wraps ILogger
// =============================================================================

/**
 * @class ilogger_adapter
 * @brief Logger adapter that forwards to common_system's ILogger
 */
class ilogger_adapter : public logger_adapter {
public:
    explicit ilogger_adapter(
        std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
        : logger_(std::move(logger)) {
        if (logger_) {
            current_level_ = from_kcenon_level(logger_->get_level());
        }
    }

    void log(log_level level, std::string_view message) override {
        if (!logger_ || !is_enabled(level)) {
            return;
        }
        // ILogger results are advisory for a logging sink
        (void)logger_->log(to_kcenon_level(level), message);
    }

    void set_level(log_level level) override {
        current_level_ = level;
        if (logger_) {
            (void)logger_->set_level(to_kcenon_level(level));
        }
    }

    [[nodiscard]] log_level get_level() const noexcept override {
        return current_level_.load(std::memory_order_relaxed);
    }

    void flush() override {
        if (logger_) {
            (void)logger_->flush();
        }
    }

private:
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
    std::atomic<log_level> current_level_{log_level::info};
};

// =============================================================================
// console_logger_adapter
// =============================================================================

/**
 * @class console_logger_adapter
 * @brief Console logger with timestamped, serialized output
 *
 * error and critical go to stderr, everything else to stdout.
 */
class console_logger_adapter : public logger_adapter {
public:
    explicit console_logger_adapter(std::string_view name) : name_(name) {}

    void log(log_level level, std::string_view message) override {
        if (!is_enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        std::tm local_tm{};
        localtime_r(&time, &local_tm);

        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms.count() << " ["
            << to_string(level) << "] ";

        if (!name_.empty()) {
            oss << "[" << name_ << "] ";
        }

        oss << message << '\n';

        std::lock_guard<std::mutex> lock(mutex_);
        auto& stream = (level >= log_level::error) ? std::cerr : std::cout;
        stream << oss.str();
    }

    void set_level(log_level level) override {
        current_level_.store(level, std::memory_order_relaxed);
    }

    [[nodiscard]] log_level get_level() const noexcept override {
        return current_level_.load(std::memory_order_relaxed);
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
    }

private:
    std::string name_;
    std::atomic<log_level> current_level_{log_level::info};
    std::mutex mutex_;
};

// =============================================================================
// Global Logger Instance
// =============================================================================

namespace {

std::unique_ptr<logger_adapter> g_default_logger;
std::mutex g_logger_mutex;

}  // namespace

logger_adapter& get_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    if (!g_default_logger) {
        g_default_logger =
            std::make_unique<console_logger_adapter>("business_dedup");
    }

    return *g_default_logger;
}

void set_default_logger(std::unique_ptr<logger_adapter> logger) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_default_logger = std::move(logger);
}

void reset_default_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_default_logger.reset();
}

void set_default_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_default_logger = std::make_unique<ilogger_adapter>(std::move(logger));
}

}  // namespace biz::dedup::integration
