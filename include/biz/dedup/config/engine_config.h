#ifndef BIZ_DEDUP_CONFIG_ENGINE_CONFIG_H
#define BIZ_DEDUP_CONFIG_ENGINE_CONFIG_H

/**
 * @file engine_config.h
 * @brief Deduplication engine configuration
 *
 * Aggregates every tunable of the engine: scoring weights and cut-offs,
 * blocking index layout, normalization tables, worker pools, the external
 * scorer budget and the options used when a caller passes none.
 */

#include "biz/dedup/index/candidate_index.h"
#include "biz/dedup/integration/logger_adapter.h"
#include "biz/dedup/match/dedup_options.h"
#include "biz/dedup/match/match_scorer.h"
#include "biz/dedup/normalize/normalization_rules.h"
#include "biz/dedup/performance/performance_types.h"

#include <chrono>
#include <string>
#include <vector>

namespace biz::dedup::config {

// =============================================================================
// Error Codes (-1120 to -1129)
// =============================================================================

/**
 * @brief Configuration error codes
 *
 * Allocated range: -1120 to -1129
 */
enum class config_error : int {
    /** Configuration file not found */
    file_not_found = -1120,

    /** Syntax error in configuration file */
    parse_error = -1121,

    /** Configuration failed validation */
    validation_error = -1122,

    /** A value could not be converted to its field's type */
    invalid_value = -1123,

    /** Unsupported configuration file format */
    invalid_format = -1124,

    /** File could not be read or written */
    io_error = -1125,

    /** Referenced environment variable is not set */
    env_var_not_found = -1126,

    /** Configuration content is empty */
    empty_config = -1127
};

/**
 * @brief Convert config_error to error code
 */
[[nodiscard]] constexpr int to_error_code(config_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief Get human-readable description
 */
[[nodiscard]] constexpr const char* to_string(config_error error) noexcept {
    switch (error) {
        case config_error::file_not_found:
            return "Configuration file not found";
        case config_error::parse_error:
            return "Configuration parse error";
        case config_error::validation_error:
            return "Configuration validation failed";
        case config_error::invalid_value:
            return "Invalid configuration value";
        case config_error::invalid_format:
            return "Unsupported configuration format";
        case config_error::io_error:
            return "Configuration I/O error";
        case config_error::env_var_not_found:
            return "Environment variable not found";
        case config_error::empty_config:
            return "Configuration content is empty";
        default:
            return "Unknown configuration error";
    }
}

using match::validation_error_info;

// =============================================================================
// Engine Configuration
// =============================================================================

/**
 * @brief Complete engine configuration
 */
struct engine_config {
    /** Name used in log messages */
    std::string name = "business_dedup";

    /** Weights and cut-offs of the overall score */
    match::scoring_config scoring;

    /** Blocking index layout */
    index::index_config blocking;

    /** Suffix, connector, abbreviation and domain tables */
    normalize::normalization_rules normalization =
        normalize::normalization_rules::defaults();

    /** Worker pool for batch comparison */
    performance::thread_pool_config pool =
        performance::thread_pool_config::for_comparison();

    /** Worker threads reserved for external scorer calls */
    size_t scorer_threads = 2;

    /** Time budget of one external scorer call */
    std::chrono::milliseconds scorer_timeout{200};

    /** Options used when a call passes none */
    match::dedup_options default_options;

    /** Minimum level applied to the default logger */
    integration::log_level log_level = integration::log_level::info;

    /**
     * @brief Validate the configuration
     * @return List of validation errors (empty if valid)
     */
    [[nodiscard]] std::vector<validation_error_info> validate() const;

    /**
     * @brief Check if configuration is valid
     */
    [[nodiscard]] bool is_valid() const { return validate().empty(); }
};

}  // namespace biz::dedup::config

#endif  // BIZ_DEDUP_CONFIG_ENGINE_CONFIG_H
