#ifndef BIZ_DEDUP_CONFIG_CONFIG_LOADER_H
#define BIZ_DEDUP_CONFIG_CONFIG_LOADER_H

/**
 * @file config_loader.h
 * @brief Engine configuration loader (YAML subset)
 *
 * Loads, validates and writes engine configuration files. Features:
 *   - Indented "key: value" sections, "- item" lists and # comments
 *   - Environment variable substitution (${VAR} syntax)
 *   - Validation with detailed error messages
 *   - Default values for every key not present
 *
 * Supported environment variable syntax:
 *   - ${VAR} - Required variable (error if not set)
 *   - ${VAR:-default} - Optional with default value
 *
 * Recognized keys (lists are comma separated or "- item" blocks):
 * @code
 * name: "business_dedup"
 * logging:
 *   level: info                      # trace|debug|info|warning|error|critical
 * scoring:
 *   weights:
 *     name: 0.25                     # any comparable field
 *   high_confidence: 0.9
 *   medium_confidence: 0.7
 *   model_weight: 0.5
 *   auto_merge_threshold: 0.9
 * index:
 *   shard_count: 64
 *   max_block_size: 250
 *   phone_key_digits: 7
 *   name_prefix_length: 6
 * normalization:
 *   legal_suffixes: inc, ltd, corp
 *   connector_words: and, &
 *   shared_email_domains: gmail.com, outlook.com
 *   abbreviations:
 *     st: street
 *   region_aliases:
 *     ontario: on
 * pool:
 *   threads: 0                       # 0 = hardware concurrency
 *   queue_capacity: 2048
 *   work_stealing: true
 * scorer:
 *   threads: 2
 *   timeout: 200ms                   # ms, s or plain milliseconds
 * defaults:
 *   threshold: 0.8
 *   algorithms: string, phonetic, token, field-exact, address
 *   check_fields: name, phone
 *   field_thresholds:
 *     name: 0.6
 *   deep_check: false
 *   auto_merge: false
 *   merge_strategy: comprehensive
 *   batch_size: 100
 * @endcode
 *
 * @example Loading Configuration
 * ```cpp
 * auto result = config_loader::load("/etc/business_dedup/engine.yaml");
 * if (!result) {
 *     std::cerr << result.error().to_string() << std::endl;
 *     return 1;
 * }
 * dedup_engine engine(store, std::move(*result));
 * ```
 */

#include "biz/dedup/config/engine_config.h"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace biz::dedup::config {

// =============================================================================
// Load Result Types
// =============================================================================

/**
 * @brief Detailed error information from configuration loading
 */
struct config_load_error {
    /** Error code */
    config_error code = config_error::parse_error;

    /** Human-readable error message */
    std::string message;

    /** File path where error occurred (if applicable) */
    std::optional<std::filesystem::path> file_path;

    /** Line number where error occurred (if applicable) */
    std::optional<size_t> line_number;

    /** Validation errors (if validation failed) */
    std::vector<validation_error_info> validation_errors;

    /**
     * @brief Get formatted error message with location
     */
    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Result type for configuration loading operations
 */
using config_result = std::expected<engine_config, config_load_error>;

// =============================================================================
// Configuration Loader
// =============================================================================

/**
 * @brief Configuration file loader
 *
 * Static class providing configuration loading and validation functions.
 */
class config_loader {
public:
    // =========================================================================
    // Loading
    // =========================================================================

    /**
     * @brief Load configuration from a file
     *
     * Accepts .yaml and .yml files.
     */
    [[nodiscard]] static config_result load(const std::filesystem::path& path);

    /**
     * @brief Load configuration from YAML string
     *
     * @param yaml_content YAML configuration string
     * @param source_name Source name for error messages
     */
    [[nodiscard]] static config_result load_yaml_string(
        std::string_view yaml_content,
        std::string_view source_name = "<string>");

    // =========================================================================
    // Validation
    // =========================================================================

    /**
     * @brief Validate a configuration
     * @return Empty vector if valid, otherwise list of errors
     */
    [[nodiscard]] static std::vector<validation_error_info> validate(
        const engine_config& config);

    // =========================================================================
    // Saving
    // =========================================================================

    /**
     * @brief Save configuration to a YAML file
     */
    [[nodiscard]] static std::expected<void, config_load_error> save_yaml(
        const engine_config& config, const std::filesystem::path& path);

    /**
     * @brief Serialize configuration to a YAML string
     *
     * The output loads back into an equal configuration, except for
     * custom comparators, which cannot be serialized.
     */
    [[nodiscard]] static std::string to_yaml(const engine_config& config);

    // =========================================================================
    // Environment Variable Processing
    // =========================================================================

    /**
     * @brief Expand environment variables in a string
     *
     * @return Expanded string or error if a required variable is missing
     */
    [[nodiscard]] static std::expected<std::string, config_load_error>
    expand_env_vars(std::string_view value);

    /**
     * @brief Check if environment variable expansion is needed
     */
    [[nodiscard]] static bool needs_env_expansion(std::string_view value);

    // =========================================================================
    // Utility
    // =========================================================================

    /**
     * @brief Get default configuration
     */
    [[nodiscard]] static engine_config get_default_config();

private:
    config_loader() = delete;
    ~config_loader() = delete;
    config_loader(const config_loader&) = delete;
    config_loader& operator=(const config_loader&) = delete;
};

}  // namespace biz::dedup::config

#endif  // BIZ_DEDUP_CONFIG_CONFIG_LOADER_H
