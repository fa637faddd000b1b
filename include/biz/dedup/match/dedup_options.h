#ifndef BIZ_DEDUP_MATCH_DEDUP_OPTIONS_H
#define BIZ_DEDUP_MATCH_DEDUP_OPTIONS_H

/**
 * @file dedup_options.h
 * @brief Per-call deduplication options and their validation
 *
 * Options are validated before any comparison work begins. Invalid
 * options are never corrected silently: the call fails with a
 * dedup_error and the details are available from validate_options().
 *
 * Callers holding loosely typed option values (algorithm and field names
 * as strings, a possibly negative batch size) convert them with
 * make_options(), which reports unknown names instead of ignoring them.
 */

#include "biz/dedup/record/business_record.h"
#include "biz/dedup/record/match_types.h"

#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace biz::dedup::match {

// =============================================================================
// Error Codes (-1100 to -1119)
// =============================================================================

/**
 * @brief Deduplication error codes
 *
 * Allocated range: -1100 to -1119
 */
enum class dedup_error : int {
    /** Threshold is not a finite value in [0,1] */
    invalid_threshold = -1100,

    /** Algorithm name is not recognized */
    unknown_algorithm = -1101,

    /** Field name is not recognized or not comparable */
    unknown_field = -1102,

    /** Per-field threshold is not a finite value in [0,1] */
    invalid_field_threshold = -1103,

    /** Batch size is not a positive integer */
    invalid_batch_size = -1104,

    /** Custom comparator is empty */
    invalid_comparator = -1105,

    /** Scoring weights are negative or sum to zero */
    invalid_weights = -1106,

    /** Merge strategy name is not recognized */
    invalid_merge_strategy = -1107,

    /** Operation requires an external scorer that is not configured */
    scorer_unavailable = -1108,

    /** Merge requested for a cluster without records */
    empty_cluster = -1109
};

/**
 * @brief Convert dedup_error to error code
 */
[[nodiscard]] constexpr int to_error_code(dedup_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief Get human-readable description
 */
[[nodiscard]] constexpr const char* to_string(dedup_error error) noexcept {
    switch (error) {
        case dedup_error::invalid_threshold:
            return "Threshold must be a number in [0,1]";
        case dedup_error::unknown_algorithm:
            return "Unknown matching algorithm";
        case dedup_error::unknown_field:
            return "Unknown or non-comparable field";
        case dedup_error::invalid_field_threshold:
            return "Field threshold must be a number in [0,1]";
        case dedup_error::invalid_batch_size:
            return "Batch size must be a positive integer";
        case dedup_error::invalid_comparator:
            return "Custom comparator is not callable";
        case dedup_error::invalid_weights:
            return "Invalid scoring weights";
        case dedup_error::invalid_merge_strategy:
            return "Unknown merge strategy";
        case dedup_error::scorer_unavailable:
            return "External scorer is not configured";
        case dedup_error::empty_cluster:
            return "Cluster contains no records";
        default:
            return "Unknown deduplication error";
    }
}

// =============================================================================
// Validation Details
// =============================================================================

/**
 * @brief One validation failure
 */
struct validation_error_info {
    /** Path to the offending option (e.g., "fieldThresholds.phone") */
    std::string field_path;

    /** Error message describing the validation failure */
    std::string message;

    /** Actual value that failed validation (if applicable) */
    std::optional<std::string> actual_value;

    /** Expected value or constraint description */
    std::optional<std::string> expected;
};

// =============================================================================
// Options
// =============================================================================

/**
 * @brief Caller-supplied field comparison
 *
 * Receives snapshots of both records and returns a score in [0,1].
 * Called with the pair ordered by id so that scoring stays symmetric.
 */
using field_comparator = std::function<double(const record::business_record&,
                                              const record::business_record&)>;

/** Default duplicate threshold */
inline constexpr double default_threshold = 0.8;

/** Default number of records per batch chunk */
inline constexpr int default_batch_size = 100;

/**
 * @brief Typed deduplication options
 */
struct dedup_options {
    /** Minimum overall score reported as a duplicate */
    double threshold = default_threshold;

    /** Algorithms to run; empty selects every algorithm except ml */
    std::vector<record::match_algorithm> algorithms;

    /** Fields to compare; empty selects every comparable field */
    std::vector<record::business_field> check_fields;

    /** Per-field minimum for a field score to count */
    std::map<record::business_field, double> field_thresholds;

    /** Per-field overrides of the built-in comparison */
    std::map<record::business_field, field_comparator> custom_comparators;

    /** Blend the external scorer into the score */
    bool deep_check = false;

    /** Merge every duplicate group of a batch */
    bool auto_merge = false;

    record::merge_strategy_type merge_strategy =
        record::merge_strategy_type::comprehensive;

    /** Records per batch chunk */
    int batch_size = default_batch_size;
};

/**
 * @brief Untyped option values as received from an outer layer
 *
 * Unset members take the value of the defaults passed to make_options().
 */
struct option_values {
    std::optional<double> threshold;
    std::optional<std::vector<std::string>> algorithms;
    std::optional<std::vector<std::string>> check_fields;
    std::map<std::string, double> field_thresholds;
    std::map<std::string, field_comparator> custom_comparators;
    std::optional<bool> deep_check;
    std::optional<bool> auto_merge;

    /** "preservePrimary", "quality" or "comprehensive" */
    std::optional<std::string> merge_strategy;

    /** Shorthand for merge_strategy = "preservePrimary" when true */
    std::optional<bool> preserve_primary;

    std::optional<long long> batch_size;
};

// =============================================================================
// Validation
// =============================================================================

/**
 * @brief Convert untyped option values and validate the result
 *
 * @param values   Values to convert
 * @param defaults Options used for unset values
 * @return Validated options, or the error of the first failure
 */
[[nodiscard]] std::expected<dedup_options, dedup_error> make_options(
    const option_values& values, const dedup_options& defaults = {});

/**
 * @brief Validate typed options
 * @return Every validation failure; empty when the options are valid
 */
[[nodiscard]] std::vector<validation_error_info> validate_options(
    const dedup_options& options);

/**
 * @brief Validate typed options, logging and returning the first failure
 */
[[nodiscard]] std::expected<void, dedup_error> check_options(
    const dedup_options& options);

// =============================================================================
// Option Queries
// =============================================================================

/**
 * @brief Algorithms enabled by the options
 */
[[nodiscard]] std::set<record::match_algorithm> effective_algorithms(
    const dedup_options& options);

/**
 * @brief Algorithms enabled when no algorithm list is given
 */
[[nodiscard]] std::set<record::match_algorithm> default_algorithms();

/**
 * @brief Check whether the external scorer is requested
 *
 * True for deep_check and for an explicit "ml" algorithm.
 */
[[nodiscard]] bool uses_model(const dedup_options& options);

/**
 * @brief Check whether only the external scorer is requested
 */
[[nodiscard]] bool model_only(const dedup_options& options);

/**
 * @brief Check whether a field is selected by check_fields
 */
[[nodiscard]] bool is_checked(const dedup_options& options,
                              record::business_field field);

/**
 * @brief Check whether a field can take part in comparison at all
 *
 * businessType, confidence and verified never can; description only
 * through a custom comparator or the external scorer.
 */
[[nodiscard]] bool is_comparable_field(record::business_field field);

}  // namespace biz::dedup::match

#endif  // BIZ_DEDUP_MATCH_DEDUP_OPTIONS_H
