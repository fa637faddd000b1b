/**
 * @file dedup_options.cpp
 * @brief Deduplication option conversion and validation
 */

#include "biz/dedup/match/dedup_options.h"

#include "biz/dedup/integration/logger_adapter.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <utility>

namespace biz::dedup::match {

namespace {

using record::business_field;
using record::match_algorithm;

struct option_failure {
    dedup_error code;
    validation_error_info info;
};

bool is_unit_interval(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

std::string format_value(double value) { return std::format("{}", value); }

/**
 * @brief Collect every failure together with its error code
 */
std::vector<option_failure> collect_failures(const dedup_options& options) {
    std::vector<option_failure> failures;

    if (!is_unit_interval(options.threshold)) {
        failures.push_back({dedup_error::invalid_threshold,
                            {"threshold", "threshold out of range",
                             format_value(options.threshold), "[0, 1]"}});
    }

    if (options.batch_size <= 0) {
        failures.push_back({dedup_error::invalid_batch_size,
                            {"batchSize", "batch size must be positive",
                             std::to_string(options.batch_size), "> 0"}});
    }

    // description is only comparable through a comparator or the model
    auto description_allowed =
        uses_model(options) ||
        options.custom_comparators.contains(business_field::description);

    auto check_field = [&](business_field field, const std::string& path) {
        if (!is_comparable_field(field) ||
            (field == business_field::description && !description_allowed)) {
            failures.push_back(
                {dedup_error::unknown_field,
                 {path, "field cannot be used for matching",
                  record::to_string(field),
                  "name, businessNumber, phone, email, website, address, "
                  "industry"}});
        }
    };

    for (auto field : options.check_fields) {
        check_field(field, "checkFields");
    }

    for (const auto& [field, value] : options.field_thresholds) {
        auto path = std::format("fieldThresholds.{}", record::to_string(field));
        check_field(field, path);
        if (!is_unit_interval(value)) {
            failures.push_back({dedup_error::invalid_field_threshold,
                                {path, "field threshold out of range",
                                 format_value(value), "[0, 1]"}});
        }
    }

    for (const auto& [field, comparator] : options.custom_comparators) {
        auto path =
            std::format("customComparators.{}", record::to_string(field));
        if (!is_comparable_field(field)) {
            failures.push_back({dedup_error::unknown_field,
                                {path, "field cannot be used for matching",
                                 record::to_string(field), std::nullopt}});
        }
        if (!comparator) {
            failures.push_back({dedup_error::invalid_comparator,
                                {path, "comparator is not callable",
                                 std::nullopt, "callable"}});
        }
    }

    return failures;
}

}  // namespace

// =============================================================================
// Conversion
// =============================================================================

std::expected<dedup_options, dedup_error> make_options(
    const option_values& values, const dedup_options& defaults) {
    dedup_options options = defaults;
    auto& logger = integration::get_logger();

    if (values.threshold) {
        options.threshold = *values.threshold;
    }

    if (values.algorithms) {
        options.algorithms.clear();
        for (const auto& name : *values.algorithms) {
            auto algorithm = record::parse_algorithm(name);
            if (!algorithm) {
                logger.warning(
                    std::format("invalid options: unknown algorithm '{}'", name));
                return std::unexpected(dedup_error::unknown_algorithm);
            }
            options.algorithms.push_back(*algorithm);
        }
    }

    if (values.check_fields) {
        options.check_fields.clear();
        for (const auto& name : *values.check_fields) {
            auto field = record::parse_field(name);
            if (!field) {
                logger.warning(
                    std::format("invalid options: unknown field '{}'", name));
                return std::unexpected(dedup_error::unknown_field);
            }
            options.check_fields.push_back(*field);
        }
    }

    for (const auto& [name, value] : values.field_thresholds) {
        auto field = record::parse_field(name);
        if (!field) {
            logger.warning(std::format(
                "invalid options: unknown field '{}' in fieldThresholds", name));
            return std::unexpected(dedup_error::unknown_field);
        }
        options.field_thresholds[*field] = value;
    }

    for (const auto& [name, comparator] : values.custom_comparators) {
        auto field = record::parse_field(name);
        if (!field) {
            logger.warning(std::format(
                "invalid options: unknown field '{}' in customComparators",
                name));
            return std::unexpected(dedup_error::unknown_field);
        }
        options.custom_comparators[*field] = comparator;
    }

    if (values.deep_check) options.deep_check = *values.deep_check;
    if (values.auto_merge) options.auto_merge = *values.auto_merge;

    if (values.merge_strategy) {
        auto strategy = record::parse_merge_strategy(*values.merge_strategy);
        if (!strategy) {
            logger.warning(std::format(
                "invalid options: unknown merge strategy '{}'",
                *values.merge_strategy));
            return std::unexpected(dedup_error::invalid_merge_strategy);
        }
        options.merge_strategy = *strategy;
    }
    if (values.preserve_primary.value_or(false)) {
        options.merge_strategy = record::merge_strategy_type::preserve_primary;
    }

    if (values.batch_size) {
        auto size = *values.batch_size;
        if (size <= 0 || size > std::numeric_limits<int>::max()) {
            logger.warning(
                std::format("invalid options: batchSize {} out of range", size));
            return std::unexpected(dedup_error::invalid_batch_size);
        }
        options.batch_size = static_cast<int>(size);
    }

    if (auto checked = check_options(options); !checked) {
        return std::unexpected(checked.error());
    }
    return options;
}

// =============================================================================
// Validation
// =============================================================================

std::vector<validation_error_info> validate_options(
    const dedup_options& options) {
    std::vector<validation_error_info> errors;
    for (auto& failure : collect_failures(options)) {
        errors.push_back(std::move(failure.info));
    }
    return errors;
}

std::expected<void, dedup_error> check_options(const dedup_options& options) {
    auto failures = collect_failures(options);
    if (failures.empty()) {
        return {};
    }

    const auto& first = failures.front();
    integration::get_logger().warning(std::format(
        "invalid options: {}: {} (value: {})", first.info.field_path,
        first.info.message, first.info.actual_value.value_or("-")));
    return std::unexpected(first.code);
}

// =============================================================================
// Option Queries
// =============================================================================

std::set<match_algorithm> default_algorithms() {
    return {match_algorithm::string, match_algorithm::phonetic,
            match_algorithm::token, match_algorithm::field_exact,
            match_algorithm::address};
}

std::set<match_algorithm> effective_algorithms(const dedup_options& options) {
    if (options.algorithms.empty()) {
        return default_algorithms();
    }
    return {options.algorithms.begin(), options.algorithms.end()};
}

bool uses_model(const dedup_options& options) {
    return options.deep_check ||
           std::find(options.algorithms.begin(), options.algorithms.end(),
                     match_algorithm::ml) != options.algorithms.end();
}

bool model_only(const dedup_options& options) {
    return !options.algorithms.empty() &&
           std::all_of(options.algorithms.begin(), options.algorithms.end(),
                       [](match_algorithm a) { return a == match_algorithm::ml; });
}

bool is_checked(const dedup_options& options, business_field field) {
    if (options.check_fields.empty()) return true;
    return std::find(options.check_fields.begin(), options.check_fields.end(),
                     field) != options.check_fields.end();
}

bool is_comparable_field(business_field field) {
    switch (field) {
        case business_field::name:
        case business_field::business_number:
        case business_field::phone:
        case business_field::email:
        case business_field::website:
        case business_field::address:
        case business_field::industry:
        case business_field::description:
            return true;
        default:
            return false;
    }
}

}  // namespace biz::dedup::match
