/**
 * @file engine_config.cpp
 * @brief Engine configuration validation
 */

#include "biz/dedup/config/engine_config.h"

#include <format>
#include <utility>

namespace biz::dedup::config {

std::vector<validation_error_info> engine_config::validate() const {
    std::vector<validation_error_info> errors;

    if (name.empty()) {
        errors.push_back({"name", "Engine name is required", std::nullopt,
                          "non-empty string"});
    }

    for (auto error : scoring.validate()) {
        error.field_path = "scoring." + error.field_path;
        errors.push_back(std::move(error));
    }

    if (blocking.shard_count == 0) {
        errors.push_back({"index.shard_count", "Shard count must be positive",
                          "0", "> 0"});
    }
    if (blocking.max_block_size == 0) {
        errors.push_back({"index.max_block_size",
                          "Maximum block size must be positive", "0", "> 0"});
    }
    if (blocking.phone_key_digits < 4) {
        errors.push_back({"index.phone_key_digits",
                          "Phone key must use at least 4 digits",
                          std::to_string(blocking.phone_key_digits), ">= 4"});
    }
    if (blocking.name_prefix_length == 0) {
        errors.push_back({"index.name_prefix_length",
                          "Name prefix length must be positive", "0", "> 0"});
    }

    if (pool.queue_capacity == 0) {
        errors.push_back({"pool.queue_capacity",
                          "Queue capacity must be positive", "0", "> 0"});
    }
    if (pool.max_threads != 0 && pool.min_threads > pool.max_threads) {
        errors.push_back({"pool.threads", "Thread count exceeds maximum",
                          std::to_string(pool.min_threads),
                          std::format("<= {}", pool.max_threads)});
    }

    if (scorer_threads == 0) {
        errors.push_back({"scorer.threads",
                          "Scorer pool needs at least one thread", "0", "> 0"});
    }
    if (scorer_timeout.count() <= 0) {
        errors.push_back({"scorer.timeout", "Scorer timeout must be positive",
                          std::format("{}ms", scorer_timeout.count()), "> 0"});
    }

    for (auto error : match::validate_options(default_options)) {
        error.field_path = "defaults." + error.field_path;
        errors.push_back(std::move(error));
    }

    return errors;
}

}  // namespace biz::dedup::config
