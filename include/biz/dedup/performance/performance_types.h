#ifndef BIZ_DEDUP_PERFORMANCE_PERFORMANCE_TYPES_H
#define BIZ_DEDUP_PERFORMANCE_PERFORMANCE_TYPES_H

/**
 * @file performance_types.h
 * @brief Worker pool error codes and configuration
 *
 * The engine runs two pools: one for pairwise comparison work during
 * batch deduplication, and a small one that isolates calls into the
 * external similarity scorer so they can be bounded by a timeout.
 */

#include <chrono>
#include <cstdint>
#include <string>

namespace biz::dedup::performance {

// =============================================================================
// Error Codes (-1130 to -1139)
// =============================================================================

/**
 * @brief Performance module error codes
 *
 * Allocated range: -1130 to -1139
 */
enum class performance_error : int {
    /** Thread pool initialization failed */
    thread_pool_init_failed = -1130,

    /** Queue is full */
    queue_full = -1131,

    /** Invalid configuration */
    invalid_configuration = -1132,

    /** Operation timed out */
    timeout = -1133,

    /** Component not initialized */
    not_initialized = -1134,

    /** Pool already running */
    already_running = -1135
};

/**
 * @brief Convert performance_error to error code integer
 */
[[nodiscard]] constexpr int to_error_code(performance_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief Get human-readable description of performance error
 */
[[nodiscard]] constexpr const char* to_string(performance_error error) noexcept {
    switch (error) {
        case performance_error::thread_pool_init_failed:
            return "Thread pool initialization failed";
        case performance_error::queue_full:
            return "Queue is full";
        case performance_error::invalid_configuration:
            return "Invalid performance configuration";
        case performance_error::timeout:
            return "Operation timed out";
        case performance_error::not_initialized:
            return "Component not initialized";
        case performance_error::already_running:
            return "Thread pool is already running";
        default:
            return "Unknown performance error";
    }
}

// =============================================================================
// Thread Pool Configuration
// =============================================================================

/**
 * @brief Worker pool configuration
 */
struct thread_pool_config {
    /** Number of worker threads started (0 = hardware_concurrency) */
    size_t min_threads = 4;

    /** Upper bound for min_threads (0 = hardware_concurrency) */
    size_t max_threads = 0;

    /** Idle workers take tasks from other workers' queues */
    bool enable_work_stealing = true;

    /** Task queue capacity per worker */
    size_t queue_capacity = 1024;

    /** Thread name prefix, used in log messages */
    std::string thread_name_prefix = "dedup_worker";

    /**
     * @brief Configuration for batch comparison work
     */
    [[nodiscard]] static thread_pool_config for_comparison() {
        thread_pool_config config;
        config.min_threads = 0;  // auto-detect
        config.max_threads = 0;
        config.queue_capacity = 2048;
        config.thread_name_prefix = "dedup_compare";
        return config;
    }

    /**
     * @brief Configuration for isolating external scorer calls
     */
    [[nodiscard]] static thread_pool_config for_scorer(size_t threads) {
        thread_pool_config config;
        config.min_threads = threads == 0 ? 1 : threads;
        config.max_threads = config.min_threads;
        config.enable_work_stealing = true;
        config.queue_capacity = 256;
        config.thread_name_prefix = "dedup_scorer";
        return config;
    }
};

}  // namespace biz::dedup::performance

#endif  // BIZ_DEDUP_PERFORMANCE_PERFORMANCE_TYPES_H
