#ifndef BIZ_DEDUP_PERFORMANCE_THREAD_POOL_MANAGER_H
#define BIZ_DEDUP_PERFORMANCE_THREAD_POOL_MANAGER_H

/**
 * @file thread_pool_manager.h
 * @brief Work-stealing worker pool
 *
 * Fixed-size pool with one task queue per worker. Tasks are distributed
 * round-robin; idle workers steal from the other queues.
 *
 * Example usage:
 * @code
 *     thread_pool_manager pool(thread_pool_config::for_comparison());
 *     if (auto result = pool.start(); !result) {
 *         handle_error(result.error());
 *         return;
 *     }
 *
 *     auto future = pool.submit([&] { return compare(a, b); });
 *     auto result = future.get();
 * @endcode
 */

#include "biz/dedup/performance/performance_types.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <type_traits>

namespace biz::dedup::performance {

// =============================================================================
// Thread Pool Statistics
// =============================================================================

/**
 * @brief Thread pool statistics
 */
struct thread_pool_statistics {
    /** Workers currently executing a task */
    std::atomic<size_t> active_threads{0};

    /** Total threads in pool */
    std::atomic<size_t> total_threads{0};

    /** Tasks queued waiting for execution */
    std::atomic<size_t> queued_tasks{0};

    /** Peak queued tasks */
    std::atomic<size_t> peak_queued{0};

    std::atomic<uint64_t> total_submitted{0};
    std::atomic<uint64_t> total_completed{0};

    /** Tasks rejected because the target queue was full */
    std::atomic<uint64_t> total_rejected{0};

    /** Tasks that threw out of a posted task_fn */
    std::atomic<uint64_t> total_failed{0};

    /** Tasks taken from another worker's queue */
    std::atomic<uint64_t> work_stolen{0};

    /** Average task duration in microseconds */
    std::atomic<uint64_t> avg_task_duration_us{0};

    /** Peak task duration in microseconds */
    std::atomic<uint64_t> peak_task_duration_us{0};

    /**
     * @brief Get completion rate
     */
    [[nodiscard]] double completion_rate() const noexcept {
        uint64_t submitted = total_submitted.load(std::memory_order_relaxed);
        if (submitted == 0) return 0.0;
        uint64_t completed = total_completed.load(std::memory_order_relaxed);
        return (static_cast<double>(completed) /
                static_cast<double>(submitted)) *
               100.0;
    }

    /**
     * @brief Reset counters
     */
    void reset() noexcept {
        total_submitted.store(0, std::memory_order_relaxed);
        total_completed.store(0, std::memory_order_relaxed);
        total_rejected.store(0, std::memory_order_relaxed);
        total_failed.store(0, std::memory_order_relaxed);
        work_stolen.store(0, std::memory_order_relaxed);
        peak_queued.store(0, std::memory_order_relaxed);
        avg_task_duration_us.store(0, std::memory_order_relaxed);
        peak_task_duration_us.store(0, std::memory_order_relaxed);
    }
};

// =============================================================================
// Thread Pool Manager
// =============================================================================

/**
 * @brief Work-stealing worker pool
 */
class thread_pool_manager {
public:
    /** Task function type */
    using task_fn = std::function<void()>;

    /**
     * @brief Construct thread pool manager
     * @param config Thread pool configuration
     */
    explicit thread_pool_manager(const thread_pool_config& config = {});

    /** Destructor; stops the pool and drains queued tasks */
    ~thread_pool_manager();

    // Non-copyable, non-movable
    thread_pool_manager(const thread_pool_manager&) = delete;
    thread_pool_manager& operator=(const thread_pool_manager&) = delete;
    thread_pool_manager(thread_pool_manager&&) = delete;
    thread_pool_manager& operator=(thread_pool_manager&&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /**
     * @brief Start the worker threads
     * @return Success or error
     */
    [[nodiscard]] std::expected<void, performance_error> start();

    /**
     * @brief Stop the pool
     *
     * With @p drain set, workers finish every queued task before
     * exiting; otherwise queued tasks are discarded and their futures
     * report std::future_errc::broken_promise.
     */
    [[nodiscard]] std::expected<void, performance_error> stop(
        bool drain = true);

    /**
     * @brief Check if pool is running
     */
    [[nodiscard]] bool is_running() const noexcept;

    // -------------------------------------------------------------------------
    // Task Submission
    // -------------------------------------------------------------------------

    /**
     * @brief Submit a task for execution
     *
     * If the pool is stopped or the target queue is full the task runs on
     * the calling thread, so the returned future is always satisfied.
     */
    template <typename F>
    [[nodiscard]] auto submit(F&& f) -> std::future<std::invoke_result_t<F>>;

    /**
     * @brief Submit a task only if the pool can accept it
     * @return Future, or std::nullopt when rejected
     */
    template <typename F>
    [[nodiscard]] auto try_submit(F&& f)
        -> std::optional<std::future<std::invoke_result_t<F>>>;

    /**
     * @brief Submit a task without a result
     *
     * Exceptions escaping @p task are counted in total_failed and logged.
     *
     * @return true if queued, false if rejected
     */
    bool post(task_fn task);

    // -------------------------------------------------------------------------
    // Status
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] size_t pending_tasks() const noexcept;
    [[nodiscard]] size_t active_tasks() const noexcept;

    [[nodiscard]] const thread_pool_statistics& statistics() const noexcept;
    void reset_statistics();

    [[nodiscard]] const thread_pool_config& config() const noexcept;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

// =============================================================================
// Template Implementations
// =============================================================================

template <typename F>
auto thread_pool_manager::submit(F&& f)
    -> std::future<std::invoke_result_t<F>> {
    using return_type = std::invoke_result_t<F>;

    auto task =
        std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    auto future = task->get_future();

    if (!post([task]() { (*task)(); })) {
        (*task)();
    }

    return future;
}

template <typename F>
auto thread_pool_manager::try_submit(F&& f)
    -> std::optional<std::future<std::invoke_result_t<F>>> {
    using return_type = std::invoke_result_t<F>;

    auto task =
        std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    auto future = task->get_future();

    if (!post([task]() { (*task)(); })) {
        return std::nullopt;
    }

    return future;
}

}  // namespace biz::dedup::performance

#endif  // BIZ_DEDUP_PERFORMANCE_THREAD_POOL_MANAGER_H
