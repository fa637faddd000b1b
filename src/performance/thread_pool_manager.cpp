/**
 * @file thread_pool_manager.cpp
 * @brief Implementation of the work-stealing worker pool
 */

#include "biz/dedup/performance/thread_pool_manager.h"

#include "biz/dedup/integration/logger_adapter.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <format>
#include <iterator>
#include <mutex>
#include <random>
#include <system_error>
#include <thread>
#include <vector>

namespace biz::dedup::performance {

// =============================================================================
// Thread Pool Manager Implementation
// =============================================================================

struct thread_pool_manager::impl {
    thread_pool_config config;
    thread_pool_statistics stats;

    std::vector<std::thread> workers;
    std::vector<std::deque<task_fn>> task_queues;
    mutable std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::atomic<bool> running{false};
    bool stopping = false;
    bool draining = true;
    size_t next_queue = 0;

    explicit impl(const thread_pool_config& cfg) : config(cfg) {
        size_t hardware = std::thread::hardware_concurrency();
        if (hardware == 0) {
            hardware = 4;
        }
        if (config.max_threads == 0) {
            config.max_threads = hardware;
        }
        if (config.min_threads == 0) {
            config.min_threads = hardware;
        }
        if (config.min_threads > config.max_threads) {
            config.min_threads = config.max_threads;
        }
        if (config.queue_capacity == 0) {
            config.queue_capacity = 1;
        }
    }

    ~impl() {
        if (running.load()) {
            (void)stop(true);
        }
    }

    std::expected<void, performance_error> start() {
        if (running.exchange(true)) {
            return std::unexpected(performance_error::already_running);
        }

        {
            std::lock_guard lock(queue_mutex);
            stopping = false;
            draining = true;
            task_queues.assign(config.min_threads, {});
        }

        try {
            workers.reserve(config.min_threads);
            for (size_t i = 0; i < config.min_threads; ++i) {
                workers.emplace_back([this, i] { worker_loop(i); });
            }
        } catch (const std::system_error& e) {
            integration::get_logger().error(std::format(
                "{}: failed to start worker thread: {}",
                config.thread_name_prefix, e.what()));
            (void)stop(false);
            return std::unexpected(performance_error::thread_pool_init_failed);
        }

        stats.total_threads.store(workers.size(), std::memory_order_relaxed);
        return {};
    }

    std::expected<void, performance_error> stop(bool drain) {
        if (!running.load()) {
            return std::unexpected(performance_error::not_initialized);
        }

        {
            std::lock_guard lock(queue_mutex);
            stopping = true;
            draining = drain;
        }
        queue_cv.notify_all();

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }

        std::deque<task_fn> discarded;
        {
            std::lock_guard lock(queue_mutex);
            for (auto& queue : task_queues) {
                std::move(queue.begin(), queue.end(),
                          std::back_inserter(discarded));
            }
            task_queues.clear();
            stats.queued_tasks.store(0, std::memory_order_relaxed);
        }
        // Destroying discarded packaged tasks breaks their promises
        discarded.clear();

        workers.clear();
        stats.total_threads.store(0, std::memory_order_relaxed);
        running.store(false);
        return {};
    }

    bool has_work_locked() const {
        return std::any_of(task_queues.begin(), task_queues.end(),
                           [](const auto& q) { return !q.empty(); });
    }

    std::optional<task_fn> take_locked(size_t worker_id, std::mt19937& rng) {
        auto& own = task_queues[worker_id];
        if (!own.empty()) {
            auto task = std::move(own.front());
            own.pop_front();
            stats.queued_tasks.fetch_sub(1, std::memory_order_relaxed);
            return task;
        }

        if (!config.enable_work_stealing || task_queues.size() <= 1) {
            return std::nullopt;
        }

        // Sweep the other queues starting from a random victim
        std::uniform_int_distribution<size_t> dist(0, task_queues.size() - 1);
        size_t start = dist(rng);
        for (size_t n = 0; n < task_queues.size(); ++n) {
            size_t victim = (start + n) % task_queues.size();
            if (victim == worker_id || task_queues[victim].empty()) continue;

            auto task = std::move(task_queues[victim].back());
            task_queues[victim].pop_back();
            stats.queued_tasks.fetch_sub(1, std::memory_order_relaxed);
            stats.work_stolen.fetch_add(1, std::memory_order_relaxed);
            return task;
        }

        return std::nullopt;
    }

    void worker_loop(size_t worker_id) {
        std::mt19937 rng(static_cast<std::mt19937::result_type>(
            std::hash<std::thread::id>{}(std::this_thread::get_id())));

        while (true) {
            std::optional<task_fn> task;
            {
                std::unique_lock lock(queue_mutex);
                queue_cv.wait(lock, [this, worker_id] {
                    if (stopping) return true;
                    if (!task_queues[worker_id].empty()) return true;
                    return config.enable_work_stealing && has_work_locked();
                });

                if (stopping && !draining) {
                    return;
                }

                task = take_locked(worker_id, rng);
                if (!task) {
                    if (stopping) {
                        return;
                    }
                    continue;
                }
            }

            run_task(*task);
        }
    }

    void run_task(task_fn& task) {
        stats.active_threads.fetch_add(1, std::memory_order_relaxed);
        auto start = std::chrono::steady_clock::now();

        try {
            task();
        } catch (const std::exception& e) {
            stats.total_failed.fetch_add(1, std::memory_order_relaxed);
            integration::get_logger().error(
                std::format("{}: task failed: {}", config.thread_name_prefix,
                            e.what()));
        }

        auto duration_us = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start)
                .count());

        stats.total_completed.fetch_add(1, std::memory_order_relaxed);
        stats.active_threads.fetch_sub(1, std::memory_order_relaxed);

        // Exponential moving average with 1/8 weight
        auto current_avg =
            stats.avg_task_duration_us.load(std::memory_order_relaxed);
        stats.avg_task_duration_us.store((current_avg * 7 + duration_us) / 8,
                                         std::memory_order_relaxed);

        auto peak = stats.peak_task_duration_us.load(std::memory_order_relaxed);
        while (duration_us > peak &&
               !stats.peak_task_duration_us.compare_exchange_weak(
                   peak, duration_us, std::memory_order_relaxed)) {
        }
    }

    bool post(task_fn task) {
        {
            std::lock_guard lock(queue_mutex);

            if (!running.load() || stopping || task_queues.empty()) {
                stats.total_rejected.fetch_add(1, std::memory_order_relaxed);
                return false;
            }

            size_t queue_id = next_queue++ % task_queues.size();
            if (task_queues[queue_id].size() >= config.queue_capacity) {
                stats.total_rejected.fetch_add(1, std::memory_order_relaxed);
                return false;
            }

            task_queues[queue_id].push_back(std::move(task));
            stats.total_submitted.fetch_add(1, std::memory_order_relaxed);

            size_t queued =
                stats.queued_tasks.fetch_add(1, std::memory_order_relaxed) + 1;
            size_t peak = stats.peak_queued.load(std::memory_order_relaxed);
            while (queued > peak &&
                   !stats.peak_queued.compare_exchange_weak(
                       peak, queued, std::memory_order_relaxed)) {
            }
        }

        if (config.enable_work_stealing) {
            queue_cv.notify_one();
        } else {
            // Only the owning worker can take the task
            queue_cv.notify_all();
        }
        return true;
    }
};

thread_pool_manager::thread_pool_manager(const thread_pool_config& config)
    : impl_(std::make_unique<impl>(config)) {}

thread_pool_manager::~thread_pool_manager() = default;

std::expected<void, performance_error> thread_pool_manager::start() {
    return impl_->start();
}

std::expected<void, performance_error> thread_pool_manager::stop(bool drain) {
    return impl_->stop(drain);
}

bool thread_pool_manager::is_running() const noexcept {
    return impl_->running.load(std::memory_order_relaxed);
}

bool thread_pool_manager::post(task_fn task) {
    return impl_->post(std::move(task));
}

size_t thread_pool_manager::thread_count() const noexcept {
    return impl_->stats.total_threads.load(std::memory_order_relaxed);
}

size_t thread_pool_manager::pending_tasks() const noexcept {
    return impl_->stats.queued_tasks.load(std::memory_order_relaxed);
}

size_t thread_pool_manager::active_tasks() const noexcept {
    return impl_->stats.active_threads.load(std::memory_order_relaxed);
}

const thread_pool_statistics& thread_pool_manager::statistics() const noexcept {
    return impl_->stats;
}

void thread_pool_manager::reset_statistics() {
    impl_->stats.reset();
}

const thread_pool_config& thread_pool_manager::config() const noexcept {
    return impl_->config;
}

}  // namespace biz::dedup::performance
