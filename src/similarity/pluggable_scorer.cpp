/**
 * @file pluggable_scorer.cpp
 * @brief External scorer wrapper and bounded evaluation
 */

#include "biz/dedup/similarity/pluggable_scorer.h"

#include "biz/dedup/integration/logger_adapter.h"

#include <cmath>
#include <exception>
#include <format>
#include <future>
#include <utility>

namespace biz::dedup::similarity {

// =============================================================================
// Function Scorer
// =============================================================================

function_scorer::function_scorer(std::string name, score_fn fn)
    : name_(std::move(name)), fn_(std::move(fn)) {}

double function_scorer::score(const record::business_record& a,
                              const record::business_record& b) {
    return fn_(a, b);
}

std::string_view function_scorer::name() const noexcept { return name_; }

std::shared_ptr<similarity_scorer> make_scorer(std::string name,
                                               function_scorer::score_fn fn) {
    if (!fn) return nullptr;
    return std::make_shared<function_scorer>(std::move(name), std::move(fn));
}

// =============================================================================
// Bounded Scorer Implementation
// =============================================================================

struct bounded_scorer::impl {
    std::shared_ptr<similarity_scorer> scorer;
    std::chrono::milliseconds timeout;
    std::unique_ptr<performance::thread_pool_manager> pool;
    bounded_scorer_statistics stats;

    impl(std::shared_ptr<similarity_scorer> s, size_t threads,
         std::chrono::milliseconds t)
        : scorer(std::move(s)), timeout(t) {
        if (!scorer) return;

        pool = std::make_unique<performance::thread_pool_manager>(
            performance::thread_pool_config::for_scorer(threads));
        if (auto started = pool->start(); !started) {
            integration::get_logger().warning(std::format(
                "scorer '{}': pool failed to start ({}); deep check disabled",
                scorer->name(), performance::to_string(started.error())));
            pool.reset();
        }
    }

    ~impl() {
        if (pool) {
            (void)pool->stop(false);
        }
    }

    scorer_outcome evaluate(const record::business_record& a,
                            const record::business_record& b) {
        scorer_outcome outcome;
        if (!scorer || !pool) {
            outcome.message = "no scorer configured";
            return outcome;
        }

        stats.calls.fetch_add(1, std::memory_order_relaxed);

        auto left = std::make_shared<const record::business_record>(a);
        auto right = std::make_shared<const record::business_record>(b);
        auto model = scorer;

        auto future = pool->try_submit(
            [model, left, right]() { return model->score(*left, *right); });
        if (!future) {
            stats.rejected.fetch_add(1, std::memory_order_relaxed);
            outcome.status = scorer_status::unavailable;
            outcome.message = "scorer queue full";
            return outcome;
        }

        if (future->wait_for(timeout) != std::future_status::ready) {
            stats.timed_out.fetch_add(1, std::memory_order_relaxed);
            outcome.status = scorer_status::timed_out;
            outcome.message =
                std::format("scorer '{}' exceeded {} ms", scorer->name(),
                            timeout.count());
            return outcome;
        }

        try {
            double value = future->get();
            if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
                stats.failed.fetch_add(1, std::memory_order_relaxed);
                outcome.status = scorer_status::failed;
                outcome.message = std::format(
                    "scorer '{}' returned out-of-range value {}",
                    scorer->name(), value);
                return outcome;
            }
            stats.succeeded.fetch_add(1, std::memory_order_relaxed);
            outcome.status = scorer_status::ok;
            outcome.score = value;
        } catch (const std::future_error& e) {
            stats.failed.fetch_add(1, std::memory_order_relaxed);
            outcome.status = scorer_status::failed;
            outcome.message =
                std::format("scorer '{}' was abandoned: {}", scorer->name(),
                            e.what());
        } catch (const std::exception& e) {
            stats.failed.fetch_add(1, std::memory_order_relaxed);
            outcome.status = scorer_status::failed;
            outcome.message =
                std::format("scorer '{}' threw: {}", scorer->name(), e.what());
        }
        return outcome;
    }
};

// =============================================================================
// Bounded Scorer
// =============================================================================

bounded_scorer::bounded_scorer(std::shared_ptr<similarity_scorer> scorer,
                               size_t threads,
                               std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(std::move(scorer), threads, timeout)) {}

bounded_scorer::~bounded_scorer() = default;

scorer_outcome bounded_scorer::evaluate(const record::business_record& a,
                                        const record::business_record& b) {
    return impl_->evaluate(a, b);
}

bool bounded_scorer::available() const noexcept {
    return impl_->scorer != nullptr && impl_->pool != nullptr;
}

std::chrono::milliseconds bounded_scorer::timeout() const noexcept {
    return impl_->timeout;
}

const bounded_scorer_statistics& bounded_scorer::statistics() const noexcept {
    return impl_->stats;
}

}  // namespace biz::dedup::similarity
