#ifndef BIZ_DEDUP_SIMILARITY_PLUGGABLE_SCORER_H
#define BIZ_DEDUP_SIMILARITY_PLUGGABLE_SCORER_H

/**
 * @file pluggable_scorer.h
 * @brief External similarity scorer interface
 *
 * The engine can blend the output of an external, typically model-based,
 * scorer into its algorithmic score ("deep check"). The scorer is opaque:
 * it receives read-only snapshots of both records, including description
 * and industry tags, and returns a value in [0,1].
 *
 * Calls are isolated on a dedicated worker pool and bounded by a timeout
 * so that one slow invocation cannot stall a batch. Every outcome other
 * than a valid score makes the caller fall back to algorithmic scoring.
 *
 * Example usage:
 * @code
 *     auto model = make_scorer("embedding", [](const business_record& a,
 *                                             const business_record& b) {
 *         return embedding_cosine(a, b);
 *     });
 *
 *     bounded_scorer bounded(model, 2, std::chrono::milliseconds{200});
 *     auto outcome = bounded.evaluate(a, b);
 *     if (outcome.status == scorer_status::ok) {
 *         use(*outcome.score);
 *     }
 * @endcode
 */

#include "biz/dedup/performance/thread_pool_manager.h"
#include "biz/dedup/record/business_record.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace biz::dedup::similarity {

// =============================================================================
// Scorer Interface
// =============================================================================

/**
 * @brief External pairwise similarity scorer
 *
 * Implementations must be safe to call concurrently.
 */
class similarity_scorer {
public:
    virtual ~similarity_scorer() = default;

    /**
     * @brief Score two records
     * @return Similarity in [0,1]; values outside that range are treated
     *         as a failure
     */
    [[nodiscard]] virtual double score(const record::business_record& a,
                                       const record::business_record& b) = 0;

    /**
     * @brief Scorer name for logging
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Scorer backed by a callable
 */
class function_scorer final : public similarity_scorer {
public:
    using score_fn = std::function<double(const record::business_record&,
                                          const record::business_record&)>;

    function_scorer(std::string name, score_fn fn);

    [[nodiscard]] double score(const record::business_record& a,
                               const record::business_record& b) override;

    [[nodiscard]] std::string_view name() const noexcept override;

private:
    std::string name_;
    score_fn fn_;
};

/**
 * @brief Create a scorer from a callable
 */
[[nodiscard]] std::shared_ptr<similarity_scorer> make_scorer(
    std::string name, function_scorer::score_fn fn);

// =============================================================================
// Bounded Evaluation
// =============================================================================

/**
 * @brief Outcome class of a scorer call
 */
enum class scorer_status {
    /** Valid score available */
    ok,

    /** No scorer configured, or the scorer pool rejected the call */
    unavailable,

    /** Scorer threw or returned a value outside [0,1] */
    failed,

    /** Scorer did not answer within the timeout */
    timed_out
};

[[nodiscard]] constexpr const char* to_string(scorer_status status) noexcept {
    switch (status) {
        case scorer_status::ok:
            return "ok";
        case scorer_status::unavailable:
            return "unavailable";
        case scorer_status::failed:
            return "failed";
        case scorer_status::timed_out:
            return "timed_out";
        default:
            return "unknown";
    }
}

/**
 * @brief Result of one bounded scorer call
 */
struct scorer_outcome {
    scorer_status status = scorer_status::unavailable;

    /** Score, set only when status is ok */
    std::optional<double> score;

    /** Failure description for logs and record issues */
    std::string message;
};

/**
 * @brief Bounded scorer statistics
 */
struct bounded_scorer_statistics {
    std::atomic<uint64_t> calls{0};
    std::atomic<uint64_t> succeeded{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> timed_out{0};
    std::atomic<uint64_t> rejected{0};
};

/**
 * @brief Runs an external scorer on its own pool with a timeout
 *
 * A call that times out keeps running in the background on the scorer
 * pool; its result is discarded. Both records are copied into the task,
 * so the caller's records may go out of scope immediately.
 */
class bounded_scorer {
public:
    /**
     * @param scorer  Scorer to call; may be null (every call is unavailable)
     * @param threads Scorer pool size
     * @param timeout Per-call time budget
     */
    bounded_scorer(std::shared_ptr<similarity_scorer> scorer, size_t threads,
                   std::chrono::milliseconds timeout);

    ~bounded_scorer();

    bounded_scorer(const bounded_scorer&) = delete;
    bounded_scorer& operator=(const bounded_scorer&) = delete;
    bounded_scorer(bounded_scorer&&) = delete;
    bounded_scorer& operator=(bounded_scorer&&) = delete;

    /**
     * @brief Score a pair within the time budget
     */
    [[nodiscard]] scorer_outcome evaluate(const record::business_record& a,
                                          const record::business_record& b);

    [[nodiscard]] bool available() const noexcept;

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept;

    [[nodiscard]] const bounded_scorer_statistics& statistics() const noexcept;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace biz::dedup::similarity

#endif  // BIZ_DEDUP_SIMILARITY_PLUGGABLE_SCORER_H
