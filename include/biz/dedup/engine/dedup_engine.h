#ifndef BIZ_DEDUP_ENGINE_DEDUP_ENGINE_H
#define BIZ_DEDUP_ENGINE_DEDUP_ENGINE_H

/**
 * @file dedup_engine.h
 * @brief Business deduplication engine
 *
 * Public entry point of the library. The engine normalizes incoming
 * records, narrows the comparison set through the candidate index, scores
 * each pair with the match scorer (optionally blending an external model)
 * and groups or merges the results.
 *
 * The candidate index is the only state shared between calls. Every call
 * works on copies of the records it is given or reads from the store.
 */

#include "biz/dedup/config/engine_config.h"
#include "biz/dedup/engine/record_store.h"
#include "biz/dedup/index/candidate_index.h"
#include "biz/dedup/match/dedup_options.h"
#include "biz/dedup/record/business_record.h"
#include "biz/dedup/record/match_types.h"
#include "biz/dedup/similarity/pluggable_scorer.h"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace biz::dedup::engine {

// =============================================================================
// Call Results
// =============================================================================

/**
 * @brief Result of a single-record duplicate search
 */
struct find_result {
    /** Matches at or above the threshold, best first */
    std::vector<record::match_result> duplicates;

    /** Effective options the search ran with */
    match::dedup_options options;

    /** Data-quality problems met while searching */
    std::vector<record::record_issue> issues;

    /** Number of candidates the index returned */
    size_t candidates_examined = 0;
};

/**
 * @brief Result of a batch deduplication
 *
 * Invariants: unique_businesses == groups.size() and
 * duplicates_found == total_processed - unique_businesses. Every record
 * counted in total_processed appears in exactly one group.
 */
struct batch_result {
    /** Records that entered comparison */
    size_t total_processed = 0;

    /** Records folded into another record's group */
    size_t duplicates_found = 0;

    /** Distinct businesses (one per group) */
    size_t unique_businesses = 0;

    /** Records excluded for data-quality reasons */
    size_t skipped = 0;

    /** Groups ordered by their first member's input position */
    std::vector<record::duplicate_group> groups;

    /** One merged record per multi-member group (auto-merge only) */
    std::vector<record::merged_record> merged;

    /** Matches against records that were already indexed */
    std::vector<record::match_evidence> existing_matches;

    std::vector<record::record_issue> issues;

    std::chrono::milliseconds duration{0};
};

// =============================================================================
// Observers
// =============================================================================

/**
 * @brief Progress snapshot reported after each batch chunk
 */
struct batch_progress {
    size_t processed = 0;
    size_t total = 0;

    /** Pairwise matches found so far */
    size_t matches_found = 0;
};

using progress_callback = std::function<void(const batch_progress&)>;

/** Called once per pairwise match found inside a batch */
using duplicate_callback = std::function<void(const record::match_evidence&)>;

// =============================================================================
// Statistics
// =============================================================================

/**
 * @brief Snapshot of engine counters
 */
struct engine_statistics {
    uint64_t comparisons = 0;
    uint64_t duplicates_found = 0;
    uint64_t merges_completed = 0;
    uint64_t batches_processed = 0;
    uint64_t records_skipped = 0;
    uint64_t scorer_calls = 0;
    uint64_t scorer_fallbacks = 0;
    uint64_t stale_candidates = 0;
    size_t indexed_records = 0;
};

// =============================================================================
// Deduplication Engine
// =============================================================================

/**
 * @brief Detects, groups and merges duplicate business records
 *
 * Thread-safe: find_duplicates(), deduplicate_batch() and the index
 * maintenance calls may run concurrently. A lookup that races an index
 * write may miss the record being written.
 *
 * @example Single Record Search
 * ```cpp
 * auto store = std::make_shared<in_memory_record_store>(existing);
 * dedup_engine engine(store);
 * engine.rebuild_index();
 *
 * match::dedup_options options;
 * options.threshold = 0.85;
 *
 * auto result = engine.find_duplicates(candidate, options);
 * if (!result) {
 *     // options were rejected; result.error() says why
 * }
 * for (const auto& match : result->duplicates) {
 *     std::cout << match.candidate_id << " " << match.score << "\n";
 * }
 * ```
 *
 * @example Batch With Auto-Merge
 * ```cpp
 * match::dedup_options options;
 * options.auto_merge = true;
 * options.merge_strategy = record::merge_strategy_type::quality;
 *
 * auto batch = engine.deduplicate_batch(records, options);
 * for (const auto& merged : batch->merged) {
 *     save(merged.record);
 * }
 * ```
 */
class dedup_engine {
public:
    /**
     * @brief Construct an engine over a record store
     *
     * @param store Record store used to resolve index candidates
     * @param config Engine configuration
     * @param scorer Optional external model scorer for deep checks
     */
    explicit dedup_engine(std::shared_ptr<record_store> store,
                          config::engine_config config = {},
                          std::shared_ptr<similarity::similarity_scorer>
                              scorer = nullptr);

    ~dedup_engine();

    dedup_engine(const dedup_engine&) = delete;
    dedup_engine& operator=(const dedup_engine&) = delete;
    dedup_engine(dedup_engine&&) = delete;
    dedup_engine& operator=(dedup_engine&&) = delete;

    // =========================================================================
    // Index Maintenance
    // =========================================================================

    /**
     * @brief Re-index every record listed by the store
     * @return Number of records indexed
     */
    size_t rebuild_index();

    /**
     * @brief Add or refresh one record in the index
     * @return false if the record has no id or no name
     */
    bool index(const record::business_record& record);

    /**
     * @brief Remove a record from the index
     */
    bool remove(const std::string& id);

    [[nodiscard]] const index::candidate_index& candidates() const noexcept;

    // =========================================================================
    // Duplicate Detection
    // =========================================================================

    /**
     * @brief Find indexed records that duplicate the given record
     *
     * @return Matches sorted by descending score (ties by id), or the
     *         validation error of the options
     */
    [[nodiscard]] std::expected<find_result, match::dedup_error>
    find_duplicates(const record::business_record& record,
                    const match::dedup_options& options) const;

    /**
     * @brief Find duplicates using the configured default options
     */
    [[nodiscard]] std::expected<find_result, match::dedup_error>
    find_duplicates(const record::business_record& record) const;

    /**
     * @brief Group a set of records into duplicate clusters
     *
     * Records are processed in chunks of options.batch_size. Each record
     * is compared with the records before it in the batch and with the
     * shared index. Clusters are the transitive closure of the pairwise
     * matches. Group order, member order and merge results depend only
     * on the input order, never on thread scheduling.
     *
     * The shared index is not modified.
     */
    [[nodiscard]] std::expected<batch_result, match::dedup_error>
    deduplicate_batch(const std::vector<record::business_record>& records,
                      const match::dedup_options& options) const;

    [[nodiscard]] std::expected<batch_result, match::dedup_error>
    deduplicate_batch(const std::vector<record::business_record>& records) const;

    // =========================================================================
    // Merging
    // =========================================================================

    /**
     * @brief Collapse a primary record and its duplicates into one record
     *
     * @return Merged record, or empty_cluster when the primary has no id
     */
    [[nodiscard]] std::expected<record::merged_record, match::dedup_error>
    merge_businesses(const record::business_record& primary,
                     const std::vector<record::business_record>& duplicates,
                     record::merge_strategy_type strategy =
                         record::merge_strategy_type::comprehensive) const;

    /**
     * @brief Merge with caller-supplied option values
     *
     * Honors "mergeStrategy" and "preservePrimary".
     */
    [[nodiscard]] std::expected<record::merged_record, match::dedup_error>
    merge_businesses(const record::business_record& primary,
                     const std::vector<record::business_record>& duplicates,
                     const match::option_values& values) const;

    // =========================================================================
    // Scorer and Observers
    // =========================================================================

    /**
     * @brief Replace (or with nullptr, remove) the external scorer
     */
    void set_scorer(std::shared_ptr<similarity::similarity_scorer> scorer);

    [[nodiscard]] bool has_scorer() const;

    void set_progress_callback(progress_callback callback);
    void set_duplicate_callback(duplicate_callback callback);

    // =========================================================================
    // Introspection
    // =========================================================================

    [[nodiscard]] engine_statistics statistics() const;
    void reset_statistics();

    [[nodiscard]] const config::engine_config& config() const noexcept;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace biz::dedup::engine

#endif  // BIZ_DEDUP_ENGINE_DEDUP_ENGINE_H
