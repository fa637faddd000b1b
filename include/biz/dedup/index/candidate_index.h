#ifndef BIZ_DEDUP_INDEX_CANDIDATE_INDEX_H
#define BIZ_DEDUP_INDEX_CANDIDATE_INDEX_H

/**
 * @file candidate_index.h
 * @brief Blocking index that narrows comparisons to plausible candidates
 *
 * Records are indexed under coarse blocking keys derived from their
 * normalized fields. A query returns the union of ids sharing at least
 * one key with the query record, so only those need a full comparison.
 *
 * Key families:
 *   - strong: business number, phone (last digits), e-mail, website host
 *   - medium: canonical name, sorted name tokens
 *   - weak:   phonetic name key, name prefix, name initials, e-mail
 *             domain, postal code, industry tag
 *
 * Weak blocks grow with the corpus ("every record at example.com"); a
 * weak block larger than index_config::max_block_size is skipped at
 * query time and counted in the statistics.
 *
 * Concurrency: keys are spread over independently locked shards, so
 * writers touching different keys never contend. Queries take shared
 * locks per shard and may miss a write that is still in flight.
 */

#include "biz/dedup/normalize/field_normalizer.h"
#include "biz/dedup/normalize/normalization_rules.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace biz::dedup::index {

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Candidate index configuration
 */
struct index_config {
    /** Number of lock shards for keys and for ids */
    size_t shard_count = 64;

    /** Weak blocks with more members than this are skipped at query time */
    size_t max_block_size = 250;

    /** Trailing phone digits used as the phone key */
    size_t phone_key_digits = 7;

    /** Characters of the canonical name used as the prefix key */
    size_t name_prefix_length = 6;

    [[nodiscard]] bool is_valid() const noexcept {
        return shard_count > 0 && max_block_size > 0 &&
               phone_key_digits > 0 && name_prefix_length > 0;
    }
};

// =============================================================================
// Blocking Keys
// =============================================================================

/**
 * @brief How selective a blocking key is
 */
enum class key_strength { strong, medium, weak };

[[nodiscard]] constexpr const char* to_string(key_strength s) noexcept {
    switch (s) {
        case key_strength::strong:
            return "strong";
        case key_strength::medium:
            return "medium";
        case key_strength::weak:
            return "weak";
        default:
            return "unknown";
    }
}

/**
 * @brief A blocking key such as "ph:1234567" or "nm:acme widgets"
 */
struct index_key {
    std::string value;
    key_strength strength = key_strength::weak;

    bool operator==(const index_key&) const = default;
};

/**
 * @brief Derive the blocking keys of a normalized record
 *
 * Keys are returned without duplicates, in a fixed family order.
 */
[[nodiscard]] std::vector<index_key> blocking_keys(
    const normalize::normalized_record& record,
    const normalize::normalization_rules& rules, const index_config& config);

// =============================================================================
// Candidate Index
// =============================================================================

/**
 * @brief Thread-safe sharded blocking index
 *
 * @example
 * ```cpp
 * field_normalizer normalizer;
 * candidate_index index;
 *
 * for (const auto& rec : store.list()) {
 *     index.index(normalizer.normalize(rec));
 * }
 * auto ids = index.candidates(normalizer.normalize(query));
 * ```
 */
class candidate_index {
public:
    explicit candidate_index(
        const index_config& config = {},
        normalize::normalization_rules rules =
            normalize::normalization_rules::defaults());

    ~candidate_index();

    candidate_index(const candidate_index&) = delete;
    candidate_index& operator=(const candidate_index&) = delete;
    candidate_index(candidate_index&&) noexcept;
    candidate_index& operator=(candidate_index&&) noexcept;

    // -------------------------------------------------------------------------
    // Maintenance
    // -------------------------------------------------------------------------

    /**
     * @brief Add or re-index a record
     *
     * Idempotent for the same id and fields. Re-indexing an id with
     * changed fields moves it from its old keys to its new keys.
     * Records without an id are ignored.
     */
    void index(const normalize::normalized_record& record);

    /**
     * @brief Remove a record from every key
     * @return true if the id was indexed
     */
    bool remove(const std::string& id);

    /**
     * @brief Remove every record
     */
    void clear();

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    /**
     * @brief Ids sharing at least one blocking key with the record
     *
     * The record's own id is excluded. Returns an empty list, not an
     * error, for a record without comparable fields.
     *
     * @return Sorted, de-duplicated ids
     */
    [[nodiscard]] std::vector<std::string> candidates(
        const normalize::normalized_record& record) const;

    [[nodiscard]] bool contains(const std::string& id) const;

    /**
     * @brief Number of indexed records
     */
    [[nodiscard]] size_t size() const;

    /**
     * @brief Number of distinct non-empty keys
     */
    [[nodiscard]] size_t key_count() const;

    [[nodiscard]] const index_config& config() const noexcept;

    // -------------------------------------------------------------------------
    // Statistics
    // -------------------------------------------------------------------------

    /**
     * @brief Index statistics
     */
    struct statistics {
        /** index() calls that stored a record */
        size_t index_count = 0;

        /** remove() calls that found the record */
        size_t remove_count = 0;

        /** candidates() calls */
        size_t lookup_count = 0;

        /** Keys probed by candidates() */
        size_t keys_probed = 0;

        /** Weak blocks skipped for exceeding max_block_size */
        size_t oversized_blocks_skipped = 0;

        /** Candidate ids returned in total */
        size_t candidates_returned = 0;

        /**
         * @brief Average candidates per lookup
         */
        [[nodiscard]] double average_candidates() const noexcept {
            if (lookup_count == 0) return 0.0;
            return static_cast<double>(candidates_returned) /
                   static_cast<double>(lookup_count);
        }
    };

    [[nodiscard]] statistics get_statistics() const;

    void reset_statistics();

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace biz::dedup::index

#endif  // BIZ_DEDUP_INDEX_CANDIDATE_INDEX_H
