#ifndef BIZ_DEDUP_RECORD_MATCH_TYPES_H
#define BIZ_DEDUP_RECORD_MATCH_TYPES_H

/**
 * @file match_types.h
 * @brief Match, cluster and merge result types
 *
 * Output types shared by the match scorer, the deduplication engine and
 * the merge strategies:
 *   - match_result: one pairwise comparison
 *   - duplicate_group: a transitive duplicate cluster from a batch
 *   - merged_record: a cluster collapsed into one record with provenance
 *   - record_issue: a per-record data-quality problem
 */

#include "biz/dedup/record/business_record.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace biz::dedup::record {

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Tiered confidence label of a match
 */
enum class match_confidence { high, medium, low };

[[nodiscard]] constexpr const char* to_string(match_confidence c) noexcept {
    switch (c) {
        case match_confidence::high:
            return "high";
        case match_confidence::medium:
            return "medium";
        case match_confidence::low:
            return "low";
        default:
            return "unknown";
    }
}

/**
 * @brief Similarity algorithm families
 */
enum class match_algorithm {
    /** Edit-distance similarity */
    string,

    /** Phonetic-code similarity */
    phonetic,

    /** Token-set similarity */
    token,

    /** Exact equality of normalized identifiers */
    field_exact,

    /** Weighted address component similarity */
    address,

    /** External model-based scorer */
    ml
};

[[nodiscard]] constexpr const char* to_string(match_algorithm a) noexcept {
    switch (a) {
        case match_algorithm::string:
            return "string";
        case match_algorithm::phonetic:
            return "phonetic";
        case match_algorithm::token:
            return "token";
        case match_algorithm::field_exact:
            return "field-exact";
        case match_algorithm::address:
            return "address";
        case match_algorithm::ml:
            return "ml";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse an algorithm name ("string", "field-exact", ...)
 */
[[nodiscard]] std::optional<match_algorithm> parse_algorithm(
    std::string_view name);

/**
 * @brief Action suggested for a matched pair
 */
enum class suggested_action {
    /** Score reached the auto-merge threshold */
    merge,

    /** A strong identifier disagrees; a human should decide */
    manual_review,

    /** Duplicate above threshold but not safe to merge automatically */
    mark_duplicate,

    /** Not a duplicate */
    keep_both
};

[[nodiscard]] constexpr const char* to_string(suggested_action a) noexcept {
    switch (a) {
        case suggested_action::merge:
            return "merge";
        case suggested_action::manual_review:
            return "manual_review";
        case suggested_action::mark_duplicate:
            return "mark_duplicate";
        case suggested_action::keep_both:
            return "keep_both";
        default:
            return "unknown";
    }
}

/**
 * @brief Merge strategy selector
 */
enum class merge_strategy_type {
    /** Keep the designated primary, fill its gaps from duplicates */
    preserve_primary,

    /** Pick every field from the highest quality member */
    quality,

    /** Computed primary, gap filling and union of set-valued fields */
    comprehensive
};

[[nodiscard]] constexpr const char* to_string(merge_strategy_type s) noexcept {
    switch (s) {
        case merge_strategy_type::preserve_primary:
            return "preservePrimary";
        case merge_strategy_type::quality:
            return "quality";
        case merge_strategy_type::comprehensive:
            return "comprehensive";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse a merge strategy name
 *
 * Accepts "preservePrimary", "preserve_primary", "quality" and
 * "comprehensive".
 */
[[nodiscard]] std::optional<merge_strategy_type> parse_merge_strategy(
    std::string_view name);

// =============================================================================
// Match Details
// =============================================================================

/**
 * @brief Per-field score breakdown of a comparison
 *
 * Only fields that carried data on both sides are present. A missing
 * entry means "not compared", never "scored zero".
 */
class match_details {
public:
    void set(business_field field, double score) { scores_[field] = score; }

    [[nodiscard]] std::optional<double> get(business_field field) const {
        auto it = scores_.find(field);
        if (it == scores_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] bool has(business_field field) const {
        return scores_.contains(field);
    }

    [[nodiscard]] size_t size() const noexcept { return scores_.size(); }
    [[nodiscard]] bool empty() const noexcept { return scores_.empty(); }

    [[nodiscard]] const std::map<business_field, double>& scores()
        const noexcept {
        return scores_;
    }

    [[nodiscard]] std::optional<double> name_match() const {
        return get(business_field::name);
    }
    [[nodiscard]] std::optional<double> business_number_match() const {
        return get(business_field::business_number);
    }
    [[nodiscard]] std::optional<double> phone_match() const {
        return get(business_field::phone);
    }
    [[nodiscard]] std::optional<double> email_match() const {
        return get(business_field::email);
    }
    [[nodiscard]] std::optional<double> website_match() const {
        return get(business_field::website);
    }
    [[nodiscard]] std::optional<double> address_match() const {
        return get(business_field::address);
    }
    [[nodiscard]] std::optional<double> industry_match() const {
        return get(business_field::industry);
    }

    bool operator==(const match_details&) const = default;

private:
    std::map<business_field, double> scores_;
};

// =============================================================================
// Match Result
// =============================================================================

/**
 * @brief Result of comparing a record against one candidate
 */
struct match_result {
    /** Identifier of the compared candidate */
    std::string candidate_id;

    /** Overall similarity in [0,1] */
    double score = 0.0;

    match_confidence confidence = match_confidence::low;

    /** Scorer that produced the decisive signal */
    match_algorithm algorithm = match_algorithm::string;

    match_details details;

    suggested_action action = suggested_action::keep_both;

    /** Both sides carry a business number and the numbers differ */
    bool conflicting_identifier = false;

    /** Score of the external model, when it was consulted successfully */
    std::optional<double> model_score;

    /** The model was requested but algorithmic scoring was used instead */
    bool scorer_fallback = false;

    /**
     * @brief Check if the result is at or above a threshold
     */
    [[nodiscard]] bool is_duplicate(double threshold) const noexcept {
        return score >= threshold;
    }
};

/**
 * @brief One edge of duplicate evidence between two records
 */
struct match_evidence {
    /** Record that was being checked */
    std::string source_id;

    /** Comparison result; result.candidate_id is the other record */
    match_result result;
};

// =============================================================================
// Record Issues
// =============================================================================

/**
 * @brief Kinds of data-quality problems reported per record
 */
enum class issue_kind {
    /** Record has no identifier; excluded */
    missing_id,

    /** Record has no name; excluded */
    missing_name,

    /** Identifier seen earlier in the same batch; excluded */
    duplicate_id,

    /** A field value is unusable and was dropped from comparison */
    invalid_value,

    /** Index returned an id the record store no longer resolves */
    stale_candidate,

    /** External scorer or custom comparator threw */
    scorer_failed,

    /** External scorer exceeded its time budget */
    scorer_timeout
};

[[nodiscard]] constexpr const char* to_string(issue_kind kind) noexcept {
    switch (kind) {
        case issue_kind::missing_id:
            return "missing_id";
        case issue_kind::missing_name:
            return "missing_name";
        case issue_kind::duplicate_id:
            return "duplicate_id";
        case issue_kind::invalid_value:
            return "invalid_value";
        case issue_kind::stale_candidate:
            return "stale_candidate";
        case issue_kind::scorer_failed:
            return "scorer_failed";
        case issue_kind::scorer_timeout:
            return "scorer_timeout";
        default:
            return "unknown";
    }
}

/**
 * @brief A data-quality issue attached to a call result
 */
struct record_issue {
    issue_kind kind = issue_kind::invalid_value;

    /** Identifier of the affected record, when it has one */
    std::string record_id;

    /** Position of the record in the batch input, when applicable */
    std::optional<size_t> input_index;

    /** Field the issue refers to, when applicable */
    std::optional<business_field> field;

    std::string message;

    /**
     * @brief Format as "kind [id] field: message"
     */
    [[nodiscard]] std::string to_string() const;
};

// =============================================================================
// Duplicate Group
// =============================================================================

/**
 * @brief A cluster of records judged to describe one business
 */
struct duplicate_group {
    /** Member identifiers in batch input order */
    std::vector<std::string> member_ids;

    /** Computed canonical representative */
    std::string canonical_id;

    /** Pairwise matches connecting the members */
    std::vector<match_evidence> evidence;

    [[nodiscard]] size_t size() const noexcept { return member_ids.size(); }

    [[nodiscard]] bool is_singleton() const noexcept {
        return member_ids.size() == 1;
    }
};

// =============================================================================
// Merged Record
// =============================================================================

/**
 * @brief A cluster collapsed into a single record
 */
struct merged_record {
    /** The merged record; carries the primary's id */
    business_record record;

    /** Which source record contributed each populated field */
    std::map<business_field, std::string> provenance;

    /**
     * Source record of each populated address component, keyed
     * "street", "city", "province" and "postalCode". Components may come
     * from different members.
     */
    std::map<std::string, std::string> address_provenance;

    /** Identifiers of every cluster member, primary first */
    std::vector<std::string> merged_from;

    merge_strategy_type strategy = merge_strategy_type::preserve_primary;

    /**
     * @brief Get the source id of a field, if the field is populated
     */
    [[nodiscard]] std::optional<std::string> source_of(
        business_field field) const {
        auto it = provenance.find(field);
        if (it == provenance.end()) return std::nullopt;
        return it->second;
    }
};

}  // namespace biz::dedup::record

#endif  // BIZ_DEDUP_RECORD_MATCH_TYPES_H
