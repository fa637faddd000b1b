#ifndef BIZ_DEDUP_MATCH_MATCH_SCORER_H
#define BIZ_DEDUP_MATCH_MATCH_SCORER_H

/**
 * @file match_scorer.h
 * @brief Pairwise record comparison
 *
 * Combines per-field similarity into one overall score:
 *
 *   score = sum(weight[f] * s[f]) / sum(weight[f])
 *
 * over the fields present on both sides. A field below its per-field
 * threshold keeps its weight but contributes zero. Exact equality of a
 * strong identifier (business number, phone, e-mail address, website
 * host) is decisive: score 1.0 and high confidence, unless both records
 * carry business numbers that differ, which caps confidence at medium
 * and suggests manual review.
 *
 * When the external scorer is requested its value is blended in:
 *
 *   score = (1 - model_weight) * algorithmic + model_weight * model
 *
 * or used alone when "ml" is the only algorithm. Any scorer failure
 * falls back to the algorithmic score for that pair.
 */

#include "biz/dedup/match/dedup_options.h"
#include "biz/dedup/normalize/field_normalizer.h"
#include "biz/dedup/normalize/normalization_rules.h"
#include "biz/dedup/record/match_types.h"
#include "biz/dedup/similarity/pluggable_scorer.h"

#include <map>
#include <vector>

namespace biz::dedup::match {

// =============================================================================
// Scoring Configuration
// =============================================================================

/**
 * @brief Weights and cut-offs of the overall score
 */
struct scoring_config {
    /** Per-field weight; identifier fields dominate */
    std::map<record::business_field, double> weights = default_weights();

    /** Minimum score for high confidence */
    double high_confidence = 0.9;

    /** Minimum score for medium confidence */
    double medium_confidence = 0.7;

    /** Share of the external scorer in a blended score */
    double model_weight = 0.5;

    /** Minimum score for the merge suggestion */
    double auto_merge_threshold = 0.9;

    /**
     * @brief Weight of a field (0 when not configured)
     */
    [[nodiscard]] double weight_of(record::business_field field) const;

    /**
     * @brief Validate weights and cut-offs
     * @return Validation failures; empty when valid
     */
    [[nodiscard]] std::vector<validation_error_info> validate() const;

    [[nodiscard]] bool is_valid() const { return validate().empty(); }

    /**
     * @brief Default weights
     *
     * name 0.25, businessNumber 0.30, phone 0.15, email 0.10,
     * website 0.10, address 0.05, industry 0.05, description 0.05.
     */
    [[nodiscard]] static std::map<record::business_field, double>
    default_weights();
};

// =============================================================================
// Match Scorer
// =============================================================================

/**
 * @brief Compares prepared records
 *
 * Holds configuration only; compare() is safe to call concurrently.
 *
 * @example
 * ```cpp
 * field_normalizer normalizer;
 * match_scorer scorer;
 *
 * auto result = scorer.compare(normalizer.prepare(a), normalizer.prepare(b),
 *                              dedup_options{});
 * if (result.is_duplicate(0.8)) { ... }
 * ```
 */
class match_scorer {
public:
    explicit match_scorer(scoring_config config = {},
                          normalize::normalization_rules rules =
                              normalize::normalization_rules::defaults());

    /**
     * @brief Compare two prepared records
     *
     * Every checked field present on both sides appears in the details.
     * A field whose algorithm is not in options.algorithms is still
     * reported there but adds nothing to the overall score.
     *
     * @param a       Record being checked
     * @param b       Candidate; its id becomes result.candidate_id
     * @param options Validated options
     * @param model   External scorer, consulted only when requested
     * @param issues  Receives comparator and scorer failures
     */
    [[nodiscard]] record::match_result compare(
        const normalize::prepared_record& a,
        const normalize::prepared_record& b, const dedup_options& options,
        similarity::bounded_scorer* model = nullptr,
        std::vector<record::record_issue>* issues = nullptr) const;

    /**
     * @brief Confidence tier of a score
     */
    [[nodiscard]] record::match_confidence confidence_for(double score) const;

    [[nodiscard]] const scoring_config& config() const noexcept {
        return config_;
    }

private:
    scoring_config config_;
    normalize::normalization_rules rules_;
};

}  // namespace biz::dedup::match

#endif  // BIZ_DEDUP_MATCH_MATCH_SCORER_H
