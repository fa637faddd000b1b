#ifndef BIZ_DEDUP_SIMILARITY_FIELD_SIMILARITY_H
#define BIZ_DEDUP_SIMILARITY_FIELD_SIMILARITY_H

/**
 * @file field_similarity.h
 * @brief Field-aware similarity scorers
 *
 * Scorers for identifier-class fields, addresses and industry tags. All
 * operate on normalized values and are symmetric.
 */

#include "biz/dedup/normalize/field_normalizer.h"
#include "biz/dedup/normalize/normalization_rules.h"

#include <optional>
#include <string_view>
#include <vector>

namespace biz::dedup::similarity {

// =============================================================================
// Name Scores
// =============================================================================

/**
 * @brief Name similarity broken down by algorithm
 */
struct name_scores {
    /** Edit-distance similarity, or abbreviation_score for initials */
    double string = 0.0;

    double phonetic = 0.0;
    double token = 0.0;

    /** Numeric tokens differ; string and phonetic are capped at token */
    bool numeric_mismatch = false;
};

/**
 * @brief Compute all name scores of two normalized names
 */
[[nodiscard]] name_scores compare_names(const normalize::normalized_name& a,
                                        const normalize::normalized_name& b);

// =============================================================================
// Identifier Fields
// =============================================================================

/**
 * @brief Exact equality of normalized values (1.0 or 0.0)
 */
[[nodiscard]] double exact_similarity(std::string_view a, std::string_view b);

/**
 * @brief Check whether two normalized phone numbers denote the same line
 *
 * Equal digit strings match. When exactly one side was written with a
 * country code, the other side matches if it equals the national part,
 * that is, the digits after a one to three digit country code, with at
 * least seven national digits.
 */
[[nodiscard]] bool same_phone(const normalize::normalized_phone& a,
                              const normalize::normalized_phone& b);

/**
 * @brief Phone similarity (1.0 or 0.0)
 */
[[nodiscard]] double phone_similarity(const normalize::normalized_phone& a,
                                      const normalize::normalized_phone& b);

/**
 * @brief E-mail similarity
 *
 * 1.0 for equal addresses. Different addresses on the same domain score
 * 0.5 + 0.5 * edit_similarity(local parts), unless the domain is a shared
 * mailbox provider, which scores 0.0.
 */
[[nodiscard]] double email_similarity(const normalize::normalized_email& a,
                                      const normalize::normalized_email& b,
                                      const normalize::normalization_rules& rules);

// =============================================================================
// Address
// =============================================================================

/**
 * @brief Address component weights
 */
struct address_weights {
    double street = 0.4;
    double city = 0.2;
    double province = 0.1;
    double postal_code = 0.3;
};

/**
 * @brief Address similarity
 *
 * Weighted average over components present on both sides: street by the
 * larger of token-set and edit similarity, city and province by exact
 * match, postal code 1.0 when equal and 0.5 when the first three
 * characters agree.
 *
 * @return std::nullopt when no component is present on both sides
 */
[[nodiscard]] std::optional<double> address_similarity(
    const normalize::normalized_address& a,
    const normalize::normalized_address& b, const address_weights& weights = {});

/**
 * @brief Postal code similarity (1.0, 0.5 for a shared 3-character prefix, 0.0)
 */
[[nodiscard]] double postal_code_similarity(std::string_view a,
                                            std::string_view b);

// =============================================================================
// Industry
// =============================================================================

/**
 * @brief Jaccard similarity of normalized industry tag sets
 */
[[nodiscard]] double industry_similarity(const std::vector<std::string>& a,
                                         const std::vector<std::string>& b);

}  // namespace biz::dedup::similarity

#endif  // BIZ_DEDUP_SIMILARITY_FIELD_SIMILARITY_H
