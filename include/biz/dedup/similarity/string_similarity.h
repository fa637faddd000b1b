#ifndef BIZ_DEDUP_SIMILARITY_STRING_SIMILARITY_H
#define BIZ_DEDUP_SIMILARITY_STRING_SIMILARITY_H

/**
 * @file string_similarity.h
 * @brief String, phonetic and token similarity algorithms
 *
 * Every scorer is a pure, symmetric function returning a value in [0,1]:
 * 1.0 for identical non-empty input and 0.0 when either side is empty.
 * Inputs are expected to be normalized already (see field_normalizer).
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace biz::dedup::similarity {

// =============================================================================
// Edit Distance
// =============================================================================

/**
 * @brief Levenshtein distance (insert, delete, substitute; unit costs)
 */
[[nodiscard]] size_t levenshtein_distance(std::string_view a,
                                          std::string_view b);

/**
 * @brief Edit-distance similarity: 1 - distance / max(|a|, |b|)
 */
[[nodiscard]] double edit_similarity(std::string_view a, std::string_view b);

// =============================================================================
// Phonetic Encoding
// =============================================================================

/**
 * @brief American Soundex code of one word
 *
 * Letters are coded as usual (first letter kept, H and W transparent,
 * vowels separate repeated codes, padded to four characters). A word
 * without letters is returned unchanged so that numbers keep their
 * identity ("50" stays "50").
 */
[[nodiscard]] std::string soundex(std::string_view word);

/**
 * @brief Soundex codes of each token, in token order
 */
[[nodiscard]] std::vector<std::string> phonetic_codes(
    const std::vector<std::string>& tokens);

/**
 * @brief Order-independent phonetic key of a token list
 *
 * Sorted Soundex codes joined by spaces; used for blocking.
 */
[[nodiscard]] std::string phonetic_key(const std::vector<std::string>& tokens);

/**
 * @brief Phonetic similarity of two token lists
 *
 * 1.0 when the multisets of Soundex codes are equal, otherwise
 * 0.8 times the multiset Jaccard similarity of the codes.
 */
[[nodiscard]] double phonetic_similarity(const std::vector<std::string>& a,
                                         const std::vector<std::string>& b);

// =============================================================================
// Token Similarity
// =============================================================================

/**
 * @brief Multiset Jaccard similarity of two token lists
 *
 * sum(min(count_a, count_b)) / sum(max(count_a, count_b)); word order is
 * ignored.
 */
[[nodiscard]] double token_set_similarity(const std::vector<std::string>& a,
                                          const std::vector<std::string>& b);

/**
 * @brief Check whether two token lists carry the same numeric tokens
 *
 * Names that differ only in a number ("Unit 5" / "Unit 50") are distinct
 * businesses; callers use this to keep edit and phonetic scores from
 * treating the numbers as typos.
 */
[[nodiscard]] bool same_numeric_tokens(const std::vector<std::string>& a,
                                       const std::vector<std::string>& b);

// =============================================================================
// Abbreviations
// =============================================================================

/**
 * @brief Initials of a token list ("international business machines" -> "ibm")
 */
[[nodiscard]] std::string initials(const std::vector<std::string>& tokens);

/**
 * @brief Check whether one name abbreviates the other
 *
 * True when one side is a single token of at least two characters equal to
 * the initials of the other side, which has at least two tokens. The check
 * is symmetric.
 */
[[nodiscard]] bool is_abbreviation(const std::vector<std::string>& a,
                                   const std::vector<std::string>& b);

/** Score given to an abbreviation match under the string algorithm */
inline constexpr double abbreviation_score = 0.9;

}  // namespace biz::dedup::similarity

#endif  // BIZ_DEDUP_SIMILARITY_STRING_SIMILARITY_H
