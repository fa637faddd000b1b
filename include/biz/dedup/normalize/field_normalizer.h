#ifndef BIZ_DEDUP_NORMALIZE_FIELD_NORMALIZER_H
#define BIZ_DEDUP_NORMALIZE_FIELD_NORMALIZER_H

/**
 * @file field_normalizer.h
 * @brief Canonicalization of raw business record fields
 *
 * Normalization is pure and total: unparseable input degrades to a best
 * effort canonical form or to "absent", never to an error. Values that
 * are present but unusable (an e-mail without a domain, a phone number
 * without digits) are reported as record_issue entries and dropped from
 * comparison.
 *
 * | Field    | Canonical form                                         |
 * |----------|--------------------------------------------------------|
 * | name     | folded, lowercased, punctuation-free tokens; trailing  |
 * |          | legal suffixes and connector words removed             |
 * | phone    | digits only, with a country-code flag for '+' / '00'   |
 * | email    | lowercased address, local part and domain              |
 * | website  | bare host: no scheme, "www.", port, path or query      |
 * | address  | expanded street tokens, folded city/province, postal   |
 * |          | code uppercased without whitespace                     |
 */

#include "biz/dedup/normalize/normalization_rules.h"
#include "biz/dedup/record/business_record.h"
#include "biz/dedup/record/match_types.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace biz::dedup::normalize {

// =============================================================================
// Normalized Values
// =============================================================================

/**
 * @brief Normalized business name
 */
struct normalized_name {
    /** Original name, kept for display */
    std::string display;

    /** All tokens, before suffix and connector removal */
    std::vector<std::string> full_tokens;

    /** Comparison tokens: suffixes and connectors removed */
    std::vector<std::string> tokens;

    /** Comparison tokens joined by single spaces */
    std::string canonical;

    [[nodiscard]] bool empty() const noexcept { return canonical.empty(); }
};

/**
 * @brief Normalized phone number
 */
struct normalized_phone {
    /** Digits only, without a "00" international prefix */
    std::string digits;

    /** Number was written with an explicit country code ('+' or "00") */
    bool has_country_code = false;
};

/**
 * @brief Normalized e-mail address
 */
struct normalized_email {
    std::string address;
    std::string local;
    std::string domain;
};

/**
 * @brief Normalized postal address
 */
struct normalized_address {
    std::optional<std::string> street;
    std::vector<std::string> street_tokens;
    std::optional<std::string> city;
    std::optional<std::string> province;
    std::optional<std::string> postal_code;

    [[nodiscard]] bool empty() const noexcept {
        return !street && !city && !province && !postal_code;
    }
};

/**
 * @brief Comparison-ready form of a business record
 */
struct normalized_record {
    std::string id;
    normalized_name name;
    std::optional<std::string> business_number;
    std::optional<normalized_phone> phone;
    std::optional<normalized_email> email;
    std::optional<std::string> website;
    std::optional<normalized_address> address;
    std::optional<std::string> description;
    std::vector<std::string> industry;
};

/**
 * @brief Immutable snapshot of a record together with its normalized form
 *
 * All comparison work runs on snapshots, never on caller-owned records.
 */
struct prepared_record {
    record::business_record source;
    normalized_record normalized;
};

// =============================================================================
// Text Helpers
// =============================================================================

/**
 * @brief Fold Latin diacritics in UTF-8 text to ASCII ("é" -> "e", "œ" -> "oe")
 *
 * Characters outside the folding table are kept unchanged.
 */
[[nodiscard]] std::string fold_diacritics(std::string_view text);

/**
 * @brief Fold diacritics, lowercase ASCII and collapse whitespace
 */
[[nodiscard]] std::string fold_and_lower(std::string_view text);

// =============================================================================
// Field Normalizer
// =============================================================================

/**
 * @brief Field normalizer
 *
 * Stateless apart from its rule tables; safe to share across threads.
 *
 * @example
 * ```cpp
 * field_normalizer normalizer;
 * auto name = normalizer.normalize_name("L'Entreprise Française & Co.");
 * // name.canonical == "lentreprise francaise co"
 *
 * auto phone = normalizer.normalize_phone("+1 (555) 123-4567");
 * // phone->digits == "15551234567", phone->has_country_code == true
 * ```
 */
class field_normalizer {
public:
    explicit field_normalizer(
        normalization_rules rules = normalization_rules::defaults());

    [[nodiscard]] normalized_name normalize_name(std::string_view raw) const;

    /**
     * @brief Uppercase alphanumerics only
     * @return std::nullopt when nothing remains
     */
    [[nodiscard]] std::optional<std::string> normalize_business_number(
        std::string_view raw) const;

    /**
     * @return std::nullopt when the value has no digits
     */
    [[nodiscard]] std::optional<normalized_phone> normalize_phone(
        std::string_view raw) const;

    /**
     * @return std::nullopt unless the value is "local@domain.tld"
     */
    [[nodiscard]] std::optional<normalized_email> normalize_email(
        std::string_view raw) const;

    /**
     * @return Bare host, or std::nullopt when no host remains
     */
    [[nodiscard]] std::optional<std::string> normalize_website(
        std::string_view raw) const;

    [[nodiscard]] normalized_address normalize_address(
        const record::business_address& raw) const;

    /**
     * @brief Fold, lowercase and de-duplicate tags, keeping first-seen order
     */
    [[nodiscard]] std::vector<std::string> normalize_industry(
        const std::vector<std::string>& raw) const;

    /**
     * @brief Normalize every field of a record
     * @param issues Receives invalid_value issues for dropped fields
     */
    [[nodiscard]] normalized_record normalize(
        const record::business_record& raw,
        std::vector<record::record_issue>* issues = nullptr) const;

    /**
     * @brief Snapshot and normalize a record
     */
    [[nodiscard]] prepared_record prepare(
        const record::business_record& raw,
        std::vector<record::record_issue>* issues = nullptr) const;

    [[nodiscard]] const normalization_rules& rules() const noexcept {
        return rules_;
    }

private:
    normalization_rules rules_;
};

// =============================================================================
// Validity Checks
// =============================================================================

/**
 * @brief Check whether a raw field value survives normalization
 *
 * Used by the quality merge strategy to prefer usable values.
 */
[[nodiscard]] bool is_valid_value(const field_normalizer& normalizer,
                                  const record::business_record& record,
                                  record::business_field field);

}  // namespace biz::dedup::normalize

#endif  // BIZ_DEDUP_NORMALIZE_FIELD_NORMALIZER_H
