#ifndef BIZ_DEDUP_RECORD_BUSINESS_RECORD_H
#define BIZ_DEDUP_RECORD_BUSINESS_RECORD_H

/**
 * @file business_record.h
 * @brief Business record data model for deduplication
 *
 * Defines the unit being deduplicated. Records are created by the
 * external record store and handed to the engine per call; the engine
 * only ever works on copies of them.
 *
 * Every optional field models "absent" explicitly. An empty string is
 * never used to mean "missing".
 */

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace biz::dedup::record {

// =============================================================================
// Business Fields
// =============================================================================

/**
 * @brief Named fields of a business record
 *
 * Used by options (check fields, field thresholds, custom comparators),
 * by match details and by merge provenance.
 */
enum class business_field {
    name,
    business_type,
    business_number,
    phone,
    email,
    website,
    address,
    description,
    industry,
    confidence,
    verified
};

/** All fields in declaration order */
inline constexpr std::array<business_field, 11> all_fields = {
    business_field::name,        business_field::business_type,
    business_field::business_number, business_field::phone,
    business_field::email,       business_field::website,
    business_field::address,     business_field::description,
    business_field::industry,    business_field::confidence,
    business_field::verified};

/**
 * @brief Get the canonical (camelCase) name of a field
 */
[[nodiscard]] constexpr const char* to_string(business_field field) noexcept {
    switch (field) {
        case business_field::name:
            return "name";
        case business_field::business_type:
            return "businessType";
        case business_field::business_number:
            return "businessNumber";
        case business_field::phone:
            return "phone";
        case business_field::email:
            return "email";
        case business_field::website:
            return "website";
        case business_field::address:
            return "address";
        case business_field::description:
            return "description";
        case business_field::industry:
            return "industry";
        case business_field::confidence:
            return "confidence";
        case business_field::verified:
            return "verified";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse a field name
 *
 * Accepts the camelCase name ("businessNumber") and the snake_case
 * spelling ("business_number").
 *
 * @return Field, or std::nullopt for an unknown name
 */
[[nodiscard]] std::optional<business_field> parse_field(std::string_view name);

// =============================================================================
// Business Address
// =============================================================================

/**
 * @brief Postal address of a business
 */
struct business_address {
    std::optional<std::string> street;
    std::optional<std::string> city;
    std::optional<std::string> province;
    std::optional<std::string> postal_code;

    /**
     * @brief Check whether any component carries data
     */
    [[nodiscard]] bool has_data() const noexcept;

    /**
     * @brief Number of populated components
     */
    [[nodiscard]] size_t component_count() const noexcept;

    /**
     * @brief Format as "street, city, province, postal" (skipping absent parts)
     */
    [[nodiscard]] std::string to_display_string() const;

    bool operator==(const business_address&) const = default;
};

// =============================================================================
// Business Record
// =============================================================================

/**
 * @brief A business record as supplied by the record store
 *
 * @example
 * ```cpp
 * business_record rec;
 * rec.id = "biz-42";
 * rec.name = "Indigenous Tech Solutions Inc.";
 * rec.phone = "+1 (555) 123-4567";
 * rec.industry = {"Technology", "Consulting"};
 * ```
 */
struct business_record {
    /** Opaque identifier assigned by the store. Never mutated by the engine. */
    std::string id;

    /** Display name (required) */
    std::string name;

    /** Categorical tag (ownership class). Informational only. */
    std::optional<std::string> business_type;

    /** Structured registration identifier */
    std::optional<std::string> business_number;

    std::optional<std::string> phone;
    std::optional<std::string> email;
    std::optional<std::string> website;
    std::optional<business_address> address;
    std::optional<std::string> description;

    /** Industry tags; empty means absent */
    std::vector<std::string> industry;

    /** Prior data-quality score in [0,1] */
    std::optional<double> confidence;

    /** Verified by an upstream process */
    std::optional<bool> verified;

    /**
     * @brief Check whether the field carries data
     *
     * Strings count as populated when non-empty, the address when any
     * component is populated, industry when it has at least one tag.
     */
    [[nodiscard]] bool has_field(business_field field) const noexcept;

    /**
     * @brief Number of populated, comparable fields
     */
    [[nodiscard]] size_t populated_field_count() const noexcept;

    bool operator==(const business_record&) const = default;
};

/**
 * @brief Record completeness points
 *
 * Name 1, business number 2, phone 1, email 1, website 1, street 1,
 * description 1, industry 1.
 */
[[nodiscard]] int completeness(const business_record& record) noexcept;

/**
 * @brief Maximum value returned by completeness()
 */
inline constexpr int max_completeness = 9;

}  // namespace biz::dedup::record

#endif  // BIZ_DEDUP_RECORD_BUSINESS_RECORD_H
