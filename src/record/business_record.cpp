/**
 * @file business_record.cpp
 * @brief Business record helpers and name parsing for record enums
 */

#include "biz/dedup/record/business_record.h"
#include "biz/dedup/record/match_types.h"

#include <algorithm>
#include <cctype>
#include <format>

namespace biz::dedup::record {

namespace {

/**
 * @brief Lowercase and drop '_' and '-' so "business_number",
 *        "businessNumber" and "field-exact" compare loosely
 */
std::string fold_name(std::string_view name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (c == '_' || c == '-' || c == ' ') continue;
        result += static_cast<char>(
            std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

bool populated(const std::optional<std::string>& value) {
    if (!value) return false;
    return std::any_of(value->begin(), value->end(), [](unsigned char c) {
        return !std::isspace(c);
    });
}

}  // namespace

// =============================================================================
// Field Names
// =============================================================================

std::optional<business_field> parse_field(std::string_view name) {
    auto folded = fold_name(name);
    for (auto field : all_fields) {
        if (fold_name(to_string(field)) == folded) {
            return field;
        }
    }
    return std::nullopt;
}

std::optional<match_algorithm> parse_algorithm(std::string_view name) {
    auto folded = fold_name(name);
    if (folded == "string" || folded == "levenshtein") {
        return match_algorithm::string;
    }
    if (folded == "phonetic" || folded == "soundex") {
        return match_algorithm::phonetic;
    }
    if (folded == "token") return match_algorithm::token;
    if (folded == "fieldexact" || folded == "exact") {
        return match_algorithm::field_exact;
    }
    if (folded == "address") return match_algorithm::address;
    if (folded == "ml") return match_algorithm::ml;
    return std::nullopt;
}

std::optional<merge_strategy_type> parse_merge_strategy(
    std::string_view name) {
    auto folded = fold_name(name);
    if (folded == "preserveprimary") {
        return merge_strategy_type::preserve_primary;
    }
    if (folded == "quality") return merge_strategy_type::quality;
    if (folded == "comprehensive") return merge_strategy_type::comprehensive;
    return std::nullopt;
}

// =============================================================================
// business_address
// =============================================================================

bool business_address::has_data() const noexcept {
    return component_count() > 0;
}

size_t business_address::component_count() const noexcept {
    size_t count = 0;
    if (populated(street)) ++count;
    if (populated(city)) ++count;
    if (populated(province)) ++count;
    if (populated(postal_code)) ++count;
    return count;
}

std::string business_address::to_display_string() const {
    std::string result;
    for (const auto* part : {&street, &city, &province, &postal_code}) {
        if (!populated(*part)) continue;
        if (!result.empty()) result += ", ";
        result += **part;
    }
    return result;
}

// =============================================================================
// business_record
// =============================================================================

bool business_record::has_field(business_field field) const noexcept {
    switch (field) {
        case business_field::name:
            return std::any_of(name.begin(), name.end(), [](unsigned char c) {
                return !std::isspace(c);
            });
        case business_field::business_type:
            return populated(business_type);
        case business_field::business_number:
            return populated(business_number);
        case business_field::phone:
            return populated(phone);
        case business_field::email:
            return populated(email);
        case business_field::website:
            return populated(website);
        case business_field::address:
            return address.has_value() && address->has_data();
        case business_field::description:
            return populated(description);
        case business_field::industry:
            return !industry.empty();
        case business_field::confidence:
            return confidence.has_value();
        case business_field::verified:
            return verified.has_value();
        default:
            return false;
    }
}

size_t business_record::populated_field_count() const noexcept {
    return static_cast<size_t>(
        std::count_if(all_fields.begin(), all_fields.end(),
                      [this](business_field f) { return has_field(f); }));
}

int completeness(const business_record& record) noexcept {
    int points = 0;
    if (record.has_field(business_field::name)) points += 1;
    if (record.has_field(business_field::business_number)) points += 2;
    if (record.has_field(business_field::phone)) points += 1;
    if (record.has_field(business_field::email)) points += 1;
    if (record.has_field(business_field::website)) points += 1;
    if (record.address && populated(record.address->street)) points += 1;
    if (record.has_field(business_field::description)) points += 1;
    if (record.has_field(business_field::industry)) points += 1;
    return points;
}

// =============================================================================
// record_issue
// =============================================================================

std::string record_issue::to_string() const {
    std::string result = record::to_string(kind);
    if (!record_id.empty()) {
        result += std::format(" [{}]", record_id);
    } else if (input_index) {
        result += std::format(" [#{}]", *input_index);
    }
    if (field) {
        result += std::format(" {}", record::to_string(*field));
    }
    if (!message.empty()) {
        result += ": " + message;
    }
    return result;
}

}  // namespace biz::dedup::record
