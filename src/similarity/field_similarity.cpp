/**
 * @file field_similarity.cpp
 * @brief Field-aware similarity implementation
 */

#include "biz/dedup/similarity/field_similarity.h"

#include "biz/dedup/similarity/string_similarity.h"

#include <algorithm>

namespace biz::dedup::similarity {

name_scores compare_names(const normalize::normalized_name& a,
                          const normalize::normalized_name& b) {
    name_scores scores;
    if (a.empty() || b.empty()) {
        return scores;
    }

    scores.string = edit_similarity(a.canonical, b.canonical);
    if (is_abbreviation(a.tokens, b.tokens)) {
        scores.string = std::max(scores.string, abbreviation_score);
    }
    scores.phonetic = phonetic_similarity(a.tokens, b.tokens);
    scores.token = token_set_similarity(a.tokens, b.tokens);

    if (!same_numeric_tokens(a.tokens, b.tokens)) {
        scores.numeric_mismatch = true;
        scores.string = std::min(scores.string, scores.token);
        scores.phonetic = std::min(scores.phonetic, scores.token);
    }

    return scores;
}

double exact_similarity(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) return 0.0;
    return a == b ? 1.0 : 0.0;
}

bool same_phone(const normalize::normalized_phone& a,
                const normalize::normalized_phone& b) {
    if (a.digits.empty() || b.digits.empty()) return false;
    if (a.digits == b.digits) return true;

    auto national_match = [](const normalize::normalized_phone& international,
                             const normalize::normalized_phone& national) {
        if (!international.has_country_code || national.has_country_code) {
            return false;
        }
        const auto& full = international.digits;
        const auto& local = national.digits;
        if (local.size() < 7 || full.size() <= local.size()) return false;

        size_t prefix = full.size() - local.size();
        return prefix >= 1 && prefix <= 3 && full.ends_with(local);
    };

    return national_match(a, b) || national_match(b, a);
}

double phone_similarity(const normalize::normalized_phone& a,
                        const normalize::normalized_phone& b) {
    return same_phone(a, b) ? 1.0 : 0.0;
}

double email_similarity(const normalize::normalized_email& a,
                        const normalize::normalized_email& b,
                        const normalize::normalization_rules& rules) {
    if (a.address.empty() || b.address.empty()) return 0.0;
    if (a.address == b.address) return 1.0;

    if (a.domain == b.domain && !rules.is_shared_domain(a.domain)) {
        return 0.5 + 0.5 * edit_similarity(a.local, b.local);
    }
    return 0.0;
}

double postal_code_similarity(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) return 0.0;
    if (a == b) return 1.0;
    if (a.size() >= 3 && b.size() >= 3 && a.substr(0, 3) == b.substr(0, 3)) {
        return 0.5;
    }
    return 0.0;
}

std::optional<double> address_similarity(const normalize::normalized_address& a,
                                         const normalize::normalized_address& b,
                                         const address_weights& weights) {
    double total = 0.0;
    double weight_sum = 0.0;

    if (a.street && b.street) {
        double street = std::max(token_set_similarity(a.street_tokens,
                                                      b.street_tokens),
                                 edit_similarity(*a.street, *b.street));
        total += weights.street * street;
        weight_sum += weights.street;
    }
    if (a.city && b.city) {
        total += weights.city * exact_similarity(*a.city, *b.city);
        weight_sum += weights.city;
    }
    if (a.province && b.province) {
        total += weights.province * exact_similarity(*a.province, *b.province);
        weight_sum += weights.province;
    }
    if (a.postal_code && b.postal_code) {
        total += weights.postal_code *
                 postal_code_similarity(*a.postal_code, *b.postal_code);
        weight_sum += weights.postal_code;
    }

    if (weight_sum <= 0.0) return std::nullopt;
    return total / weight_sum;
}

double industry_similarity(const std::vector<std::string>& a,
                           const std::vector<std::string>& b) {
    // Normalized tags are already de-duplicated, so multiset Jaccard is
    // plain set Jaccard here
    return token_set_similarity(a, b);
}

}  // namespace biz::dedup::similarity
