/**
 * @file merge_strategy.cpp
 * @brief Merge strategy implementations
 */

#include "biz/dedup/merge/merge_strategy.h"

#include "biz/dedup/integration/logger_adapter.h"

#include <algorithm>
#include <format>
#include <tuple>
#include <utility>

namespace biz::dedup::merge {

using record::business_address;
using record::business_field;
using record::business_record;
using record::merged_record;

// =============================================================================
// Primary Selection
// =============================================================================

int primary_score(const business_record& record) noexcept {
    int score = record::completeness(record);
    if (record.verified.value_or(false)) {
        score += 10;
    }
    return score;
}

size_t select_primary(const std::vector<business_record>& members) noexcept {
    size_t best = 0;
    int best_score = -1;
    for (size_t i = 0; i < members.size(); ++i) {
        int score = primary_score(members[i]);
        if (score > best_score) {
            best_score = score;
            best = i;
        }
    }
    return best;
}

double record_quality(const business_record& record) noexcept {
    if (record.confidence) {
        return *record.confidence;
    }
    return static_cast<double>(record::completeness(record)) /
           static_cast<double>(record::max_completeness);
}

namespace {

/** Fields merged as a whole, in provenance order */
constexpr business_field merged_fields[] = {
    business_field::name,        business_field::business_type,
    business_field::business_number, business_field::phone,
    business_field::email,       business_field::website,
    business_field::address,     business_field::description,
    business_field::industry,    business_field::confidence,
    business_field::verified};

void copy_field(business_record& target, const business_record& source,
                business_field field) {
    switch (field) {
        case business_field::name:
            target.name = source.name;
            break;
        case business_field::business_type:
            target.business_type = source.business_type;
            break;
        case business_field::business_number:
            target.business_number = source.business_number;
            break;
        case business_field::phone:
            target.phone = source.phone;
            break;
        case business_field::email:
            target.email = source.email;
            break;
        case business_field::website:
            target.website = source.website;
            break;
        case business_field::address:
            target.address = source.address;
            break;
        case business_field::description:
            target.description = source.description;
            break;
        case business_field::industry:
            target.industry = source.industry;
            break;
        case business_field::confidence:
            target.confidence = source.confidence;
            break;
        case business_field::verified:
            target.verified = source.verified;
            break;
    }
}

size_t value_length(const business_record& record, business_field field) {
    switch (field) {
        case business_field::name:
            return record.name.size();
        case business_field::business_type:
            return record.business_type.value_or("").size();
        case business_field::business_number:
            return record.business_number.value_or("").size();
        case business_field::phone:
            return record.phone.value_or("").size();
        case business_field::email:
            return record.email.value_or("").size();
        case business_field::website:
            return record.website.value_or("").size();
        case business_field::address:
            return record.address ? record.address->to_display_string().size()
                                  : 0;
        case business_field::description:
            return record.description.value_or("").size();
        case business_field::industry:
            return record.industry.size();
        default:
            return 0;
    }
}

/**
 * @brief Members in merge order: primary first, then duplicates
 */
std::vector<const business_record*> member_order(
    const business_record& primary,
    const std::vector<business_record>& duplicates) {
    std::vector<const business_record*> members;
    members.reserve(duplicates.size() + 1);
    members.push_back(&primary);
    for (const auto& duplicate : duplicates) {
        members.push_back(&duplicate);
    }
    return members;
}

/**
 * @brief Record the source of every component already in the merged address
 */
void note_address_sources(merged_record& merged, const std::string& source_id) {
    const auto& address = *merged.record.address;
    if (address.street) merged.address_provenance.try_emplace("street", source_id);
    if (address.city) merged.address_provenance.try_emplace("city", source_id);
    if (address.province) {
        merged.address_provenance.try_emplace("province", source_id);
    }
    if (address.postal_code) {
        merged.address_provenance.try_emplace("postalCode", source_id);
    }
}

void fill_component(merged_record& merged, std::optional<std::string>& target,
                    const std::optional<std::string>& value, const char* part,
                    const std::string& source_id) {
    if (target || !value) return;
    target = value;
    merged.address_provenance[part] = source_id;
}

/**
 * @brief Fill components missing from the merged address from @p source
 */
void fill_address_components(merged_record& merged,
                             const business_record& source) {
    if (!source.address) return;
    auto& target = *merged.record.address;
    const auto& from = *source.address;
    fill_component(merged, target.street, from.street, "street", source.id);
    fill_component(merged, target.city, from.city, "city", source.id);
    fill_component(merged, target.province, from.province, "province",
                   source.id);
    fill_component(merged, target.postal_code, from.postal_code, "postalCode",
                   source.id);
}

/**
 * @brief Primary-preserving gap filling over an ordered member list
 */
merged_record fill_gaps(const std::vector<const business_record*>& members) {
    merged_record merged;
    const auto& primary = *members.front();
    merged.record = primary;

    for (const auto* member : members) {
        merged.merged_from.push_back(member->id);
    }

    for (auto field : merged_fields) {
        if (primary.has_field(field)) {
            merged.provenance[field] = primary.id;
            continue;
        }
        for (size_t i = 1; i < members.size(); ++i) {
            if (!members[i]->has_field(field)) continue;

            copy_field(merged.record, *members[i], field);
            merged.provenance[field] = members[i]->id;
            break;
        }
    }

    // Fill individual address components from later members
    if (merged.record.address) {
        note_address_sources(merged, merged.provenance[business_field::address]);
        for (size_t i = 1; i < members.size(); ++i) {
            fill_address_components(merged, *members[i]);
        }
    }

    return merged;
}

void take_best_confidence(merged_record& merged,
                          const std::vector<const business_record*>& members) {
    for (const auto* member : members) {
        if (!member->confidence) continue;
        if (!merged.record.confidence ||
            *member->confidence > *merged.record.confidence) {
            merged.record.confidence = member->confidence;
            merged.provenance[business_field::confidence] = member->id;
        }
    }

    for (const auto* member : members) {
        if (member->verified.value_or(false)) {
            merged.record.verified = true;
            merged.provenance[business_field::verified] = member->id;
            break;
        }
    }
}

}  // namespace

// =============================================================================
// Preserve Primary
// =============================================================================

merged_record preserve_primary_strategy::merge(
    const business_record& primary,
    const std::vector<business_record>& duplicates) const {
    auto merged = fill_gaps(member_order(primary, duplicates));
    merged.strategy = type();
    return merged;
}

// =============================================================================
// Quality
// =============================================================================

quality_strategy::quality_strategy(normalize::normalization_rules rules)
    : normalizer_(std::move(rules)) {}

merged_record quality_strategy::merge(
    const business_record& primary,
    const std::vector<business_record>& duplicates) const {
    auto members = member_order(primary, duplicates);

    merged_record merged;
    merged.strategy = type();
    merged.record.id = primary.id;
    for (const auto* member : members) {
        merged.merged_from.push_back(member->id);
    }

    std::vector<double> quality;
    quality.reserve(members.size());
    for (const auto* member : members) {
        quality.push_back(record_quality(*member));
    }

    for (auto field : merged_fields) {
        if (field == business_field::confidence ||
            field == business_field::verified) {
            continue;
        }

        // Rank: quality, validity, length, primary, earlier position
        std::optional<size_t> best;
        std::tuple<double, bool, size_t> best_key{};
        for (size_t i = 0; i < members.size(); ++i) {
            const auto& member = *members[i];
            if (!member.has_field(field)) continue;

            std::tuple<double, bool, size_t> key{
                quality[i], normalize::is_valid_value(normalizer_, member, field),
                value_length(member, field)};
            if (!best || key > best_key) {
                best = i;
                best_key = key;
            }
        }

        if (best) {
            copy_field(merged.record, *members[*best], field);
            merged.provenance[field] = members[*best]->id;
        }
    }

    // Missing address components come from the other members by quality
    if (merged.record.address) {
        note_address_sources(merged, merged.provenance[business_field::address]);

        std::vector<size_t> ranked(members.size());
        for (size_t i = 0; i < ranked.size(); ++i) ranked[i] = i;
        std::stable_sort(ranked.begin(), ranked.end(),
                         [&quality](size_t a, size_t b) {
                             return quality[a] > quality[b];
                         });
        for (auto i : ranked) {
            fill_address_components(merged, *members[i]);
        }
    }

    take_best_confidence(merged, members);
    return merged;
}

// =============================================================================
// Comprehensive
// =============================================================================

merged_record comprehensive_strategy::merge(
    const business_record& primary,
    const std::vector<business_record>& duplicates) const {
    std::vector<business_record> all;
    all.reserve(duplicates.size() + 1);
    all.push_back(primary);
    all.insert(all.end(), duplicates.begin(), duplicates.end());

    size_t chosen = select_primary(all);

    std::vector<const business_record*> members;
    members.reserve(all.size());
    members.push_back(&all[chosen]);
    for (size_t i = 0; i < all.size(); ++i) {
        if (i != chosen) members.push_back(&all[i]);
    }

    auto merged = fill_gaps(members);
    merged.strategy = type();

    // Ordered union of industry tags, first spelling wins
    std::vector<std::string> tags;
    std::vector<std::string> folded_tags;
    for (const auto* member : members) {
        for (const auto& tag : member->industry) {
            auto folded = normalize::fold_and_lower(tag);
            if (folded.empty() ||
                std::find(folded_tags.begin(), folded_tags.end(), folded) !=
                    folded_tags.end()) {
                continue;
            }
            folded_tags.push_back(std::move(folded));
            tags.push_back(tag);
        }
    }
    merged.record.industry = std::move(tags);

    take_best_confidence(merged, members);

    integration::get_logger().debug(
        std::format("comprehensive merge of {} records, primary {}",
                    members.size(), merged.record.id));
    return merged;
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<merge_strategy> create_merge_strategy(
    record::merge_strategy_type type,
    const normalize::normalization_rules& rules) {
    switch (type) {
        case record::merge_strategy_type::quality:
            return std::make_unique<quality_strategy>(rules);
        case record::merge_strategy_type::comprehensive:
            return std::make_unique<comprehensive_strategy>();
        case record::merge_strategy_type::preserve_primary:
        default:
            return std::make_unique<preserve_primary_strategy>();
    }
}

}  // namespace biz::dedup::merge
