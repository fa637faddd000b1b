#ifndef BIZ_DEDUP_MERGE_MERGE_STRATEGY_H
#define BIZ_DEDUP_MERGE_MERGE_STRATEGY_H

/**
 * @file merge_strategy.h
 * @brief Policies that collapse a duplicate cluster into one record
 *
 * Strategies are deterministic for a given input order and never drop a
 * populated field that exists anywhere in the cluster when the merged
 * field would otherwise be empty.
 *
 * | Strategy         | Primary                | Field selection               |
 * |------------------|------------------------|-------------------------------|
 * | preservePrimary  | caller's primary       | primary, gaps from duplicates |
 * |                  |                        | in list order                 |
 * | quality          | caller's primary       | per field, best member by     |
 * |                  |                        | confidence or completeness    |
 * | comprehensive    | select_primary()       | gap filling plus ordered      |
 * |                  |                        | union of industry tags        |
 */

#include "biz/dedup/normalize/field_normalizer.h"
#include "biz/dedup/normalize/normalization_rules.h"
#include "biz/dedup/record/business_record.h"
#include "biz/dedup/record/match_types.h"

#include <memory>
#include <string_view>
#include <vector>

namespace biz::dedup::merge {

// =============================================================================
// Primary Selection
// =============================================================================

/**
 * @brief Primary selection score: +10 when verified, plus completeness
 */
[[nodiscard]] int primary_score(const record::business_record& record) noexcept;

/**
 * @brief Index of the member best suited as canonical record
 *
 * Highest primary_score() wins; ties go to the earlier member.
 *
 * @return Index into @p members, 0 for an empty list
 */
[[nodiscard]] size_t select_primary(
    const std::vector<record::business_record>& members) noexcept;

/**
 * @brief Quality of a record used by the quality strategy
 *
 * The record's confidence when set, otherwise completeness scaled to [0,1].
 */
[[nodiscard]] double record_quality(const record::business_record& record) noexcept;

// =============================================================================
// Merge Strategy Interface
// =============================================================================

/**
 * @brief Merge policy
 */
class merge_strategy {
public:
    virtual ~merge_strategy() = default;

    /**
     * @brief Merge a primary with its duplicates
     *
     * The merged record keeps the id of the record acting as primary.
     * merged_from lists that record first, then the remaining members in
     * input order.
     */
    [[nodiscard]] virtual record::merged_record merge(
        const record::business_record& primary,
        const std::vector<record::business_record>& duplicates) const = 0;

    [[nodiscard]] virtual record::merge_strategy_type type() const noexcept = 0;

    [[nodiscard]] std::string_view name() const noexcept {
        return record::to_string(type());
    }
};

/**
 * @brief Keeps the primary, fills its gaps from duplicates
 *
 * Each empty primary field is taken from the first duplicate that has
 * it. Address components are filled individually.
 */
class preserve_primary_strategy final : public merge_strategy {
public:
    [[nodiscard]] record::merged_record merge(
        const record::business_record& primary,
        const std::vector<record::business_record>& duplicates) const override;

    [[nodiscard]] record::merge_strategy_type type() const noexcept override {
        return record::merge_strategy_type::preserve_primary;
    }
};

/**
 * @brief Picks every field from the best member
 *
 * Members holding a field are ranked by record_quality(), then by
 * whether the value survives normalization, then by value length, then
 * primary first, then input order. The merged confidence is the highest
 * member confidence; verified is set when any member is verified.
 */
class quality_strategy final : public merge_strategy {
public:
    explicit quality_strategy(normalize::normalization_rules rules =
                                  normalize::normalization_rules::defaults());

    [[nodiscard]] record::merged_record merge(
        const record::business_record& primary,
        const std::vector<record::business_record>& duplicates) const override;

    [[nodiscard]] record::merge_strategy_type type() const noexcept override {
        return record::merge_strategy_type::quality;
    }

private:
    normalize::field_normalizer normalizer_;
};

/**
 * @brief Computed primary, gap filling and union of industry tags
 */
class comprehensive_strategy final : public merge_strategy {
public:
    [[nodiscard]] record::merged_record merge(
        const record::business_record& primary,
        const std::vector<record::business_record>& duplicates) const override;

    [[nodiscard]] record::merge_strategy_type type() const noexcept override {
        return record::merge_strategy_type::comprehensive;
    }
};

/**
 * @brief Create a strategy instance
 */
[[nodiscard]] std::unique_ptr<merge_strategy> create_merge_strategy(
    record::merge_strategy_type type,
    const normalize::normalization_rules& rules =
        normalize::normalization_rules::defaults());

}  // namespace biz::dedup::merge

#endif  // BIZ_DEDUP_MERGE_MERGE_STRATEGY_H
