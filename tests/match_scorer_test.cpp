/**
 * @file match_scorer_test.cpp
 * @brief Unit tests for pairwise record comparison
 *
 * @see include/biz/dedup/match/match_scorer.h
 */

#include <gtest/gtest.h>

#include "biz/dedup/match/match_scorer.h"
#include "biz/dedup/normalize/field_normalizer.h"

#include "utils/test_helpers.h"

#include <stdexcept>

namespace biz::dedup::match {
namespace {

using namespace biz::dedup::test;
using namespace std::chrono_literals;
using record::business_field;
using record::match_algorithm;
using record::match_confidence;
using record::suggested_action;

class MatchScorerTest : public biz_dedup_test {
protected:
    [[nodiscard]] record::match_result compare(
        const record::business_record& a, const record::business_record& b,
        const dedup_options& options = {},
        similarity::bounded_scorer* model = nullptr,
        std::vector<record::record_issue>* issues = nullptr) const {
        return scorer_.compare(normalizer_.prepare(a), normalizer_.prepare(b),
                               options, model, issues);
    }

    normalize::field_normalizer normalizer_;
    match_scorer scorer_;
};

// =============================================================================
// Properties
// =============================================================================

TEST_F(MatchScorerTest, ScoreIsSymmetric) {
    auto a = samples::complete("biz-a");
    auto b = samples::named("biz-b", "Indigenous Technology Solutions");
    b.phone = "555 123 4568";
    b.email = "sales@indigenoustech.ca";
    b.address = record::business_address{"125 Main Street", "Toronto", "ON",
                                          "M5V 1A1"};

    auto ab = compare(a, b);
    auto ba = compare(b, a);
    EXPECT_DOUBLE_EQ(ab.score, ba.score);
    EXPECT_EQ(ab.confidence, ba.confidence);
    EXPECT_EQ(ab.candidate_id, "biz-b");
    EXPECT_EQ(ba.candidate_id, "biz-a");
}

TEST_F(MatchScorerTest, IdenticalRecordsScoreOne) {
    auto result = compare(samples::complete("biz-a"), samples::complete("biz-b"));
    EXPECT_DOUBLE_EQ(result.score, 1.0);
    EXPECT_EQ(result.confidence, match_confidence::high);
    EXPECT_EQ(result.action, suggested_action::merge);

    auto name_only = compare(samples::named("x", "Acme"), samples::named("y", "Acme"));
    EXPECT_DOUBLE_EQ(name_only.score, 1.0);
}

TEST_F(MatchScorerTest, SingularPluralNamesMatchByString) {
    auto result = compare(samples::named("a", "Indigenous Tech Solutions"),
                          samples::named("b", "Indigenous Tech Solution"));
    EXPECT_GT(result.score, 0.9);
    EXPECT_EQ(result.algorithm, match_algorithm::string);
    ASSERT_TRUE(result.details.name_match().has_value());
}

TEST_F(MatchScorerTest, BusinessNumberDominatesName) {
    auto a = samples::named("a", "Company A");
    a.business_number = "123456789RC0001";
    auto b = samples::named("b", "Totally Different Holdings Ltd");
    b.business_number = "123456789RC0001";

    auto result = compare(a, b);
    EXPECT_DOUBLE_EQ(result.score, 1.0);
    EXPECT_EQ(result.confidence, match_confidence::high);
    EXPECT_EQ(result.algorithm, match_algorithm::field_exact);
    EXPECT_EQ(result.details.business_number_match(), 1.0);
}

TEST_F(MatchScorerTest, LegalSuffixWithSameBusinessNumber) {
    auto a = samples::named("a", "Company A");
    a.business_number = "123456789RC0001";
    auto b = samples::named("b", "Company A Ltd");
    b.business_number = "123456789RC0001";

    auto result = compare(a, b);
    EXPECT_DOUBLE_EQ(result.score, 1.0);
    EXPECT_EQ(result.confidence, match_confidence::high);
}

TEST_F(MatchScorerTest, PhoneFormatsMatch) {
    record::business_record a;
    a.id = "a";
    a.phone = "+1 (555) 123-4567";
    record::business_record b;
    b.id = "b";
    b.phone = "5551234567";

    auto result = compare(a, b);
    EXPECT_EQ(result.details.phone_match(), 1.0);
    EXPECT_DOUBLE_EQ(result.score, 1.0);
}

TEST_F(MatchScorerTest, ConflictingBusinessNumbersNeedReview) {
    auto a = samples::named("a", "Company A");
    a.business_number = "123456789RC0001";
    a.phone = "555-123-4567";
    auto b = samples::named("b", "Company A");
    b.business_number = "987654321RC0001";
    b.phone = "555-123-4567";

    auto result = compare(a, b);
    EXPECT_TRUE(result.conflicting_identifier);
    EXPECT_EQ(result.action, suggested_action::manual_review);
    EXPECT_NE(result.confidence, match_confidence::high);
    EXPECT_LT(result.score, 1.0);
}

TEST_F(MatchScorerTest, NameOnlyRecordsDoNotMatchByAccident) {
    auto result = compare(samples::named("a", "Acme Bakery"),
                          samples::named("b", "Zenith Motors"));
    EXPECT_LT(result.score, default_threshold);
    EXPECT_EQ(result.action, suggested_action::keep_both);
    EXPECT_EQ(result.confidence, match_confidence::low);
}

TEST_F(MatchScorerTest, NumberedBusinessesStayApart) {
    auto result = compare(samples::named("a", "Business 5"),
                          samples::named("b", "Business 7"));
    EXPECT_LT(result.score, default_threshold);
}

TEST_F(MatchScorerTest, DetailsOnlyForFieldsOnBothSides) {
    auto result = compare(samples::complete("a"), samples::named("b", "Acme"));
    EXPECT_TRUE(result.details.has(business_field::name));
    EXPECT_FALSE(result.details.has(business_field::phone));
    EXPECT_FALSE(result.details.has(business_field::address));
    EXPECT_EQ(result.details.size(), 1u);
}

TEST_F(MatchScorerTest, RecordWithoutFieldsScoresZero) {
    record::business_record empty;
    empty.id = "empty";
    auto result = compare(empty, samples::complete("a"));
    EXPECT_DOUBLE_EQ(result.score, 0.0);
    EXPECT_TRUE(result.details.empty());
}

// =============================================================================
// Options
// =============================================================================

TEST_F(MatchScorerTest, CheckFieldsRestrictComparison) {
    auto a = samples::named("a", "Alpha Foods");
    a.website = "https://shared.example.ca";
    auto b = samples::named("b", "Omega Tools");
    b.website = "https://shared.example.ca";

    EXPECT_DOUBLE_EQ(compare(a, b).score, 1.0);

    dedup_options options;
    options.check_fields = {business_field::name};
    auto result = compare(a, b, options);
    EXPECT_FALSE(result.details.has(business_field::website));
    EXPECT_LT(result.score, default_threshold);
}

TEST_F(MatchScorerTest, FieldThresholdDropsWeakScores) {
    auto a = samples::named("a", "Indigenous Tech Solutions");
    auto b = samples::named("b", "Indigenous Tech Solution");

    dedup_options options;
    options.algorithms = {match_algorithm::string};
    EXPECT_NEAR(compare(a, b, options).score, 0.96, 1e-9);

    options.field_thresholds[business_field::name] = 0.99;
    auto result = compare(a, b, options);
    EXPECT_DOUBLE_EQ(result.score, 0.0);
    EXPECT_NEAR(*result.details.name_match(), 0.96, 1e-9);
}

TEST_F(MatchScorerTest, AlgorithmSubsetChangesNameScore) {
    auto a = samples::named("a", "Tech Indigenous Solutions");
    auto b = samples::named("b", "Indigenous Tech Solutions");

    dedup_options token_only;
    token_only.algorithms = {match_algorithm::token};
    EXPECT_DOUBLE_EQ(compare(a, b, token_only).score, 1.0);

    dedup_options string_only;
    string_only.algorithms = {match_algorithm::string};
    EXPECT_LT(compare(a, b, string_only).score, 1.0);
}

TEST_F(MatchScorerTest, UnselectedAlgorithmsStillReportDetails) {
    auto a = samples::named("a", "Maple Leaf Catering");
    a.phone = "613-555-0101";
    a.address = record::business_address{"12 Bank St", "Ottawa", "ON", "K1P 5N2"};
    auto b = samples::named("b", "Maple Leaf Catering");
    b.phone = "613-555-0199";
    b.address = a.address;

    dedup_options options;
    options.algorithms = {match_algorithm::field_exact};
    auto result = compare(a, b, options);

    ASSERT_TRUE(result.details.name_match().has_value());
    EXPECT_DOUBLE_EQ(*result.details.name_match(), 1.0);
    ASSERT_TRUE(result.details.address_match().has_value());
    EXPECT_DOUBLE_EQ(*result.details.address_match(), 1.0);
    EXPECT_DOUBLE_EQ(*result.details.phone_match(), 0.0);
    EXPECT_DOUBLE_EQ(result.score, 0.0);

    options.algorithms = {match_algorithm::string};
    auto by_name = compare(a, b, options);
    ASSERT_TRUE(by_name.details.phone_match().has_value());
    EXPECT_DOUBLE_EQ(*by_name.details.phone_match(), 0.0);
    EXPECT_DOUBLE_EQ(by_name.score, 1.0);
}

TEST_F(MatchScorerTest, CustomComparatorReplacesBuiltin) {
    dedup_options options;
    options.custom_comparators[business_field::name] =
        [](const record::business_record&, const record::business_record&) {
            return 0.5;
        };

    auto result = compare(samples::named("a", "Acme"),
                          samples::named("b", "Acme"), options);
    EXPECT_DOUBLE_EQ(result.score, 0.5);
}

TEST_F(MatchScorerTest, CustomComparatorSeesPairInIdOrder) {
    std::vector<std::string> seen;
    dedup_options options;
    options.custom_comparators[business_field::name] =
        [&seen](const record::business_record& first,
                const record::business_record& second) {
            seen.push_back(first.id + "," + second.id);
            return 1.0;
        };

    (void)compare(samples::named("b", "Acme"), samples::named("a", "Acme"),
                  options);
    (void)compare(samples::named("a", "Acme"), samples::named("b", "Acme"),
                  options);
    EXPECT_EQ(seen, (std::vector<std::string>{"a,b", "a,b"}));
}

TEST_F(MatchScorerTest, ThrowingComparatorIsReported) {
    dedup_options options;
    options.custom_comparators[business_field::name] =
        [](const record::business_record&,
           const record::business_record&) -> double {
        throw std::runtime_error("lookup failed");
    };

    std::vector<record::record_issue> issues;
    auto result = compare(samples::named("a", "Acme"),
                          samples::named("b", "Acme"), options, nullptr, &issues);

    EXPECT_DOUBLE_EQ(result.score, 0.0);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, record::issue_kind::scorer_failed);
    EXPECT_EQ(issues[0].field, business_field::name);
    EXPECT_THAT(issues[0].message, ContainsSubstring("lookup failed"));
    EXPECT_GE(log().count(integration::log_level::warning), 1u);
}

TEST_F(MatchScorerTest, DescriptionThroughComparator) {
    auto a = samples::named("a", "Alpha");
    a.description = "Fishing charters";
    auto b = samples::named("b", "Omega");
    b.description = "Fishing charters";

    dedup_options options;
    options.check_fields = {business_field::description};
    options.custom_comparators[business_field::description] =
        [](const record::business_record& x, const record::business_record& y) {
            return x.description == y.description ? 1.0 : 0.0;
        };

    auto result = compare(a, b, options);
    EXPECT_DOUBLE_EQ(result.score, 1.0);
    EXPECT_TRUE(result.details.has(business_field::description));
}

// =============================================================================
// External Scorer
// =============================================================================

TEST_F(MatchScorerTest, ModelScoreIsBlended) {
    similarity::bounded_scorer model(
        similarity::make_scorer("fixed", [](const auto&, const auto&) { return 0.2; }),
        1, 500ms);

    dedup_options options;
    options.deep_check = true;
    auto result = compare(samples::named("a", "Northern Lights Cafe"),
                          samples::named("b", "Northern Lights Cafe"), options,
                          &model);

    EXPECT_DOUBLE_EQ(result.score, 0.6);
    EXPECT_EQ(result.model_score, 0.2);
    EXPECT_FALSE(result.scorer_fallback);
    EXPECT_NE(result.algorithm, match_algorithm::ml);
}

TEST_F(MatchScorerTest, ModelOnlyUsesModelScore) {
    similarity::bounded_scorer model(
        similarity::make_scorer("fixed", [](const auto&, const auto&) { return 0.85; }),
        1, 500ms);

    dedup_options options;
    options.algorithms = {match_algorithm::ml};
    auto result = compare(samples::named("a", "Acme"),
                          samples::named("b", "Zenith"), options, &model);

    EXPECT_DOUBLE_EQ(result.score, 0.85);
    EXPECT_EQ(result.algorithm, match_algorithm::ml);
}

TEST_F(MatchScorerTest, MissingModelFallsBack) {
    dedup_options options;
    options.deep_check = true;
    auto result = compare(samples::named("a", "Acme"),
                          samples::named("b", "Acme"), options);

    EXPECT_TRUE(result.scorer_fallback);
    EXPECT_DOUBLE_EQ(result.score, 1.0);
    EXPECT_FALSE(result.model_score.has_value());
}

TEST_F(MatchScorerTest, FailingModelFallsBackWithIssue) {
    similarity::bounded_scorer model(
        similarity::make_scorer("broken",
                                [](const auto&, const auto&) -> double {
                                    throw std::runtime_error("model crashed");
                                }),
        1, 500ms);

    dedup_options options;
    options.deep_check = true;
    std::vector<record::record_issue> issues;
    auto result = compare(samples::named("a", "Acme"),
                          samples::named("b", "Acme"), options, &model, &issues);

    EXPECT_TRUE(result.scorer_fallback);
    EXPECT_DOUBLE_EQ(result.score, 1.0);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, record::issue_kind::scorer_failed);
}

TEST_F(MatchScorerTest, DecisiveMatchIgnoresModel) {
    similarity::bounded_scorer model(
        similarity::make_scorer("low", [](const auto&, const auto&) { return 0.0; }),
        1, 500ms);

    dedup_options options;
    options.deep_check = true;
    auto result = compare(samples::complete("a"), samples::complete("b"),
                          options, &model);
    EXPECT_DOUBLE_EQ(result.score, 1.0);
    EXPECT_EQ(result.model_score, 0.0);
}

// =============================================================================
// Configuration
// =============================================================================

TEST_F(MatchScorerTest, ConfidenceTiers) {
    EXPECT_EQ(scorer_.confidence_for(0.95), match_confidence::high);
    EXPECT_EQ(scorer_.confidence_for(0.75), match_confidence::medium);
    EXPECT_EQ(scorer_.confidence_for(0.5), match_confidence::low);
}

TEST_F(MatchScorerTest, DefaultWeights) {
    scoring_config config;
    EXPECT_DOUBLE_EQ(config.weight_of(business_field::business_number), 0.30);
    EXPECT_DOUBLE_EQ(config.weight_of(business_field::name), 0.25);
    EXPECT_DOUBLE_EQ(config.weight_of(business_field::verified), 0.0);
    EXPECT_TRUE(config.is_valid());
}

TEST_F(MatchScorerTest, InvalidScoringConfig) {
    scoring_config negative;
    negative.weights[business_field::phone] = -1.0;
    EXPECT_FALSE(negative.is_valid());

    scoring_config zero;
    for (auto& [field, weight] : zero.weights) {
        weight = 0.0;
    }
    EXPECT_FALSE(zero.is_valid());

    scoring_config inverted;
    inverted.medium_confidence = 0.95;
    EXPECT_FALSE(inverted.is_valid());
}

}  // namespace
}  // namespace biz::dedup::match
