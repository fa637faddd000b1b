/**
 * @file dedup_engine_test.cpp
 * @brief Unit tests for the deduplication engine
 *
 * Covers single-record search against the record store, batch
 * clustering, merging, callbacks and external scorer fallback.
 *
 * @see include/biz/dedup/engine/dedup_engine.h
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "biz/dedup/engine/dedup_engine.h"
#include "biz/dedup/engine/record_store.h"

#include "utils/test_helpers.h"

#include <future>
#include <set>
#include <stdexcept>

namespace biz::dedup::engine {
namespace {

using namespace biz::dedup::test;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;
using record::business_field;
using record::issue_kind;

// =============================================================================
// Mock Scorer
// =============================================================================

class mock_scorer : public similarity::similarity_scorer {
public:
    MOCK_METHOD(double, score,
                (const record::business_record&, const record::business_record&),
                (override));
    MOCK_METHOD(std::string_view, name, (), (const, noexcept, override));
};

// =============================================================================
// Test Fixture
// =============================================================================

class DedupEngineTest : public biz_dedup_test {
protected:
    void SetUp() override {
        biz_dedup_test::SetUp();
        store_ = std::make_shared<in_memory_record_store>();
    }

    [[nodiscard]] std::unique_ptr<dedup_engine> make_engine(
        config::engine_config config = {},
        std::shared_ptr<similarity::similarity_scorer> scorer = nullptr) {
        config.pool.min_threads = 2;
        return std::make_unique<dedup_engine>(store_, std::move(config),
                                              std::move(scorer));
    }

    [[nodiscard]] static std::shared_ptr<mock_scorer> make_mock() {
        auto mock = std::make_shared<mock_scorer>();
        ON_CALL(*mock, name()).WillByDefault(Return(std::string_view("mock")));
        EXPECT_CALL(*mock, name()).Times(::testing::AnyNumber());
        return mock;
    }

    static std::vector<record::business_record> three_records() {
        auto first = samples::named("r1", "Duplicate Business");
        first.email = "info@dup.com";
        auto second = samples::named("r2", "Duplicate Business Inc");
        second.email = "contact@dup.com";
        auto third = samples::named("r3", "Unique Business");
        third.email = "unique@different.com";
        return {first, second, third};
    }

    std::shared_ptr<in_memory_record_store> store_;
};

// =============================================================================
// Index Maintenance
// =============================================================================

TEST_F(DedupEngineTest, RebuildIndexFromStore) {
    store_->put(samples::complete("biz-1"));
    store_->put(samples::named("biz-2", "Northern Bakery"));
    auto engine = make_engine();

    EXPECT_EQ(engine->rebuild_index(), 2u);
    EXPECT_EQ(engine->candidates().size(), 2u);
    EXPECT_EQ(engine->statistics().indexed_records, 2u);
}

TEST_F(DedupEngineTest, IndexRejectsRecordsWithoutIdOrName) {
    auto engine = make_engine();
    EXPECT_FALSE(engine->index(samples::named("", "Acme")));
    EXPECT_FALSE(engine->index(samples::named("biz-1", "   ")));
    EXPECT_TRUE(engine->index(samples::named("biz-2", "Acme")));
    EXPECT_GE(log().count(integration::log_level::warning), 2u);
}

TEST_F(DedupEngineTest, RemoveFromIndex) {
    auto engine = make_engine();
    ASSERT_TRUE(engine->index(samples::complete("biz-1")));
    EXPECT_TRUE(engine->remove("biz-1"));
    EXPECT_FALSE(engine->remove("biz-1"));
}

// =============================================================================
// Single Record Search
// =============================================================================

TEST_F(DedupEngineTest, FindDuplicatesInStore) {
    store_->put(samples::complete("biz-1"));
    store_->put(samples::named("biz-2", "Northern Bakery"));
    auto engine = make_engine();
    engine->rebuild_index();

    auto result = engine->find_duplicates(samples::complete("query"));
    ASSERT_EXPECTED_OK(result);
    ASSERT_EQ(result->duplicates.size(), 1u);
    EXPECT_EQ(result->duplicates[0].candidate_id, "biz-1");
    EXPECT_DOUBLE_EQ(result->duplicates[0].score, 1.0);
    EXPECT_EQ(result->duplicates[0].confidence, record::match_confidence::high);
    EXPECT_DOUBLE_EQ(result->options.threshold, 0.8);
}

TEST_F(DedupEngineTest, FindDuplicatesSortedByScore) {
    auto exact = samples::named("exact", "Indigenous Tech Solutions");
    auto close = samples::named("close", "Indigenous Tech Solution");
    close.industry = {"Retail"};
    auto query = samples::named("query", "Indigenous Tech Solutions");
    query.industry = {"Technology"};
    exact.industry = {"Technology"};

    store_->put(close);
    store_->put(exact);
    auto engine = make_engine();
    engine->rebuild_index();

    auto result = engine->find_duplicates(query);
    ASSERT_EXPECTED_OK(result);
    ASSERT_EQ(result->duplicates.size(), 2u);
    EXPECT_EQ(result->duplicates[0].candidate_id, "exact");
    EXPECT_EQ(result->duplicates[1].candidate_id, "close");
    EXPECT_GE(result->duplicates[0].score, result->duplicates[1].score);
}

TEST_F(DedupEngineTest, FindDuplicatesHonorsThreshold) {
    store_->put(samples::named("biz-1", "Indigenous Tech Solution"));
    auto engine = make_engine();
    engine->rebuild_index();

    match::dedup_options options;
    options.algorithms = {record::match_algorithm::string};
    options.threshold = 0.99;

    auto result = engine->find_duplicates(
        samples::named("query", "Indigenous Tech Solutions"), options);
    ASSERT_EXPECTED_OK(result);
    EXPECT_TRUE(result->duplicates.empty());
    EXPECT_EQ(result->candidates_examined, 1u);
}

TEST_F(DedupEngineTest, StaleCandidateIsSkipped) {
    store_->put(samples::complete("biz-1"));
    store_->put(samples::complete("biz-2"));
    auto engine = make_engine();
    engine->rebuild_index();
    store_->erase("biz-2");

    auto result = engine->find_duplicates(samples::complete("query"));
    ASSERT_EXPECTED_OK(result);
    ASSERT_EQ(result->duplicates.size(), 1u);
    EXPECT_EQ(result->duplicates[0].candidate_id, "biz-1");

    ASSERT_EQ(result->issues.size(), 1u);
    EXPECT_EQ(result->issues[0].kind, issue_kind::stale_candidate);
    EXPECT_EQ(result->issues[0].record_id, "biz-2");
    EXPECT_EQ(engine->statistics().stale_candidates, 1u);
}

TEST_F(DedupEngineTest, InvalidOptionsAreRejected) {
    auto engine = make_engine();

    match::dedup_options options;
    options.threshold = 2.0;
    auto result = engine->find_duplicates(samples::complete("query"), options);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), match::dedup_error::invalid_threshold);

    options.threshold = 0.8;
    options.batch_size = 0;
    auto batch = engine->deduplicate_batch(three_records(), options);
    ASSERT_EXPECTED_ERROR(batch);
    EXPECT_EQ(batch.error(), match::dedup_error::invalid_batch_size);
    EXPECT_EQ(engine->statistics().comparisons, 0u);
}

TEST_F(DedupEngineTest, InvalidScoringWeightsAreRejected) {
    config::engine_config config;
    for (auto& [field, weight] : config.scoring.weights) {
        weight = 0.0;
    }
    auto engine = make_engine(config);

    auto result = engine->find_duplicates(samples::complete("query"));
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), match::dedup_error::invalid_weights);
}

TEST_F(DedupEngineTest, UnusableFieldsAreReported) {
    auto engine = make_engine();
    auto query = samples::named("query", "Acme");
    query.phone = "12";

    auto result = engine->find_duplicates(query);
    ASSERT_EXPECTED_OK(result);
    ASSERT_EQ(result->issues.size(), 1u);
    EXPECT_EQ(result->issues[0].kind, issue_kind::invalid_value);
    EXPECT_EQ(result->issues[0].field, business_field::phone);
}

// =============================================================================
// Batch Deduplication
// =============================================================================

TEST_F(DedupEngineTest, SmallBatch) {
    auto engine = make_engine();
    auto result = engine->deduplicate_batch(three_records());
    ASSERT_EXPECTED_OK(result);

    EXPECT_EQ(result->total_processed, 3u);
    EXPECT_EQ(result->unique_businesses, 2u);
    EXPECT_EQ(result->duplicates_found, 1u);
    ASSERT_EQ(result->groups.size(), 2u);
    EXPECT_EQ(result->groups[0].member_ids,
              (std::vector<std::string>{"r1", "r2"}));
    EXPECT_EQ(result->groups[1].member_ids, (std::vector<std::string>{"r3"}));
    ASSERT_EQ(result->groups[0].evidence.size(), 1u);
    EXPECT_EQ(result->groups[0].evidence[0].source_id, "r2");
    EXPECT_EQ(result->groups[0].evidence[0].result.candidate_id, "r1");
    EXPECT_TRUE(result->merged.empty());
    EXPECT_TRUE(log().contains("batch finished"));
}

TEST_F(DedupEngineTest, BatchGroupsTransitiveMatches) {
    auto first = samples::named("a", "Maple Leaf Catering");
    first.phone = "613-555-0101";
    auto second = samples::named("b", "Riverside Auto Repair");
    second.phone = "(613) 555-0101";
    second.email = "office@riverside-auto.ca";
    auto third = samples::named("c", "Northern Lights Bakery");
    third.email = "Office@Riverside-Auto.ca";

    auto engine = make_engine();
    auto result = engine->deduplicate_batch({first, second, third});
    ASSERT_EXPECTED_OK(result);

    EXPECT_EQ(result->total_processed, 3u);
    EXPECT_EQ(result->duplicates_found, 2u);
    EXPECT_EQ(result->unique_businesses, 1u);
    ASSERT_EQ(result->groups.size(), 1u);
    EXPECT_EQ(result->groups[0].member_ids,
              (std::vector<std::string>{"a", "b", "c"}));

    // a and c share nothing, so only the two direct links are evidence
    std::set<std::pair<std::string, std::string>> edges;
    for (const auto& link : result->groups[0].evidence) {
        edges.emplace(link.source_id, link.result.candidate_id);
    }
    ASSERT_EQ(result->groups[0].evidence.size(), 2u);
    EXPECT_EQ(edges, (std::set<std::pair<std::string, std::string>>{
                         {"b", "a"}, {"c", "b"}}));
}

TEST_F(DedupEngineTest, EmptyBatch) {
    auto engine = make_engine();
    auto result = engine->deduplicate_batch({});
    ASSERT_EXPECTED_OK(result);
    EXPECT_EQ(result->total_processed, 0u);
    EXPECT_TRUE(result->groups.empty());
}

TEST_F(DedupEngineTest, UnusableRecordsAreSkipped) {
    auto records = three_records();
    records.push_back(samples::named("", "No Id"));
    records.push_back(samples::named("r4", ""));
    records.push_back(samples::named("r1", "Repeated Id"));

    auto engine = make_engine();
    auto result = engine->deduplicate_batch(records);
    ASSERT_EXPECTED_OK(result);

    EXPECT_EQ(result->skipped, 3u);
    EXPECT_EQ(result->total_processed, 3u);
    EXPECT_EQ(result->unique_businesses, 2u);

    std::vector<issue_kind> kinds;
    for (const auto& issue : result->issues) {
        kinds.push_back(issue.kind);
    }
    EXPECT_EQ(kinds, (std::vector<issue_kind>{issue_kind::missing_id,
                                              issue_kind::missing_name,
                                              issue_kind::duplicate_id}));
    EXPECT_EQ(result->issues[0].input_index, 3u);
    EXPECT_EQ(engine->statistics().records_skipped, 3u);
}

TEST_F(DedupEngineTest, EveryRecordInExactlyOneGroup) {
    auto records = samples::repeated_businesses(20, 5);
    auto engine = make_engine();
    auto result = engine->deduplicate_batch(records);
    ASSERT_EXPECTED_OK(result);

    std::multiset<std::string> seen;
    size_t members = 0;
    for (const auto& group : result->groups) {
        members += group.size();
        seen.insert(group.member_ids.begin(), group.member_ids.end());
    }
    EXPECT_EQ(members, result->total_processed);
    for (const auto& rec : records) {
        EXPECT_EQ(seen.count(rec.id), 1u) << rec.id;
    }
    EXPECT_EQ(result->unique_businesses + result->duplicates_found,
              result->total_processed);
}

TEST_F(DedupEngineTest, ThousandRecordBatch) {
    auto records = samples::repeated_businesses();
    ASSERT_EQ(records.size(), 1000u);

    auto engine = make_engine();
    scoped_timer timer;
    auto result = engine->deduplicate_batch(records);
    auto elapsed = timer.elapsed_ms();
    ASSERT_EXPECTED_OK(result);

    EXPECT_EQ(result->total_processed, 1000u);
    EXPECT_EQ(result->unique_businesses, 100u);
    EXPECT_EQ(result->duplicates_found, 900u);
    for (const auto& group : result->groups) {
        EXPECT_EQ(group.size(), 10u);
    }
    EXPECT_LT(elapsed, 30000);
}

TEST_F(DedupEngineTest, BatchResultIsReproducible) {
    auto records = samples::repeated_businesses(30, 4);
    auto engine = make_engine();

    auto first = engine->deduplicate_batch(records);
    auto second = engine->deduplicate_batch(records);
    ASSERT_EXPECTED_OK(first);
    ASSERT_EXPECTED_OK(second);

    ASSERT_EQ(first->groups.size(), second->groups.size());
    for (size_t i = 0; i < first->groups.size(); ++i) {
        EXPECT_EQ(first->groups[i].member_ids, second->groups[i].member_ids);
        EXPECT_EQ(first->groups[i].canonical_id, second->groups[i].canonical_id);
    }
    EXPECT_EQ(first->groups[0].member_ids.front(), "biz-0-0");
}

TEST_F(DedupEngineTest, SmallChunksGiveSameGroups) {
    auto records = samples::repeated_businesses(10, 3);
    auto engine = make_engine();

    match::dedup_options small;
    small.batch_size = 7;
    auto chunked = engine->deduplicate_batch(records, small);
    auto whole = engine->deduplicate_batch(records);
    ASSERT_EXPECTED_OK(chunked);
    ASSERT_EXPECTED_OK(whole);

    ASSERT_EQ(chunked->groups.size(), 10u);
    for (size_t i = 0; i < whole->groups.size(); ++i) {
        EXPECT_EQ(chunked->groups[i].member_ids, whole->groups[i].member_ids);
    }
}

TEST_F(DedupEngineTest, BatchReportsMatchesAgainstIndex) {
    store_->put(samples::complete("stored"));
    auto engine = make_engine();
    engine->rebuild_index();

    auto result = engine->deduplicate_batch(
        {samples::complete("incoming"), samples::named("other", "Zenith Motors")});
    ASSERT_EXPECTED_OK(result);

    ASSERT_EQ(result->existing_matches.size(), 1u);
    EXPECT_EQ(result->existing_matches[0].source_id, "incoming");
    EXPECT_EQ(result->existing_matches[0].result.candidate_id, "stored");
    EXPECT_EQ(result->groups.size(), 2u);
}

TEST_F(DedupEngineTest, BatchCopySupersedesIndexedRecord) {
    store_->put(samples::complete("biz-1"));
    auto engine = make_engine();
    engine->rebuild_index();

    auto result = engine->deduplicate_batch({samples::complete("biz-1")});
    ASSERT_EXPECTED_OK(result);
    EXPECT_TRUE(result->existing_matches.empty());
}

TEST_F(DedupEngineTest, AutoMergeBuildsMergedRecords) {
    auto records = three_records();
    records[1].phone = "555-123-4567";

    match::dedup_options options;
    options.auto_merge = true;
    options.merge_strategy = record::merge_strategy_type::preserve_primary;

    auto engine = make_engine();
    auto result = engine->deduplicate_batch(records, options);
    ASSERT_EXPECTED_OK(result);

    ASSERT_EQ(result->merged.size(), 1u);
    const auto& merged = result->merged[0];
    EXPECT_EQ(merged.record.id, result->groups[0].canonical_id);
    EXPECT_EQ(merged.record.id, "r2");
    EXPECT_EQ(merged.merged_from, (std::vector<std::string>{"r2", "r1"}));
    EXPECT_EQ(merged.strategy, record::merge_strategy_type::preserve_primary);
    EXPECT_EQ(engine->statistics().merges_completed, 1u);
}

// =============================================================================
// Callbacks
// =============================================================================

TEST_F(DedupEngineTest, ProgressAndDuplicateCallbacks) {
    auto engine = make_engine();

    std::vector<batch_progress> progress;
    std::vector<std::string> duplicates;
    engine->set_progress_callback(
        [&](const batch_progress& p) { progress.push_back(p); });
    engine->set_duplicate_callback([&](const record::match_evidence& e) {
        duplicates.push_back(e.source_id + "->" + e.result.candidate_id);
    });

    match::dedup_options options;
    options.batch_size = 1;
    auto result = engine->deduplicate_batch(three_records(), options);
    ASSERT_EXPECTED_OK(result);

    ASSERT_EQ(progress.size(), 3u);
    EXPECT_EQ(progress[0].processed, 1u);
    EXPECT_EQ(progress[2].processed, 3u);
    EXPECT_EQ(progress[2].total, 3u);
    EXPECT_EQ(progress[2].matches_found, 1u);
    EXPECT_EQ(duplicates, (std::vector<std::string>{"r2->r1"}));
}

// =============================================================================
// Merging
// =============================================================================

TEST_F(DedupEngineTest, MergeBusinesses) {
    auto engine = make_engine();
    auto primary = samples::named("p", "Acme");
    auto duplicate = samples::complete("d");

    auto merged = engine->merge_businesses(
        primary, {duplicate}, record::merge_strategy_type::preserve_primary);
    ASSERT_EXPECTED_OK(merged);
    EXPECT_EQ(merged->record.id, "p");
    EXPECT_EQ(merged->record.name, "Acme");
    EXPECT_EQ(merged->record.phone, duplicate.phone);
}

TEST_F(DedupEngineTest, MergeBusinessesWithQualityOption) {
    auto engine = make_engine();
    auto a = samples::named("a", "Acme");
    a.email = "not-valid";
    a.confidence = 0.2;
    auto b = samples::named("b", "Acme");
    b.email = "hello@acme.ca";
    b.confidence = 0.9;

    match::option_values values;
    values.merge_strategy = "quality";
    auto merged = engine->merge_businesses(a, {b}, values);
    ASSERT_EXPECTED_OK(merged);
    EXPECT_EQ(merged->record.email, "hello@acme.ca");
    EXPECT_EQ(merged->strategy, record::merge_strategy_type::quality);
}

TEST_F(DedupEngineTest, MergeRejectsBadInput) {
    auto engine = make_engine();

    match::option_values values;
    values.merge_strategy = "latest";
    auto unknown = engine->merge_businesses(samples::named("a", "Acme"), {}, values);
    ASSERT_EXPECTED_ERROR(unknown);
    EXPECT_EQ(unknown.error(), match::dedup_error::invalid_merge_strategy);

    auto no_id = engine->merge_businesses(samples::named("", "Acme"), {});
    ASSERT_EXPECTED_ERROR(no_id);
    EXPECT_EQ(no_id.error(), match::dedup_error::empty_cluster);
}

// =============================================================================
// External Scorer
// =============================================================================

TEST_F(DedupEngineTest, DeepCheckBlendsModelScore) {
    auto mock = make_mock();
    EXPECT_CALL(*mock, score(_, _)).WillRepeatedly(Return(0.8));

    store_->put(samples::named("stored", "Northern Lights Cafe"));
    auto engine = make_engine({}, mock);
    engine->rebuild_index();
    ASSERT_TRUE(engine->has_scorer());

    match::dedup_options options;
    options.deep_check = true;
    auto result = engine->find_duplicates(
        samples::named("query", "Northern Lights Cafe"), options);
    ASSERT_EXPECTED_OK(result);
    ASSERT_EQ(result->duplicates.size(), 1u);
    EXPECT_DOUBLE_EQ(result->duplicates[0].score, 0.9);
    EXPECT_EQ(result->duplicates[0].model_score, 0.8);
    EXPECT_EQ(engine->statistics().scorer_calls, 1u);
}

TEST_F(DedupEngineTest, ThrowingScorerFallsBack) {
    auto mock = make_mock();
    EXPECT_CALL(*mock, score(_, _))
        .WillRepeatedly(::testing::Throw(std::runtime_error("model down")));

    store_->put(samples::named("stored", "Northern Lights Cafe"));
    auto engine = make_engine({}, mock);
    engine->rebuild_index();

    match::dedup_options options;
    options.deep_check = true;
    auto result = engine->find_duplicates(
        samples::named("query", "Northern Lights Cafe"), options);
    ASSERT_EXPECTED_OK(result);
    ASSERT_EQ(result->duplicates.size(), 1u);
    EXPECT_TRUE(result->duplicates[0].scorer_fallback);
    EXPECT_DOUBLE_EQ(result->duplicates[0].score, 1.0);

    ASSERT_EQ(result->issues.size(), 1u);
    EXPECT_EQ(result->issues[0].kind, issue_kind::scorer_failed);
    EXPECT_EQ(engine->statistics().scorer_fallbacks, 1u);
}

TEST_F(DedupEngineTest, SlowScorerTimesOut) {
    std::promise<void> release;
    auto released = release.get_future().share();

    auto mock = make_mock();
    EXPECT_CALL(*mock, score(_, _))
        .WillRepeatedly([released](const record::business_record&,
                                   const record::business_record&) {
            released.wait_for(2s);
            return 0.9;
        });

    config::engine_config config;
    config.scorer_timeout = 20ms;
    store_->put(samples::named("stored", "Northern Lights Cafe"));
    auto engine = make_engine(config, mock);
    engine->rebuild_index();

    match::dedup_options options;
    options.deep_check = true;
    auto result = engine->find_duplicates(
        samples::named("query", "Northern Lights Cafe"), options);
    release.set_value();

    ASSERT_EXPECTED_OK(result);
    ASSERT_EQ(result->duplicates.size(), 1u);
    EXPECT_TRUE(result->duplicates[0].scorer_fallback);
    ASSERT_EQ(result->issues.size(), 1u);
    EXPECT_EQ(result->issues[0].kind, issue_kind::scorer_timeout);
}

TEST_F(DedupEngineTest, DeepCheckWithoutScorerFallsBack) {
    store_->put(samples::named("stored", "Northern Lights Cafe"));
    auto engine = make_engine();
    engine->rebuild_index();
    EXPECT_FALSE(engine->has_scorer());

    match::dedup_options options;
    options.deep_check = true;
    auto result = engine->find_duplicates(
        samples::named("query", "Northern Lights Cafe"), options);
    ASSERT_EXPECTED_OK(result);
    ASSERT_EQ(result->duplicates.size(), 1u);
    EXPECT_TRUE(result->duplicates[0].scorer_fallback);
    EXPECT_TRUE(result->issues.empty());
}

TEST_F(DedupEngineTest, ScorerCanBeReplaced) {
    auto engine = make_engine();
    EXPECT_FALSE(engine->has_scorer());

    engine->set_scorer(similarity::make_scorer(
        "fixed", [](const auto&, const auto&) { return 0.5; }));
    EXPECT_TRUE(engine->has_scorer());

    engine->set_scorer(std::shared_ptr<similarity::similarity_scorer>{});
    EXPECT_FALSE(engine->has_scorer());
}

// =============================================================================
// Statistics
// =============================================================================

TEST_F(DedupEngineTest, StatisticsTrackWork) {
    auto engine = make_engine();
    auto result = engine->deduplicate_batch(three_records());
    ASSERT_EXPECTED_OK(result);

    auto stats = engine->statistics();
    EXPECT_EQ(stats.batches_processed, 1u);
    EXPECT_GE(stats.comparisons, 1u);
    EXPECT_EQ(stats.duplicates_found, 1u);

    engine->reset_statistics();
    stats = engine->statistics();
    EXPECT_EQ(stats.batches_processed, 0u);
    EXPECT_EQ(stats.comparisons, 0u);
}

}  // namespace
}  // namespace biz::dedup::engine
