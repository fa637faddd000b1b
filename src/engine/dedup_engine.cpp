/**
 * @file dedup_engine.cpp
 * @brief Business deduplication engine implementation
 */

#include "biz/dedup/engine/dedup_engine.h"

#include "biz/dedup/integration/logger_adapter.h"
#include "biz/dedup/match/match_scorer.h"
#include "biz/dedup/merge/merge_strategy.h"
#include "biz/dedup/normalize/field_normalizer.h"
#include "biz/dedup/performance/thread_pool_manager.h"

#include <algorithm>
#include <atomic>
#include <format>
#include <future>
#include <iterator>
#include <mutex>
#include <numeric>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace biz::dedup::engine {

namespace {

// =============================================================================
// Helpers
// =============================================================================

[[nodiscard]] bool has_name(const record::business_record& rec) noexcept {
    return rec.name.find_first_not_of(" \t\r\n") != std::string::npos;
}

[[nodiscard]] record::record_issue make_issue(record::issue_kind kind,
                                              std::string record_id,
                                              std::optional<size_t> input_index,
                                              std::string message) {
    record::record_issue issue;
    issue.kind = kind;
    issue.record_id = std::move(record_id);
    issue.input_index = input_index;
    issue.message = std::move(message);
    return issue;
}

/**
 * @brief Union-find over batch positions
 *
 * The root of every set is its smallest position, so the root of a
 * cluster is always its first member in input order.
 */
class disjoint_set {
public:
    explicit disjoint_set(size_t size) : parent_(size) {
        std::iota(parent_.begin(), parent_.end(), size_t{0});
    }

    [[nodiscard]] size_t find(size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(size_t a, size_t b) {
        auto root_a = find(a);
        auto root_b = find(b);
        if (root_a == root_b) return;
        if (root_a < root_b) {
            parent_[root_b] = root_a;
        } else {
            parent_[root_a] = root_b;
        }
    }

private:
    std::vector<size_t> parent_;
};

/** A match between two batch positions; target precedes source */
struct batch_edge {
    size_t source = 0;
    size_t target = 0;
    record::match_result result;
};

/** Output of one comparison task */
struct compare_output {
    std::vector<batch_edge> edges;
    std::vector<record::match_evidence> existing;
    std::vector<record::record_issue> issues;
};

}  // namespace

// =============================================================================
// dedup_engine::impl
// =============================================================================

class dedup_engine::impl {
public:
    impl(std::shared_ptr<record_store> store, config::engine_config cfg,
         std::shared_ptr<similarity::similarity_scorer> external)
        : store_(store ? std::move(store)
                       : std::make_shared<in_memory_record_store>()),
          config_(std::move(cfg)),
          normalizer_(config_.normalization),
          matcher_(config_.scoring, config_.normalization),
          shared_index_(config_.blocking, config_.normalization),
          pool_(config_.pool) {
        auto& logger = integration::get_logger();
        logger.set_level(config_.log_level);

        for (const auto& error : config_.validate()) {
            logger.warning(std::format("{}: configuration {}: {}",
                                       config_.name, error.field_path,
                                       error.message));
        }

        if (auto started = pool_.start(); started) {
            pool_running_ = true;
        } else {
            logger.warning(std::format(
                "{}: comparison pool failed to start ({}); comparing inline",
                config_.name, performance::to_string(started.error())));
        }

        model_ = make_model(std::move(external));
    }

    ~impl() {
        if (pool_running_) {
            (void)pool_.stop(true);
        }
    }

    // =========================================================================
    // Index Maintenance
    // =========================================================================

    size_t rebuild_index() {
        shared_index_.clear();
        size_t indexed = 0;
        for (const auto& rec : store_->list()) {
            if (index(rec)) {
                ++indexed;
            }
        }
        integration::get_logger().info(std::format(
            "{}: index rebuilt with {} records ({} keys)", config_.name,
            indexed, shared_index_.key_count()));
        return indexed;
    }

    bool index(const record::business_record& rec) {
        if (rec.id.empty() || !has_name(rec)) {
            integration::get_logger().warning(std::format(
                "{}: not indexing record '{}' without {}", config_.name, rec.id,
                rec.id.empty() ? "id" : "name"));
            return false;
        }
        shared_index_.index(normalizer_.normalize(rec));
        return true;
    }

    bool remove(const std::string& id) { return shared_index_.remove(id); }

    // =========================================================================
    // Single Record Search
    // =========================================================================

    std::expected<find_result, match::dedup_error> find_duplicates(
        const record::business_record& rec,
        const match::dedup_options& options) {
        if (auto checked = check(options); !checked) {
            return std::unexpected(checked.error());
        }

        find_result result;
        result.options = options;

        auto model = current_model();
        auto query = normalizer_.prepare(rec, &result.issues);
        auto ids = shared_index_.candidates(query.normalized);
        result.candidates_examined = ids.size();

        for (const auto& id : ids) {
            auto candidate = resolve(id, result.issues);
            if (!candidate) continue;

            auto match = compare(query, *candidate, options, model.get(),
                                 &result.issues);
            if (match.is_duplicate(options.threshold)) {
                result.duplicates.push_back(std::move(match));
            }
        }

        std::sort(result.duplicates.begin(), result.duplicates.end(),
                  [](const record::match_result& a,
                     const record::match_result& b) {
                      if (a.score != b.score) return a.score > b.score;
                      return a.candidate_id < b.candidate_id;
                  });

        duplicates_found_.fetch_add(result.duplicates.size(),
                                    std::memory_order_relaxed);
        return result;
    }

    // =========================================================================
    // Batch Deduplication
    // =========================================================================

    std::expected<batch_result, match::dedup_error> deduplicate_batch(
        const std::vector<record::business_record>& records,
        const match::dedup_options& options) {
        if (auto checked = check(options); !checked) {
            return std::unexpected(checked.error());
        }

        auto& logger = integration::get_logger();
        const auto started_at = std::chrono::steady_clock::now();
        logger.info(std::format("{}: batch of {} records started (chunk size {})",
                                config_.name, records.size(),
                                options.batch_size));

        batch_result result;

        // Records without id or name, and repeated ids, never enter comparison
        std::vector<size_t> accepted;
        std::unordered_set<std::string> batch_ids;
        accepted.reserve(records.size());
        for (size_t i = 0; i < records.size(); ++i) {
            const auto& rec = records[i];
            std::optional<record::record_issue> issue;
            if (rec.id.empty()) {
                issue = make_issue(record::issue_kind::missing_id, {}, i,
                                   "record has no id");
            } else if (!has_name(rec)) {
                issue = make_issue(record::issue_kind::missing_name, rec.id, i,
                                   "record has no name");
            } else if (!batch_ids.insert(rec.id).second) {
                issue = make_issue(record::issue_kind::duplicate_id, rec.id, i,
                                   "id already seen earlier in the batch");
            }

            if (issue) {
                logger.warning(std::format("{}: skipping record #{}: {}",
                                           config_.name, i, issue->to_string()));
                result.issues.push_back(std::move(*issue));
            } else {
                accepted.push_back(i);
            }
        }
        result.skipped = records.size() - accepted.size();

        const size_t total = accepted.size();
        const size_t chunk_size = static_cast<size_t>(options.batch_size);
        auto model = current_model();
        auto [on_progress, on_duplicate] = callbacks();

        std::vector<normalize::prepared_record> prepared(total);
        std::unordered_map<std::string, size_t> position;
        position.reserve(total);
        index::candidate_index batch_index(config_.blocking,
                                           config_.normalization);
        disjoint_set clusters(total);
        std::vector<std::pair<size_t, record::match_evidence>> evidence;
        size_t matches_found = 0;

        for (size_t begin = 0; begin < total; begin += chunk_size) {
            const size_t end = std::min(total, begin + chunk_size);

            for (size_t pos = begin; pos < end; ++pos) {
                prepared[pos] =
                    normalizer_.prepare(records[accepted[pos]], &result.issues);
                position.emplace(prepared[pos].source.id, pos);
                batch_index.index(prepared[pos].normalized);
            }

            auto outputs = compare_chunk(prepared, position, batch_ids,
                                         batch_index, begin, end, options,
                                         model.get());

            // Sequential reduction in input order
            for (auto& output : outputs) {
                for (auto& edge : output.edges) {
                    clusters.unite(edge.source, edge.target);
                    record::match_evidence found{prepared[edge.source].source.id,
                                                 std::move(edge.result)};
                    if (on_duplicate) on_duplicate(found);
                    evidence.emplace_back(edge.source, std::move(found));
                    ++matches_found;
                }
                for (auto& found : output.existing) {
                    if (on_duplicate) on_duplicate(found);
                    result.existing_matches.push_back(std::move(found));
                }
                std::move(output.issues.begin(), output.issues.end(),
                          std::back_inserter(result.issues));
            }

            if (on_progress) {
                on_progress(batch_progress{end, total, matches_found});
            }
        }

        build_groups(result, prepared, clusters, std::move(evidence), options);

        result.total_processed = total;
        result.unique_businesses = result.groups.size();
        result.duplicates_found = total - result.unique_businesses;
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at);

        batches_processed_.fetch_add(1, std::memory_order_relaxed);
        records_skipped_.fetch_add(result.skipped, std::memory_order_relaxed);
        duplicates_found_.fetch_add(result.duplicates_found,
                                    std::memory_order_relaxed);

        logger.info(std::format(
            "{}: batch finished: {} processed, {} unique, {} duplicates, "
            "{} skipped, {} merged in {} ms",
            config_.name, result.total_processed, result.unique_businesses,
            result.duplicates_found, result.skipped, result.merged.size(),
            result.duration.count()));

        return result;
    }

    // =========================================================================
    // Merging
    // =========================================================================

    std::expected<record::merged_record, match::dedup_error> merge_records(
        const record::business_record& primary,
        const std::vector<record::business_record>& duplicates,
        record::merge_strategy_type type) {
        if (primary.id.empty()) {
            integration::get_logger().warning(std::format(
                "{}: merge rejected, primary record has no id", config_.name));
            return std::unexpected(match::dedup_error::empty_cluster);
        }

        auto strategy = merge::create_merge_strategy(type, config_.normalization);
        auto merged = strategy->merge(primary, duplicates);
        merges_completed_.fetch_add(1, std::memory_order_relaxed);
        return merged;
    }

    // =========================================================================
    // Scorer and Observers
    // =========================================================================

    void set_scorer(std::shared_ptr<similarity::similarity_scorer> scorer) {
        auto replacement = make_model(std::move(scorer));
        std::shared_ptr<similarity::bounded_scorer> previous;
        {
            std::unique_lock lock(model_mutex_);
            previous = std::exchange(model_, std::move(replacement));
        }
        if (previous) {
            retired_scorer_calls_.fetch_add(
                previous->statistics().calls.load(std::memory_order_relaxed),
                std::memory_order_relaxed);
        }
    }

    [[nodiscard]] std::shared_ptr<similarity::bounded_scorer> current_model()
        const {
        std::shared_lock lock(model_mutex_);
        return model_;
    }

    void set_progress_callback(progress_callback callback) {
        std::lock_guard lock(callback_mutex_);
        on_progress_ = std::move(callback);
    }

    void set_duplicate_callback(duplicate_callback callback) {
        std::lock_guard lock(callback_mutex_);
        on_duplicate_ = std::move(callback);
    }

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] engine_statistics statistics() const {
        engine_statistics stats;
        stats.comparisons = comparisons_.load(std::memory_order_relaxed);
        stats.duplicates_found = duplicates_found_.load(std::memory_order_relaxed);
        stats.merges_completed = merges_completed_.load(std::memory_order_relaxed);
        stats.batches_processed =
            batches_processed_.load(std::memory_order_relaxed);
        stats.records_skipped = records_skipped_.load(std::memory_order_relaxed);
        stats.scorer_calls =
            retired_scorer_calls_.load(std::memory_order_relaxed);
        if (auto model = current_model()) {
            stats.scorer_calls +=
                model->statistics().calls.load(std::memory_order_relaxed);
        }
        stats.scorer_fallbacks = scorer_fallbacks_.load(std::memory_order_relaxed);
        stats.stale_candidates = stale_candidates_.load(std::memory_order_relaxed);
        stats.indexed_records = shared_index_.size();
        return stats;
    }

    void reset_statistics() {
        comparisons_.store(0, std::memory_order_relaxed);
        duplicates_found_.store(0, std::memory_order_relaxed);
        merges_completed_.store(0, std::memory_order_relaxed);
        batches_processed_.store(0, std::memory_order_relaxed);
        records_skipped_.store(0, std::memory_order_relaxed);
        retired_scorer_calls_.store(0, std::memory_order_relaxed);
        scorer_fallbacks_.store(0, std::memory_order_relaxed);
        stale_candidates_.store(0, std::memory_order_relaxed);
    }

    [[nodiscard]] const config::engine_config& config() const noexcept {
        return config_;
    }

    [[nodiscard]] const index::candidate_index& shared_index() const noexcept {
        return shared_index_;
    }

private:
    [[nodiscard]] std::shared_ptr<similarity::bounded_scorer> make_model(
        std::shared_ptr<similarity::similarity_scorer> external) const {
        if (!external) return nullptr;
        return std::make_shared<similarity::bounded_scorer>(
            std::move(external), config_.scorer_threads, config_.scorer_timeout);
    }

    [[nodiscard]] std::pair<progress_callback, duplicate_callback> callbacks()
        const {
        std::lock_guard lock(callback_mutex_);
        return {on_progress_, on_duplicate_};
    }

    [[nodiscard]] std::expected<void, match::dedup_error> check(
        const match::dedup_options& options) const {
        if (auto errors = config_.scoring.validate(); !errors.empty()) {
            integration::get_logger().warning(std::format(
                "{}: scoring.{}: {}", config_.name, errors.front().field_path,
                errors.front().message));
            return std::unexpected(match::dedup_error::invalid_weights);
        }
        return match::check_options(options);
    }

    /**
     * @brief Load an indexed record from the store
     *
     * An id the store no longer resolves is reported and skipped.
     */
    [[nodiscard]] std::optional<normalize::prepared_record> resolve(
        const std::string& id, std::vector<record::record_issue>& issues) {
        auto stored = store_->get(id);
        if (!stored) {
            stale_candidates_.fetch_add(1, std::memory_order_relaxed);
            integration::get_logger().debug(std::format(
                "{}: indexed record '{}' is gone from the store", config_.name,
                id));
            issues.push_back(make_issue(record::issue_kind::stale_candidate, id,
                                        std::nullopt,
                                        "indexed record no longer in store"));
            return std::nullopt;
        }
        return normalizer_.prepare(*stored);
    }

    [[nodiscard]] record::match_result compare(
        const normalize::prepared_record& query,
        const normalize::prepared_record& candidate,
        const match::dedup_options& options, similarity::bounded_scorer* model,
        std::vector<record::record_issue>* issues) {
        auto result = matcher_.compare(query, candidate, options, model, issues);
        comparisons_.fetch_add(1, std::memory_order_relaxed);
        if (result.scorer_fallback) {
            scorer_fallbacks_.fetch_add(1, std::memory_order_relaxed);
        }
        return result;
    }

    /**
     * @brief Compare records [first, last) against earlier batch records
     *        and the shared index
     */
    [[nodiscard]] compare_output compare_range(
        const std::vector<normalize::prepared_record>& prepared,
        const std::unordered_map<std::string, size_t>& position,
        const std::unordered_set<std::string>& batch_ids,
        const index::candidate_index& batch_index, size_t first, size_t last,
        const match::dedup_options& options,
        similarity::bounded_scorer* model) {
        compare_output output;

        for (size_t pos = first; pos < last; ++pos) {
            const auto& query = prepared[pos];

            std::vector<size_t> earlier;
            for (const auto& id : batch_index.candidates(query.normalized)) {
                auto it = position.find(id);
                if (it != position.end() && it->second < pos) {
                    earlier.push_back(it->second);
                }
            }
            std::sort(earlier.begin(), earlier.end());

            for (auto target : earlier) {
                auto match = compare(query, prepared[target], options, model,
                                     &output.issues);
                if (match.is_duplicate(options.threshold)) {
                    output.edges.push_back({pos, target, std::move(match)});
                }
            }

            for (const auto& id : shared_index_.candidates(query.normalized)) {
                // The batch copy of a record supersedes the indexed one
                if (batch_ids.contains(id)) continue;

                auto candidate = resolve(id, output.issues);
                if (!candidate) continue;

                auto match = compare(query, *candidate, options, model,
                                     &output.issues);
                if (match.is_duplicate(options.threshold)) {
                    output.existing.push_back({query.source.id, std::move(match)});
                }
            }
        }

        return output;
    }

    /**
     * @brief Compare one chunk, split into ranges across the pool
     *
     * Outputs are returned in range order so the reduction does not
     * depend on task completion order.
     */
    [[nodiscard]] std::vector<compare_output> compare_chunk(
        const std::vector<normalize::prepared_record>& prepared,
        const std::unordered_map<std::string, size_t>& position,
        const std::unordered_set<std::string>& batch_ids,
        const index::candidate_index& batch_index, size_t begin, size_t end,
        const match::dedup_options& options,
        similarity::bounded_scorer* model) {
        const size_t count = end - begin;
        const size_t workers =
            pool_running_ ? std::max<size_t>(1, pool_.thread_count()) : 1;
        const size_t task_count = std::max<size_t>(1, std::min(count, workers * 4));
        const size_t per_task = (count + task_count - 1) / task_count;

        std::vector<compare_output> outputs;
        if (!pool_running_ || task_count == 1) {
            outputs.push_back(compare_range(prepared, position, batch_ids,
                                            batch_index, begin, end, options,
                                            model));
            return outputs;
        }

        std::vector<std::future<compare_output>> futures;
        futures.reserve(task_count);
        for (size_t first = begin; first < end; first += per_task) {
            const size_t last = std::min(end, first + per_task);
            futures.push_back(pool_.submit(
                [this, &prepared, &position, &batch_ids, &batch_index,
                 &options, model, first, last]() {
                    return compare_range(prepared, position, batch_ids,
                                         batch_index, first, last, options,
                                         model);
                }));
        }

        // Every task references this frame; wait for all before collecting
        for (auto& future : futures) {
            future.wait();
        }

        outputs.reserve(futures.size());
        for (auto& future : futures) {
            outputs.push_back(future.get());
        }
        return outputs;
    }

    void build_groups(
        batch_result& result,
        const std::vector<normalize::prepared_record>& prepared,
        disjoint_set& clusters,
        std::vector<std::pair<size_t, record::match_evidence>> evidence,
        const match::dedup_options& options) {
        constexpr size_t no_group = static_cast<size_t>(-1);
        std::vector<size_t> group_of(prepared.size(), no_group);
        std::vector<std::vector<size_t>> members;

        for (size_t pos = 0; pos < prepared.size(); ++pos) {
            auto root = clusters.find(pos);
            if (group_of[root] == no_group) {
                group_of[root] = result.groups.size();
                result.groups.emplace_back();
                members.emplace_back();
            }
            auto group = group_of[root];
            result.groups[group].member_ids.push_back(prepared[pos].source.id);
            members[group].push_back(pos);
        }

        for (auto& [source, found] : evidence) {
            auto group = group_of[clusters.find(source)];
            result.groups[group].evidence.push_back(std::move(found));
        }

        std::unique_ptr<merge::merge_strategy> strategy;
        if (options.auto_merge) {
            strategy = merge::create_merge_strategy(options.merge_strategy,
                                                    config_.normalization);
        }

        for (size_t group = 0; group < result.groups.size(); ++group) {
            std::vector<record::business_record> sources;
            sources.reserve(members[group].size());
            for (auto pos : members[group]) {
                sources.push_back(prepared[pos].source);
            }

            auto canonical = merge::select_primary(sources);
            result.groups[group].canonical_id = sources[canonical].id;

            if (!strategy || sources.size() < 2) continue;

            std::vector<record::business_record> duplicates;
            duplicates.reserve(sources.size() - 1);
            for (size_t i = 0; i < sources.size(); ++i) {
                if (i != canonical) duplicates.push_back(sources[i]);
            }
            result.merged.push_back(
                strategy->merge(sources[canonical], duplicates));
            merges_completed_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    std::shared_ptr<record_store> store_;
    config::engine_config config_;
    normalize::field_normalizer normalizer_;
    match::match_scorer matcher_;
    index::candidate_index shared_index_;
    performance::thread_pool_manager pool_;
    bool pool_running_ = false;

    mutable std::shared_mutex model_mutex_;
    std::shared_ptr<similarity::bounded_scorer> model_;

    mutable std::mutex callback_mutex_;
    progress_callback on_progress_;
    duplicate_callback on_duplicate_;

    std::atomic<uint64_t> comparisons_{0};
    std::atomic<uint64_t> duplicates_found_{0};
    std::atomic<uint64_t> merges_completed_{0};
    std::atomic<uint64_t> batches_processed_{0};
    std::atomic<uint64_t> records_skipped_{0};
    std::atomic<uint64_t> retired_scorer_calls_{0};
    std::atomic<uint64_t> scorer_fallbacks_{0};
    std::atomic<uint64_t> stale_candidates_{0};
};

// =============================================================================
// dedup_engine
// =============================================================================

dedup_engine::dedup_engine(
    std::shared_ptr<record_store> store, config::engine_config config,
    std::shared_ptr<similarity::similarity_scorer> scorer)
    : pimpl_(std::make_unique<impl>(std::move(store), std::move(config),
                                    std::move(scorer))) {}

dedup_engine::~dedup_engine() = default;

size_t dedup_engine::rebuild_index() { return pimpl_->rebuild_index(); }

bool dedup_engine::index(const record::business_record& record) {
    return pimpl_->index(record);
}

bool dedup_engine::remove(const std::string& id) { return pimpl_->remove(id); }

const index::candidate_index& dedup_engine::candidates() const noexcept {
    return pimpl_->shared_index();
}

std::expected<find_result, match::dedup_error> dedup_engine::find_duplicates(
    const record::business_record& record,
    const match::dedup_options& options) const {
    return pimpl_->find_duplicates(record, options);
}

std::expected<find_result, match::dedup_error> dedup_engine::find_duplicates(
    const record::business_record& record) const {
    return pimpl_->find_duplicates(record, pimpl_->config().default_options);
}

std::expected<batch_result, match::dedup_error> dedup_engine::deduplicate_batch(
    const std::vector<record::business_record>& records,
    const match::dedup_options& options) const {
    return pimpl_->deduplicate_batch(records, options);
}

std::expected<batch_result, match::dedup_error> dedup_engine::deduplicate_batch(
    const std::vector<record::business_record>& records) const {
    return pimpl_->deduplicate_batch(records, pimpl_->config().default_options);
}

std::expected<record::merged_record, match::dedup_error>
dedup_engine::merge_businesses(
    const record::business_record& primary,
    const std::vector<record::business_record>& duplicates,
    record::merge_strategy_type strategy) const {
    return pimpl_->merge_records(primary, duplicates, strategy);
}

std::expected<record::merged_record, match::dedup_error>
dedup_engine::merge_businesses(
    const record::business_record& primary,
    const std::vector<record::business_record>& duplicates,
    const match::option_values& values) const {
    auto options = match::make_options(values, pimpl_->config().default_options);
    if (!options) {
        return std::unexpected(options.error());
    }
    return pimpl_->merge_records(primary, duplicates, options->merge_strategy);
}

void dedup_engine::set_scorer(
    std::shared_ptr<similarity::similarity_scorer> scorer) {
    pimpl_->set_scorer(std::move(scorer));
}

bool dedup_engine::has_scorer() const {
    auto model = pimpl_->current_model();
    return model != nullptr && model->available();
}

void dedup_engine::set_progress_callback(progress_callback callback) {
    pimpl_->set_progress_callback(std::move(callback));
}

void dedup_engine::set_duplicate_callback(duplicate_callback callback) {
    pimpl_->set_duplicate_callback(std::move(callback));
}

engine_statistics dedup_engine::statistics() const {
    return pimpl_->statistics();
}

void dedup_engine::reset_statistics() { pimpl_->reset_statistics(); }

const config::engine_config& dedup_engine::config() const noexcept {
    return pimpl_->config();
}

}  // namespace biz::dedup::engine
