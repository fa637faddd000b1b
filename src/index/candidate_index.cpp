/**
 * @file candidate_index.cpp
 * @brief Sharded blocking index implementation
 */

#include "biz/dedup/index/candidate_index.h"

#include "biz/dedup/similarity/string_similarity.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <functional>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <unordered_map>

namespace biz::dedup::index {

// =============================================================================
// Blocking Keys
// =============================================================================

namespace {

void add_key(std::vector<index_key>& keys, std::string value,
             key_strength strength) {
    auto it = std::find_if(keys.begin(), keys.end(), [&](const index_key& k) {
        return k.value == value;
    });
    if (it == keys.end()) {
        keys.push_back({std::move(value), strength});
    }
}

bool all_alpha(const std::string& token) {
    return !token.empty() &&
           std::all_of(token.begin(), token.end(), [](unsigned char c) {
               return std::isalpha(c) != 0;
           });
}

}  // namespace

std::vector<index_key> blocking_keys(const normalize::normalized_record& record,
                                     const normalize::normalization_rules& rules,
                                     const index_config& config) {
    std::vector<index_key> keys;

    // Strong identifiers
    if (record.business_number) {
        add_key(keys, "bn:" + *record.business_number, key_strength::strong);
    }
    if (record.phone && !record.phone->digits.empty()) {
        const auto& digits = record.phone->digits;
        size_t take = std::min(digits.size(), config.phone_key_digits);
        add_key(keys, "ph:" + digits.substr(digits.size() - take),
                key_strength::strong);
    }
    if (record.email) {
        add_key(keys, "em:" + record.email->address, key_strength::strong);
    }
    if (record.website) {
        add_key(keys, "ws:" + *record.website, key_strength::strong);
    }

    // Name
    const auto& name = record.name;
    if (!name.empty()) {
        add_key(keys, "nm:" + name.canonical, key_strength::medium);

        auto sorted = name.tokens;
        std::sort(sorted.begin(), sorted.end());
        std::string token_key;
        for (const auto& token : sorted) {
            if (!token_key.empty()) token_key += ' ';
            token_key += token;
        }
        add_key(keys, "nt:" + token_key, key_strength::medium);

        add_key(keys, "np:" + similarity::phonetic_key(name.tokens),
                key_strength::weak);
        add_key(keys, "nx:" + name.canonical.substr(0, config.name_prefix_length),
                key_strength::weak);

        // "ibm" blocks with "international business machines"
        if (name.tokens.size() >= 2) {
            add_key(keys, "ni:" + similarity::initials(name.tokens),
                    key_strength::weak);
        } else if (name.tokens.size() == 1 && name.tokens.front().size() >= 2 &&
                   name.tokens.front().size() <= 6 &&
                   all_alpha(name.tokens.front())) {
            add_key(keys, "ni:" + name.tokens.front(), key_strength::weak);
        }
    }

    // Weak contact and location keys
    if (record.email && !rules.is_shared_domain(record.email->domain)) {
        add_key(keys, "ed:" + record.email->domain, key_strength::weak);
    }
    if (record.address && record.address->postal_code) {
        add_key(keys, "pc:" + *record.address->postal_code, key_strength::weak);
    }
    for (const auto& tag : record.industry) {
        add_key(keys, "ig:" + tag, key_strength::weak);
    }

    return keys;
}

// =============================================================================
// Implementation
// =============================================================================

class candidate_index::impl {
public:
    struct key_shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, std::set<std::string>> blocks;
    };

    struct id_shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, std::vector<std::string>> keys_by_id;
    };

    index_config config_;
    normalize::normalization_rules rules_;
    std::vector<key_shard> key_shards_;
    std::vector<id_shard> id_shards_;

    // Updated from const queries
    mutable std::atomic<size_t> index_count_{0};
    mutable std::atomic<size_t> remove_count_{0};
    mutable std::atomic<size_t> lookup_count_{0};
    mutable std::atomic<size_t> keys_probed_{0};
    mutable std::atomic<size_t> oversized_skipped_{0};
    mutable std::atomic<size_t> candidates_returned_{0};

    impl(const index_config& config, normalize::normalization_rules rules)
        : config_(config),
          rules_(std::move(rules)),
          key_shards_(config.shard_count == 0 ? 1 : config.shard_count),
          id_shards_(config.shard_count == 0 ? 1 : config.shard_count) {}

    key_shard& key_shard_for(const std::string& key) {
        return key_shards_[std::hash<std::string>{}(key) % key_shards_.size()];
    }

    const key_shard& key_shard_for(const std::string& key) const {
        return key_shards_[std::hash<std::string>{}(key) % key_shards_.size()];
    }

    id_shard& id_shard_for(const std::string& id) {
        return id_shards_[std::hash<std::string>{}(id) % id_shards_.size()];
    }

    const id_shard& id_shard_for(const std::string& id) const {
        return id_shards_[std::hash<std::string>{}(id) % id_shards_.size()];
    }

    void add_to_block(const std::string& key, const std::string& id) {
        auto& shard = key_shard_for(key);
        std::unique_lock lock(shard.mutex);
        shard.blocks[key].insert(id);
    }

    void remove_from_block(const std::string& key, const std::string& id) {
        auto& shard = key_shard_for(key);
        std::unique_lock lock(shard.mutex);
        auto it = shard.blocks.find(key);
        if (it == shard.blocks.end()) return;
        it->second.erase(id);
        if (it->second.empty()) {
            shard.blocks.erase(it);
        }
    }

    // Lock order: id shard, then key shards
    void index(const normalize::normalized_record& record) {
        if (record.id.empty()) return;

        std::vector<std::string> new_keys;
        for (auto& key : blocking_keys(record, rules_, config_)) {
            new_keys.push_back(std::move(key.value));
        }

        auto& ids = id_shard_for(record.id);
        std::unique_lock id_lock(ids.mutex);

        auto& current = ids.keys_by_id[record.id];
        for (const auto& old_key : current) {
            if (std::find(new_keys.begin(), new_keys.end(), old_key) ==
                new_keys.end()) {
                remove_from_block(old_key, record.id);
            }
        }
        for (const auto& key : new_keys) {
            if (std::find(current.begin(), current.end(), key) == current.end()) {
                add_to_block(key, record.id);
            }
        }
        current = std::move(new_keys);

        index_count_.fetch_add(1, std::memory_order_relaxed);
    }

    bool remove(const std::string& id) {
        auto& ids = id_shard_for(id);
        std::unique_lock id_lock(ids.mutex);

        auto it = ids.keys_by_id.find(id);
        if (it == ids.keys_by_id.end()) return false;

        for (const auto& key : it->second) {
            remove_from_block(key, id);
        }
        ids.keys_by_id.erase(it);

        remove_count_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    void clear() {
        for (auto& shard : id_shards_) {
            std::unique_lock lock(shard.mutex);
            shard.keys_by_id.clear();
        }
        for (auto& shard : key_shards_) {
            std::unique_lock lock(shard.mutex);
            shard.blocks.clear();
        }
    }

    std::vector<std::string> candidates(
        const normalize::normalized_record& record) const {
        lookup_count_.fetch_add(1, std::memory_order_relaxed);

        std::set<std::string> found;
        for (const auto& key : blocking_keys(record, rules_, config_)) {
            keys_probed_.fetch_add(1, std::memory_order_relaxed);

            const auto& shard = key_shard_for(key.value);
            std::shared_lock lock(shard.mutex);
            auto it = shard.blocks.find(key.value);
            if (it == shard.blocks.end()) continue;

            if (key.strength == key_strength::weak &&
                it->second.size() > config_.max_block_size) {
                oversized_skipped_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            found.insert(it->second.begin(), it->second.end());
        }

        if (!record.id.empty()) {
            found.erase(record.id);
        }

        candidates_returned_.fetch_add(found.size(), std::memory_order_relaxed);
        return {found.begin(), found.end()};
    }

    bool contains(const std::string& id) const {
        const auto& ids = id_shard_for(id);
        std::shared_lock lock(ids.mutex);
        return ids.keys_by_id.contains(id);
    }

    size_t size() const {
        size_t total = 0;
        for (const auto& shard : id_shards_) {
            std::shared_lock lock(shard.mutex);
            total += shard.keys_by_id.size();
        }
        return total;
    }

    size_t key_count() const {
        size_t total = 0;
        for (const auto& shard : key_shards_) {
            std::shared_lock lock(shard.mutex);
            total += shard.blocks.size();
        }
        return total;
    }

    statistics snapshot() const {
        statistics stats;
        stats.index_count = index_count_.load(std::memory_order_relaxed);
        stats.remove_count = remove_count_.load(std::memory_order_relaxed);
        stats.lookup_count = lookup_count_.load(std::memory_order_relaxed);
        stats.keys_probed = keys_probed_.load(std::memory_order_relaxed);
        stats.oversized_blocks_skipped =
            oversized_skipped_.load(std::memory_order_relaxed);
        stats.candidates_returned =
            candidates_returned_.load(std::memory_order_relaxed);
        return stats;
    }

    void reset() {
        index_count_.store(0, std::memory_order_relaxed);
        remove_count_.store(0, std::memory_order_relaxed);
        lookup_count_.store(0, std::memory_order_relaxed);
        keys_probed_.store(0, std::memory_order_relaxed);
        oversized_skipped_.store(0, std::memory_order_relaxed);
        candidates_returned_.store(0, std::memory_order_relaxed);
    }
};

// =============================================================================
// Public Interface
// =============================================================================

candidate_index::candidate_index(const index_config& config,
                                 normalize::normalization_rules rules)
    : pimpl_(std::make_unique<impl>(config, std::move(rules))) {}

candidate_index::~candidate_index() = default;

candidate_index::candidate_index(candidate_index&&) noexcept = default;
candidate_index& candidate_index::operator=(candidate_index&&) noexcept =
    default;

void candidate_index::index(const normalize::normalized_record& record) {
    pimpl_->index(record);
}

bool candidate_index::remove(const std::string& id) {
    return pimpl_->remove(id);
}

void candidate_index::clear() { pimpl_->clear(); }

std::vector<std::string> candidate_index::candidates(
    const normalize::normalized_record& record) const {
    return pimpl_->candidates(record);
}

bool candidate_index::contains(const std::string& id) const {
    return pimpl_->contains(id);
}

size_t candidate_index::size() const { return pimpl_->size(); }

size_t candidate_index::key_count() const { return pimpl_->key_count(); }

const index_config& candidate_index::config() const noexcept {
    return pimpl_->config_;
}

candidate_index::statistics candidate_index::get_statistics() const {
    return pimpl_->snapshot();
}

void candidate_index::reset_statistics() { pimpl_->reset(); }

}  // namespace biz::dedup::index
