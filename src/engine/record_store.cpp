/**
 * @file record_store.cpp
 * @brief In-memory record store
 */

#include "biz/dedup/engine/record_store.h"

#include <mutex>
#include <utility>

namespace biz::dedup::engine {

in_memory_record_store::in_memory_record_store(
    const std::vector<record::business_record>& records) {
    for (const auto& rec : records) {
        if (!rec.id.empty()) {
            records_.insert_or_assign(rec.id, rec);
        }
    }
}

bool in_memory_record_store::put(record::business_record record) {
    if (record.id.empty()) return false;

    std::unique_lock lock(mutex_);
    auto id = record.id;
    records_.insert_or_assign(std::move(id), std::move(record));
    return true;
}

bool in_memory_record_store::erase(const std::string& id) {
    std::unique_lock lock(mutex_);
    return records_.erase(id) > 0;
}

void in_memory_record_store::clear() {
    std::unique_lock lock(mutex_);
    records_.clear();
}

size_t in_memory_record_store::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

std::optional<record::business_record> in_memory_record_store::get(
    const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<record::business_record> in_memory_record_store::list() const {
    std::shared_lock lock(mutex_);
    std::vector<record::business_record> result;
    result.reserve(records_.size());
    for (const auto& [id, rec] : records_) {
        result.push_back(rec);
    }
    return result;
}

}  // namespace biz::dedup::engine
