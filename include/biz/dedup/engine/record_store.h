#ifndef BIZ_DEDUP_ENGINE_RECORD_STORE_H
#define BIZ_DEDUP_ENGINE_RECORD_STORE_H

/**
 * @file record_store.h
 * @brief Read access to the external business record store
 *
 * The engine resolves index candidates through this interface and uses
 * list() to (re)build its candidate index. Ownership of the records and
 * their persistence stay with the application.
 */

#include "biz/dedup/record/business_record.h"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace biz::dedup::engine {

/**
 * @brief Record store collaborator
 *
 * Implementations must be safe for concurrent reads.
 */
class record_store {
public:
    virtual ~record_store() = default;

    /**
     * @brief Look up a record by id
     * @return Copy of the record, or std::nullopt when it no longer exists
     */
    [[nodiscard]] virtual std::optional<record::business_record> get(
        const std::string& id) const = 0;

    /**
     * @brief Snapshot of every record
     */
    [[nodiscard]] virtual std::vector<record::business_record> list() const = 0;
};

/**
 * @brief Thread-safe in-memory record store
 *
 * list() returns records ordered by id.
 */
class in_memory_record_store final : public record_store {
public:
    in_memory_record_store() = default;
    explicit in_memory_record_store(
        const std::vector<record::business_record>& records);

    /**
     * @brief Insert or replace a record
     * @return false when the record has no id
     */
    bool put(record::business_record record);

    /**
     * @return true if the record existed
     */
    bool erase(const std::string& id);

    void clear();

    [[nodiscard]] size_t size() const;

    [[nodiscard]] std::optional<record::business_record> get(
        const std::string& id) const override;

    [[nodiscard]] std::vector<record::business_record> list() const override;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, record::business_record> records_;
};

}  // namespace biz::dedup::engine

#endif  // BIZ_DEDUP_ENGINE_RECORD_STORE_H
