/**
 * @file test_helpers.h
 * @brief Common test utilities and helpers for business_dedup tests
 *
 * Provides sample records, a capturing logger, timing helpers and a base
 * fixture. Uses Google Test (gtest) and Google Mock (gmock) frameworks.
 */

#ifndef BIZ_DEDUP_TEST_HELPERS_H
#define BIZ_DEDUP_TEST_HELPERS_H

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "biz/dedup/integration/logger_adapter.h"
#include "biz/dedup/record/business_record.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace biz::dedup::test {

// =============================================================================
// Scratch Directory Utilities
// =============================================================================

/**
 * @brief Per-test scratch directory under the system temp directory
 */
inline std::filesystem::path scratch_dir(std::string_view name) {
    auto dir = std::filesystem::temp_directory_path() / "business_dedup_test" /
               std::string(name);
    std::filesystem::create_directories(dir);
    return dir;
}

// =============================================================================
// Sample Records
// =============================================================================

namespace samples {

/**
 * @brief Record with only an id and a name
 */
inline record::business_record named(std::string id, std::string name) {
    record::business_record rec;
    rec.id = std::move(id);
    rec.name = std::move(name);
    return rec;
}

/**
 * @brief Fully populated record
 */
inline record::business_record complete(std::string id) {
    record::business_record rec;
    rec.id = std::move(id);
    rec.name = "Indigenous Tech Solutions Inc.";
    rec.business_type = "indigenous_owned";
    rec.business_number = "123456789RC0001";
    rec.phone = "+1 (555) 123-4567";
    rec.email = "info@indigenoustech.ca";
    rec.website = "https://www.indigenoustech.ca/about";
    rec.address = record::business_address{"123 Main St", "Toronto", "ON",
                                           "M5V 2T6"};
    rec.description = "Software consulting for First Nations communities";
    rec.industry = {"Technology", "Consulting"};
    rec.confidence = 0.8;
    rec.verified = true;
    return rec;
}

/**
 * @brief 1000 records: 100 businesses repeated 10 times each
 *
 * Copies of one business share its name and website but vary their
 * phone, email and street number.
 */
inline std::vector<record::business_record> repeated_businesses(
    size_t distinct = 100, size_t copies = 10) {
    std::vector<record::business_record> records;
    records.reserve(distinct * copies);
    for (size_t copy = 0; copy < copies; ++copy) {
        for (size_t b = 0; b < distinct; ++b) {
            record::business_record rec;
            rec.id = "biz-" + std::to_string(b) + "-" + std::to_string(copy);
            rec.name = "Business " + std::to_string(b);
            rec.website = "https://business" + std::to_string(b) + ".example.ca";
            rec.phone = "555-" + std::to_string(1000 + b) + "-" +
                        std::to_string(1000 + copy);
            rec.email = "contact" + std::to_string(copy) + "@business" +
                        std::to_string(b) + ".example.ca";
            rec.address = record::business_address{
                std::to_string(10 + copy) + " Main St", "Toronto", "ON",
                std::nullopt};
            records.push_back(std::move(rec));
        }
    }
    return records;
}

}  // namespace samples

// =============================================================================
// Capturing Logger
// =============================================================================

/**
 * @brief Logger adapter that keeps every message in memory
 */
class capturing_logger final : public integration::logger_adapter {
public:
    struct entry {
        integration::log_level level;
        std::string message;
    };

    void log(integration::log_level level, std::string_view message) override {
        if (!is_enabled(level)) return;
        std::lock_guard lock(mutex_);
        entries_.push_back({level, std::string(message)});
    }

    void set_level(integration::log_level level) override { level_ = level; }

    [[nodiscard]] integration::log_level get_level() const noexcept override {
        return level_;
    }

    void flush() override {}

    [[nodiscard]] std::vector<entry> entries() const {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    [[nodiscard]] size_t count(integration::log_level level) const {
        std::lock_guard lock(mutex_);
        return static_cast<size_t>(std::count_if(
            entries_.begin(), entries_.end(),
            [level](const entry& e) { return e.level == level; }));
    }

    [[nodiscard]] bool contains(std::string_view text) const {
        std::lock_guard lock(mutex_);
        return std::any_of(entries_.begin(), entries_.end(),
                           [text](const entry& e) {
                               return e.message.find(text) != std::string::npos;
                           });
    }

private:
    mutable std::mutex mutex_;
    std::vector<entry> entries_;
    std::atomic<integration::log_level> level_{integration::log_level::trace};
};

// =============================================================================
// Performance Testing Utilities
// =============================================================================

/**
 * @brief Simple timer for performance measurements
 */
class scoped_timer {
public:
    scoped_timer() : start_(std::chrono::steady_clock::now()) {}

    /**
     * @brief Elapsed time in milliseconds
     */
    [[nodiscard]] int64_t elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - start_)
            .count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// =============================================================================
// Test Fixture Base Class
// =============================================================================

/**
 * @brief Base fixture for business_dedup tests
 *
 * Routes library logging into a capturing logger for the duration of
 * each test.
 */
class biz_dedup_test : public ::testing::Test {
protected:
    void SetUp() override {
        auto logger = std::make_unique<capturing_logger>();
        log_ = logger.get();
        integration::set_default_logger(std::move(logger));
    }

    void TearDown() override {
        log_ = nullptr;
        integration::reset_default_logger();
    }

    /**
     * @brief Messages logged during the current test
     */
    [[nodiscard]] capturing_logger& log() const { return *log_; }

private:
    capturing_logger* log_ = nullptr;
};

// =============================================================================
// Custom Matchers
// =============================================================================

/**
 * @brief Matcher for checking if a string contains a substring
 */
MATCHER_P(ContainsSubstring, substring, "") {
    return arg.find(substring) != std::string::npos;
}

/**
 * @brief Matcher for checking if a value is within range
 */
MATCHER_P2(InRange, min_val, max_val, "") {
    return arg >= min_val && arg <= max_val;
}

// =============================================================================
// Synchronization Utilities
// =============================================================================

/**
 * @brief Wait for a condition using yield-based polling with timeout
 */
template <typename Predicate>
bool wait_for(Predicate pred,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::yield();
    }
    return true;
}

// =============================================================================
// Helper Macros
// =============================================================================

/**
 * @brief Assert that an expected value has a value (for std::expected)
 */
#define ASSERT_EXPECTED_OK(expected) \
    ASSERT_TRUE((expected).has_value()) << "Expected value but got error"

/**
 * @brief Expect that an expected value has a value (for std::expected)
 */
#define EXPECT_EXPECTED_OK(expected) \
    EXPECT_TRUE((expected).has_value()) << "Expected value but got error"

/**
 * @brief Assert that an expected value has an error (for std::expected)
 */
#define ASSERT_EXPECTED_ERROR(expected) \
    ASSERT_FALSE((expected).has_value()) << "Expected error but got value"

/**
 * @brief Expect that an expected value has an error (for std::expected)
 */
#define EXPECT_EXPECTED_ERROR(expected) \
    EXPECT_FALSE((expected).has_value()) << "Expected error but got value"

}  // namespace biz::dedup::test

#endif  // BIZ_DEDUP_TEST_HELPERS_H
