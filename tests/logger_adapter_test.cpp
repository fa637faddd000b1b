/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for log level handling and logger installation
 *
 * Covers level names, the engine applying its configured level, and
 * engine messages reaching an installed ILogger.
 *
 * @see include/biz/dedup/integration/logger_adapter.h
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "biz/dedup/engine/dedup_engine.h"
#include "biz/dedup/engine/record_store.h"
#include "biz/dedup/integration/logger_adapter.h"

#include "utils/test_helpers.h"

#include <kcenon/common/interfaces/logger_interface.h>

namespace biz::dedup::integration {
namespace {

using namespace ::testing;
using namespace biz::dedup::test;
namespace common = kcenon::common::interfaces;

// =============================================================================
// Mock ILogger for Testing
// =============================================================================

class MockILogger : public kcenon::common::interfaces::ILogger {
public:
    MOCK_METHOD(kcenon::common::VoidResult, log,
                (kcenon::common::interfaces::log_level level, const std::string& message),
                (override));
    MOCK_METHOD(kcenon::common::VoidResult, log,
                (kcenon::common::interfaces::log_level level,
                 std::string_view message,
                 const kcenon::common::source_location& loc),
                (override));
    MOCK_METHOD(kcenon::common::VoidResult, log,
                (kcenon::common::interfaces::log_level level,
                 const std::string& message,
                 const std::string& file,
                 int line,
                 const std::string& function),
                (override));
    MOCK_METHOD(kcenon::common::VoidResult, log,
                (const kcenon::common::interfaces::log_entry& entry), (override));
    MOCK_METHOD(bool, is_enabled, (kcenon::common::interfaces::log_level level), (const, override));
    MOCK_METHOD(kcenon::common::VoidResult, set_level,
                (kcenon::common::interfaces::log_level level), (override));
    MOCK_METHOD(kcenon::common::interfaces::log_level, get_level, (), (const, override));
    MOCK_METHOD(kcenon::common::VoidResult, flush, (), (override));
};

kcenon::common::VoidResult ok() {
    return kcenon::common::VoidResult(std::monostate{});
}

// =============================================================================
// Level Names
// =============================================================================

class LogLevelNameTest : public biz_dedup_test {};

TEST_F(LogLevelNameTest, ToString) {
    EXPECT_STREQ(to_string(log_level::trace), "TRACE");
    EXPECT_STREQ(to_string(log_level::warning), "WARN");
    EXPECT_STREQ(to_string(log_level::critical), "CRIT");
}

TEST_F(LogLevelNameTest, ParseIsCaseInsensitive) {
    log_level level = log_level::info;

    ASSERT_TRUE(parse_log_level("DEBUG", level));
    EXPECT_EQ(level, log_level::debug);

    ASSERT_TRUE(parse_log_level("warn", level));
    EXPECT_EQ(level, log_level::warning);

    ASSERT_TRUE(parse_log_level("Warning", level));
    EXPECT_EQ(level, log_level::warning);

    ASSERT_TRUE(parse_log_level("fatal", level));
    EXPECT_EQ(level, log_level::critical);
}

TEST_F(LogLevelNameTest, ParseRejectsUnknownName) {
    log_level level = log_level::error;
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_FALSE(parse_log_level("", level));
    EXPECT_EQ(level, log_level::error);
}

TEST_F(LogLevelNameTest, NamesParseBack) {
    for (auto level : {log_level::trace, log_level::debug, log_level::info,
                       log_level::warning, log_level::error,
                       log_level::critical}) {
        log_level parsed = log_level::info;
        ASSERT_TRUE(parse_log_level(to_string(level), parsed)) << to_string(level);
        EXPECT_EQ(parsed, level);
    }
}

// =============================================================================
// Engine Logging
// =============================================================================

class EngineLoggingTest : public biz_dedup_test {
protected:
    [[nodiscard]] static std::unique_ptr<engine::dedup_engine> make_engine(
        log_level level) {
        config::engine_config config;
        config.pool.min_threads = 1;
        config.log_level = level;
        return std::make_unique<engine::dedup_engine>(
            std::make_shared<engine::in_memory_record_store>(), config);
    }

    static std::vector<record::business_record> pair_of_duplicates() {
        auto first = samples::named("r1", "Duplicate Business");
        first.email = "info@dup.com";
        auto second = samples::named("r2", "Duplicate Business Inc");
        second.email = "info@dup.com";
        return {first, second};
    }
};

TEST_F(EngineLoggingTest, EngineAppliesConfiguredLevel) {
    auto engine = make_engine(log_level::warning);
    EXPECT_EQ(get_logger().get_level(), log_level::warning);

    ASSERT_EXPECTED_OK(engine->deduplicate_batch(pair_of_duplicates()));
    EXPECT_FALSE(log().contains("batch finished"));
    EXPECT_EQ(log().count(log_level::info), 0u);
}

TEST_F(EngineLoggingTest, DebugLevelKeepsBatchSummary) {
    auto engine = make_engine(log_level::debug);
    EXPECT_EQ(get_logger().get_level(), log_level::debug);

    ASSERT_EXPECTED_OK(engine->deduplicate_batch(pair_of_duplicates()));
    EXPECT_TRUE(log().contains("batch finished: 2 processed, 1 unique"));
}

TEST_F(EngineLoggingTest, BatchMessagesReachInstalledILogger) {
    auto mock_logger = std::make_shared<NiceMock<MockILogger>>();
    ON_CALL(*mock_logger, get_level())
        .WillByDefault(Return(common::log_level::info));
    ON_CALL(*mock_logger, set_level(_)).WillByDefault(Return(ok()));
    ON_CALL(*mock_logger, flush()).WillByDefault(Return(ok()));
    ON_CALL(*mock_logger, log(_, _, _)).WillByDefault(Return(ok()));

    EXPECT_CALL(*mock_logger, set_level(common::log_level::info))
        .Times(AtLeast(1));
    EXPECT_CALL(*mock_logger, log(_, _, _)).Times(AnyNumber());
    EXPECT_CALL(*mock_logger, log(common::log_level::debug, _, _)).Times(0);
    EXPECT_CALL(*mock_logger,
                log(common::log_level::info, HasSubstr("batch finished"), _))
        .Times(1);

    set_default_logger(mock_logger);
    {
        auto engine = make_engine(log_level::info);
        ASSERT_EXPECTED_OK(engine->deduplicate_batch(pair_of_duplicates()));
    }
    reset_default_logger();
}

}  // namespace
}  // namespace biz::dedup::integration
