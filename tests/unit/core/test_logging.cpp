/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging
 */

#include <gtest/gtest.h>

#include <kcenon/segment_transfer/core/logging.h>

#include <string>
#include <vector>

namespace kcenon::segment_transfer::test {

// =============================================================================
// Task Log Context Tests
// =============================================================================

class TaskLogContextTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(TaskLogContextTest, EmptyContextToJson) {
    task_log_context ctx;

    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TaskLogContextTest, AllFieldsToJson) {
    task_log_context ctx;
    ctx.task_id = 42;
    ctx.block_index = 2;
    ctx.block_count = 4;
    ctx.instance_length = 1048576;
    ctx.cause = "completed";
    ctx.error_message = "Test error";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"task_id\":42"), std::string::npos);
    EXPECT_NE(json.find("\"block_index\":2"), std::string::npos);
    EXPECT_NE(json.find("\"block_count\":4"), std::string::npos);
    EXPECT_NE(json.find("\"instance_length\":1048576"), std::string::npos);
    EXPECT_NE(json.find("\"cause\":\"completed\""), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"Test error\""), std::string::npos);
}

TEST_F(TaskLogContextTest, JsonEscaping) {
    task_log_context ctx;
    ctx.error_message = "Error:\n\"quoted\"\ttab";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\\\""), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
    EXPECT_NE(json.find("\\t"), std::string::npos);
}

// =============================================================================
// Logger Tests
// =============================================================================

class SegmentTransferLoggerTest : public ::testing::Test {
protected:
    struct record {
        log_level level;
        std::string category;
        std::string message;
        bool has_context;
    };

    void SetUp() override {
        get_logger().set_level(log_level::trace);
        get_logger().set_callback(
            [this](log_level level, std::string_view category, std::string_view message,
                   const task_log_context* ctx) {
                records_.push_back({level, std::string(category), std::string(message),
                                    ctx != nullptr});
            });
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(log_level::info);
        get_logger().set_output_format(log_output_format::text);
    }

    std::vector<record> records_;
};

TEST_F(SegmentTransferLoggerTest, LevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

TEST_F(SegmentTransferLoggerTest, CallbackReceivesRecords) {
    ST_LOG_INFO(log_category::call, "hello");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, log_level::info);
    EXPECT_EQ(records_[0].category, "segment_transfer.call");
    EXPECT_EQ(records_[0].message, "hello");
    EXPECT_FALSE(records_[0].has_context);
}

TEST_F(SegmentTransferLoggerTest, ContextIsForwarded) {
    task_log_context ctx;
    ctx.task_id = 1;

    ST_LOG_WARN_CTX(log_category::chain, "block failed", ctx);

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].category, "segment_transfer.chain");
    EXPECT_TRUE(records_[0].has_context);
}

TEST_F(SegmentTransferLoggerTest, LevelFilterDropsLowerLevels) {
    get_logger().set_level(log_level::warn);

    ST_LOG_DEBUG(log_category::pool, "dropped");
    ST_LOG_INFO(log_category::pool, "dropped");
    ST_LOG_ERROR(log_category::pool, "kept");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "kept");
    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::fatal));
}

TEST_F(SegmentTransferLoggerTest, OutputFormatCanBeSwitched) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().set_output_format(log_output_format::text);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(SegmentTransferLoggerTest, InitializeIsIdempotent) {
    get_logger().initialize();
    get_logger().initialize();
    EXPECT_TRUE(get_logger().is_initialized());

    get_logger().shutdown();
    EXPECT_FALSE(get_logger().is_initialized());
}

}  // namespace kcenon::segment_transfer::test
