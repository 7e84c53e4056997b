/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <kcenon/path_migration/core/logging.h>

#include <regex>
#include <string>
#include <tuple>
#include <vector>

namespace kcenon::path_migration::test {

// =============================================================================
// Masking Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(SensitiveInfoMaskerTest, NoMaskingByDefault) {
    sensitive_info_masker masker;
    std::string input = "Path 10.0.0.5:4433 -> 192.168.1.100:443";

    EXPECT_EQ(masker.mask(input), input);
    EXPECT_EQ(masker.mask_connection_id("a1b2c3d4e5f6"), "a1b2c3d4e5f6");
}

TEST_F(SensitiveInfoMaskerTest, MaskIPAddress) {
    masking_config config;
    config.mask_ips = true;
    sensitive_info_masker masker(config);

    // 192.168.1 = 9 chars -> *********
    EXPECT_EQ(masker.mask_ip("192.168.1.100"), "*********.100");
}

TEST_F(SensitiveInfoMaskerTest, MaskIPAddressesInText) {
    masking_config config;
    config.mask_ips = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask("Migrating 192.168.1.100 to 10.0.0.1");

    EXPECT_NE(result.find("*********.100"), std::string::npos);
    EXPECT_NE(result.find("******.1"), std::string::npos);
    EXPECT_EQ(result.find("192.168"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskConnectionId) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask_connection_id("a1b2c3d4e5f6"), "a1b2********");
    EXPECT_EQ(masker.mask_connection_id("a1b2"), "a1b2");
}

TEST_F(SensitiveInfoMaskerTest, UpdateConfig) {
    sensitive_info_masker masker;
    EXPECT_EQ(masker.mask_ip("10.1.2.3"), "10.1.2.3");

    masker.set_config(masking_config::all_masked());
    EXPECT_EQ(masker.mask_ip("10.1.2.3"), "******.3");
}

// =============================================================================
// Log Context Tests
// =============================================================================

class PathLogContextTest : public ::testing::Test {};

TEST_F(PathLogContextTest, EmptyContextToJson) {
    path_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(PathLogContextTest, FieldsToJson) {
    path_log_context ctx;
    ctx.connection_id = "c0ffee";
    ctx.path_id = 2;
    ctx.remote_address = "10.0.0.1:4433";
    ctx.attempt = 3;
    ctx.bytes = 4096;

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"connection_id\":\"c0ffee\""), std::string::npos);
    EXPECT_NE(json.find("\"path_id\":2"), std::string::npos);
    EXPECT_NE(json.find("\"remote_address\":\"10.0.0.1:4433\""), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":3"), std::string::npos);
    EXPECT_NE(json.find("\"bytes\":4096"), std::string::npos);
}

TEST_F(PathLogContextTest, JsonWithMasking) {
    path_log_context ctx;
    ctx.connection_id = "a1b2c3d4e5f6";
    ctx.local_address = "192.168.1.100:5000";

    sensitive_info_masker masker(masking_config::all_masked());
    auto json = ctx.to_json_with_masking(&masker);

    EXPECT_EQ(json.find("192.168.1.100"), std::string::npos);
    EXPECT_EQ(json.find("a1b2c3d4e5f6"), std::string::npos);
    EXPECT_NE(json.find("a1b2"), std::string::npos);
}

TEST_F(PathLogContextTest, JsonEscaping) {
    path_log_context ctx;
    ctx.error_message = "bad \"token\"\n";

    auto json = ctx.to_json();
    EXPECT_NE(json.find("bad \\\"token\\\"\\n"), std::string::npos);
}

// =============================================================================
// Log Entry Builder Tests
// =============================================================================

class LogEntryBuilderTest : public ::testing::Test {};

TEST_F(LogEntryBuilderTest, BuilderWithContextFields) {
    auto entry = log_entry_builder()
        .with_level(log_level::warn)
        .with_category(log_category::validator)
        .with_message("Path validation failed")
        .with_path_id(4)
        .with_interface("wlan0")
        .with_attempt(2)
        .with_error_message("timeout")
        .build();

    EXPECT_EQ(entry.level, log_level::warn);
    EXPECT_EQ(entry.category, "path_migration.validator");
    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->path_id.value(), 4u);
    EXPECT_EQ(entry.context->interface_name.value(), "wlan0");
    EXPECT_EQ(entry.context->attempt.value(), 2u);
    EXPECT_EQ(entry.context->error_message.value(), "timeout");
}

TEST_F(LogEntryBuilderTest, BuildJson) {
    auto json = log_entry_builder()
        .with_level(log_level::info)
        .with_category(log_category::coordinator)
        .with_message("Migration completed")
        .with_duration_ms(35)
        .build_json();

    EXPECT_NE(json.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"path_migration.coordinator\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"Migration completed\""), std::string::npos);
    EXPECT_NE(json.find("\"duration_ms\":35"), std::string::npos);
}

TEST_F(LogEntryBuilderTest, SourceLocation) {
    auto json = log_entry_builder()
        .with_message("x")
        .with_source_location("coordinator.cpp", 42, "migrate_to")
        .build_json();

    EXPECT_NE(json.find("\"file\":\"coordinator.cpp\""), std::string::npos);
    EXPECT_NE(json.find("\"line\":42"), std::string::npos);
    EXPECT_NE(json.find("\"function\":\"migrate_to\""), std::string::npos);
}

TEST_F(LogEntryBuilderTest, TimestampFormat) {
    auto entry = log_entry_builder().with_message("Test").build();

    // ISO 8601 format: YYYY-MM-DDTHH:MM:SS.mmmZ
    std::regex iso8601_regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
    EXPECT_TRUE(std::regex_match(entry.timestamp, iso8601_regex));
}

// =============================================================================
// Logger Tests
// =============================================================================

class PathMigrationLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().enable_json_output(false);
        get_logger().enable_masking(false);
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_json_callback(nullptr);
        get_logger().enable_json_output(false);
        get_logger().enable_masking(false);
        get_logger().set_level(log_level::info);
    }
};

TEST_F(PathMigrationLoggerTest, LogCallback) {
    std::vector<std::tuple<log_level, std::string, std::string>> captured;

    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const path_log_context*) {
        captured.emplace_back(level, std::string(category), std::string(message));
    });

    PM_LOG_INFO(log_category::pool, "Allocated local connection ID #1");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::info);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::pool);
    EXPECT_EQ(std::get<2>(captured[0]), "Allocated local connection ID #1");
}

TEST_F(PathMigrationLoggerTest, ContextPassedToCallback) {
    std::optional<uint32_t> seen_path;

    get_logger().set_callback([&](log_level, std::string_view, std::string_view,
                                  const path_log_context* ctx) {
        if (ctx) {
            seen_path = ctx->path_id;
        }
    });

    path_log_context ctx;
    ctx.path_id = 7;
    PM_LOG_WARN_CTX(log_category::coordinator, "Migration failed", ctx);

    ASSERT_TRUE(seen_path.has_value());
    EXPECT_EQ(*seen_path, 7u);
}

TEST_F(PathMigrationLoggerTest, JsonCallback) {
    std::vector<std::string> captured_json;

    get_logger().enable_json_output(true);
    get_logger().set_json_callback([&](const structured_log_entry&, const std::string& json) {
        captured_json.push_back(json);
    });

    PM_LOG_INFO(log_category::bridge, "JSON test");

    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_NE(captured_json[0].find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(captured_json[0].find("\"message\":\"JSON test\""), std::string::npos);
}

TEST_F(PathMigrationLoggerTest, JsonOutputIsMasked) {
    std::vector<std::string> captured_json;

    get_logger().enable_json_output(true);
    get_logger().enable_masking(true);
    get_logger().set_json_callback([&](const structured_log_entry&, const std::string& json) {
        captured_json.push_back(json);
    });

    PM_LOG_INFO(log_category::coordinator, "Peer address changed to 203.0.113.9:4433");

    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_EQ(captured_json[0].find("203.0.113.9"), std::string::npos);
}

TEST_F(PathMigrationLoggerTest, LogLevelFiltering) {
    std::vector<std::string> captured;

    get_logger().set_callback([&](log_level, std::string_view, std::string_view message,
                                  const path_log_context*) {
        captured.emplace_back(message);
    });

    get_logger().set_level(log_level::warn);
    PM_LOG_DEBUG(log_category::validator, "debug");
    PM_LOG_INFO(log_category::validator, "info");
    PM_LOG_WARN(log_category::validator, "warn");
    PM_LOG_ERROR(log_category::validator, "error");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "warn");
    EXPECT_EQ(captured[1], "error");
}

TEST_F(PathMigrationLoggerTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

}  // namespace kcenon::path_migration::test
