/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <kcenon/fetcher/core/logging.h>

#include <string>
#include <tuple>
#include <vector>

namespace kcenon::fetcher::test {

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(SensitiveInfoMaskerTest, NoMaskingByDefault) {
    sensitive_info_masker masker;
    std::string input = "Listing /incoming/daily on 192.168.1.100";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MaskIPAddress) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask_ip("192.168.1.100"), "*********.100");
}

TEST_F(SensitiveInfoMaskerTest, MaskIPAddressesInText) {
    masking_config config;
    config.mask_ips = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask("Connection from 192.168.1.100 to 10.0.0.1");

    EXPECT_NE(result.find("*********.100"), std::string::npos);
    EXPECT_NE(result.find("******.1"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskPathKeepsFileName) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask_path("/incoming/daily/report_20250101.csv");

    EXPECT_NE(result.find("report_20250101.csv"), std::string::npos);
    EXPECT_EQ(result.find("incoming"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, TopLevelFileIsNotMasked) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask_path("/report.csv"), "/report.csv");
}

TEST_F(SensitiveInfoMaskerTest, EmptyInput) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask(""), "");
    EXPECT_EQ(masker.mask_path(""), "");
    EXPECT_EQ(masker.mask_ip(""), "");
}

// =============================================================================
// Fetch Log Context Tests
// =============================================================================

class FetchLogContextTest : public ::testing::Test {};

TEST_F(FetchLogContextTest, EmptyContextToJson) {
    fetch_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(FetchLogContextTest, FieldsToJson) {
    fetch_log_context ctx;
    ctx.job_id = "daily_export";
    ctx.service_id = "billing";
    ctx.remote_path = "/out/a.csv";
    ctx.file_size = 2048;
    ctx.attempt = 2;
    ctx.error_message = "timed out";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"job_id\":\"daily_export\""), std::string::npos);
    EXPECT_NE(json.find("\"service_id\":\"billing\""), std::string::npos);
    EXPECT_NE(json.find("\"remote_path\":\"/out/a.csv\""), std::string::npos);
    EXPECT_NE(json.find("\"size\":2048"), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"timed out\""), std::string::npos);
}

TEST_F(FetchLogContextTest, JsonWithMaskingHidesHost) {
    fetch_log_context ctx;
    ctx.host = "10.20.30.40";

    sensitive_info_masker masker(masking_config::all_masked());
    auto json = ctx.to_json_with_masking(&masker);

    EXPECT_EQ(json.find("10.20.30.40"), std::string::npos);
    EXPECT_NE(json.find(".40"), std::string::npos);
}

TEST_F(FetchLogContextTest, JsonEscaping) {
    fetch_log_context ctx;
    ctx.error_message = "550 \"missing\"\nretry";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\\\""), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
}

// =============================================================================
// Log Level Tests
// =============================================================================

TEST(LogLevelTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::debug), "DEBUG");
    EXPECT_EQ(log_level_to_string(log_level::info), "INFO");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::error), "ERROR");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

// =============================================================================
// Logger Integration Tests
// =============================================================================

class FetcherLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_masking_config(masking_config::none());
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_json_callback(nullptr);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_masking_config(masking_config::none());
        get_logger().set_level(log_level::info);
    }
};

TEST_F(FetcherLoggerTest, SetOutputFormat) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().set_output_format(log_output_format::text);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(FetcherLoggerTest, LogCallbackReceivesCategoryAndContext) {
    std::vector<std::tuple<log_level, std::string, std::string, std::string>> captured;

    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const fetch_log_context* ctx) {
        captured.emplace_back(level, std::string(category), std::string(message),
                              ctx ? ctx->job_id : std::string());
    });

    fetch_log_context ctx;
    ctx.job_id = "job-7";
    FETCHER_LOG_INFO_CTX(log_category::download, "Downloaded file", ctx);

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::info);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::download);
    EXPECT_EQ(std::get<2>(captured[0]), "Downloaded file");
    EXPECT_EQ(std::get<3>(captured[0]), "job-7");
}

TEST_F(FetcherLoggerTest, LogLevelFiltering) {
    std::vector<std::string> captured;

    get_logger().set_callback([&](log_level, std::string_view,
                                  std::string_view message, const fetch_log_context*) {
        captured.emplace_back(message);
    });

    get_logger().set_level(log_level::warn);

    FETCHER_LOG_DEBUG(log_category::listing, "Debug message");
    FETCHER_LOG_INFO(log_category::listing, "Info message");
    FETCHER_LOG_WARN(log_category::listing, "Warn message");
    FETCHER_LOG_ERROR(log_category::listing, "Error message");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "Warn message");
    EXPECT_EQ(captured[1], "Error message");
}

TEST_F(FetcherLoggerTest, JsonCallbackWithMasking) {
    std::vector<std::string> captured_json;

    get_logger().set_output_format(log_output_format::json);
    get_logger().set_masking_config(masking_config::all_masked());
    get_logger().set_json_callback([&](const structured_log_entry&, const std::string& json) {
        captured_json.push_back(json);
    });

    fetch_log_context ctx;
    ctx.host = "192.168.1.100";
    FETCHER_LOG_INFO_CTX(log_category::connection, "Connected", ctx);

    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_NE(captured_json[0].find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(captured_json[0].find("\"category\":\"fetcher.connection\""), std::string::npos);
    EXPECT_EQ(captured_json[0].find("192.168.1.100"), std::string::npos);
}

}  // namespace kcenon::fetcher::test
