/**
 * @file test_transfer_config.cpp
 * @brief Unit tests for flat transfer configuration parsing
 */

#include <gtest/gtest.h>

#include <kcenon/fetcher/config/transfer_config.h>

namespace kcenon::fetcher::test {

class TransferConfigTest : public ::testing::Test {};

TEST_F(TransferConfigTest, DefaultsForMinimalDocument) {
    auto parsed = transfer_config::from_yaml_string("type: local\n");
    ASSERT_TRUE(parsed.has_value());

    const auto& cfg = parsed.value();
    EXPECT_EQ(cfg.connection.type, "local");
    EXPECT_EQ(cfg.path, "/");
    EXPECT_TRUE(cfg.download.resume_transfer);
    EXPECT_EQ(cfg.download.max_reconnect_attempts, 3);
    EXPECT_EQ(cfg.download.reconnect_delay, std::chrono::seconds(5));
    EXPECT_EQ(cfg.download.instance_id, "default");
    EXPECT_EQ(cfg.download.channel_id, "default");
    EXPECT_FALSE(cfg.sorting.sort_by_date.has_value());
    EXPECT_EQ(cfg.sorting.date_format_in_filename, "%Y-%m-%d");
    EXPECT_EQ(cfg.listing_deadline, std::chrono::seconds(0));
    EXPECT_FALSE(cfg.date_window.is_configured());
}

TEST_F(TransferConfigTest, ParsesConnectionKeys) {
    auto parsed = transfer_config::from_yaml_string(R"(
type: SFTP
host: files.example.com
username: reader
password: secret
passive: false
connection_timeout: 12
)");
    ASSERT_TRUE(parsed.has_value());

    const auto& conn = parsed.value().connection;
    EXPECT_EQ(conn.type, "sftp");
    EXPECT_EQ(conn.user, "reader");
    EXPECT_EQ(conn.pass, "secret");
    EXPECT_FALSE(conn.passive);
    EXPECT_EQ(conn.connection_timeout, std::chrono::seconds(12));
    EXPECT_EQ(conn.effective_port(), 22);
}

TEST_F(TransferConfigTest, EffectivePortPrefersExplicitPort) {
    connection_settings conn;
    conn.type = "ftp";
    EXPECT_EQ(conn.effective_port(), 21);
    conn.port = 2121;
    EXPECT_EQ(conn.effective_port(), 2121);
}

TEST_F(TransferConfigTest, BucketImpliesS3) {
    auto parsed = transfer_config::from_yaml_string(R"(
bucket: exports
credentials:
  access_key_id: AKIA
  secret_access_key: shh
  session_token: tok
)");
    ASSERT_TRUE(parsed.has_value());

    const auto& conn = parsed.value().connection;
    EXPECT_EQ(conn.type, "s3");
    EXPECT_EQ(conn.access_key_id, "AKIA");
    EXPECT_EQ(conn.secret_access_key, "shh");
    EXPECT_EQ(conn.session_token, "tok");
}

TEST_F(TransferConfigTest, ListsAcceptSequencesOrCommaStrings) {
    auto parsed = transfer_config::from_yaml_string(R"(
type: ftp
extensions: [".csv", " .xml "]
excludeFolders: "archive, tmp ,,old"
excludeKeywords: [Draft, TEMP]
)");
    ASSERT_TRUE(parsed.has_value());

    const auto& sel = parsed.value().selection;
    EXPECT_EQ(sel.extensions, (std::vector<std::string>{".csv", ".xml"}));
    EXPECT_EQ(sel.exclude_folders, (std::vector<std::string>{"archive", "tmp", "old"}));
    EXPECT_EQ(sel.exclude_keywords, (std::vector<std::string>{"draft", "temp"}));
}

TEST_F(TransferConfigTest, SortingAndWindowKeys) {
    auto parsed = transfer_config::from_yaml_string(R"(
type: ftp
sortByDate: false
getLatestFileOnly: true
num_files: 5
extractedDateStart: "2025-01-01"
extractedDateLastDays: 3
listing_deadline_seconds: 90
)");
    ASSERT_TRUE(parsed.has_value());

    const auto& cfg = parsed.value();
    ASSERT_TRUE(cfg.sorting.sort_by_date.has_value());
    EXPECT_FALSE(*cfg.sorting.sort_by_date);
    EXPECT_TRUE(cfg.sorting.get_latest_file_only);
    EXPECT_EQ(cfg.sorting.num_files, 5u);
    EXPECT_EQ(cfg.date_window.start, "2025-01-01");
    EXPECT_EQ(cfg.date_window.last_days, 3);
    EXPECT_TRUE(cfg.date_window.is_configured());
    EXPECT_EQ(cfg.listing_deadline, std::chrono::seconds(90));
}

TEST_F(TransferConfigTest, UnknownKeysArePreservedAsExtras) {
    auto parsed = transfer_config::from_yaml_string(R"(
type: local
upload_directory: /data/out
custom: { nested: 1 }
)");
    ASSERT_TRUE(parsed.has_value());

    const auto& extras = parsed.value().extras;
    ASSERT_EQ(extras.count("upload_directory"), 1u);
    EXPECT_EQ(extras.at("upload_directory"), "/data/out");
    EXPECT_EQ(extras.count("custom"), 1u);
    EXPECT_EQ(extras.count("type"), 0u);
}

TEST_F(TransferConfigTest, RejectsNonMappingDocument) {
    auto parsed = transfer_config::from_yaml_string("- a\n- b\n");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::invalid_configuration);
}

TEST_F(TransferConfigTest, RejectsBadScalarType) {
    auto parsed = transfer_config::from_yaml_string("type: ftp\nport: not-a-number\n");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::config_parse_error);
}

TEST_F(TransferConfigTest, RejectsMalformedYaml) {
    auto parsed = transfer_config::from_yaml_string("type: [unclosed\n");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::config_parse_error);
}

TEST_F(TransferConfigTest, ParseSize) {
    EXPECT_EQ(parse_size("2048"), 2048u);
    EXPECT_EQ(parse_size("10KB"), 10u * 1024);
    EXPECT_EQ(parse_size("1.5 mb"), static_cast<uint64_t>(1.5 * 1024 * 1024));
    EXPECT_EQ(parse_size("2GB"), 2ULL * 1024 * 1024 * 1024);
    EXPECT_FALSE(parse_size("").has_value());
    EXPECT_FALSE(parse_size("ten MB").has_value());
    EXPECT_FALSE(parse_size("-5").has_value());
}

TEST_F(TransferConfigTest, SplitCommaList) {
    EXPECT_EQ(split_comma_list(" a, b ,,c "), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(split_comma_list("").empty());
}

}  // namespace kcenon::fetcher::test
