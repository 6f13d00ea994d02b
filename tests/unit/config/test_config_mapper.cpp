/**
 * @file test_config_mapper.cpp
 * @brief Unit tests for structured-to-flat configuration mapping
 */

#include <gtest/gtest.h>

#include <kcenon/fetcher/config/config_mapper.h>
#include <kcenon/fetcher/config/transfer_config.h>

namespace kcenon::fetcher::test {

class ConfigMapperTest : public ::testing::Test {
protected:
    static auto load(const std::string& text) -> YAML::Node { return YAML::Load(text); }
};

TEST_F(ConfigMapperTest, MapsFtpDocument) {
    auto doc = load(R"(
ftp:
  connection:
    protocol: sftp
    host: files.example.com
    port: 2222
    auth: { username: reader, password: secret }
  scope: { path: /exports }
  file_select:
    include: { patterns: ["report_.*", "ignored"], extensions: [".csv"] }
    exclude: { patterns: ["tmp"], folders: ["archive"], skip_subfolders: true }
  sorting: { by: date_in_filename, date_format: "%Y%m%d", descending: true }
  date_window: { range: "T+14" }
  post_fetch: { rename_after_fetch: true }
instance_id: prod
)");

    auto flat = config_mapper::map_ftp_config(doc);

    EXPECT_EQ(flat["type"].as<std::string>(), "sftp");
    EXPECT_EQ(flat["source_type"].as<std::string>(), "sftp");
    EXPECT_EQ(flat["host"].as<std::string>(), "files.example.com");
    EXPECT_EQ(flat["port"].as<int>(), 2222);
    EXPECT_EQ(flat["user"].as<std::string>(), "reader");
    EXPECT_EQ(flat["pass"].as<std::string>(), "secret");
    EXPECT_EQ(flat["path"].as<std::string>(), "/exports");
    EXPECT_EQ(flat["pattern"].as<std::string>(), "report_.*");
    EXPECT_EQ(flat["exclude_pattern"].as<std::string>(), "tmp");
    EXPECT_EQ(flat["excludeFolders"][0].as<std::string>(), "archive");
    EXPECT_TRUE(flat["skipSubFolders"].as<bool>());
    EXPECT_TRUE(flat["sortByDateInFilename"].as<bool>());
    EXPECT_FALSE(flat["sortOnFileName"].as<bool>());
    EXPECT_TRUE(flat["sortDescending"].as<bool>());
    EXPECT_EQ(flat["dateFormatInFilename"].as<std::string>(), "%Y%m%d");
    EXPECT_EQ(flat["extractedDateNextDays"].as<int>(), 14);
    EXPECT_TRUE(flat["renameAfterFetching"].as<bool>());
    EXPECT_EQ(flat["fileParsedString"].as<std::string>(), "Processed");
    EXPECT_EQ(flat["instance_id"].as<std::string>(), "prod");
    EXPECT_FALSE(flat["ftp"]);
}

TEST_F(ConfigMapperTest, FtpDefaults) {
    auto flat = config_mapper::map_ftp_config(load("ftp: { connection: { host: h } }"));

    EXPECT_EQ(flat["type"].as<std::string>(), "ftp");
    EXPECT_EQ(flat["path"].as<std::string>(), "/");
    EXPECT_TRUE(flat["pattern"].IsNull());
    EXPECT_TRUE(flat["extensions"].IsSequence());
    EXPECT_EQ(flat["extensions"].size(), 0u);
    EXPECT_TRUE(flat["extractedDateNextDays"].IsNull());
    EXPECT_EQ(flat["dateFormatInPath"].as<std::string>(), "%Y/%m/%d");
}

TEST_F(ConfigMapperTest, MapsS3Document) {
    auto doc = load(R"(
s3:
  connection:
    bucket: exports
    region: eu-west-1
    credentials: { access_key_id: AKIA, secret_access_key: shh }
  scope: { path: daily/ }
  sorting: { by: modified_time }
)");

    auto flat = config_mapper::map_s3_config(doc);

    EXPECT_EQ(flat["type"].as<std::string>(), "s3");
    EXPECT_EQ(flat["bucket"].as<std::string>(), "exports");
    EXPECT_EQ(flat["region"].as<std::string>(), "eu-west-1");
    EXPECT_EQ(flat["aws_access_key_id"].as<std::string>(), "AKIA");
    EXPECT_EQ(flat["aws_secret_access_key"].as<std::string>(), "shh");
    EXPECT_EQ(flat["path"].as<std::string>(), "daily/");
    EXPECT_TRUE(flat["sortFilesByModifiedTime"].as<bool>());
}

TEST_F(ConfigMapperTest, MappedDocumentParsesAsTransferConfig) {
    auto flat = config_mapper::map_s3_config(load(R"(
s3:
  connection: { bucket: exports, credentials: { access_key_id: A, secret_access_key: B } }
  file_select: { include: { extensions: [".json"] } }
)"));

    auto parsed = transfer_config::from_yaml(flat);

    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(parsed.value().connection.type, "s3");
    EXPECT_EQ(parsed.value().connection.bucket, "exports");
    EXPECT_EQ(parsed.value().connection.region, "us-east-1");
    EXPECT_EQ(parsed.value().connection.access_key_id, "A");
    ASSERT_EQ(parsed.value().selection.extensions.size(), 1u);
    EXPECT_EQ(parsed.value().selection.extensions[0], ".json");
}

TEST_F(ConfigMapperTest, ParseDateRange) {
    EXPECT_EQ(config_mapper::parse_date_range("T+7"), 7);
    EXPECT_EQ(config_mapper::parse_date_range("T+0"), 0);
    EXPECT_FALSE(config_mapper::parse_date_range("T-7").has_value());
    EXPECT_FALSE(config_mapper::parse_date_range("T+").has_value());
    EXPECT_FALSE(config_mapper::parse_date_range("T+7d").has_value());
    EXPECT_FALSE(config_mapper::parse_date_range("7").has_value());
}

}  // namespace kcenon::fetcher::test
