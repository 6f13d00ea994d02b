/**
 * @file test_end_to_end.cpp
 * @brief Pipeline runs against a real local source directory
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <kcenon/fetcher/module/file_source_module.h>
#include <kcenon/fetcher/pipeline/transfer_state_store.h>

#include <algorithm>

namespace kcenon::fetcher::test {

class EndToEndTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        deps_.sleeper = sleeper_.function();
    }

    auto load(const std::string& extra = {}) -> transfer_config {
        auto text = "type: local\n"
                    "path: " + source_dir_.string() + "\n"
                    "state_directory: " + state_dir_.string() + "\n"
                    "instance_id: e2e\n"
                    "channel_id: ch_1\n" + extra;
        auto config = transfer_config::from_yaml_string(text);
        EXPECT_TRUE(config.has_value()) << config.error().message;
        return config.value();
    }

    auto state_exists() const -> bool {
        return transfer_state_store(state_dir_).exists(transfer_state_key{"e2e", "ch_1"});
    }

    auto downloaded_names() const -> std::vector<std::string> {
        std::vector<std::string> names;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(download_dir_)) {
            if (entry.is_regular_file()) {
                names.push_back(entry.path().lexically_relative(download_dir_).generic_string());
            }
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    recording_sleeper sleeper_;
    pipeline_dependencies deps_;
};

TEST_F(EndToEndTest, DownloadsMatchingFilesAndClearsState) {
    create_text_file(source_dir_ / "report_b.csv", "b,2\n");
    create_text_file(source_dir_ / "report_a.csv", "a,1\n");
    create_text_file(source_dir_ / "notes.txt", "ignore me");
    // Include patterns are regexes, not globs
    auto config = load("pattern: '\\.csv$'\nsortOnFileName: true\n");

    auto outcome = run_file_transfer(config, download_dir_, deps_);

    ASSERT_TRUE(outcome.success) << outcome.error.value_or("");
    EXPECT_EQ(outcome.metadata.total_found, 3u);
    EXPECT_EQ(outcome.metadata.after_filtering, 2u);
    EXPECT_EQ(outcome.metadata.after_sorting, 2u);
    EXPECT_EQ(outcome.metadata.downloaded, 2u);
    EXPECT_EQ(outcome.metadata.failed, 0u);
    EXPECT_EQ(outcome.files_downloaded.size(), 2u);

    EXPECT_EQ(downloaded_names(), (std::vector<std::string>{"report_a.csv", "report_b.csv"}));
    EXPECT_EQ(read_file(download_dir_ / "report_a.csv"), "a,1\n");
    EXPECT_FALSE(state_exists());
    EXPECT_TRUE(sleeper_.delays().empty());
}

TEST_F(EndToEndTest, ResumesFromSavedState) {
    create_text_file(source_dir_ / "a.csv", "a");
    create_text_file(source_dir_ / "b.csv", "b");
    auto config = load();

    transfer_state_store store(state_dir_);
    ASSERT_TRUE(store.save(transfer_state_key{"e2e", "ch_1"},
                           {(source_dir_ / "a.csv").string()},
                           {(source_dir_ / "b.csv").string()})
                    .has_value());

    auto outcome = run_file_transfer(config, download_dir_, deps_);

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(downloaded_names(), (std::vector<std::string>{"b.csv"}));
    EXPECT_FALSE(state_exists());
}

TEST_F(EndToEndTest, WalksSubdirectoriesExceptExcludedOnes) {
    create_text_file(source_dir_ / "top.csv", "t");
    create_text_file(source_dir_ / "daily" / "d.csv", "d");
    create_text_file(source_dir_ / "archive" / "old.csv", "o");
    auto config = load("excludeFolders: [archive]\n");

    auto outcome = run_file_transfer(config, download_dir_, deps_);

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.metadata.total_found, 2u);
    EXPECT_EQ(downloaded_names(), (std::vector<std::string>{"d.csv", "top.csv"}));
}

TEST_F(EndToEndTest, LatestFileOnlyByModifiedTime) {
    create_text_file(source_dir_ / "older.csv", "1");
    create_text_file(source_dir_ / "newer.csv", "2");
    auto now = std::filesystem::file_time_type::clock::now();
    std::filesystem::last_write_time(source_dir_ / "older.csv", now - std::chrono::hours(2));
    std::filesystem::last_write_time(source_dir_ / "newer.csv", now - std::chrono::minutes(5));
    auto config = load("getLatestFileOnly: true\n");

    auto outcome = run_file_transfer(config, download_dir_, deps_);

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(downloaded_names(), (std::vector<std::string>{"newer.csv"}));
}

TEST_F(EndToEndTest, NothingMatchingIsNotAnError) {
    create_text_file(source_dir_ / "a.txt", "a");
    auto config = load("extensions: csv\n");

    auto outcome = run_file_transfer(config, download_dir_, deps_);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.metadata.message, "No files match filters");
    EXPECT_EQ(outcome.metadata.total_found, 1u);
    EXPECT_TRUE(downloaded_names().empty());
}

TEST_F(EndToEndTest, GlobIncludePatternMatchesNothing) {
    create_text_file(source_dir_ / "a.csv", "a");
    auto config = load("pattern: '*.csv'\n");

    auto outcome = run_file_transfer(config, download_dir_, deps_);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.metadata.message, "No files match filters");
    EXPECT_TRUE(downloaded_names().empty());
}

TEST_F(EndToEndTest, EmptySourceReportsNoFiles) {
    auto outcome = run_file_transfer(load(), download_dir_, deps_);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.metadata.message, "No files found");
    EXPECT_TRUE(outcome.files_downloaded.empty());
}

TEST_F(EndToEndTest, RenameAfterFetchingMarksSourceFiles) {
    create_text_file(source_dir_ / "in.csv", "x");
    auto config = load("renameAfterFetching: true\nfileParsedString: Done\n");

    auto outcome = run_file_transfer(config, download_dir_, deps_);

    ASSERT_TRUE(outcome.success);
    EXPECT_TRUE(std::filesystem::exists(source_dir_ / "Done_in.csv"));
    EXPECT_FALSE(std::filesystem::exists(source_dir_ / "in.csv"));
    EXPECT_EQ(downloaded_names(), (std::vector<std::string>{"in.csv"}));
}

TEST_F(EndToEndTest, FileSourceModuleUploadsValidFiles) {
    create_text_file(source_dir_ / "sales.csv", "1");
    create_text_file(source_dir_ / "photo.png", "2");
    auto upload_root = test_dir_ / "upload";
    auto document = YAML::Load(
        "channel_number: 5\n"
        "source_type: local\n"
        "path: " + source_dir_.string() + "\n"
        "state_directory: " + state_dir_.string() + "\n"
        "channel: { upload_directory: " + upload_root.string() + " }\n");
    auto config = yaml_job_config_manager::from_document("nightly", "svc", document);
    ASSERT_TRUE(config.has_value()) << config.error().message;

    file_source_module module(config.value(), deps_);
    auto result = module.execute();

    ASSERT_TRUE(result.success) << result.error.value_or("") << " " << result.details.value_or("");
    auto folder = upload_root / "data" / "local" / "ch_5" / "validated";
    EXPECT_EQ(read_file(folder / "sales.csv"), "1");
    EXPECT_FALSE(std::filesystem::exists(folder / "photo.png"));
    ASSERT_TRUE(result.validation.has_value());
    EXPECT_EQ(result.validation->invalid_files.size(), 1u);
}

}  // namespace kcenon::fetcher::test
