/**
 * @file test_directory_lister.cpp
 * @brief Unit tests for the recursive lister and its retry policy
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <kcenon/fetcher/pipeline/directory_lister.h>

#include <algorithm>
#include <cmath>

namespace kcenon::fetcher::test {

class DirectoryListerTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs_.add_file("/in/a.csv", "aaa");
        fs_.add_file("/in/sub/b.csv", "bb");
        fs_.add_file("/in/archive/old.csv", "o");
        fs_.add_file("/in/sub/deeper/c.csv", "c");
    }

    static auto sorted_paths(const file_list& files) -> std::vector<std::string> {
        std::vector<std::string> paths;
        for (const auto& f : files) {
            paths.push_back(f.path);
        }
        std::sort(paths.begin(), paths.end());
        return paths;
    }

    fake_remote_filesystem fs_;
    recording_sleeper sleeper_;
};

TEST_F(DirectoryListerTest, WalksRecursively) {
    directory_lister lister(lister_options{}, sleeper_.function());

    auto listed = lister.list(fs_, "/in");

    EXPECT_EQ(sorted_paths(listed.files),
              (std::vector<std::string>{"/in/a.csv", "/in/archive/old.csv", "/in/sub/b.csv",
                                        "/in/sub/deeper/c.csv"}));
    EXPECT_TRUE(listed.failed_directories.empty());
    EXPECT_FALSE(listed.deadline_reached);

    auto a = std::find_if(listed.files.begin(), listed.files.end(),
                          [](const file_entry& f) { return f.name == "a.csv"; });
    ASSERT_NE(a, listed.files.end());
    EXPECT_EQ(a->size, 3u);
    EXPECT_EQ(a->type, entry_type::file);
}

TEST_F(DirectoryListerTest, ExcludedFoldersAreNotEntered) {
    lister_options options;
    options.exclude_folders = {"archive", "deeper"};
    directory_lister lister(options, sleeper_.function());

    auto listed = lister.list(fs_, "/in");

    EXPECT_EQ(sorted_paths(listed.files),
              (std::vector<std::string>{"/in/a.csv", "/in/sub/b.csv"}));
    EXPECT_EQ(listed.skipped_folders.size(), 2u);

    auto calls = fs_.list_calls();
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "/in/archive"), 0);
}

TEST_F(DirectoryListerTest, SkipSubFoldersListsRootOnly) {
    lister_options options;
    options.skip_sub_folders = true;
    directory_lister lister(options, sleeper_.function());

    auto listed = lister.list(fs_, "/in");

    EXPECT_EQ(sorted_paths(listed.files), (std::vector<std::string>{"/in/a.csv"}));
    EXPECT_EQ(fs_.list_calls().size(), 1u);
}

TEST_F(DirectoryListerTest, RetriesWithExponentialBackoff) {
    fs_.fail_listing("/in/sub", 3);
    directory_lister lister(lister_options{}, sleeper_.function());

    auto listed = lister.list(fs_, "/in");

    EXPECT_TRUE(listed.failed_directories.empty());
    EXPECT_EQ(listed.files.size(), 4u);
    EXPECT_EQ(sleeper_.delays(), (std::vector<std::chrono::milliseconds>{
                                     std::chrono::milliseconds(500),
                                     std::chrono::milliseconds(1000),
                                     std::chrono::milliseconds(2000)}));
}

TEST_F(DirectoryListerTest, ExhaustedRetriesRecordFailedDirectory) {
    fs_.fail_listing("/in/sub", 10);
    directory_lister lister(lister_options{}, sleeper_.function());

    auto listed = lister.list(fs_, "/in");

    EXPECT_EQ(listed.failed_directories, (std::vector<std::string>{"/in/sub"}));
    EXPECT_EQ(sorted_paths(listed.files),
              (std::vector<std::string>{"/in/a.csv", "/in/archive/old.csv"}));
    EXPECT_EQ(sleeper_.delays().size(), 3u);

    auto calls = fs_.list_calls();
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "/in/sub"), 4);
}

TEST_F(DirectoryListerTest, MissingDirectoryIsNotRetried) {
    directory_lister lister(lister_options{}, sleeper_.function());

    auto listed = lister.list(fs_, "/nowhere");

    EXPECT_TRUE(listed.files.empty());
    EXPECT_EQ(listed.failed_directories, (std::vector<std::string>{"/nowhere"}));
    EXPECT_EQ(fs_.list_calls().size(), 1u);
    EXPECT_TRUE(sleeper_.delays().empty());
}

TEST_F(DirectoryListerTest, ZeroRetries) {
    lister_options options;
    options.max_retries = 0;
    fs_.fail_listing("/in", 1);
    directory_lister lister(options, sleeper_.function());

    auto listed = lister.list(fs_, "/in");

    EXPECT_TRUE(listed.files.empty());
    EXPECT_EQ(listed.failed_directories, (std::vector<std::string>{"/in"}));
    EXPECT_TRUE(sleeper_.delays().empty());
}

TEST_F(DirectoryListerTest, RetryDelayDoubles) {
    directory_lister lister(lister_options{}, sleeper_.function());

    EXPECT_EQ(lister.retry_delay(1), std::chrono::milliseconds(500));
    EXPECT_EQ(lister.retry_delay(2), std::chrono::milliseconds(1000));
    EXPECT_EQ(lister.retry_delay(4), std::chrono::milliseconds(4000));
}

TEST_F(DirectoryListerTest, OptionsFromConfig) {
    transfer_config config;
    config.download.max_reconnect_attempts = 5;
    config.listing_deadline = std::chrono::seconds(30);
    config.selection.exclude_folders = {"tmp"};
    config.selection.skip_sub_folders = true;

    auto options = lister_options::from_config(config);

    EXPECT_EQ(options.max_retries, 5);
    EXPECT_EQ(options.deadline, std::chrono::seconds(30));
    EXPECT_EQ(options.exclude_folders, (std::vector<std::string>{"tmp"}));
    EXPECT_TRUE(options.skip_sub_folders);
}

TEST_F(DirectoryListerTest, ListFilesUsesConfiguredRoot) {
    transfer_config config;
    config.path = "/in/sub";
    config.selection.skip_sub_folders = true;

    auto listed = list_files(fs_, config, sleeper_.function());

    EXPECT_EQ(sorted_paths(listed.files), (std::vector<std::string>{"/in/sub/b.csv"}));
}

// =============================================================================
// Helper Tests
// =============================================================================

TEST(ListingHelpersTest, ResolveListingRoot) {
    transfer_config config;
    config.connection.type = "ftp";
    config.path = "/exports";
    EXPECT_EQ(resolve_listing_root(config), "/exports");

    config.connection.type = "S3";
    config.connection.bucket = "bucket";
    EXPECT_EQ(resolve_listing_root(config), "bucket/exports");

    config.path = "daily/";
    EXPECT_EQ(resolve_listing_root(config), "bucket/daily/");

    config.path.clear();
    EXPECT_EQ(resolve_listing_root(config), "bucket/");
}

TEST(ListingHelpersTest, NormalizeMtime) {
    auto now = std::chrono::system_clock::now();
    auto fixed = std::chrono::system_clock::time_point(std::chrono::seconds(1000));

    EXPECT_EQ(normalize_mtime(remote_mtime{}, now), now);
    EXPECT_EQ(normalize_mtime(remote_mtime{fixed}, now), fixed);
    EXPECT_EQ(normalize_mtime(remote_mtime{1000.0}, now), fixed);
    EXPECT_EQ(normalize_mtime(remote_mtime{-1.0}, now), now);
    EXPECT_EQ(normalize_mtime(remote_mtime{std::nan("")}, now), now);
}

TEST(ListingHelpersTest, FormatFileSize) {
    EXPECT_EQ(format_file_size(512), "512 Bytes");
    EXPECT_EQ(format_file_size(2048), "2.00 KB");
    EXPECT_EQ(format_file_size(1572864), "1.50 MB");
}

}  // namespace kcenon::fetcher::test
