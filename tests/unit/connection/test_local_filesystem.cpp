/**
 * @file test_local_filesystem.cpp
 * @brief Unit tests for the local directory source
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <kcenon/fetcher/connection/local_filesystem.h>

#include <algorithm>

namespace kcenon::fetcher::test {

class LocalFilesystemTest : public TempDirectoryFixture {
protected:
    local_filesystem fs_;
};

TEST_F(LocalFilesystemTest, ListsFilesAndDirectories) {
    create_source_file("a.csv", 12);
    std::filesystem::create_directories(source_dir_ / "nested");

    auto listed = fs_.list(source_dir_.string());
    ASSERT_TRUE(listed.has_value()) << listed.error().message;

    auto entries = listed.value();
    std::sort(entries.begin(), entries.end(),
              [](const remote_entry& a, const remote_entry& b) { return a.name < b.name; });
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0].name, "a.csv");
    EXPECT_EQ(entries[0].type, entry_type::file);
    EXPECT_EQ(entries[0].size, 12u);
    EXPECT_EQ(entries[0].path, (source_dir_ / "a.csv").generic_string());
    EXPECT_TRUE(std::holds_alternative<std::chrono::system_clock::time_point>(entries[0].mtime));

    EXPECT_EQ(entries[1].name, "nested");
    EXPECT_EQ(entries[1].type, entry_type::directory);
}

TEST_F(LocalFilesystemTest, MissingDirectory) {
    auto listed = fs_.list((test_dir_ / "absent").string());
    ASSERT_FALSE(listed.has_value());
    EXPECT_EQ(listed.error().code, error_code::path_not_found);
}

TEST_F(LocalFilesystemTest, DownloadCopiesAndCreatesParents) {
    auto source = create_text_file(source_dir_ / "data.txt", "payload");
    auto target = download_dir_ / "deep" / "dir" / "data.txt";

    auto copied = fs_.download(source.string(), target);

    ASSERT_TRUE(copied.has_value()) << copied.error().message;
    EXPECT_EQ(read_file(target), "payload");
}

TEST_F(LocalFilesystemTest, DownloadOverwritesExistingTarget) {
    auto source = create_text_file(source_dir_ / "data.txt", "new");
    auto target = create_text_file(download_dir_ / "data.txt", "old contents");

    ASSERT_TRUE(fs_.download(source.string(), target).has_value());
    EXPECT_EQ(read_file(target), "new");
}

TEST_F(LocalFilesystemTest, DownloadMissingSourceFails) {
    auto copied = fs_.download((source_dir_ / "absent").string(), download_dir_ / "x");
    ASSERT_FALSE(copied.has_value());
    EXPECT_EQ(copied.error().code, error_code::download_failed);
}

TEST_F(LocalFilesystemTest, Rename) {
    auto source = create_text_file(source_dir_ / "a.csv", "a");
    auto renamed = source_dir_ / "Parsed_a.csv";

    ASSERT_TRUE(fs_.rename(source.string(), renamed.string()).has_value());
    EXPECT_FALSE(std::filesystem::exists(source));
    EXPECT_TRUE(std::filesystem::exists(renamed));
}

TEST_F(LocalFilesystemTest, CloseRejectsFurtherCalls) {
    EXPECT_TRUE(fs_.is_alive());
    EXPECT_EQ(fs_.protocol(), "local");

    fs_.close();

    EXPECT_FALSE(fs_.is_alive());
    auto listed = fs_.list(source_dir_.string());
    ASSERT_FALSE(listed.has_value());
    EXPECT_EQ(listed.error().code, error_code::connection_closed);
}

}  // namespace kcenon::fetcher::test
