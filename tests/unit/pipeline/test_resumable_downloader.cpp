/**
 * @file test_resumable_downloader.cpp
 * @brief Unit tests for resumable downloads, retries and remote renames
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <kcenon/fetcher/pipeline/resumable_downloader.h>

#include <algorithm>

namespace kcenon::fetcher::test {

class ResumableDownloaderTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();

        remote_ = std::make_shared<fake_remote_filesystem>();
        for (const auto& [path, content] : std::vector<std::pair<std::string, std::string>>{
                 {"/in/A.csv", "alpha"}, {"/in/B.csv", "bravo!"}, {"/in/C.csv", "charlie"}}) {
            remote_->add_file(path, content);
            files_.push_back(make_file(path, content.size()));
        }

        config_.download.local_download_path = download_dir_;
        config_.download.state_directory = state_dir_;
        config_.download.instance_id = "job";
        config_.download.channel_id = "ch_1";
        config_.download.reconnect_delay = std::chrono::seconds(2);
    }

    auto make_downloader(connection_factory reconnect = {}) -> resumable_downloader {
        if (!reconnect) {
            reconnect = fixed_connection(remote_);
        }
        return resumable_downloader(config_, std::move(reconnect), sleeper_.function());
    }

    auto download_all(resumable_downloader& downloader) -> download_report {
        std::shared_ptr<remote_filesystem> fs = remote_;
        return downloader.download(fs, files_);
    }

    std::shared_ptr<fake_remote_filesystem> remote_;
    file_list files_;
    transfer_config config_;
    recording_sleeper sleeper_;
};

TEST_F(ResumableDownloaderTest, DownloadsEverythingAndClearsState) {
    auto downloader = make_downloader();

    auto report = download_all(downloader);

    EXPECT_EQ(report.success_count, 3u);
    EXPECT_EQ(report.failed_count, 0u);
    EXPECT_EQ(report.total_count, 3u);
    EXPECT_EQ(report.downloaded_files.size(), 3u);
    EXPECT_EQ(read_file(download_dir_ / "B.csv"), "bravo!");
    EXPECT_FALSE(downloader.state_store().exists(downloader.state_key()));
}

TEST_F(ResumableDownloaderTest, ResumeSkipsProcessedFiles) {
    auto downloader = make_downloader();
    ASSERT_TRUE(downloader.state_store()
                    .save(downloader.state_key(), {"/in/A.csv", "/in/B.csv"}, {"/in/C.csv"})
                    .has_value());

    auto report = download_all(downloader);

    EXPECT_EQ(remote_->download_calls(), (std::vector<std::string>{"/in/C.csv"}));
    EXPECT_EQ(report.resumed_count, 2u);
    EXPECT_EQ(report.success_count, 3u);
    EXPECT_EQ(report.total_count, 1u);
    EXPECT_FALSE(downloader.state_store().exists(downloader.state_key()));
}

TEST_F(ResumableDownloaderTest, UnreadableStateIsIgnored) {
    auto downloader = make_downloader();
    create_text_file(downloader.state_store().path_for(downloader.state_key()),
                     "{\"processed_files\": [\"/in/\\uZZZZ.csv\"], \"remaining_files\": []}");

    auto report = download_all(downloader);

    EXPECT_EQ(report.resumed_count, 0u);
    EXPECT_EQ(report.success_count, 3u);
    EXPECT_EQ(remote_->download_calls().size(), 3u);
    EXPECT_FALSE(downloader.state_store().exists(downloader.state_key()));
}

TEST_F(ResumableDownloaderTest, ResumeDisabledIgnoresState) {
    config_.download.resume_transfer = false;
    auto downloader = make_downloader();
    ASSERT_TRUE(downloader.state_store()
                    .save(downloader.state_key(), {"/in/A.csv"}, {})
                    .has_value());

    auto report = download_all(downloader);

    EXPECT_EQ(remote_->download_calls().size(), 3u);
    EXPECT_EQ(report.resumed_count, 0u);
}

TEST_F(ResumableDownloaderTest, SizeMismatchIsRetriedThenFailed) {
    config_.download.max_reconnect_attempts = 2;
    remote_->truncate_downloads_of("/in/C.csv");
    auto downloader = make_downloader();

    auto report = download_all(downloader);

    auto calls = remote_->download_calls();
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "/in/C.csv"), 3);
    EXPECT_EQ(report.success_count, 2u);
    EXPECT_EQ(report.failed_count, 1u);
    EXPECT_EQ(report.failed_files, (std::vector<std::string>{"C.csv"}));
    EXPECT_EQ(report.outstanding(), 1u);
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "C.csv"));
    // live connection, so no reconnect delay
    EXPECT_TRUE(sleeper_.delays().empty());

    auto state = downloader.state_store().load(downloader.state_key());
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state.value().processed_files,
              (std::vector<std::string>{"/in/A.csv", "/in/B.csv"}));
    EXPECT_EQ(state.value().remaining_files, (std::vector<std::string>{"/in/C.csv"}));
}

TEST_F(ResumableDownloaderTest, TransientFailureRecovers) {
    remote_->fail_download("/in/B.csv", 1);
    auto downloader = make_downloader();

    auto report = download_all(downloader);

    EXPECT_EQ(report.success_count, 3u);
    EXPECT_EQ(report.failed_count, 0u);
}

TEST_F(ResumableDownloaderTest, NonRetryableErrorIsNotRetried) {
    config_.download.max_reconnect_attempts = 3;
    auto downloader = make_downloader();
    auto missing = make_file("/in/gone.csv", 4);

    std::shared_ptr<remote_filesystem> fs = remote_;
    auto report = downloader.download(fs, {missing, files_[0]});

    EXPECT_EQ(report.failed_files, (std::vector<std::string>{"gone.csv"}));
    EXPECT_EQ(report.success_count, 1u);
    auto calls = remote_->download_calls();
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "/in/gone.csv"), 1);
    EXPECT_TRUE(sleeper_.delays().empty());
}

TEST_F(ResumableDownloaderTest, DeadConnectionIsReplaced) {
    remote_->fail_download("/in/A.csv", 1);
    remote_->set_alive(false);

    auto replacement = std::make_shared<fake_remote_filesystem>();
    replacement->add_file("/in/A.csv", "alpha");
    replacement->add_file("/in/B.csv", "bravo!");
    replacement->add_file("/in/C.csv", "charlie");
    auto downloader = make_downloader(fixed_connection(replacement));

    std::shared_ptr<remote_filesystem> fs = remote_;
    auto report = downloader.download(fs, files_);

    EXPECT_EQ(report.success_count, 3u);
    EXPECT_EQ(fs, replacement);
    EXPECT_EQ(sleeper_.delays(),
              (std::vector<std::chrono::milliseconds>{std::chrono::milliseconds(2000)}));
    EXPECT_EQ(replacement->download_calls().size(), 3u);
}

TEST_F(ResumableDownloaderTest, FailedReconnectCountsAsRetry) {
    config_.download.max_reconnect_attempts = 1;
    remote_->fail_download("/in/A.csv", 5);
    remote_->set_alive(false);
    auto downloader = make_downloader([](const transfer_config&) {
        resolved_connection failed;
        failed.failure = "Connection Refused";
        return failed;
    });

    std::shared_ptr<remote_filesystem> fs = remote_;
    auto report = downloader.download(fs, {files_[0]});

    EXPECT_EQ(report.failed_count, 1u);
    EXPECT_EQ(remote_->download_calls().size(), 1u);
    EXPECT_EQ(sleeper_.delays().size(), 1u);
}

TEST_F(ResumableDownloaderTest, ExistingFileSkippedWithoutOverwrite) {
    create_text_file(download_dir_ / "A.csv", "local copy");
    auto downloader = make_downloader();

    auto report = download_all(downloader);

    EXPECT_EQ(report.skipped_count, 1u);
    EXPECT_EQ(report.skipped_files, (std::vector<std::string>{"A.csv"}));
    EXPECT_EQ(report.success_count, 2u);
    EXPECT_EQ(read_file(download_dir_ / "A.csv"), "local copy");

    auto state = downloader.state_store().load(downloader.state_key());
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state.value().remaining_files, (std::vector<std::string>{"/in/A.csv"}));
}

TEST_F(ResumableDownloaderTest, OverwriteReplacesExistingFile) {
    config_.download.overwrite_existing = true;
    create_text_file(download_dir_ / "A.csv", "local copy");
    auto downloader = make_downloader();

    auto report = download_all(downloader);

    EXPECT_EQ(report.skipped_count, 0u);
    EXPECT_EQ(read_file(download_dir_ / "A.csv"), "alpha");
}

TEST_F(ResumableDownloaderTest, RenamesRemoteAfterFetching) {
    config_.download.rename_after_fetching = true;
    config_.download.file_parsed_string = "Processed";
    auto downloader = make_downloader();

    (void)download_all(downloader);

    auto renames = remote_->renames();
    ASSERT_EQ(renames.size(), 3u);
    EXPECT_EQ(renames[0].first, "/in/A.csv");
    EXPECT_EQ(renames[0].second, "/in/Processed_A.csv");
}

TEST_F(ResumableDownloaderTest, LocalPathHonorsAppendFullPath) {
    auto file = make_file("/in/sub/A.csv", 1);

    EXPECT_EQ(make_downloader().local_path_for(file), download_dir_ / "A.csv");

    config_.download.append_full_path = true;
    EXPECT_EQ(make_downloader().local_path_for(file), download_dir_ / "in/sub/A.csv");

    auto relative = make_file("in/A.csv", 1);
    config_.download.add_front_slash_path = true;
    EXPECT_EQ(make_downloader().local_path_for(relative), download_dir_ / "in/A.csv");
}

TEST_F(ResumableDownloaderTest, EmptyInput) {
    auto downloader = make_downloader();
    std::shared_ptr<remote_filesystem> fs = remote_;

    auto report = downloader.download(fs, {});

    EXPECT_EQ(report.total_count, 0u);
    EXPECT_TRUE(remote_->download_calls().empty());
}

TEST(RenamedRemotePathTest, PrefixesBaseName) {
    EXPECT_EQ(renamed_remote_path("a.csv", "Parsed"), "Parsed_a.csv");
    EXPECT_EQ(renamed_remote_path("/x/y.csv", "Parsed"), "/x/Parsed_y.csv");
    EXPECT_EQ(renamed_remote_path("bucket/k/z.csv", "Done"), "bucket/k/Done_z.csv");
}

}  // namespace kcenon::fetcher::test
